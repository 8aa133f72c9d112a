#include "core/version.hpp"
#include "protfasta/commands.hpp"

#include <cstdio>
#include <cstring>

using namespace protfasta;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s <command> [options]\n"
        "\n"
        "Parse, sanitize and rewrite protein FASTA files.\n"
        "\n"
        "Commands:\n"
        "  clean                    Clean a FASTA file\n"
        "  split                    Split a FASTA file into N chunks\n"
        "\n"
        "Run '%s <command> -h' for command options.\n"
        "\n"
        "Options:\n"
        "  -h, --help               Show this help\n"
        "  --version                Show version\n",
        prog, prog);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const char* cmd = argv[1];
    if (std::strcmp(cmd, "-h") == 0 || std::strcmp(cmd, "--help") == 0) {
        print_usage(argv[0]);
        return 0;
    }
    if (std::strcmp(cmd, "--version") == 0) {
        std::fprintf(stderr, "protfasta %s\n", PROTFASTA_VERSION);
        return 0;
    }

    if (std::strcmp(cmd, "clean") == 0) return run_clean(argc - 1, argv + 1);
    if (std::strcmp(cmd, "split") == 0) return run_split(argc - 1, argv + 1);

    std::fprintf(stderr, "Error: unknown command '%s'\n", cmd);
    print_usage(argv[0]);
    return 1;
}
