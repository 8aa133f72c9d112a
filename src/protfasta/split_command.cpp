#include "core/version.hpp"
#include "io/fasta_reader.hpp"
#include "io/fasta_splitter.hpp"
#include "io/fasta_writer.hpp"
#include "protfasta/commands.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/count_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>
#include <unordered_set>

namespace protfasta {

static const std::unordered_set<std::string> kSplitFlags = {
    "-no_outputfiles", "-silent", "-v", "--verbose", "-h", "--help", "--version",
};

static const std::unordered_set<std::string> kSplitOptions = {
    "-o", "-chunks", "-line_length",
};

static void print_split_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s <input.fasta> -o <dir> -chunks <int> [options]\n"
        "\n"
        "Required:\n"
        "  -o <dir>                 Output directory (created if missing)\n"
        "  -chunks <int>            Number of chunks to split into\n"
        "\n"
        "Options:\n"
        "  -line_length <int>       Residues per output line, min 5 (default: 60)\n"
        "  -no_outputfiles          Do not write the chunk files\n"
        "  -silent                  No output at all to stdout\n"
        "  -v, --verbose            Verbose logging\n"
        "  -h, --help               Show this help\n",
        prog);
}

int run_split(int argc, char* argv[]) {
    CliParser cli(argc, argv, kSplitFlags);

    if (check_version(cli, "protfasta split")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_split_usage("protfasta split");
        return 0;
    }

    std::unordered_set<std::string> known = kSplitFlags;
    known.insert(kSplitOptions.begin(), kSplitOptions.end());
    for (const auto& key : cli.unknown_keys(known)) {
        std::fprintf(stderr, "Error: unknown option %s\n", key.c_str());
        return 1;
    }

    if (cli.positional().size() != 1) {
        std::fprintf(stderr, "Error: exactly one input FASTA file is required\n");
        print_split_usage("protfasta split");
        return 1;
    }
    if (!cli.has("-o") || !cli.has("-chunks")) {
        std::fprintf(stderr, "Error: -o and -chunks are required\n");
        print_split_usage("protfasta split");
        return 1;
    }

    const std::string input_path = cli.positional()[0];
    const std::string output_dir = cli.get_string("-o");

    std::string msg;
    uint64_t num_chunks = 0;
    uint64_t line_length = DEFAULT_LINE_LENGTH;
    if (!parse_count("-chunks", cli.get_string("-chunks"), num_chunks, msg) ||
        (cli.has("-line_length") &&
         !parse_count("-line_length", cli.get_string("-line_length"),
                      line_length, msg))) {
        std::fprintf(stderr, "Error: %s\n", msg.c_str());
        return 1;
    }

    Logger logger = make_logger(cli);
    Error err;

    FastaReadOptions read_opts;
    read_opts.expect_unique_header = true;
    Dataset records;
    if (!read_fasta(input_path, read_opts, records, err, logger)) {
        std::fprintf(stderr, "Error: %s\n", err.message.c_str());
        return 1;
    }

    std::vector<Dataset> chunks;
    if (!split_fasta(records, static_cast<size_t>(num_chunks), chunks, err)) {
        std::fprintf(stderr, "Error: %s\n", err.message.c_str());
        return 1;
    }

    if (!cli.has("-no_outputfiles")) {
        std::error_code ec;
        std::filesystem::create_directories(output_dir, ec);
        if (ec) {
            std::fprintf(stderr, "Error: cannot create output directory %s: %s\n",
                         output_dir.c_str(), ec.message().c_str());
            return 1;
        }

        std::string stem = input_path == "-"
            ? "stdin" : std::filesystem::path(input_path).stem().string();
        FastaWriteOptions write_opts;
        write_opts.line_length = static_cast<size_t>(line_length);
        for (size_t i = 0; i < chunks.size(); i++) {
            std::string path =
                (std::filesystem::path(output_dir) / chunk_filename(stem, i + 1)).string();
            if (!write_fasta(path, chunks[i], write_opts, err, logger)) {
                std::fprintf(stderr, "Error: %s\n", err.message.c_str());
                return 1;
            }
        }
    }

    logger.info("Split FASTA into %zu chunks", chunks.size());
    return 0;
}

} // namespace protfasta
