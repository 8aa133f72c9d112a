#include "clean/clean_pipeline.hpp"
#include "clean/clean_policy.hpp"
#include "core/version.hpp"
#include "io/correction_table_reader.hpp"
#include "io/fasta_reader.hpp"
#include "io/fasta_writer.hpp"
#include "io/stats_writer.hpp"
#include "protfasta/commands.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/count_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <iostream>
#include <random>
#include <string>
#include <unordered_set>

namespace protfasta {

static const std::unordered_set<std::string> kCleanFlags = {
    "-non_unique_header", "-alignment", "-remove_comma_from_header",
    "-print_statistics", "-no_outputfile", "-silent",
    "-v", "--verbose", "-h", "--help", "--version",
};

static const std::unordered_set<std::string> kCleanOptions = {
    "-o", "-duplicate_record", "-duplicate_sequence", "-invalid_sequence",
    "-correction_table", "-line_length", "-shortest_seq", "-longest_seq",
    "-random_subsample", "-seed", "-stats_format",
};

static void print_clean_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s <input.fasta> [options]\n"
        "\n"
        "Output:\n"
        "  -o <path>                    Output FASTA file (not written if omitted)\n"
        "  -line_length <int>           Residues per output line, min 5 (default: 60)\n"
        "  -no_outputfile               Never write the output file\n"
        "\n"
        "Cleaning:\n"
        "  -non_unique_header           Allow non-unique headers while parsing\n"
        "  -duplicate_record <action>   ignore|fail|remove (default: fail)\n"
        "  -duplicate_sequence <action> ignore|fail|remove (default: ignore)\n"
        "  -invalid_sequence <action>   ignore|fail|remove|convert|convert-ignore|\n"
        "                               convert-remove (default: fail)\n"
        "  -correction_table <path>     Replace the default correction table\n"
        "                               (SOURCE<TAB>TARGET per line)\n"
        "  -alignment                   Accept the '-' gap character\n"
        "  -shortest_seq <int>          Drop sequences shorter than this\n"
        "  -longest_seq <int>           Drop sequences longer than this\n"
        "  -random_subsample <int>      Keep a random subset of this size\n"
        "  -seed <int>                  Seed for -random_subsample (default: random)\n"
        "  -remove_comma_from_header    Replace ',' with ';' in headers\n"
        "\n"
        "Reporting:\n"
        "  -print_statistics            Print information on the cleaned sequences\n"
        "  -stats_format <fmt>          text|json (default: text)\n"
        "  -silent                      No output at all to stdout\n"
        "  -v, --verbose                Verbose logging\n"
        "  -h, --help                   Show this help\n",
        prog);
}

static bool get_optional_count(const CliParser& cli, const std::string& key,
                               std::optional<uint64_t>& out, std::string& err) {
    if (!cli.has(key)) return true;
    uint64_t v = 0;
    if (!parse_count(key, cli.get_string(key), v, err)) return false;
    out = v;
    return true;
}

int run_clean(int argc, char* argv[]) {
    CliParser cli(argc, argv, kCleanFlags);

    if (check_version(cli, "protfasta clean")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_clean_usage("protfasta clean");
        return 0;
    }

    std::unordered_set<std::string> known = kCleanFlags;
    known.insert(kCleanOptions.begin(), kCleanOptions.end());
    for (const auto& key : cli.unknown_keys(known)) {
        std::fprintf(stderr, "Error: unknown option %s\n", key.c_str());
        return 1;
    }

    if (cli.positional().size() != 1) {
        std::fprintf(stderr, "Error: exactly one input FASTA file is required\n");
        print_clean_usage("protfasta clean");
        return 1;
    }
    const std::string input_path = cli.positional()[0];

    Logger logger = make_logger(cli);
    Error err;
    std::string msg;

    CleanPolicy policy;
    if (!parse_invalid_sequence_action(cli.get_string("-invalid_sequence", "fail"),
                                       policy.invalid_sequence, err) ||
        !parse_duplicate_action("duplicate_record_action",
                                cli.get_string("-duplicate_record", "fail"),
                                policy.duplicate_record, err) ||
        !parse_duplicate_action("duplicate_sequence_action",
                                cli.get_string("-duplicate_sequence", "ignore"),
                                policy.duplicate_sequence, err)) {
        std::fprintf(stderr, "Error: %s\n", err.message.c_str());
        return 1;
    }

    if (!get_optional_count(cli, "-shortest_seq", policy.shortest_seq, msg) ||
        !get_optional_count(cli, "-longest_seq", policy.longest_seq, msg) ||
        !get_optional_count(cli, "-random_subsample", policy.random_subsample, msg)) {
        std::fprintf(stderr, "Error: %s\n", msg.c_str());
        return 1;
    }

    std::optional<uint64_t> line_length;
    std::optional<uint64_t> seed;
    if (!get_optional_count(cli, "-line_length", line_length, msg) ||
        !get_optional_count(cli, "-seed", seed, msg)) {
        std::fprintf(stderr, "Error: %s\n", msg.c_str());
        return 1;
    }

    StatsFormat stats_format = StatsFormat::kText;
    if (!parse_stats_format(cli.get_string("-stats_format", "text"),
                            stats_format, err)) {
        std::fprintf(stderr, "Error: %s\n", err.message.c_str());
        return 1;
    }

    policy.alignment = cli.has("-alignment");
    policy.remove_comma_from_header = cli.has("-remove_comma_from_header");

    if (cli.has("-correction_table")) {
        CorrectionTable table;
        if (!read_correction_table(cli.get_string("-correction_table"), table, err)) {
            std::fprintf(stderr, "Error: %s\n", err.message.c_str());
            return 1;
        }
        logger.debug("Loaded %zu correction entries", table.size());
        policy.correction_table = std::move(table);
    }

    bool expect_unique_header = !cli.has("-non_unique_header");
    if (!validate_clean_inputs(policy, expect_unique_header, err)) {
        std::fprintf(stderr, "Error: %s\n", err.message.c_str());
        return 1;
    }

    // Parse
    FastaReadOptions read_opts;
    read_opts.expect_unique_header = expect_unique_header;
    Dataset records;
    if (!read_fasta(input_path, read_opts, records, err, logger)) {
        std::fprintf(stderr, "Error: %s\n", err.message.c_str());
        return 1;
    }

    // Clean
    std::mt19937_64 rng(seed ? *seed : std::random_device{}());
    CleanSummary summary;
    if (!clean_sequences(records, policy, rng, logger, err, &summary)) {
        std::fprintf(stderr, "Error: %s\n", err.message.c_str());
        return 1;
    }

    if (cli.has("-print_statistics") && !logger.silent()) {
        write_stats(std::cout, compute_stats(records), stats_format, &summary);
        std::cout.flush();
    }

    // Write
    std::string output_path = cli.get_string("-o");
    if (!cli.has("-no_outputfile") && !output_path.empty()) {
        FastaWriteOptions write_opts;
        write_opts.line_length = line_length
            ? static_cast<size_t>(*line_length) : DEFAULT_LINE_LENGTH;
        if (!write_fasta(output_path, records, write_opts, err, logger)) {
            std::fprintf(stderr, "Error: %s\n", err.message.c_str());
            return 1;
        }
    }

    return 0;
}

} // namespace protfasta
