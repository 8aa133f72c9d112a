#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>

// PROTFASTA_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace protfasta {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, PROTFASTA_VERSION);
        return true;
    }
    return false;
}

// Create the stdout Logger from -silent and -v / --verbose flags.
// -silent wins over -v.
inline Logger make_logger(const CliParser& cli) {
    if (cli.has("-silent")) return Logger(Logger::kSilent, stdout);
    bool verbose = cli.has("-v") || cli.has("--verbose");
    return Logger(verbose ? Logger::kDebug : Logger::kInfo, stdout);
}

} // namespace protfasta
