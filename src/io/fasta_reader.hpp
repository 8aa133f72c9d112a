#pragma once

#include <functional>
#include <istream>
#include <string>

#include "core/error.hpp"
#include "core/types.hpp"
#include "util/logger.hpp"

namespace protfasta {

struct FastaReadOptions {
    // Fail with kParse on the first repeated header.
    bool expect_unique_header = true;
    // Applied to every header (text after '>') before it is stored.
    std::function<std::string(const std::string&)> header_parser;
};

// Read all records from an input stream.
// Lines are trimmed and blank lines skipped. A record is emitted when the
// next header (or end of input) is reached and only if its sequence is
// non-empty; sequence lines are concatenated and uppercased.
bool read_fasta_stream(std::istream& in, const FastaReadOptions& opts,
                       Dataset& records, Error& err, const Logger& logger);

// Read all records from a FASTA file. path can be "-" for stdin.
// Fails with kFile if the file cannot be opened.
bool read_fasta(const std::string& path, const FastaReadOptions& opts,
                Dataset& records, Error& err, const Logger& logger);

} // namespace protfasta
