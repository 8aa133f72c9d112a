#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

#include "core/error.hpp"
#include "core/types.hpp"
#include "util/logger.hpp"

namespace protfasta {

inline constexpr size_t MIN_LINE_LENGTH = 5;
inline constexpr size_t DEFAULT_LINE_LENGTH = 60;

struct FastaWriteOptions {
    // Wrap width; unset writes each sequence on one line.
    // Widths below MIN_LINE_LENGTH are raised to MIN_LINE_LENGTH.
    std::optional<size_t> line_length;
    // Append to an existing file instead of truncating it.
    bool append = false;
};

// Write records as ">header", sequence line(s), then a blank line.
// Fails with kWrite (before writing anything) if any sequence is empty,
// or on stream failure.
bool write_fasta_stream(std::ostream& out, const Dataset& records,
                        const FastaWriteOptions& opts, Error& err);

// Write records to `path`. Fails with kWrite if the file cannot be opened.
bool write_fasta(const std::string& path, const Dataset& records,
                 const FastaWriteOptions& opts, Error& err,
                 const Logger& logger);

} // namespace protfasta
