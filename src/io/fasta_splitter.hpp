#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"

namespace protfasta {

// Split records into at most n contiguous chunks of ceil(total / n)
// records each (the last chunk takes the remainder). Order is preserved
// within and across chunks; no empty chunk is produced.
// Fails with kInvalidPolicy when n == 0.
bool split_fasta(const Dataset& records, size_t n,
                 std::vector<Dataset>& chunks, Error& err);

// "<stem>_<index, 6 digits>.fasta" for 1-based chunk index.
std::string chunk_filename(const std::string& stem, size_t index);

} // namespace protfasta
