#pragma once

#include <cstddef>
#include <string>

#include "core/alphabet.hpp"
#include "core/types.hpp"

namespace protfasta {

// Rewrite `seq` with a correction table. When `table` is null the default
// table for the alignment mode is used; a supplied table replaces the
// defaults entirely. Each key in turn has all of its non-overlapping
// occurrences replaced across the whole string before the next key is
// applied. Empty keys are skipped.
std::string convert_to_valid(const std::string& seq, bool alignment,
                             const CorrectionTable* table = nullptr);

// Apply convert_to_valid to every record. Returns the number of records
// whose sequence string changed.
size_t convert_invalid_sequences(Dataset& records, bool alignment,
                                 const CorrectionTable* table = nullptr);

} // namespace protfasta
