#pragma once

#include <cstddef>
#include <string>

#include "core/error.hpp"
#include "core/types.hpp"

namespace protfasta {

struct ValidityResult {
    bool valid = true;
    // First invalid residue, empty when valid. A non-ASCII residue holds its
    // whole UTF-8 sequence.
    std::string invalid_residue;
};

// Check every residue of `seq` against the standard alphabet
// (with the gap character when alignment is true). Distinct characters are
// visited in order of first occurrence, so the reported residue is the
// first invalid residue of the sequence.
ValidityResult check_sequence_is_valid(const std::string& seq, bool alignment);

// Fail with kInvalidSequence on the first record (in input order) holding
// an invalid residue. The message names the header and the residue.
bool fail_on_invalid_sequences(const Dataset& records, bool alignment,
                               Error& err);

// Drop records holding invalid residues, keeping the order of the rest.
// Returns the number of records removed.
size_t remove_invalid_sequences(Dataset& records, bool alignment);

} // namespace protfasta
