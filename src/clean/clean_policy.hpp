#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/alphabet.hpp"
#include "core/error.hpp"

namespace protfasta {

enum class InvalidSequenceAction : uint8_t {
    kIgnore = 0,
    kFail = 1,
    kRemove = 2,
    kConvert = 3,        // correct, then fail on anything still invalid
    kConvertIgnore = 4,  // correct, keep anything still invalid
    kConvertRemove = 5,  // correct, drop anything still invalid
};

enum class DuplicateAction : uint8_t {
    kIgnore = 0,
    kFail = 1,
    kRemove = 2,
};

// Declarative description of one cleaning run.
struct CleanPolicy {
    InvalidSequenceAction invalid_sequence = InvalidSequenceAction::kIgnore;
    DuplicateAction duplicate_record = DuplicateAction::kIgnore;
    DuplicateAction duplicate_sequence = DuplicateAction::kIgnore;
    std::optional<uint64_t> shortest_seq;     // inclusive lower bound
    std::optional<uint64_t> longest_seq;      // inclusive upper bound
    std::optional<uint64_t> random_subsample; // records kept after shuffle
    bool remove_comma_from_header = false;
    bool alignment = false;
    // Replaces the default correction table for the convert actions.
    std::optional<CorrectionTable> correction_table;
};

// Parse "ignore", "fail", "remove", "convert", "convert-ignore",
// "convert-remove". On failure, out is unchanged and err is kInvalidPolicy.
bool parse_invalid_sequence_action(const std::string& str,
                                   InvalidSequenceAction& out, Error& err);

// Parse "ignore", "fail", "remove" for the option named `name`
// (used in the error message).
bool parse_duplicate_action(const std::string& name, const std::string& str,
                            DuplicateAction& out, Error& err);

const char* action_name(InvalidSequenceAction action);
const char* action_name(DuplicateAction action);

// Configuration-level checks made once before cleaning:
//  - unique headers cannot be expected while duplicate records are ignored
//  - a supplied correction table must not be empty
bool validate_clean_inputs(const CleanPolicy& policy, bool expect_unique_header,
                           Error& err);

} // namespace protfasta
