#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "core/error.hpp"
#include "core/types.hpp"
#include "util/logger.hpp"

namespace protfasta {

// Key the single-key duplicate checks operate on.
enum class DuplicateKey : uint8_t {
    kHeader = 0,
    kSequence = 1,
};

// Fail with kDuplicate on the first header seen twice (input order).
bool fail_on_duplicate_records(const Dataset& records, Error& err);

// Keep the first record of each header. Returns the number removed.
size_t remove_duplicate_records(Dataset& records);

// Fail with kDuplicate on the first sequence body seen twice.
bool fail_on_duplicate_sequences(const Dataset& records, Error& err);

// Keep the first record of each sequence body. Returns the number removed.
size_t remove_duplicate_sequences(Dataset& records);

// Combined key: a record is a duplicate only if an earlier record has the
// same header and the same sequence. A repeated header carrying a new
// sequence is kept.
bool fail_on_duplicates(const Dataset& records, Error& err);
size_t remove_duplicates(Dataset& records);

// Header -> sequence map. Later records overwrite earlier ones with the
// same header; each overwrite is reported as a warning.
std::unordered_map<std::string, std::string> records_to_map(
    const Dataset& records, const Logger& logger);

} // namespace protfasta
