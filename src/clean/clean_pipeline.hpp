#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include "clean/clean_policy.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "util/logger.hpp"

namespace protfasta {

// Per-stage record counts of one cleaning run.
struct CleanSummary {
    uint64_t input_records = 0;
    uint64_t removed_invalid = 0;        // remove / convert-remove
    uint64_t corrected = 0;              // convert*
    uint64_t removed_duplicate_records = 0;
    uint64_t removed_duplicate_sequences = 0;
    uint64_t removed_by_length = 0;
    uint64_t removed_by_subsample = 0;
    uint64_t output_records = 0;
};

// Stage 1: invalid-sequence handling. `table` may be null (default table).
bool apply_invalid_sequence_action(Dataset& records,
                                   InvalidSequenceAction action,
                                   bool alignment,
                                   const CorrectionTable* table,
                                   const Logger& logger,
                                   CleanSummary& summary,
                                   Error& err);

// Stage 2: duplicate records, keyed on the header.
bool apply_duplicate_record_action(Dataset& records, DuplicateAction action,
                                   const Logger& logger, CleanSummary& summary,
                                   Error& err);

// Stage 3: duplicate sequences, keyed on the sequence body.
bool apply_duplicate_sequence_action(Dataset& records, DuplicateAction action,
                                     const Logger& logger, CleanSummary& summary,
                                     Error& err);

// Stage 4: keep shortest <= length <= longest (each bound optional).
uint64_t filter_by_length(Dataset& records,
                          const std::optional<uint64_t>& shortest,
                          const std::optional<uint64_t>& longest);

// Stage 5: shuffle, then keep the first `count` records.
uint64_t random_subsample(Dataset& records, uint64_t count,
                          std::mt19937_64& rng);

// Stage 6: replace ',' with ';' in every header.
void replace_header_commas(Dataset& records);

// Run all stages in order: invalid sequences, duplicate records, duplicate
// sequences, length filter, random subsample, header commas.
// On success `records` holds the cleaned dataset. On failure `records` is
// left exactly as passed in and err describes the failing stage.
// summary: optional per-stage counts.
bool clean_sequences(Dataset& records, const CleanPolicy& policy,
                     std::mt19937_64& rng, const Logger& logger, Error& err,
                     CleanSummary* summary = nullptr);

} // namespace protfasta
