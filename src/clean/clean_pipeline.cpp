#include "clean/clean_pipeline.hpp"
#include "clean/duplicate_filter.hpp"
#include "clean/sequence_corrector.hpp"
#include "clean/sequence_validator.hpp"

#include <algorithm>

namespace protfasta {

bool apply_invalid_sequence_action(Dataset& records,
                                   InvalidSequenceAction action,
                                   bool alignment,
                                   const CorrectionTable* table,
                                   const Logger& logger,
                                   CleanSummary& summary,
                                   Error& err) {
    switch (action) {
        case InvalidSequenceAction::kIgnore:
            return true;

        case InvalidSequenceAction::kFail:
            return fail_on_invalid_sequences(records, alignment, err);

        case InvalidSequenceAction::kRemove: {
            size_t total = records.size();
            size_t removed = remove_invalid_sequences(records, alignment);
            summary.removed_invalid += removed;
            logger.info("Removed %zu of %zu sequences due to invalid characters",
                        removed, total);
            return true;
        }

        case InvalidSequenceAction::kConvert:
        case InvalidSequenceAction::kConvertIgnore:
        case InvalidSequenceAction::kConvertRemove: {
            size_t count = convert_invalid_sequences(records, alignment, table);
            summary.corrected += count;
            logger.info("Converted %zu sequences to valid sequences", count);

            if (action == InvalidSequenceAction::kConvert) {
                return fail_on_invalid_sequences(records, alignment, err);
            }
            if (action == InvalidSequenceAction::kConvertRemove) {
                size_t total = records.size();
                size_t removed = remove_invalid_sequences(records, alignment);
                summary.removed_invalid += removed;
                logger.info("Removed %zu of %zu sequences still invalid after "
                            "conversion", removed, total);
            }
            return true;
        }
    }
    err.set(ErrorKind::kInvalidPolicy, "Unknown invalid_sequence_action");
    return false;
}

bool apply_duplicate_record_action(Dataset& records, DuplicateAction action,
                                   const Logger& logger, CleanSummary& summary,
                                   Error& err) {
    switch (action) {
        case DuplicateAction::kIgnore:
            return true;
        case DuplicateAction::kFail:
            return fail_on_duplicate_records(records, err);
        case DuplicateAction::kRemove: {
            size_t total = records.size();
            size_t removed = remove_duplicate_records(records);
            summary.removed_duplicate_records += removed;
            logger.info("Removed %zu of %zu sequences due to duplicate records",
                        removed, total);
            return true;
        }
    }
    err.set(ErrorKind::kInvalidPolicy, "Unknown duplicate_record_action");
    return false;
}

bool apply_duplicate_sequence_action(Dataset& records, DuplicateAction action,
                                     const Logger& logger, CleanSummary& summary,
                                     Error& err) {
    switch (action) {
        case DuplicateAction::kIgnore:
            return true;
        case DuplicateAction::kFail:
            return fail_on_duplicate_sequences(records, err);
        case DuplicateAction::kRemove: {
            size_t total = records.size();
            size_t removed = remove_duplicate_sequences(records);
            summary.removed_duplicate_sequences += removed;
            logger.info("Removed %zu of %zu sequences due to duplicate sequences",
                        removed, total);
            return true;
        }
    }
    err.set(ErrorKind::kInvalidPolicy, "Unknown duplicate_sequence_action");
    return false;
}

uint64_t filter_by_length(Dataset& records,
                          const std::optional<uint64_t>& shortest,
                          const std::optional<uint64_t>& longest) {
    size_t before = records.size();
    if (shortest) {
        uint64_t min_len = *shortest;
        records.erase(
            std::remove_if(records.begin(), records.end(),
                [min_len](const FastaRecord& r) { return r.sequence.size() < min_len; }),
            records.end());
    }
    if (longest) {
        uint64_t max_len = *longest;
        records.erase(
            std::remove_if(records.begin(), records.end(),
                [max_len](const FastaRecord& r) { return r.sequence.size() > max_len; }),
            records.end());
    }
    return before - records.size();
}

uint64_t random_subsample(Dataset& records, uint64_t count,
                          std::mt19937_64& rng) {
    std::shuffle(records.begin(), records.end(), rng);
    if (count >= records.size()) return 0;
    uint64_t dropped = records.size() - count;
    records.resize(static_cast<size_t>(count));
    return dropped;
}

void replace_header_commas(Dataset& records) {
    for (auto& rec : records) {
        std::replace(rec.header.begin(), rec.header.end(), ',', ';');
    }
}

bool clean_sequences(Dataset& records, const CleanPolicy& policy,
                     std::mt19937_64& rng, const Logger& logger, Error& err,
                     CleanSummary* summary) {
    CleanSummary local;
    local.input_records = records.size();

    // Work on a copy so a failing stage leaves the caller's data untouched.
    Dataset work = records;

    const CorrectionTable* table =
        policy.correction_table ? &*policy.correction_table : nullptr;

    logger.debug("Invalid sequence action: %s",
                 action_name(policy.invalid_sequence));
    if (!apply_invalid_sequence_action(work, policy.invalid_sequence,
                                       policy.alignment, table, logger,
                                       local, err)) {
        return false;
    }

    logger.debug("Duplicate record action: %s",
                 action_name(policy.duplicate_record));
    if (!apply_duplicate_record_action(work, policy.duplicate_record, logger,
                                       local, err)) {
        return false;
    }

    logger.debug("Duplicate sequence action: %s",
                 action_name(policy.duplicate_sequence));
    if (!apply_duplicate_sequence_action(work, policy.duplicate_sequence, logger,
                                         local, err)) {
        return false;
    }

    if (policy.shortest_seq || policy.longest_seq) {
        size_t total = work.size();
        local.removed_by_length =
            filter_by_length(work, policy.shortest_seq, policy.longest_seq);
        logger.info("Removed %llu of %zu sequences due to length constraints",
                    static_cast<unsigned long long>(local.removed_by_length),
                    total);
    }

    if (policy.random_subsample) {
        size_t total = work.size();
        local.removed_by_subsample =
            random_subsample(work, *policy.random_subsample, rng);
        logger.info("Removed %llu of %zu sequences due to random subsampling",
                    static_cast<unsigned long long>(local.removed_by_subsample),
                    total);
    }

    if (policy.remove_comma_from_header) {
        replace_header_commas(work);
    }

    local.output_records = work.size();
    records.swap(work);
    if (summary) *summary = local;
    return true;
}

} // namespace protfasta
