#include "clean/duplicate_filter.hpp"

#include <algorithm>
#include <unordered_set>

namespace protfasta {

static const std::string& key_of(const FastaRecord& rec, DuplicateKey key) {
    return key == DuplicateKey::kHeader ? rec.header : rec.sequence;
}

static const FastaRecord* find_first_repeat(const Dataset& records,
                                            DuplicateKey key) {
    std::unordered_set<std::string> seen;
    seen.reserve(records.size());
    for (const auto& rec : records) {
        if (!seen.insert(key_of(rec, key)).second) return &rec;
    }
    return nullptr;
}

static size_t remove_repeats(Dataset& records, DuplicateKey key) {
    std::unordered_set<std::string> seen;
    seen.reserve(records.size());
    size_t before = records.size();
    records.erase(
        std::remove_if(records.begin(), records.end(),
            [&](const FastaRecord& rec) {
                return !seen.insert(key_of(rec, key)).second;
            }),
        records.end());
    return before - records.size();
}

bool fail_on_duplicate_records(const Dataset& records, Error& err) {
    const FastaRecord* dup = find_first_repeat(records, DuplicateKey::kHeader);
    if (dup) {
        err.set(ErrorKind::kDuplicate,
                "Found duplicate header: " + dup->header);
        return false;
    }
    return true;
}

size_t remove_duplicate_records(Dataset& records) {
    return remove_repeats(records, DuplicateKey::kHeader);
}

bool fail_on_duplicate_sequences(const Dataset& records, Error& err) {
    const FastaRecord* dup = find_first_repeat(records, DuplicateKey::kSequence);
    if (dup) {
        err.set(ErrorKind::kDuplicate,
                "Found duplicate sequence in record: " + dup->header);
        return false;
    }
    return true;
}

size_t remove_duplicate_sequences(Dataset& records) {
    return remove_repeats(records, DuplicateKey::kSequence);
}

bool fail_on_duplicates(const Dataset& records, Error& err) {
    std::unordered_map<std::string, std::unordered_set<std::string>> groups;
    for (const auto& rec : records) {
        if (!groups[rec.header].insert(rec.sequence).second) {
            err.set(ErrorKind::kDuplicate,
                    "Found duplicate entries of the following record:\n>" +
                    rec.header + "\n" + rec.sequence);
            return false;
        }
    }
    return true;
}

size_t remove_duplicates(Dataset& records) {
    std::unordered_map<std::string, std::unordered_set<std::string>> groups;
    size_t before = records.size();
    records.erase(
        std::remove_if(records.begin(), records.end(),
            [&](const FastaRecord& rec) {
                return !groups[rec.header].insert(rec.sequence).second;
            }),
        records.end());
    return before - records.size();
}

std::unordered_map<std::string, std::string> records_to_map(
    const Dataset& records, const Logger& logger) {
    std::unordered_map<std::string, std::string> result;
    result.reserve(records.size());

    size_t overwrites = 0;
    for (const auto& rec : records) {
        auto ins = result.insert_or_assign(rec.header, rec.sequence);
        if (!ins.second) {
            overwrites++;
            logger.warn("Overwriting entry [count = %zu]", overwrites);
        }
    }

    if (overwrites > 0) {
        logger.info("%zu duplicate header(s) collapsed; keep the record list "
                    "to retain every entry", overwrites);
    } else {
        logger.info("All processed sequences uniquely added to the returning "
                    "dictionary");
    }
    return result;
}

} // namespace protfasta
