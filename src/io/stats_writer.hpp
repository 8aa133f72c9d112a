#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "clean/clean_pipeline.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

namespace protfasta {

struct DatasetStats {
    uint64_t total_sequences = 0;
    std::optional<uint64_t> shortest; // unset for an empty dataset
    std::optional<uint64_t> longest;
};

DatasetStats compute_stats(const Dataset& records);

enum class StatsFormat { kText, kJson };

// Parse a statistics format string ("text", "json").
// Returns true on success. On failure, out is unchanged and err is set.
bool parse_stats_format(const std::string& str, StatsFormat& out, Error& err);

// Text report:
//   Total sequences: N
//   Shortest sequence: S
//   Longest sequence: L
void write_stats_text(std::ostream& out, const DatasetStats& stats);

// JSON report. summary: optional per-stage counts of the cleaning run.
void write_stats_json(std::ostream& out, const DatasetStats& stats,
                      const CleanSummary* summary = nullptr);

void write_stats(std::ostream& out, const DatasetStats& stats,
                 StatsFormat fmt, const CleanSummary* summary = nullptr);

} // namespace protfasta
