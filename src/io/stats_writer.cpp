#include "io/stats_writer.hpp"

#include <algorithm>
#include <memory>

#include <json/json.h>

namespace protfasta {

DatasetStats compute_stats(const Dataset& records) {
    DatasetStats stats;
    stats.total_sequences = records.size();
    for (const auto& rec : records) {
        uint64_t len = rec.sequence.size();
        stats.shortest = stats.shortest ? std::min(*stats.shortest, len) : len;
        stats.longest = stats.longest ? std::max(*stats.longest, len) : len;
    }
    return stats;
}

bool parse_stats_format(const std::string& str, StatsFormat& out, Error& err) {
    if (str == "text") {
        out = StatsFormat::kText;
    } else if (str == "json") {
        out = StatsFormat::kJson;
    } else {
        err.set(ErrorKind::kInvalidPolicy,
                "-stats_format must be 'text' or 'json' (got '" + str + "')");
        return false;
    }
    return true;
}

void write_stats_text(std::ostream& out, const DatasetStats& stats) {
    out << "Total sequences: " << stats.total_sequences << "\n";
    if (stats.shortest) out << "Shortest sequence: " << *stats.shortest << "\n";
    if (stats.longest) out << "Longest sequence: " << *stats.longest << "\n";
}

void write_stats_json(std::ostream& out, const DatasetStats& stats,
                      const CleanSummary* summary) {
    Json::Value root;
    root["total_sequences"] = static_cast<Json::UInt64>(stats.total_sequences);
    root["shortest_sequence"] = stats.shortest
        ? Json::Value(static_cast<Json::UInt64>(*stats.shortest))
        : Json::Value(Json::nullValue);
    root["longest_sequence"] = stats.longest
        ? Json::Value(static_cast<Json::UInt64>(*stats.longest))
        : Json::Value(Json::nullValue);

    if (summary) {
        Json::Value clean;
        clean["input_records"] = static_cast<Json::UInt64>(summary->input_records);
        clean["removed_invalid"] = static_cast<Json::UInt64>(summary->removed_invalid);
        clean["corrected"] = static_cast<Json::UInt64>(summary->corrected);
        clean["removed_duplicate_records"] =
            static_cast<Json::UInt64>(summary->removed_duplicate_records);
        clean["removed_duplicate_sequences"] =
            static_cast<Json::UInt64>(summary->removed_duplicate_sequences);
        clean["removed_by_length"] = static_cast<Json::UInt64>(summary->removed_by_length);
        clean["removed_by_subsample"] =
            static_cast<Json::UInt64>(summary->removed_by_subsample);
        clean["output_records"] = static_cast<Json::UInt64>(summary->output_records);
        root["clean"] = clean;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(root, &out);
    out << "\n";
}

void write_stats(std::ostream& out, const DatasetStats& stats,
                 StatsFormat fmt, const CleanSummary* summary) {
    switch (fmt) {
        case StatsFormat::kText:
            write_stats_text(out, stats);
            break;
        case StatsFormat::kJson:
            write_stats_json(out, stats, summary);
            break;
    }
}

} // namespace protfasta
