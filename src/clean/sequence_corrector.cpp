#include "clean/sequence_corrector.hpp"

namespace protfasta {

static void replace_all(std::string& s, const std::string& from,
                        const std::string& to) {
    if (from.empty() || s.find(from) == std::string::npos) return;

    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    for (;;) {
        size_t hit = s.find(from, pos);
        if (hit == std::string::npos) break;
        out.append(s, pos, hit - pos);
        out += to;
        pos = hit + from.size();
    }
    out.append(s, pos, std::string::npos);
    s.swap(out);
}

std::string convert_to_valid(const std::string& seq, bool alignment,
                             const CorrectionTable* table) {
    const CorrectionTable& converter =
        table ? *table : default_correction_table(alignment);

    std::string result = seq;
    for (const auto& kv : converter) {
        replace_all(result, kv.first, kv.second);
    }
    return result;
}

size_t convert_invalid_sequences(Dataset& records, bool alignment,
                                 const CorrectionTable* table) {
    size_t count = 0;
    for (auto& rec : records) {
        std::string corrected = convert_to_valid(rec.sequence, alignment, table);
        if (corrected != rec.sequence) {
            rec.sequence.swap(corrected);
            count++;
        }
    }
    return count;
}

} // namespace protfasta
