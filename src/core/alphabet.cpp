#include "core/alphabet.hpp"

namespace protfasta {

Alphabet::Alphabet(const std::string& residues) {
    for (char c : residues) {
        if (mask_[static_cast<unsigned char>(c)]) continue;
        mask_[static_cast<unsigned char>(c)] = true;
        residues_.push_back(c);
    }
}

const Alphabet& standard_alphabet(bool with_gap) {
    static const Alphabet standard(STANDARD_AAS);
    static const Alphabet standard_with_gap(std::string(STANDARD_AAS) + GAP_CHAR);
    return with_gap ? standard_with_gap : standard;
}

const CorrectionTable& default_correction_table(bool with_gap) {
    static const CorrectionTable standard = {
        {"B", "N"},
        {"U", "C"},
        {"X", "G"},
        {"Z", "Q"},
        {"*", ""},
        {"-", ""},
    };
    static const CorrectionTable standard_with_gap = {
        {"B", "N"},
        {"U", "C"},
        {"X", "G"},
        {"Z", "Q"},
        {" ", ""},
        {"*", ""},
    };
    return with_gap ? standard_with_gap : standard;
}

CorrectionTable build_custom_table(const CorrectionTable& additions,
                                   bool with_gap) {
    CorrectionTable table = default_correction_table(with_gap);
    for (const auto& kv : additions) {
        table[kv.first] = kv.second;
    }
    return table;
}

} // namespace protfasta
