#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <string>

namespace protfasta {

// The 20 canonical amino acids, and the alignment gap character.
inline constexpr const char* STANDARD_AAS = "ACDEFGHIKLMNPQRSTVWY";
inline constexpr char GAP_CHAR = '-';

// Set of valid residue characters with a 256-entry lookup mask.
class Alphabet {
public:
    explicit Alphabet(const std::string& residues);

    bool contains(char c) const {
        return mask_[static_cast<unsigned char>(c)];
    }

    // Residues in declaration order.
    const std::string& residues() const { return residues_; }
    size_t size() const { return residues_.size(); }

private:
    std::string residues_;
    std::array<bool, 256> mask_{};
};

// Source substring -> replacement substring. Ordered so that corrections
// are applied in the same order on every run.
using CorrectionTable = std::map<std::string, std::string>;

// Standard alphabet; with_gap adds '-'.
const Alphabet& standard_alphabet(bool with_gap);

// Default correction table for non-standard residue codes.
//   without gap: B->N U->C X->G Z->Q *->"" -->""
//   with gap:    B->N U->C X->G Z->Q *->"" " "->""
// The gap variant deletes spaces instead of '-' so that gaps survive.
const CorrectionTable& default_correction_table(bool with_gap);

// Default table for the alphabet variant with `additions` inserted on top
// (additions win on key collision).
CorrectionTable build_custom_table(const CorrectionTable& additions,
                                   bool with_gap = false);

} // namespace protfasta
