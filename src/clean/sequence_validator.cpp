#include "clean/sequence_validator.hpp"
#include "core/alphabet.hpp"

#include <algorithm>
#include <array>
#include <cstddef>

namespace protfasta {

// Byte length of the UTF-8 sequence starting with lead byte c.
static size_t utf8_length(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;  // stray continuation or invalid lead byte
}

ValidityResult check_sequence_is_valid(const std::string& seq, bool alignment) {
    const Alphabet& alphabet = standard_alphabet(alignment);

    std::array<bool, 128> seen{};
    for (size_t i = 0; i < seq.size(); i++) {
        auto c = static_cast<unsigned char>(seq[i]);
        if (c >= 0x80) {
            // The alphabet is ASCII, so any multibyte residue is invalid.
            size_t len = std::min(utf8_length(c), seq.size() - i);
            return {false, seq.substr(i, len)};
        }
        if (seen[c]) continue;
        seen[c] = true;
        if (!alphabet.contains(seq[i])) {
            return {false, std::string(1, seq[i])};
        }
    }
    return {};
}

bool fail_on_invalid_sequences(const Dataset& records, bool alignment,
                               Error& err) {
    for (const auto& rec : records) {
        ValidityResult r = check_sequence_is_valid(rec.sequence, alignment);
        if (!r.valid) {
            err.set(ErrorKind::kInvalidSequence,
                    "Invalid character '" + r.invalid_residue +
                    "' found in sequence: " + rec.header);
            return false;
        }
    }
    return true;
}

size_t remove_invalid_sequences(Dataset& records, bool alignment) {
    size_t before = records.size();
    records.erase(
        std::remove_if(records.begin(), records.end(),
            [alignment](const FastaRecord& rec) {
                return !check_sequence_is_valid(rec.sequence, alignment).valid;
            }),
        records.end());
    return before - records.size();
}

} // namespace protfasta
