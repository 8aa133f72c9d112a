#pragma once

#include <string>
#include <vector>

namespace protfasta {

struct FastaRecord {
    std::string header;   // text after '>' (trimmed line, no '>')
    std::string sequence; // concatenated sequence lines (uppercase)

    bool operator==(const FastaRecord& o) const {
        return header == o.header && sequence == o.sequence;
    }
    bool operator!=(const FastaRecord& o) const { return !(*this == o); }
};

// Ordered collection of records flowing through the cleaning stages.
using Dataset = std::vector<FastaRecord>;

} // namespace protfasta
