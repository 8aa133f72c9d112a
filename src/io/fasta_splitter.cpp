#include "io/fasta_splitter.hpp"

#include <cstdio>

namespace protfasta {

bool split_fasta(const Dataset& records, size_t n,
                 std::vector<Dataset>& chunks, Error& err) {
    if (n == 0) {
        err.set(ErrorKind::kInvalidPolicy, "Number of chunks must be at least 1");
        return false;
    }

    size_t total = records.size();
    size_t chunk_size = (total + n - 1) / n;

    std::vector<Dataset> result;
    Dataset current;
    for (const auto& rec : records) {
        if (current.size() >= chunk_size && result.size() < n - 1) {
            result.push_back(std::move(current));
            current.clear();
        }
        current.push_back(rec);
    }
    if (!current.empty()) result.push_back(std::move(current));

    chunks.swap(result);
    return true;
}

std::string chunk_filename(const std::string& stem, size_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "_%06zu.fasta", index);
    return stem + buf;
}

} // namespace protfasta
