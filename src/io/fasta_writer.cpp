#include "io/fasta_writer.hpp"

#include <algorithm>
#include <fstream>

namespace protfasta {

static bool check_records(const Dataset& records, Error& err) {
    for (const auto& rec : records) {
        if (rec.sequence.empty()) {
            err.set(ErrorKind::kWrite,
                    "Sequence associated with [" + rec.header + "] is empty");
            return false;
        }
    }
    return true;
}

bool write_fasta_stream(std::ostream& out, const Dataset& records,
                        const FastaWriteOptions& opts, Error& err) {
    if (!check_records(records, err)) return false;

    std::optional<size_t> width = opts.line_length;
    if (width && *width < MIN_LINE_LENGTH) width = MIN_LINE_LENGTH;

    for (const auto& rec : records) {
        out << '>' << rec.header << '\n';
        if (width) {
            for (size_t pos = 0; pos < rec.sequence.size(); pos += *width) {
                out.write(rec.sequence.data() + pos,
                          static_cast<std::streamsize>(
                              std::min(*width, rec.sequence.size() - pos)));
                out << '\n';
            }
        } else {
            out << rec.sequence << '\n';
        }
        out << '\n';
    }

    out.flush();
    if (!out) {
        err.set(ErrorKind::kWrite, "Failed to write FASTA output");
        return false;
    }
    return true;
}

bool write_fasta(const std::string& path, const Dataset& records,
                 const FastaWriteOptions& opts, Error& err,
                 const Logger& logger) {
    if (!check_records(records, err)) return false;

    std::ofstream file(path, opts.append ? std::ios::app : std::ios::trunc);
    if (!file.is_open()) {
        err.set(ErrorKind::kWrite, "Cannot open output file " + path);
        return false;
    }
    if (!write_fasta_stream(file, records, opts, err)) {
        err.set(ErrorKind::kWrite, "Failed to write FASTA output to " + path);
        return false;
    }
    logger.info("Wrote %zu sequences to %s", records.size(), path.c_str());
    return true;
}

} // namespace protfasta
