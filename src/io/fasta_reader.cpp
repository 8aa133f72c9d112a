#include "io/fasta_reader.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <unordered_set>

namespace protfasta {

static std::string trim(const std::string& line) {
    size_t start = 0;
    while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start])))
        start++;
    size_t end = line.size();
    while (end > start && std::isspace(static_cast<unsigned char>(line[end - 1])))
        end--;
    return line.substr(start, end - start);
}

static bool finish_record(Dataset& records, std::string& cur_header,
                          std::string& cur_seq,
                          std::unordered_set<std::string>& seen_headers,
                          bool expect_unique_header, Error& err) {
    if (!seen_headers.insert(cur_header).second && expect_unique_header) {
        err.set(ErrorKind::kParse, "Found duplicate header (" + cur_header + ")");
        return false;
    }
    for (auto& c : cur_seq)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    records.push_back({cur_header, std::move(cur_seq)});
    cur_seq.clear();
    return true;
}

bool read_fasta_stream(std::istream& in, const FastaReadOptions& opts,
                       Dataset& records, Error& err, const Logger& logger) {
    Dataset parsed;
    std::unordered_set<std::string> seen_headers;
    std::string line;
    std::string cur_header;
    std::string cur_seq;
    size_t num_lines = 0;

    while (std::getline(in, line)) {
        num_lines++;
        std::string sline = trim(line);
        if (sline.empty())
            continue;

        if (sline[0] == '>') {
            if (!cur_seq.empty() &&
                !finish_record(parsed, cur_header, cur_seq, seen_headers,
                               opts.expect_unique_header, err)) {
                return false;
            }
            std::string h = sline.substr(1);
            cur_header = opts.header_parser ? opts.header_parser(h) : h;
            cur_seq.clear();
        } else {
            cur_seq += sline;
        }
    }

    if (!cur_seq.empty() &&
        !finish_record(parsed, cur_header, cur_seq, seen_headers,
                       opts.expect_unique_header, err)) {
        return false;
    }

    logger.info("Read in file with %zu lines", num_lines);
    logger.info("Parsed file to recover %zu sequences", parsed.size());
    records.swap(parsed);
    return true;
}

bool read_fasta(const std::string& path, const FastaReadOptions& opts,
                Dataset& records, Error& err, const Logger& logger) {
    if (path == "-") {
        return read_fasta_stream(std::cin, opts, records, err, logger);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        err.set(ErrorKind::kFile, "Unable to find or read file: " + path);
        return false;
    }
    return read_fasta_stream(file, opts, records, err, logger);
}

} // namespace protfasta
