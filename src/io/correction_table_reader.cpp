#include "io/correction_table_reader.hpp"

#include <fstream>

namespace protfasta {

bool read_correction_table(const std::string& path, CorrectionTable& table,
                           Error& err) {
    std::ifstream file(path);
    if (!file.is_open()) {
        err.set(ErrorKind::kFile, "Unable to find or read file: " + path);
        return false;
    }

    CorrectionTable result;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        // Remove trailing \r
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (line.empty() || line[0] == '#') continue;

        std::string source;
        std::string target;
        auto tab = line.find('\t');
        if (tab == std::string::npos) {
            source = line;
        } else {
            source = line.substr(0, tab);
            target = line.substr(tab + 1);
        }

        if (source.empty()) {
            err.set(ErrorKind::kParse,
                    path + ":" + std::to_string(line_no) +
                    ": correction entry has an empty source");
            return false;
        }
        result[source] = target;
    }

    if (result.empty()) {
        err.set(ErrorKind::kParse, "No correction entries found in " + path);
        return false;
    }

    table.swap(result);
    return true;
}

} // namespace protfasta
