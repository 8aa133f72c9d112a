#include "util/cli_parser.hpp"

#include <utility>

namespace protfasta {

CliParser::CliParser(int argc, char* argv[],
                     const std::unordered_set<std::string>& flags) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-') {
            // Handle --key=value syntax for double-dash args
            if (arg.size() >= 3 && arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    add(arg.substr(0, eq), arg.substr(eq + 1));
                    continue;
                }
            }

            if (flags.count(arg) > 0) {
                add(arg, "1");
                continue;
            }

            // Check if this is a flag (no value) or key-value pair
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                add(arg, argv[i + 1]);
                i++;
            } else {
                add(arg, "1");
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

void CliParser::add(const std::string& key, std::string value) {
    auto ins = opts_.insert_or_assign(key, std::move(value));
    if (ins.second) order_.push_back(key);
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                  const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return default_val;
}

std::vector<std::string> CliParser::unknown_keys(
    const std::unordered_set<std::string>& known) const {
    std::vector<std::string> result;
    for (const auto& key : order_) {
        if (known.count(key) == 0) result.push_back(key);
    }
    return result;
}

} // namespace protfasta
