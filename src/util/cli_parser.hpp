#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace protfasta {

// Simple command-line argument parser for -key value style arguments.
// Keys listed in `flags` never take a value, so a flag may be followed
// directly by a positional argument.
class CliParser {
public:
    CliParser(int argc, char* argv[],
              const std::unordered_set<std::string>& flags = {});

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Get string value for a key; the last occurrence wins.
    // Returns default_val if not found.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // Get the program name (argv[0]).
    const std::string& program() const { return program_; }

    // Get positional arguments (those not preceded by a -key).
    const std::vector<std::string>& positional() const { return positional_; }

    // Keys present on the command line that are not in `known`.
    std::vector<std::string> unknown_keys(
        const std::unordered_set<std::string>& known) const;

private:
    std::string program_;
    std::unordered_map<std::string, std::string> opts_;
    std::vector<std::string> order_;
    std::vector<std::string> positional_;

    void add(const std::string& key, std::string value);
};

} // namespace protfasta
