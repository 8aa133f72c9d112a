#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace protfasta {

// Parse a non-negative decimal count for option `name` (e.g. "-shortest_seq").
// Returns false and sets error_msg on empty input, trailing garbage,
// a sign, or overflow.
inline bool parse_count(const std::string& name, const std::string& value,
                        uint64_t& out, std::string& error_msg) {
    if (value.empty() || value[0] == '-' || value[0] == '+') {
        error_msg = name + " must be a non-negative integer (got '" + value + "')";
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0') {
        error_msg = name + " must be a non-negative integer (got '" + value + "')";
        return false;
    }
    if (errno == ERANGE) {
        error_msg = name + " is out of range (got '" + value + "')";
        return false;
    }
    out = static_cast<uint64_t>(v);
    return true;
}

} // namespace protfasta
