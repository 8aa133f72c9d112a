#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace protfasta {

enum class ErrorKind : uint8_t {
    kNone = 0,
    kFile = 1,             // unreadable input / missing file
    kParse = 2,            // duplicate header during strict parse, bad table file
    kInvalidSequence = 3,  // residue outside the active alphabet
    kDuplicate = 4,        // duplicate header / sequence / record
    kInvalidPolicy = 5,    // bad option or incompatible configuration
    kWrite = 6,            // empty sequence or output I/O failure
};

// Error filled in by every fallible operation. Functions report failure by
// returning false; the Error then holds the kind and a readable message.
struct Error {
    ErrorKind kind = ErrorKind::kNone;
    std::string message;

    bool ok() const { return kind == ErrorKind::kNone; }

    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }

    void clear() {
        kind = ErrorKind::kNone;
        message.clear();
    }
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone:            return "None";
        case ErrorKind::kFile:            return "FileError";
        case ErrorKind::kParse:           return "ParseError";
        case ErrorKind::kInvalidSequence: return "InvalidSequenceError";
        case ErrorKind::kDuplicate:       return "DuplicateError";
        case ErrorKind::kInvalidPolicy:   return "InvalidPolicyError";
        case ErrorKind::kWrite:           return "WriteError";
    }
    return "UnknownError";
}

} // namespace protfasta
