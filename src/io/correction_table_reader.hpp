#pragma once

#include <string>

#include "core/alphabet.hpp"
#include "core/error.hpp"

namespace protfasta {

// Read a correction table file.
// One entry per line: SOURCE<TAB>TARGET. A line without a tab maps SOURCE
// to the empty string (deletion). Empty lines and lines starting with '#' are skipped,
// trailing '\r' is removed. Later lines override earlier ones.
// Fails with kFile if the file cannot be opened, kParse on an empty SOURCE
// or a file without entries.
bool read_correction_table(const std::string& path, CorrectionTable& table,
                           Error& err);

} // namespace protfasta
