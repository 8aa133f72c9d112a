#pragma once

#include <cstdio>
#include <cstdarg>

namespace protfasta {

// Simple printf-style logger. The CLI points it at stdout so that
// -silent can suppress every informational line; library code defaults
// to stderr.
class Logger {
public:
    enum Level { kSilent = -1, kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::FILE* out = stderr)
        : level_(level), out_(out) {}

    bool silent() const { return level_ == kSilent; }

    void warn(const char* fmt, ...) const {
        if (level_ < kWarn) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("WARNING", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        if (level_ < kInfo) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        if (level_ < kDebug) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    std::FILE* out_;

    void log_impl(const char* tag, const char* fmt, va_list ap) const {
        std::fprintf(out_, "[%s]: ", tag);
        std::vfprintf(out_, fmt, ap);
        std::fprintf(out_, "\n");
    }
};

} // namespace protfasta
