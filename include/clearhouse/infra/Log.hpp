#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace clearhouse::infra {

enum class LogLevel : uint8_t { QUIET = 0, ERROR = 1, INFO = 2, DEBUG = 3 };

const char* level_str(LogLevel l) noexcept;
bool parse_level(const std::string& s, LogLevel& out) noexcept;

// ---------------------------------------------------------------------------
// Console logging. Lines look like "[GOVERNOR] candidate multihop done".
// INFO/DEBUG go to stdout, ERROR to stderr. Each line is assembled locally
// and written under one lock so candidate threads never interleave mid-line.
// ---------------------------------------------------------------------------
class Log {
public:
    static void set_level(LogLevel l) noexcept;
    static LogLevel level() noexcept;
    static bool enabled(LogLevel l) noexcept;

    static void write(LogLevel l, const char* tag, const std::string& msg);
};

class LogLine {
public:
    LogLine(LogLevel l, const char* tag) : level_(l), tag_(tag), on_(Log::enabled(l)) {}
    ~LogLine() {
        if (on_) Log::write(level_, tag_, buf_.str());
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template<typename T>
    LogLine& operator<<(const T& v) {
        if (on_) buf_ << v;
        return *this;
    }

private:
    LogLevel level_;
    const char* tag_;
    bool on_;
    std::ostringstream buf_;
};

inline LogLine log_info(const char* tag)  { return LogLine(LogLevel::INFO, tag); }
inline LogLine log_debug(const char* tag) { return LogLine(LogLevel::DEBUG, tag); }
inline LogLine log_error(const char* tag) { return LogLine(LogLevel::ERROR, tag); }

} // namespace clearhouse::infra
