#include "clearhouse/infra/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace clearhouse::infra {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::INFO)};
std::mutex g_write_mtx;

} // namespace

const char* level_str(LogLevel l) noexcept {
    switch (l) {
        case LogLevel::QUIET: return "quiet";
        case LogLevel::ERROR: return "error";
        case LogLevel::INFO:  return "info";
        case LogLevel::DEBUG: return "debug";
    }
    return "info";
}

bool parse_level(const std::string& s, LogLevel& out) noexcept {
    if (s == "quiet") { out = LogLevel::QUIET; return true; }
    if (s == "error") { out = LogLevel::ERROR; return true; }
    if (s == "info")  { out = LogLevel::INFO;  return true; }
    if (s == "debug") { out = LogLevel::DEBUG; return true; }
    return false;
}

void Log::set_level(LogLevel l) noexcept {
    g_level.store(static_cast<uint8_t>(l), std::memory_order_relaxed);
}

LogLevel Log::level() noexcept {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool Log::enabled(LogLevel l) noexcept {
    if (l == LogLevel::QUIET) return false;
    return static_cast<uint8_t>(l) <= g_level.load(std::memory_order_relaxed);
}

void Log::write(LogLevel l, const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_write_mtx);
    std::ostream& os = (l == LogLevel::ERROR) ? std::cerr : std::cout;
    os << "[" << tag << "] " << msg << "\n";
}

} // namespace clearhouse::infra
