#include "core/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <set>

namespace core {

namespace {
LogLevel level_from_env() {
    if (const char* lvl = std::getenv("STREAMSCRIBE_LOG_LEVEL")) {
        std::string s(lvl);
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (s == "debug") return LogLevel::Debug;
        if (s == "warn" || s == "warning") return LogLevel::Warn;
        if (s == "error") return LogLevel::Error;
        return LogLevel::Info;
    }
    return std::getenv("STREAMSCRIBE_DEBUG") != nullptr ? LogLevel::Debug : LogLevel::Info;
}

std::atomic<int>& level_storage() {
    static std::atomic<int> level{static_cast<int>(level_from_env())};
    return level;
}

// Serializes writers so lines from pipeline threads do not interleave
std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

bool enabled(LogLevel level) {
    return static_cast<int>(level) >= level_storage().load();
}
} // namespace

LogLevel log_level() { return static_cast<LogLevel>(level_storage().load()); }
void set_log_level(LogLevel level) { level_storage().store(static_cast<int>(level)); }
bool is_verbose() { return enabled(LogLevel::Debug); }

void log_debug(const std::string& msg) {
    if (!enabled(LogLevel::Debug)) return;
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "[DEBUG] " << msg << std::endl;
}

void log_info(const std::string& msg) {
    if (!enabled(LogLevel::Info)) return;
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cout << "[INFO] " << msg << std::endl;
}

void log_warn(const std::string& msg) {
    if (!enabled(LogLevel::Warn)) return;
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "[WARN] " << msg << std::endl;
}

void log_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << "[ERROR] " << msg << std::endl;
}

void log_warn_once(const std::string& key, const std::string& msg) {
    static std::mutex seen_mutex;
    static std::set<std::string> seen;
    {
        std::lock_guard<std::mutex> lock(seen_mutex);
        if (!seen.insert(key).second) return;
    }
    log_warn(msg);
}

} // namespace core
