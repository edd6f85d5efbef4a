#pragma once
#include <string>

namespace core {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Minimum level that reaches the console. Defaults to Info, or Debug when
// STREAMSCRIBE_DEBUG is set; STREAMSCRIBE_LOG_LEVEL (debug|info|warn|error) overrides both.
LogLevel log_level();
void set_log_level(LogLevel level);
bool is_verbose();

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

// Emits the warning only the first time a given key is seen in this process
void log_warn_once(const std::string& key, const std::string& msg);

} // namespace core
