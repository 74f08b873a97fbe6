#pragma once
#include <functional>
#include <string>

namespace fillcast {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* to_string(LogLevel lvl);

// Global verbosity (default Info). Messages below it are dropped.
void set_log_level(LogLevel lvl) noexcept;
LogLevel get_log_level() noexcept;

// Receives every message that passes the level filter. An empty function
// restores the default sink (stdout for Debug/Info, stderr for Warn/Error).
using LogSink = std::function<void(LogLevel, const std::string&)>;
void set_log_sink(LogSink sink);

// Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

inline void log_debug(const std::string& msg) noexcept { log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg) noexcept  { log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg) noexcept  { log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) noexcept { log(LogLevel::Error, msg); }

} // namespace fillcast
