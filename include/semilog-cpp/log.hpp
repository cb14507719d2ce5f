/// @file log.hpp
/// @brief Leveled, timestamped logging with a replaceable sink.
///
/// The default sink writes `[YYYY-mm-dd HH:MM:SS][LEVEL] message` lines to
/// stderr. Messages below the current level are dropped before they reach
/// the sink.

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace semilog_cpp {

/// Log severity, in increasing order. `off` silences everything.
enum class LogLevel : std::uint8_t {
    debug,
    info,
    warn,
    error,
    off,
};

/// Convert a LogLevel to its upper-case label ("DEBUG", "INFO", ...).
auto to_string_view(LogLevel level) noexcept -> std::string_view;

/// Parse "debug", "info", "warn", "error" or "off".
auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/// Receives every message that passes the level filter.
using LogSink = std::function<void(LogLevel, const std::string&)>;

/// Set the minimum level that is logged. Defaults to info.
void set_log_level(LogLevel level);

/// Current minimum level.
auto log_level() -> LogLevel;

/// Replace the sink. An empty function restores the stderr sink.
void set_log_sink(LogSink sink);

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

}  // namespace semilog_cpp
