#include <semilog-cpp/log.hpp>

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>
#include <utility>

namespace semilog_cpp {

namespace {

auto timestamp_now() -> std::string {
    char buf[64];
    const auto t = std::time(nullptr);
    auto tmv = std::tm{};
    localtime_r(&t, &tmv);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return std::string{buf};
}

void stderr_sink(LogLevel level, const std::string& msg) {
    std::cerr << "[" << timestamp_now() << "][" << to_string_view(level) << "] "
              << msg << std::endl;
}

std::atomic<LogLevel> current_level{LogLevel::info};
std::mutex sink_mutex;
LogSink current_sink = stderr_sink;

void log_common(LogLevel level, const std::string& msg) {
    if (level < current_level.load(std::memory_order_relaxed)) return;
    auto sink = LogSink{};
    {
        auto lock = std::lock_guard{sink_mutex};
        sink = current_sink;
    }
    // Called unlocked so a sink may itself log or replace the sink.
    sink(level, msg);
}

}  // namespace

auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info:  return "INFO";
        case LogLevel::warn:  return "WARN";
        case LogLevel::error: return "ERROR";
        case LogLevel::off:   return "OFF";
    }
    return "UNKNOWN";
}

auto parse_log_level(std::string_view name) -> std::optional<LogLevel> {
    if (name == "debug") return LogLevel::debug;
    if (name == "info") return LogLevel::info;
    if (name == "warn") return LogLevel::warn;
    if (name == "error") return LogLevel::error;
    if (name == "off") return LogLevel::off;
    return std::nullopt;
}

void set_log_level(LogLevel level) {
    current_level.store(level, std::memory_order_relaxed);
}

auto log_level() -> LogLevel {
    return current_level.load(std::memory_order_relaxed);
}

void set_log_sink(LogSink sink) {
    auto lock = std::lock_guard{sink_mutex};
    current_sink = sink ? std::move(sink) : LogSink{stderr_sink};
}

void log_debug(const std::string& msg) { log_common(LogLevel::debug, msg); }
void log_info(const std::string& msg) { log_common(LogLevel::info, msg); }
void log_warn(const std::string& msg) { log_common(LogLevel::warn, msg); }
void log_error(const std::string& msg) { log_common(LogLevel::error, msg); }

}  // namespace semilog_cpp
