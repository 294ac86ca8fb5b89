#pragma once

#include <cstdint>
#include <cstdio>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>

namespace cogstream {

enum class LogLevel : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "off";
}

/// Parse a level name as accepted in COGSTREAM_LOG_LEVEL (case-sensitive, lower case)
[[nodiscard]] inline std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
        if (log_level_name(level) == name) {
            return level;
        }
    }
    if (name == "warning") {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

/// Receives every message at or above the logger's level
using LogSink = std::function<void(LogLevel, std::string_view)>;

/// Small leveled logger. Messages are formatted with {fmt} only when enabled;
/// without a sink they are printed to stderr as "[cogstream] <level>: <message>".
/// The sink may be called from several threads at once.
class Logger {
private:
    LogLevel level_{LogLevel::Warn};
    LogSink sink_;

    void emit(LogLevel level, std::string_view message) const {
        if (sink_) {
            sink_(level, message);
        } else {
            fmt::print(stderr, "[cogstream] {}: {}\n", log_level_name(level), message);
        }
    }

public:
    Logger() = default;

    explicit Logger(LogLevel level, LogSink sink = {})
        : level_(level), sink_(std::move(sink)) {}

    [[nodiscard]] LogLevel level() const noexcept { return level_; }

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return level_ != LogLevel::Off && level != LogLevel::Off && level >= level_;
    }

    template <typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) const {
        if (!enabled(level)) {
            return;
        }
        emit(level, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) const {
        log(LogLevel::Trace, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) const {
        log(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) const {
        log(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) const {
        log(LogLevel::Warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) const {
        log(LogLevel::Error, format, std::forward<Args>(args)...);
    }
};

} // namespace cogstream
