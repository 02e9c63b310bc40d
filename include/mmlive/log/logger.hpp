#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace mmlive {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Every inbound message and audio buffer
    Debug = 1,  // Ignored connects, retired sessions
    Info  = 2,  // Connect, reconnect, handover
    Warn  = 3,  // Dropped sends, undecodable audio, GoAway
    Error = 4,  // Failed opens, rejected configuration
    Fatal = 5,  // Reconnection exhausted
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Case-insensitive; "warning" and "critical" are accepted as aliases.
/// Unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────
// `category` mirrors the `log` notification type ("client.open",
// "server.goaway", ...); empty for free-form diagnostics.

struct LogRecord {
    LogLevel level;
    std::string category;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string cat,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , category(std::move(cat))
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger - operational log sink injected into LiveClient
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void event(
        LogLevel level,
        std::string_view category,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        write(level, category, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, {}, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, {}, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, {}, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, {}, msg, loc);
    }

    // Formatting is skipped entirely below the threshold.
    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        write_fmt(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

private:
    void write(LogLevel level, std::string_view category, std::string_view msg, std::source_location loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(category), std::string(msg), loc));
        }
    }

    template<typename... Args>
    void write_fmt(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, {}, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────
// A LiveClient configured without a logger writes here. NullLogger until
// set_logger() installs something else.

[[nodiscard]] ILogger& get_logger() noexcept;

/// Takes ownership. nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

/// Shared handle that forwards to whichever logger is installed at the time
/// of each call, so clients built before set_logger() still follow it.
[[nodiscard]] std::shared_ptr<ILogger> global_logger_handle();

}  // namespace mmlive
