#pragma once

#include "mmlive/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace mmlive {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Categorized records are rendered as "[category] message" so that session
// transcripts can be grepped by event kind ("server.goaway", "client.send").

class SpdlogLogger final : public ILogger {
public:
    /// Console (stdout, colored) sink
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// File sink
    SpdlogLogger(const std::string& filename, LogLevel min_level = LogLevel::Info);

    /// Multiple sinks
    SpdlogLogger(
        std::vector<spdlog::sink_ptr> sinks,
        LogLevel min_level = LogLevel::Info
    );

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;
    SpdlogLogger(SpdlogLogger&&) noexcept = default;
    SpdlogLogger& operator=(SpdlogLogger&&) noexcept = default;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;

    /// spdlog pattern syntax
    void set_pattern(const std::string& pattern);

    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Console plus file, e.g. for keeping a full session transcript on disk
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Non-blocking console logger. Transport callbacks log on the transport's
/// read path, so this keeps slow terminals from stalling the socket.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level = LogLevel::Info,
    std::size_t queue_size = 8192,
    std::size_t thread_count = 1
);

}  // namespace mmlive
