#include "mmlive/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace mmlive {

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info")  return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal" || lower == "critical") return LogLevel::Fatal;
    if (lower == "off")   return LogLevel::Off;
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& installed_logger() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& install_mutex() {
    static std::mutex mutex;
    return mutex;
}

class GlobalLoggerProxy final : public ILogger {
public:
    void log(const LogRecord& record) override {
        get_logger().log(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return get_logger().should_log(level);
    }
};

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(install_mutex());
    return *installed_logger();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(install_mutex());
    if (logger) {
        installed_logger() = std::move(logger);
    } else {
        installed_logger() = std::make_unique<NullLogger>();
    }
}

std::shared_ptr<ILogger> global_logger_handle() {
    static const std::shared_ptr<ILogger> proxy = std::make_shared<GlobalLoggerProxy>();
    return proxy;
}

}  // namespace mmlive
