#ifndef MMLIVE_CLIENT_LIVE_CLIENT_CONFIG_HPP
#define MMLIVE_CLIENT_LIVE_CLIENT_CONFIG_HPP

#include "mmlive/log/logger.hpp"
#include "mmlive/transport/live_transport.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <tl/expected.hpp>

namespace mmlive {

// ─────────────────────────────────────────────────────────────────────────────
// Live Client Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Reconnection and shutdown tunables for LiveClient. The defaults match the
// live service; tests shrink the delays to keep timer-driven cases fast.

struct LiveClientConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Reconnection
    // ─────────────────────────────────────────────────────────────────────────

    // Abnormal closures and failed connects are retried this many times
    // before auto-reconnect switches itself off.
    std::size_t max_reconnect_attempts{5};

    // First backoff delay; each further attempt doubles it.
    std::chrono::milliseconds reconnect_base_delay{1000};

    // Whether abnormal closures trigger reconnection at all.
    bool auto_reconnect{true};

    // ─────────────────────────────────────────────────────────────────────────
    // Session Shutdown
    // ─────────────────────────────────────────────────────────────────────────

    // Close code that counts as a clean shutdown (never reconnected).
    int normal_closure_code{kNormalClosureCode};

    // On a GoAway warning the replacement session is opened this long
    // before the announced deadline.
    std::chrono::milliseconds goaway_lead_time{1000};

    // ─────────────────────────────────────────────────────────────────────────
    // Diagnostics
    // ─────────────────────────────────────────────────────────────────────────

    // Operational log sink. Null = the global logger.
    std::shared_ptr<ILogger> logger;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────
    //   LiveClientConfig{}.with_reconnect_base_delay(10ms).with_max_reconnect_attempts(2)

    LiveClientConfig& with_max_reconnect_attempts(std::size_t attempts);
    LiveClientConfig& with_reconnect_base_delay(std::chrono::milliseconds delay);
    LiveClientConfig& with_auto_reconnect(bool enabled);
    LiveClientConfig& with_normal_closure_code(int code);
    LiveClientConfig& with_goaway_lead_time(std::chrono::milliseconds lead_time);
    LiveClientConfig& with_logger(std::shared_ptr<ILogger> sink);

    /// Reject values the client cannot run with.
    [[nodiscard]] tl::expected<void, std::string> validate() const;
};

}  // namespace mmlive

#endif  // MMLIVE_CLIENT_LIVE_CLIENT_CONFIG_HPP
