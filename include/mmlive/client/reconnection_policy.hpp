#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace mmlive {

// ─────────────────────────────────────────────────────────────────────────────
// Reconnection State
// ─────────────────────────────────────────────────────────────────────────────

struct ReconnectionState {
    bool enabled{true};
    std::size_t attempts{0};
    std::size_t max_attempts{5};
    std::chrono::milliseconds base_delay{1000};
};

// ─────────────────────────────────────────────────────────────────────────────
// Reconnection Policy
// ─────────────────────────────────────────────────────────────────────────────
// Attempt budget plus exponential delay:
//
//   delay = base * 2^attempts
//
//   Attempt 0: 1000ms
//   Attempt 1: 2000ms
//   Attempt 2: 4000ms
//   Attempt 3: 8000ms
//   Attempt 4: 16000ms
//
// The attempt ceiling, not a delay cap, bounds the schedule; delays only
// saturate at kMaxReconnectDelay so a timer deadline never overflows. Once
// the budget is spent the policy disables itself and stays disabled until
// set_enabled(true).
//
// Not thread-safe; LiveClient guards it with its own mutex.
//
// Usage:
//   ReconnectionPolicy policy(5, 1000ms);
//   if (auto delay = policy.schedule()) {
//       timer.expires_after(*delay);
//   }

inline constexpr std::chrono::milliseconds kMaxReconnectDelay =
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds::max()) / 4;

class ReconnectionPolicy {
public:
    ReconnectionPolicy(std::size_t max_attempts, std::chrono::milliseconds base_delay);

    /// Delay for the current attempt count. Does not consume an attempt.
    [[nodiscard]] std::chrono::milliseconds next_delay() const;

    /// Consume one attempt and return its delay, or disable the policy and
    /// return nullopt when the budget is exhausted.
    [[nodiscard]] std::optional<std::chrono::milliseconds> schedule();

    /// Successful connection: attempt counter back to zero.
    void reset() noexcept;

    /// Explicit toggle. Either direction resets the attempt counter.
    void set_enabled(bool enabled) noexcept;

    [[nodiscard]] bool enabled() const noexcept { return state_.enabled; }
    [[nodiscard]] std::size_t attempts() const noexcept { return state_.attempts; }
    [[nodiscard]] std::size_t max_attempts() const noexcept { return state_.max_attempts; }

private:
    ReconnectionState state_;
};

}  // namespace mmlive
