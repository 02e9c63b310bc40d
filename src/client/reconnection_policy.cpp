#include "mmlive/client/reconnection_policy.hpp"

#include <cmath>
#include <cstdint>

namespace mmlive {

ReconnectionPolicy::ReconnectionPolicy(
    std::size_t max_attempts,
    std::chrono::milliseconds base_delay
)
    : state_{true, 0, max_attempts, base_delay}
{}

std::chrono::milliseconds ReconnectionPolicy::next_delay() const {
    const double exponent = static_cast<double>(state_.attempts);
    const double base_ms = static_cast<double>(state_.base_delay.count());
    const double delay_ms = base_ms * std::pow(2.0, exponent);

    if (delay_ms >= static_cast<double>(kMaxReconnectDelay.count())) {
        return kMaxReconnectDelay;
    }
    return std::chrono::milliseconds{static_cast<std::int64_t>(delay_ms)};
}

std::optional<std::chrono::milliseconds> ReconnectionPolicy::schedule() {
    const bool exhausted = (state_.attempts >= state_.max_attempts);
    if (exhausted) {
        state_.enabled = false;
        return std::nullopt;
    }

    const auto delay = next_delay();
    ++state_.attempts;
    return delay;
}

void ReconnectionPolicy::reset() noexcept {
    state_.attempts = 0;
}

void ReconnectionPolicy::set_enabled(bool enabled) noexcept {
    state_.enabled = enabled;
    state_.attempts = 0;
}

}  // namespace mmlive
