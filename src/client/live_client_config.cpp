#include "mmlive/client/live_client_config.hpp"

namespace mmlive {

LiveClientConfig& LiveClientConfig::with_max_reconnect_attempts(std::size_t attempts) {
    max_reconnect_attempts = attempts;
    return *this;
}

LiveClientConfig& LiveClientConfig::with_reconnect_base_delay(std::chrono::milliseconds delay) {
    reconnect_base_delay = delay;
    return *this;
}

LiveClientConfig& LiveClientConfig::with_auto_reconnect(bool enabled) {
    auto_reconnect = enabled;
    return *this;
}

LiveClientConfig& LiveClientConfig::with_normal_closure_code(int code) {
    normal_closure_code = code;
    return *this;
}

LiveClientConfig& LiveClientConfig::with_goaway_lead_time(std::chrono::milliseconds lead_time) {
    goaway_lead_time = lead_time;
    return *this;
}

LiveClientConfig& LiveClientConfig::with_logger(std::shared_ptr<ILogger> sink) {
    logger = std::move(sink);
    return *this;
}

tl::expected<void, std::string> LiveClientConfig::validate() const {
    if (reconnect_base_delay.count() <= 0) {
        return tl::unexpected(std::string("reconnect_base_delay must be positive"));
    }
    if (goaway_lead_time.count() < 0) {
        return tl::unexpected(std::string("goaway_lead_time must not be negative"));
    }
    return {};
}

}  // namespace mmlive
