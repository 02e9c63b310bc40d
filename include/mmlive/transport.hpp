#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by the session contract and every transport binding.
//
// For the session contract, use: #include "mmlive/transport/live_transport.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mmlive {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Network,    // Socket / connection level failure
        Timeout,    // Open or send did not complete in time
        Protocol,   // Service rejected the request (bad model, bad config, stale handle)
        Closed      // Session already closed
    };

    Category category{};
    std::string message;
    std::optional<int> code{};  // Service or close code, when one was reported

    [[nodiscard]] static TransportError network(std::string msg) {
        return {Category::Network, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError protocol(std::string msg, std::optional<int> code = std::nullopt) {
        return {Category::Protocol, std::move(msg), code};
    }

    [[nodiscard]] static TransportError closed() {
        return {Category::Closed, "Session is closed", std::nullopt};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:  return "Network";
        case TransportError::Category::Timeout:  return "Timeout";
        case TransportError::Category::Protocol: return "Protocol";
        case TransportError::Category::Closed:   return "Closed";
    }
    return "Unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mmlive
