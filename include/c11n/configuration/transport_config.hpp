#pragma once

#include "c11n/core/constants.hpp"

#include <chrono>
#include <cstddef>

namespace c11n::configuration {

/// Timeouts and limits for the Unix-socket HTTP transport
///
/// The peer is a local process that is already running, so every bound is
/// short. A timeout means the node is hung, not that the network is slow.
///
/// - connect_timeout: establishing the socket connection
/// - request_timeout: whole exchange, connect through last body byte
/// - response_header_timeout: from end of request write to end of headers
///
/// @example
/// ```cpp
/// auto config = TransportConfig::Default();   // 1s / 5s / 5s
/// ```
class TransportConfig {
public:
    using Duration = std::chrono::milliseconds;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Fixed production timeouts used by every client
    [[nodiscard]] static constexpr TransportConfig Default() noexcept {
        return TransportConfig(
            core::NodeConstants::DIAL_TIMEOUT,
            core::NodeConstants::REQUEST_TIMEOUT,
            core::NodeConstants::RESPONSE_HEADER_TIMEOUT);
    }

    explicit constexpr TransportConfig(
        const Duration connect_timeout,
        const Duration request_timeout,
        const Duration response_header_timeout,
        const size_t max_header_bytes = core::NodeConstants::MAX_RESPONSE_HEADER_BYTES) noexcept
        : connect_timeout_(connect_timeout)
        , request_timeout_(request_timeout)
        , response_header_timeout_(response_header_timeout)
        , max_header_bytes_(max_header_bytes) {}

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] constexpr Duration ConnectTimeout() const noexcept {
        return connect_timeout_;
    }

    [[nodiscard]] constexpr Duration RequestTimeout() const noexcept {
        return request_timeout_;
    }

    [[nodiscard]] constexpr Duration ResponseHeaderTimeout() const noexcept {
        return response_header_timeout_;
    }

    [[nodiscard]] constexpr size_t MaxHeaderBytes() const noexcept {
        return max_header_bytes_;
    }

    [[nodiscard]] constexpr bool operator==(const TransportConfig& other) const noexcept {
        return connect_timeout_ == other.connect_timeout_
            && request_timeout_ == other.request_timeout_
            && response_header_timeout_ == other.response_header_timeout_
            && max_header_bytes_ == other.max_header_bytes_;
    }

private:
    Duration connect_timeout_;
    Duration request_timeout_;
    Duration response_header_timeout_;
    size_t max_header_bytes_;
};

} // namespace c11n::configuration
