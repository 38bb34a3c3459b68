#pragma once

#include "c11n/interfaces/i_http_transport.hpp"
#include "c11n/configuration/transport_config.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace c11n::transport {

using configuration::TransportConfig;

/// `http+unix://c/<target>`; `target` must already be escaped
[[nodiscard]] std::string NodeUrl(std::string_view target);

/**
 * @brief HTTP transport that reaches the node through its Unix domain socket
 *
 * Requests are addressed to the virtual host `c` (`http+unix://c/<path>`);
 * any other host is rejected with a Transport failure. Each exchange opens
 * its own connection, so one transport may be shared between threads.
 *
 * Timeouts (see TransportConfig):
 * - connect is bounded by the dial timeout
 * - headers must arrive within the header timeout after the request is written
 * - the whole exchange is bounded by the request timeout
 */
class LocalTransport final : public interfaces::IHttpTransport {
public:
    explicit LocalTransport(
        std::string socket_path,
        TransportConfig config = TransportConfig::Default());

    [[nodiscard]] static std::shared_ptr<const LocalTransport> Create(
        std::string socket_path,
        TransportConfig config = TransportConfig::Default());

    [[nodiscard]] Result<HttpResponse, NodeClientFailure> RoundTrip(
        const HttpRequest& request) const override;

    [[nodiscard]] const std::string& SocketPath() const noexcept { return socket_path_; }
    [[nodiscard]] const TransportConfig& Config() const noexcept { return config_; }

private:
    std::string socket_path_;
    TransportConfig config_;
};

} // namespace c11n::transport
