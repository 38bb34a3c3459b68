#pragma once

#include "c11n/interfaces/i_http_transport.hpp"
#include "c11n/configuration/transport_config.hpp"
#include "c11n/models/encrypted_payload_hash.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace google::protobuf {
class Message;
}

namespace c11n::client {

using core::Result;
using core::NodeClientFailure;
using models::EncryptedPayloadHash;
using transport::HttpResponse;

/**
 * @brief Request/response client for the node's payload API
 *
 * Every call is a single synchronous exchange over the shared transport.
 * Transport failures are returned unchanged. Any status other than 200
 * becomes UnexpectedStatus with the status code and response headers, and
 * the body of such a response is never decoded.
 *
 * Keys and participants are passed as standard base64 strings, the form the
 * node uses in its headers.
 *
 * Thread-safe: the client holds no mutable state.
 */
class PayloadClient {
public:
    using Bytes = std::vector<uint8_t>;

    explicit PayloadClient(std::shared_ptr<const interfaces::IHttpTransport> transport);

    /// Client bound to the node socket at `socket_path` with default timeouts
    [[nodiscard]] static PayloadClient Create(
        std::string socket_path,
        configuration::TransportConfig config = configuration::TransportConfig::Default());

    // =========================================================================
    // Raw endpoints
    // =========================================================================

    /// POST `message` as JSON to `path` and return the successful response as is
    [[nodiscard]] Result<HttpResponse, NodeClientFailure> SendJson(
        std::string_view path,
        const google::protobuf::Message& message) const;

    /**
     * @brief Store `payload` for `to` and return the key the node assigned
     *
     * `c11n-from` is sent only when `from` is non-empty, so the node falls
     * back to its default sender key.
     */
    [[nodiscard]] Result<Bytes, NodeClientFailure> SendPayload(
        std::span<const uint8_t> payload,
        std::string_view from,
        const std::vector<std::string>& to) const;

    /// Distribute a payload the node already holds under a signed hash
    [[nodiscard]] Result<Bytes, NodeClientFailure> SendSignedPayload(
        std::span<const uint8_t> signed_payload,
        const std::vector<std::string>& to) const;

    /// Payload stored under `key`, returned without decoding
    [[nodiscard]] Result<Bytes, NodeClientFailure> ReceivePayload(
        std::span<const uint8_t> key) const;

    /// True only when the node answers with exactly `true`
    [[nodiscard]] Result<bool, NodeClientFailure> IsSender(
        const EncryptedPayloadHash& hash) const;

    /// Comma-separated body split verbatim; an empty body yields one empty entry
    [[nodiscard]] Result<std::vector<std::string>, NodeClientFailure> GetParticipants(
        const EncryptedPayloadHash& hash) const;

    // =========================================================================
    // Structured endpoints
    // =========================================================================

    [[nodiscard]] Result<Bytes, NodeClientFailure> Send(
        std::span<const uint8_t> payload,
        std::string_view from,
        const std::vector<std::string>& to) const;

    [[nodiscard]] Result<Bytes, NodeClientFailure> Receive(
        std::span<const uint8_t> key,
        std::string_view to) const;

private:
    [[nodiscard]] Result<HttpResponse, NodeClientFailure> Execute(
        const transport::HttpRequest& request) const;

    [[nodiscard]] Result<HttpResponse, NodeClientFailure> PostBinary(
        std::string_view path,
        std::span<const uint8_t> body,
        std::string_view from,
        const std::vector<std::string>& to) const;

    [[nodiscard]] Result<HttpResponse, NodeClientFailure> GetTransaction(
        const EncryptedPayloadHash& hash,
        std::string_view suffix) const;

    std::shared_ptr<const interfaces::IHttpTransport> transport_;
};

} // namespace c11n::client
