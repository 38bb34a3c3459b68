#include "c11n/client/payload_client.hpp"
#include "c11n/transport/local_transport.hpp"
#include "c11n/encoding/base64.hpp"
#include "c11n/encoding/participant_list.hpp"
#include "c11n/encoding/path_segment.hpp"
#include "c11n/core/constants.hpp"
#include "c11n/debug/ipc_logger.hpp"
#include "c11n/node_api.pb.h"

#include <google/protobuf/util/json_util.h>
#include <fmt/core.h>

#include <utility>

namespace c11n::client {

using core::ApiPaths;
using core::ContentTypes;
using core::ErrorMessages;
using core::HeaderNames;
using core::HttpConstants;
using core::NodeConstants;
using core::Unit;
using debug::Component;
using encoding::Base64;
using encoding::ParticipantList;
using encoding::PathSegment;
using transport::HttpRequest;

namespace {
    std::string ToBinaryString(std::span<const uint8_t> bytes) {
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    PayloadClient::Bytes ToBytes(const std::string& binary) {
        return PayloadClient::Bytes(binary.begin(), binary.end());
    }

    Result<Unit, NodeClientFailure> ParseJsonBody(
        const std::string& body,
        google::protobuf::Message& message) {
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;
        const auto status = google::protobuf::util::JsonStringToMessage(body, &message, options);
        if (!status.ok()) {
            return Result<Unit, NodeClientFailure>::Err(
                NodeClientFailure::Decoding(
                    fmt::format("Invalid {} response: {}",
                                std::string(message.GetDescriptor()->name()), status.ToString())));
        }
        return Result<Unit, NodeClientFailure>::Ok(core::unit);
    }
}

PayloadClient::PayloadClient(std::shared_ptr<const interfaces::IHttpTransport> transport)
    : transport_(std::move(transport)) {}

PayloadClient PayloadClient::Create(std::string socket_path, const configuration::TransportConfig config) {
    return PayloadClient(transport::LocalTransport::Create(std::move(socket_path), config));
}

// ============================================================================
// Shared request path
// ============================================================================

Result<HttpResponse, NodeClientFailure> PayloadClient::Execute(const HttpRequest& request) const {
    auto response_result = transport_->RoundTrip(request);
    if (response_result.IsErr()) {
        return response_result;
    }
    auto response = std::move(response_result).Unwrap();
    if (response.status_code != HttpConstants::STATUS_OK) {
        auto failure = NodeClientFailure::UnexpectedStatus(
            fmt::format("{}: {} {}", ErrorMessages::NON_200_STATUS, response.status_code, response.reason),
            response.status_code,
            std::move(response.headers));
        C11N_LOG_FAILURE(Component::Client, failure);
        return Result<HttpResponse, NodeClientFailure>::Err(std::move(failure));
    }
    return Result<HttpResponse, NodeClientFailure>::Ok(std::move(response));
}

Result<HttpResponse, NodeClientFailure> PayloadClient::PostBinary(
    std::string_view path,
    std::span<const uint8_t> body,
    std::string_view from,
    const std::vector<std::string>& to) const {
    auto request_result = HttpRequest::Create(HttpConstants::METHOD_POST, transport::NodeUrl(path));
    if (request_result.IsErr()) {
        return Result<HttpResponse, NodeClientFailure>::Err(std::move(request_result).UnwrapErr());
    }
    auto request = std::move(request_result).Unwrap();
    if (!from.empty()) {
        request.SetHeader(HeaderNames::FROM, from);
    }
    request.SetHeader(HeaderNames::TO, ParticipantList::Join(to));
    request.SetHeader(HeaderNames::CONTENT_TYPE, ContentTypes::OCTET_STREAM);
    request.SetBody(body);
    return Execute(request);
}

Result<HttpResponse, NodeClientFailure> PayloadClient::GetTransaction(
    const EncryptedPayloadHash& hash,
    std::string_view suffix) const {
    const std::string target = fmt::format("{}{}{}",
        ApiPaths::TRANSACTION_PREFIX, PathSegment::Escape(hash.ToBase64()), suffix);
    auto request_result = HttpRequest::Create(HttpConstants::METHOD_GET, transport::NodeUrl(target));
    if (request_result.IsErr()) {
        return Result<HttpResponse, NodeClientFailure>::Err(std::move(request_result).UnwrapErr());
    }
    return Execute(request_result.Unwrap());
}

// ============================================================================
// Raw endpoints
// ============================================================================

Result<HttpResponse, NodeClientFailure> PayloadClient::SendJson(
    std::string_view path,
    const google::protobuf::Message& message) const {
    std::string json;
    const auto status = google::protobuf::util::MessageToJsonString(message, &json);
    if (!status.ok()) {
        return Result<HttpResponse, NodeClientFailure>::Err(
            NodeClientFailure::InvalidInput(
                fmt::format("Failed to encode {}: {}", std::string(message.GetDescriptor()->name()), status.ToString())));
    }

    auto request_result = HttpRequest::Create(HttpConstants::METHOD_POST, transport::NodeUrl(path));
    if (request_result.IsErr()) {
        return Result<HttpResponse, NodeClientFailure>::Err(std::move(request_result).UnwrapErr());
    }
    auto request = std::move(request_result).Unwrap();
    request.SetHeader(HeaderNames::CONTENT_TYPE, ContentTypes::JSON);
    request.SetBody(std::string_view(json));
    return Execute(request);
}

Result<PayloadClient::Bytes, NodeClientFailure> PayloadClient::SendPayload(
    std::span<const uint8_t> payload,
    std::string_view from,
    const std::vector<std::string>& to) const {
    return PostBinary(ApiPaths::SEND_RAW, payload, from, to)
        .Bind([](HttpResponse response) { return Base64::Decode(response.body); });
}

Result<PayloadClient::Bytes, NodeClientFailure> PayloadClient::SendSignedPayload(
    std::span<const uint8_t> signed_payload,
    const std::vector<std::string>& to) const {
    return PostBinary(ApiPaths::SEND_SIGNED_TX, signed_payload, {}, to)
        .Bind([](HttpResponse response) { return Base64::Decode(response.body); });
}

Result<PayloadClient::Bytes, NodeClientFailure> PayloadClient::ReceivePayload(
    std::span<const uint8_t> key) const {
    auto request_result = HttpRequest::Create(
        HttpConstants::METHOD_GET, transport::NodeUrl(ApiPaths::RECEIVE_RAW));
    if (request_result.IsErr()) {
        return Result<Bytes, NodeClientFailure>::Err(std::move(request_result).UnwrapErr());
    }
    auto request = std::move(request_result).Unwrap();
    request.SetHeader(HeaderNames::KEY, Base64::Encode(key));
    return Execute(request).Map([](HttpResponse response) { return response.BodyBytes(); });
}

Result<bool, NodeClientFailure> PayloadClient::IsSender(const EncryptedPayloadHash& hash) const {
    return GetTransaction(hash, ApiPaths::IS_SENDER_SUFFIX)
        .Map([](HttpResponse response) { return response.body == NodeConstants::IS_SENDER_TRUE; });
}

Result<std::vector<std::string>, NodeClientFailure> PayloadClient::GetParticipants(
    const EncryptedPayloadHash& hash) const {
    return GetTransaction(hash, ApiPaths::PARTICIPANTS_SUFFIX)
        .Map([](HttpResponse response) { return ParticipantList::Split(response.body); });
}

// ============================================================================
// Structured endpoints
// ============================================================================

Result<PayloadClient::Bytes, NodeClientFailure> PayloadClient::Send(
    std::span<const uint8_t> payload,
    std::string_view from,
    const std::vector<std::string>& to) const {
    proto::node::SendRequest message;
    message.set_payload(ToBinaryString(payload));
    message.set_from(std::string(from));
    for (const auto& recipient : to) {
        message.add_to(recipient);
    }

    auto response_result = SendJson(ApiPaths::SEND, message);
    if (response_result.IsErr()) {
        return Result<Bytes, NodeClientFailure>::Err(std::move(response_result).UnwrapErr());
    }
    proto::node::SendResponse reply;
    if (auto parsed = ParseJsonBody(response_result.Unwrap().body, reply); parsed.IsErr()) {
        return Result<Bytes, NodeClientFailure>::Err(std::move(parsed).UnwrapErr());
    }
    return Result<Bytes, NodeClientFailure>::Ok(ToBytes(reply.key()));
}

Result<PayloadClient::Bytes, NodeClientFailure> PayloadClient::Receive(
    std::span<const uint8_t> key,
    std::string_view to) const {
    proto::node::ReceiveRequest message;
    message.set_key(ToBinaryString(key));
    message.set_to(std::string(to));

    auto response_result = SendJson(ApiPaths::RECEIVE, message);
    if (response_result.IsErr()) {
        return Result<Bytes, NodeClientFailure>::Err(std::move(response_result).UnwrapErr());
    }
    proto::node::ReceiveResponse reply;
    if (auto parsed = ParseJsonBody(response_result.Unwrap().body, reply); parsed.IsErr()) {
        return Result<Bytes, NodeClientFailure>::Err(std::move(parsed).UnwrapErr());
    }
    return Result<Bytes, NodeClientFailure>::Ok(ToBytes(reply.payload()));
}

} // namespace c11n::client
