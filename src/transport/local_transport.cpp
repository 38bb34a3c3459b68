#include "c11n/transport/local_transport.hpp"
#include "c11n/transport/http_codec.hpp"
#include "c11n/transport/unix_socket.hpp"
#include "c11n/core/constants.hpp"
#include "c11n/debug/ipc_logger.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <utility>

namespace c11n::transport {

using core::ErrorMessages;
using core::HttpConstants;
using core::NodeConstants;
using debug::Component;

std::string NodeUrl(std::string_view target) {
    return fmt::format("{}{}/{}", HttpConstants::SCHEME, NodeConstants::VIRTUAL_HOST, target);
}

LocalTransport::LocalTransport(std::string socket_path, const TransportConfig config)
    : socket_path_(std::move(socket_path))
    , config_(config) {}

std::shared_ptr<const LocalTransport> LocalTransport::Create(
    std::string socket_path,
    const TransportConfig config) {
    return std::make_shared<const LocalTransport>(std::move(socket_path), config);
}

Result<HttpResponse, NodeClientFailure> LocalTransport::RoundTrip(const HttpRequest& request) const {
    using Clock = UnixSocket::Clock;

    if (request.Host() != NodeConstants::VIRTUAL_HOST) {
        auto failure = NodeClientFailure::Transport(
            fmt::format("{}: '{}'", ErrorMessages::UNKNOWN_LOCATION, request.Host()));
        C11N_LOG_FAILURE(Component::Transport, failure);
        return Result<HttpResponse, NodeClientFailure>::Err(std::move(failure));
    }

    auto wire_result = HttpRequestWriter::Serialize(request);
    if (wire_result.IsErr()) {
        return Result<HttpResponse, NodeClientFailure>::Err(std::move(wire_result).UnwrapErr());
    }
    const std::string wire = std::move(wire_result).Unwrap();

    C11N_LOG_REQUEST(request.Method(), request.Target(), request.Body().size());

    const auto started = Clock::now();
    const auto request_deadline = started + config_.RequestTimeout();
    const auto connect_deadline = std::min(started + config_.ConnectTimeout(), request_deadline);

    auto socket_result = UnixSocket::Connect(socket_path_, connect_deadline);
    if (socket_result.IsErr()) {
        auto failure = std::move(socket_result).UnwrapErr();
        C11N_LOG_FAILURE(Component::Transport, failure);
        return Result<HttpResponse, NodeClientFailure>::Err(std::move(failure));
    }
    UnixSocket socket = std::move(socket_result).Unwrap();

    if (auto written = socket.WriteAll(wire, request_deadline, ErrorMessages::REQUEST_TIMEOUT);
        written.IsErr()) {
        auto failure = std::move(written).UnwrapErr();
        C11N_LOG_FAILURE(Component::Transport, failure);
        return Result<HttpResponse, NodeClientFailure>::Err(std::move(failure));
    }

    const auto header_deadline = std::min(
        Clock::now() + config_.ResponseHeaderTimeout(), request_deadline);

    HttpResponseParser parser(config_.MaxHeaderBytes());
    std::array<char, HttpConstants::READ_CHUNK_SIZE> buffer{};
    while (!parser.IsComplete()) {
        const bool awaiting_headers = !parser.HeadersComplete();
        auto read_result = socket.ReadSome(
            buffer.data(),
            buffer.size(),
            awaiting_headers ? header_deadline : request_deadline,
            awaiting_headers ? ErrorMessages::HEADER_TIMEOUT : ErrorMessages::REQUEST_TIMEOUT);
        if (read_result.IsErr()) {
            auto failure = std::move(read_result).UnwrapErr();
            C11N_LOG_FAILURE(Component::Transport, failure);
            return Result<HttpResponse, NodeClientFailure>::Err(std::move(failure));
        }
        const size_t received = read_result.Unwrap();
        auto progress = received == 0
            ? parser.FinishOnClose()
            : parser.Feed(std::string_view(buffer.data(), received));
        if (progress.IsErr()) {
            auto failure = std::move(progress).UnwrapErr();
            C11N_LOG_FAILURE(Component::Transport, failure);
            return Result<HttpResponse, NodeClientFailure>::Err(std::move(failure));
        }
        if (received == 0) {
            break;
        }
    }

    HttpResponse response = std::move(parser).TakeResponse();
    C11N_LOG_RESPONSE(response.status_code, response.body.size());
    return Result<HttpResponse, NodeClientFailure>::Ok(std::move(response));
}

} // namespace c11n::transport
