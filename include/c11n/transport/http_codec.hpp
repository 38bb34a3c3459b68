#pragma once

#include "c11n/transport/http_message.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace c11n::transport {

using core::Unit;

/**
 * @brief HTTP/1.1 request writer for the local transport
 *
 * Every request is sent with `Connection: close` so one connection carries
 * exactly one exchange.
 */
class HttpRequestWriter {
public:
    /**
     * @brief Serialize `request` for the wire
     *
     * Adds Host, Content-Length (always for POST, otherwise only with a
     * body) and Connection headers.
     *
     * @return Ok(bytes) or InvalidInput if a header name or value contains
     *         CR or LF
     */
    [[nodiscard]] static Result<std::string, NodeClientFailure> Serialize(const HttpRequest& request);

    [[nodiscard]] static bool IsValidHeader(std::string_view name, std::string_view value) noexcept;

private:
    HttpRequestWriter() = delete;
};

/**
 * @brief Incremental HTTP/1.1 response parser
 *
 * Bytes are fed as they arrive. Bodies framed by Content-Length,
 * chunked transfer encoding or connection close are supported. Interim 1xx
 * responses are skipped.
 *
 * Usage:
 * @code
 * HttpResponseParser parser(max_header_bytes);
 * while (!parser.IsComplete()) {
 *     n = read(...);
 *     if (n == 0) { parser.FinishOnClose(); break; }
 *     parser.Feed({buffer, n});
 * }
 * HttpResponse response = std::move(parser).TakeResponse();
 * @endcode
 */
class HttpResponseParser {
public:
    explicit HttpResponseParser(size_t max_header_bytes);

    /// Append received bytes; Err on malformed or oversized headers
    [[nodiscard]] Result<Unit, NodeClientFailure> Feed(std::string_view data);

    /// Peer closed the connection; completes close-delimited bodies
    [[nodiscard]] Result<Unit, NodeClientFailure> FinishOnClose();

    [[nodiscard]] bool HeadersComplete() const noexcept { return state_ != State::Headers; }
    [[nodiscard]] bool IsComplete() const noexcept { return state_ == State::Complete; }

    [[nodiscard]] HttpResponse TakeResponse() && { return std::move(response_); }

private:
    enum class State {
        Headers,
        FixedLengthBody,
        ChunkedBody,
        UntilCloseBody,
        Complete
    };

    enum class ChunkProgress {
        Incomplete,
        Complete,
        Malformed
    };

    Result<Unit, NodeClientFailure> Advance();
    Result<Unit, NodeClientFailure> ParseHead(std::string_view head);
    ChunkProgress DecodeChunks();

    size_t max_header_bytes_;
    State state_ = State::Headers;
    std::string buffer_;
    size_t content_length_ = 0;
    HttpResponse response_;
};

} // namespace c11n::transport
