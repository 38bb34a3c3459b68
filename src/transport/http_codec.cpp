#include "c11n/transport/http_codec.hpp"
#include "c11n/core/constants.hpp"

#include <fmt/core.h>

#include <charconv>
#include <utility>

namespace c11n::transport {

using core::ErrorMessages;
using core::HeaderNames;
using core::HttpConstants;

namespace {
    std::string_view TrimWhitespace(std::string_view text) {
        while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
            text.remove_prefix(1);
        }
        while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
            text.remove_suffix(1);
        }
        return text;
    }

    bool ContainsLineBreak(std::string_view text) {
        return text.find('\r') != std::string_view::npos
            || text.find('\n') != std::string_view::npos;
    }

    Result<Unit, NodeClientFailure> Malformed(std::string_view what, std::string_view detail) {
        return Result<Unit, NodeClientFailure>::Err(
            NodeClientFailure::Transport(fmt::format("{}: {}", what, detail)));
    }
}

// ============================================================================
// HttpRequestWriter
// ============================================================================

bool HttpRequestWriter::IsValidHeader(std::string_view name, std::string_view value) noexcept {
    if (name.empty() || name.find(':') != std::string_view::npos) {
        return false;
    }
    return !ContainsLineBreak(name) && !ContainsLineBreak(value);
}

Result<std::string, NodeClientFailure> HttpRequestWriter::Serialize(const HttpRequest& request) {
    for (const auto& [name, value] : request.Headers()) {
        if (!IsValidHeader(name, value)) {
            return Result<std::string, NodeClientFailure>::Err(
                NodeClientFailure::InvalidInput(
                    fmt::format("{}: {}", ErrorMessages::HEADER_INJECTION, name)));
        }
    }
    if (ContainsLineBreak(request.Target()) || request.Target().find(' ') != std::string::npos ||
        ContainsLineBreak(request.Host())) {
        return Result<std::string, NodeClientFailure>::Err(
            NodeClientFailure::InvalidInput(
                fmt::format("Request target is not a valid path: {}", request.Target())));
    }

    std::string wire;
    wire.reserve(256 + request.Body().size());
    wire += fmt::format("{} /{} {}{}", request.Method(), request.Target(),
                        HttpConstants::VERSION, HttpConstants::CRLF);
    wire += fmt::format("{}: {}{}", HeaderNames::HOST, request.Host(), HttpConstants::CRLF);
    for (const auto& [name, value] : request.Headers()) {
        wire += fmt::format("{}: {}{}", name, value, HttpConstants::CRLF);
    }
    if (request.Method() == HttpConstants::METHOD_POST || !request.Body().empty()) {
        wire += fmt::format("{}: {}{}", HeaderNames::CONTENT_LENGTH,
                            request.Body().size(), HttpConstants::CRLF);
    }
    wire += fmt::format("{}: {}{}", HeaderNames::CONNECTION,
                        HttpConstants::CONNECTION_CLOSE, HttpConstants::CRLF);
    wire += HttpConstants::CRLF;
    wire += request.Body();
    return Result<std::string, NodeClientFailure>::Ok(std::move(wire));
}

// ============================================================================
// HttpResponseParser
// ============================================================================

HttpResponseParser::HttpResponseParser(const size_t max_header_bytes)
    : max_header_bytes_(max_header_bytes) {}

Result<Unit, NodeClientFailure> HttpResponseParser::Feed(std::string_view data) {
    if (state_ == State::Complete) {
        return Result<Unit, NodeClientFailure>::Ok(core::unit);
    }
    buffer_.append(data.data(), data.size());
    return Advance();
}

Result<Unit, NodeClientFailure> HttpResponseParser::FinishOnClose() {
    switch (state_) {
        case State::Complete:
            return Result<Unit, NodeClientFailure>::Ok(core::unit);
        case State::UntilCloseBody:
            response_.body = std::move(buffer_);
            buffer_.clear();
            state_ = State::Complete;
            return Result<Unit, NodeClientFailure>::Ok(core::unit);
        case State::Headers:
        case State::FixedLengthBody:
        case State::ChunkedBody:
            break;
    }
    return Result<Unit, NodeClientFailure>::Err(
        NodeClientFailure::Transport(std::string(ErrorMessages::CONNECTION_CLOSED)));
}

Result<Unit, NodeClientFailure> HttpResponseParser::Advance() {
    while (true) {
        switch (state_) {
            case State::Headers: {
                const size_t end = buffer_.find(HttpConstants::HEADER_TERMINATOR);
                if (end == std::string::npos) {
                    if (buffer_.size() > max_header_bytes_) {
                        return Result<Unit, NodeClientFailure>::Err(
                            NodeClientFailure::Transport(std::string(ErrorMessages::HEADERS_TOO_LARGE)));
                    }
                    return Result<Unit, NodeClientFailure>::Ok(core::unit);
                }
                if (end > max_header_bytes_) {
                    return Result<Unit, NodeClientFailure>::Err(
                        NodeClientFailure::Transport(std::string(ErrorMessages::HEADERS_TOO_LARGE)));
                }
                const std::string head = buffer_.substr(0, end);
                buffer_.erase(0, end + HttpConstants::HEADER_TERMINATOR.size());
                auto head_result = ParseHead(head);
                if (head_result.IsErr()) {
                    return head_result;
                }
                continue;
            }
            case State::FixedLengthBody:
                if (buffer_.size() >= content_length_) {
                    response_.body = buffer_.substr(0, content_length_);
                    buffer_.clear();
                    state_ = State::Complete;
                }
                return Result<Unit, NodeClientFailure>::Ok(core::unit);
            case State::ChunkedBody:
                switch (DecodeChunks()) {
                    case ChunkProgress::Incomplete:
                        return Result<Unit, NodeClientFailure>::Ok(core::unit);
                    case ChunkProgress::Complete:
                        state_ = State::Complete;
                        return Result<Unit, NodeClientFailure>::Ok(core::unit);
                    case ChunkProgress::Malformed:
                        break;
                }
                return Result<Unit, NodeClientFailure>::Err(
                    NodeClientFailure::Transport(std::string(ErrorMessages::MALFORMED_CHUNK)));
            case State::UntilCloseBody:
            case State::Complete:
                return Result<Unit, NodeClientFailure>::Ok(core::unit);
        }
    }
}

Result<Unit, NodeClientFailure> HttpResponseParser::ParseHead(std::string_view head) {
    const size_t status_end = head.find(HttpConstants::CRLF);
    const std::string_view status_line = head.substr(0, status_end);

    // HTTP/1.x SP 3DIGIT [SP reason]
    if (status_line.size() < 12 || status_line.substr(0, 7) != "HTTP/1." || status_line[8] != ' ') {
        return Malformed(ErrorMessages::MALFORMED_STATUS_LINE, status_line);
    }
    int status = 0;
    const char* code_begin = status_line.data() + 9;
    const auto [code_end, code_error] = std::from_chars(code_begin, code_begin + 3, status);
    if (code_error != std::errc{} || code_end != code_begin + 3 || status < 100 || status > 999) {
        return Malformed(ErrorMessages::MALFORMED_STATUS_LINE, status_line);
    }
    if (status_line.size() > 12 && status_line[12] != ' ') {
        return Malformed(ErrorMessages::MALFORMED_STATUS_LINE, status_line);
    }

    HttpResponse response;
    response.status_code = status;
    response.reason = status_line.size() > 13 ? std::string(status_line.substr(13)) : std::string();

    std::string_view rest = status_end == std::string_view::npos
        ? std::string_view{}
        : head.substr(status_end + HttpConstants::CRLF.size());
    while (!rest.empty()) {
        const size_t line_end = rest.find(HttpConstants::CRLF);
        const std::string_view line = rest.substr(0, line_end);
        rest = line_end == std::string_view::npos
            ? std::string_view{}
            : rest.substr(line_end + HttpConstants::CRLF.size());

        const size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0 || line.front() == ' ' || line.front() == '\t') {
            return Malformed(ErrorMessages::MALFORMED_HEADER, line);
        }
        const std::string_view name = line.substr(0, colon);
        if (name.find_first_of(" \t") != std::string_view::npos) {
            return Malformed(ErrorMessages::MALFORMED_HEADER, line);
        }
        response.headers.emplace_back(std::string(name), std::string(TrimWhitespace(line.substr(colon + 1))));
    }

    if (status < 200) {
        // Interim response, the final one follows on the same connection
        return Result<Unit, NodeClientFailure>::Ok(core::unit);
    }

    response_ = std::move(response);
    if (status == 204 || status == 304) {
        state_ = State::Complete;
        return Result<Unit, NodeClientFailure>::Ok(core::unit);
    }

    if (const auto encoding = response_.GetHeader(HeaderNames::TRANSFER_ENCODING)) {
        const std::string_view codings = *encoding;
        const size_t last_comma = codings.rfind(',');
        const std::string_view last = TrimWhitespace(
            last_comma == std::string_view::npos ? codings : codings.substr(last_comma + 1));
        if (HeaderNameEquals(last, HttpConstants::CHUNKED)) {
            state_ = State::ChunkedBody;
            return Result<Unit, NodeClientFailure>::Ok(core::unit);
        }
        state_ = State::UntilCloseBody;
        return Result<Unit, NodeClientFailure>::Ok(core::unit);
    }

    if (const auto length = response_.GetHeader(HeaderNames::CONTENT_LENGTH)) {
        const std::string_view digits = TrimWhitespace(*length);
        size_t parsed = 0;
        const auto [end, error] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
        if (digits.empty() || error != std::errc{} || end != digits.data() + digits.size()) {
            return Malformed(ErrorMessages::MALFORMED_HEADER, *length);
        }
        content_length_ = parsed;
        state_ = State::FixedLengthBody;
        return Result<Unit, NodeClientFailure>::Ok(core::unit);
    }

    state_ = State::UntilCloseBody;
    return Result<Unit, NodeClientFailure>::Ok(core::unit);
}

HttpResponseParser::ChunkProgress HttpResponseParser::DecodeChunks() {
    std::string body;
    size_t pos = 0;
    while (true) {
        const size_t line_end = buffer_.find(HttpConstants::CRLF, pos);
        if (line_end == std::string::npos) {
            return ChunkProgress::Incomplete;
        }
        std::string_view size_line(buffer_.data() + pos, line_end - pos);
        if (const size_t extension = size_line.find(';'); extension != std::string_view::npos) {
            size_line = size_line.substr(0, extension);
        }
        size_line = TrimWhitespace(size_line);
        size_t chunk_size = 0;
        const auto [end, error] = std::from_chars(
            size_line.data(), size_line.data() + size_line.size(), chunk_size, 16);
        if (size_line.empty() || error != std::errc{} || end != size_line.data() + size_line.size()) {
            return ChunkProgress::Malformed;
        }
        pos = line_end + HttpConstants::CRLF.size();

        if (chunk_size == 0) {
            // Trailer section ends with an empty line
            while (true) {
                const size_t trailer_end = buffer_.find(HttpConstants::CRLF, pos);
                if (trailer_end == std::string::npos) {
                    return ChunkProgress::Incomplete;
                }
                const bool empty_line = trailer_end == pos;
                pos = trailer_end + HttpConstants::CRLF.size();
                if (empty_line) {
                    break;
                }
            }
            response_.body = std::move(body);
            buffer_.clear();
            return ChunkProgress::Complete;
        }

        // A chunk that could never fit in the buffer is rejected before the
        // size arithmetic below can wrap.
        if (chunk_size > buffer_.max_size() - pos - HttpConstants::CRLF.size()) {
            return ChunkProgress::Malformed;
        }
        if (buffer_.size() < pos + chunk_size + HttpConstants::CRLF.size()) {
            return ChunkProgress::Incomplete;
        }
        body.append(buffer_, pos, chunk_size);
        if (buffer_.compare(pos + chunk_size, HttpConstants::CRLF.size(), HttpConstants::CRLF) != 0) {
            return ChunkProgress::Malformed;
        }
        pos += chunk_size + HttpConstants::CRLF.size();
    }
}

} // namespace c11n::transport
