#include "c11n/transport/http_message.hpp"
#include "c11n/core/constants.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>

namespace c11n::transport {

using core::HttpConstants;

bool HeaderNameEquals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> FindHeader(const HeaderList& headers, std::string_view name) {
    const auto it = std::find_if(headers.begin(), headers.end(),
        [name](const auto& header) { return HeaderNameEquals(header.first, name); });
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<HttpRequest, NodeClientFailure> HttpRequest::Create(
    std::string_view method,
    std::string_view url) {
    if (url.substr(0, HttpConstants::SCHEME.size()) != HttpConstants::SCHEME) {
        return Result<HttpRequest, NodeClientFailure>::Err(
            NodeClientFailure::InvalidInput(
                fmt::format("Unsupported URL scheme: {}", url)));
    }
    const auto rest = url.substr(HttpConstants::SCHEME.size());
    const auto slash = rest.find('/');
    const auto host = rest.substr(0, slash);
    if (host.empty()) {
        return Result<HttpRequest, NodeClientFailure>::Err(
            NodeClientFailure::InvalidInput(
                fmt::format("URL has no host: {}", url)));
    }
    const auto target = slash == std::string_view::npos
        ? std::string_view{}
        : rest.substr(slash + 1);
    return Result<HttpRequest, NodeClientFailure>::Ok(
        HttpRequest(std::string(method), std::string(host), std::string(target)));
}

void HttpRequest::SetHeader(std::string_view name, std::string_view value) {
    const auto it = std::find_if(headers_.begin(), headers_.end(),
        [name](const auto& header) { return HeaderNameEquals(header.first, name); });
    if (it != headers_.end()) {
        it->second = std::string(value);
        return;
    }
    headers_.emplace_back(std::string(name), std::string(value));
}

void HttpRequest::SetBody(std::span<const uint8_t> body) {
    body_.assign(body.begin(), body.end());
}

void HttpRequest::SetBody(std::string_view body) {
    body_.assign(body.begin(), body.end());
}

} // namespace c11n::transport
