#pragma once

#include "c11n/core/result.hpp"
#include "c11n/core/failures.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace c11n::transport {

using core::Result;
using core::NodeClientFailure;
using core::HeaderList;

/// Case-insensitive ASCII comparison, as HTTP field names require
[[nodiscard]] bool HeaderNameEquals(std::string_view a, std::string_view b) noexcept;

/// First value of `name` in `headers`, if present
[[nodiscard]] std::optional<std::string> FindHeader(const HeaderList& headers, std::string_view name);

/**
 * @brief Request addressed to a virtual host of the local transport
 *
 * Built from an `http+unix://<host>/<target>` URL the same way a network
 * request is built from an `http://` URL. The target is kept verbatim, so
 * path segments must already be escaped.
 */
class HttpRequest {
public:
    /**
     * @brief Parse `url` and start a request
     *
     * @param method Request method, e.g. "GET"
     * @param url    `http+unix://<host>/<target>`
     * @return Ok(request) or InvalidInput for a URL with another scheme or no host
     */
    [[nodiscard]] static Result<HttpRequest, NodeClientFailure> Create(
        std::string_view method,
        std::string_view url);

    /// Replace any existing value of `name`
    void SetHeader(std::string_view name, std::string_view value);

    void SetBody(std::span<const uint8_t> body);
    void SetBody(std::string_view body);

    [[nodiscard]] const std::string& Method() const noexcept { return method_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] const std::string& Target() const noexcept { return target_; }
    [[nodiscard]] const HeaderList& Headers() const noexcept { return headers_; }
    [[nodiscard]] const std::string& Body() const noexcept { return body_; }

    [[nodiscard]] std::optional<std::string> GetHeader(std::string_view name) const {
        return FindHeader(headers_, name);
    }

private:
    HttpRequest(std::string method, std::string host, std::string target)
        : method_(std::move(method))
        , host_(std::move(host))
        , target_(std::move(target)) {}

    std::string method_;
    std::string host_;
    std::string target_;
    HeaderList headers_;
    std::string body_;
};

struct HttpResponse {
    int status_code = 0;
    std::string reason;
    HeaderList headers;
    std::string body;

    [[nodiscard]] std::optional<std::string> GetHeader(std::string_view name) const {
        return FindHeader(headers, name);
    }

    [[nodiscard]] std::vector<uint8_t> BodyBytes() const {
        return std::vector<uint8_t>(body.begin(), body.end());
    }
};

} // namespace c11n::transport
