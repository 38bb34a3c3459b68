#pragma once
#include "c11n/core/result.hpp"
#include "c11n/core/failures.hpp"
#include "c11n/transport/http_message.hpp"
namespace c11n::interfaces {
using core::Result;
using core::NodeClientFailure;
using transport::HttpRequest;
using transport::HttpResponse;
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    [[nodiscard]] virtual Result<HttpResponse, NodeClientFailure> RoundTrip(
        const HttpRequest& request) const = 0;
};
}
