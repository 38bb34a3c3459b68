#include "c11n/node/health_prober.hpp"
#include "c11n/transport/local_transport.hpp"
#include "c11n/core/constants.hpp"
#include "c11n/debug/ipc_logger.hpp"

#include <fmt/core.h>

#include <thread>
#include <utility>

namespace c11n::node {

using core::ApiPaths;
using core::ErrorMessages;
using core::HttpConstants;
using debug::Component;
using transport::HttpRequest;

HealthProber::HealthProber(std::shared_ptr<const interfaces::IHttpTransport> transport)
    : transport_(std::move(transport)) {}

Result<Unit, NodeClientFailure> HealthProber::Probe() const {
    auto request_result = HttpRequest::Create(
        HttpConstants::METHOD_GET, transport::NodeUrl(ApiPaths::UPCHECK));
    if (request_result.IsErr()) {
        return Result<Unit, NodeClientFailure>::Err(std::move(request_result).UnwrapErr());
    }

    auto response_result = transport_->RoundTrip(request_result.Unwrap());
    if (response_result.IsErr()) {
        auto failure = std::move(response_result).UnwrapErr();
        C11N_LOG_FAILURE(Component::Prober, failure);
        return Result<Unit, NodeClientFailure>::Err(std::move(failure));
    }
    auto response = std::move(response_result).Unwrap();
    if (response.status_code != HttpConstants::STATUS_OK) {
        auto failure = NodeClientFailure::UnexpectedStatus(
            fmt::format("{} (status {})", ErrorMessages::UPCHECK_FAILED, response.status_code),
            response.status_code,
            std::move(response.headers));
        C11N_LOG_FAILURE(Component::Prober, failure);
        return Result<Unit, NodeClientFailure>::Err(std::move(failure));
    }
    return Result<Unit, NodeClientFailure>::Ok(core::unit);
}

Result<Unit, NodeClientFailure> HealthProber::WaitUntilReady(
    const Duration timeout,
    const Duration interval) const {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + timeout;

    while (true) {
        auto probe = Probe();
        if (probe.IsOk() || Clock::now() + interval > deadline) {
            return probe;
        }
        std::this_thread::sleep_for(interval);
    }
}

} // namespace c11n::node
