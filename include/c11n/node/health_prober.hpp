#pragma once

#include "c11n/interfaces/i_http_transport.hpp"

#include <chrono>
#include <memory>

namespace c11n::node {

using core::Result;
using core::Unit;
using core::NodeClientFailure;

/**
 * @brief Liveness check against the node's `/upcheck` endpoint
 *
 * A probe is a single request with no retry. Only an exact 200 counts as
 * alive; any other status is UnexpectedStatus and any transport error is
 * returned as is.
 */
class HealthProber {
public:
    using Duration = std::chrono::milliseconds;

    explicit HealthProber(std::shared_ptr<const interfaces::IHttpTransport> transport);

    [[nodiscard]] Result<Unit, NodeClientFailure> Probe() const;

    /**
     * @brief Probe every `interval` until the node answers
     *
     * @return Ok on the first successful probe, otherwise the failure of the
     *         last probe once `timeout` has elapsed
     */
    [[nodiscard]] Result<Unit, NodeClientFailure> WaitUntilReady(
        Duration timeout,
        Duration interval) const;

private:
    std::shared_ptr<const interfaces::IHttpTransport> transport_;
};

} // namespace c11n::node
