#pragma once

#include "c11n/core/constants.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace c11n::configuration {

/// How the node process is started and when it counts as ready
///
/// The default waits a fixed settle delay after the start call, which is a
/// heuristic only. Readiness polling probes the node socket until it answers
/// and is the stricter option.
class SupervisorConfig {
public:
    using Duration = std::chrono::milliseconds;

    /// `constellation-node` from PATH, 100 ms settle delay, no polling
    [[nodiscard]] static SupervisorConfig Default() {
        return SupervisorConfig(std::string(core::NodeConstants::EXECUTABLE));
    }

    [[nodiscard]] static SupervisorConfig WithExecutable(std::string executable) {
        return SupervisorConfig(std::move(executable));
    }

    /// Poll `socket_path` for liveness after launch instead of trusting the delay
    [[nodiscard]] SupervisorConfig WithReadinessPolling(
        std::string socket_path,
        const Duration timeout = core::NodeConstants::DEFAULT_READINESS_TIMEOUT,
        const Duration interval = core::NodeConstants::DEFAULT_READINESS_INTERVAL) const {
        SupervisorConfig copy = *this;
        copy.readiness_socket_path_ = std::move(socket_path);
        copy.readiness_timeout_ = timeout;
        copy.readiness_interval_ = interval;
        return copy;
    }

    [[nodiscard]] SupervisorConfig WithSettleDelay(const Duration delay) const {
        SupervisorConfig copy = *this;
        copy.settle_delay_ = delay;
        return copy;
    }

    [[nodiscard]] const std::string& Executable() const noexcept { return executable_; }
    [[nodiscard]] Duration SettleDelay() const noexcept { return settle_delay_; }
    [[nodiscard]] bool IsReadinessPollingEnabled() const noexcept { return !readiness_socket_path_.empty(); }
    [[nodiscard]] const std::string& ReadinessSocketPath() const noexcept { return readiness_socket_path_; }
    [[nodiscard]] Duration ReadinessTimeout() const noexcept { return readiness_timeout_; }
    [[nodiscard]] Duration ReadinessInterval() const noexcept { return readiness_interval_; }

private:
    explicit SupervisorConfig(std::string executable)
        : executable_(std::move(executable)) {}

    std::string executable_;
    Duration settle_delay_ = core::NodeConstants::SETTLE_DELAY;
    std::string readiness_socket_path_;
    Duration readiness_timeout_ = core::NodeConstants::DEFAULT_READINESS_TIMEOUT;
    Duration readiness_interval_ = core::NodeConstants::DEFAULT_READINESS_INTERVAL;
};

} // namespace c11n::configuration
