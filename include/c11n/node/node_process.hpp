#pragma once

#include "c11n/core/result.hpp"
#include "c11n/core/failures.hpp"
#include "c11n/core/constants.hpp"

#include <chrono>
#include <optional>

#include <sys/types.h>

namespace c11n::node {

using core::Result;
using core::NodeClientFailure;

/**
 * @brief Owning handle for a launched node process
 *
 * Move-only. A child that is still running when the handle is destroyed is
 * terminated and reaped, so no zombie outlives its handle.
 *
 * Exit status follows the shell convention: the exit code for a normal exit,
 * 128 + signal number for a child killed by a signal.
 */
class NodeProcess {
public:
    using Duration = std::chrono::milliseconds;

    explicit NodeProcess(pid_t pid) noexcept;
    ~NodeProcess();

    NodeProcess(NodeProcess&& other) noexcept;
    NodeProcess& operator=(NodeProcess&& other) noexcept;

    NodeProcess(const NodeProcess&) = delete;
    NodeProcess& operator=(const NodeProcess&) = delete;

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }

    /// Non-blocking; reaps the child if it has exited
    [[nodiscard]] bool IsRunning();

    /// Block until the child exits
    [[nodiscard]] Result<int, NodeClientFailure> Wait();

    /// SIGTERM, then SIGKILL once `grace` has elapsed; always reaps
    [[nodiscard]] Result<int, NodeClientFailure> Terminate(
        Duration grace = core::NodeConstants::DEFAULT_TERMINATE_GRACE);

    [[nodiscard]] std::optional<int> ExitStatus() const noexcept { return exit_status_; }

private:
    void Release() noexcept;

    pid_t pid_ = -1;
    std::optional<int> exit_status_;
};

} // namespace c11n::node
