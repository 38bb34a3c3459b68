#pragma once

#include "c11n/core/result.hpp"
#include "c11n/core/failures.hpp"

#include <functional>

namespace c11n::node {

using core::Result;
using core::Unit;
using core::NodeClientFailure;

/**
 * @brief Copies a child's stderr pipe to our stderr in the background
 *
 * The copy runs until the pipe reaches EOF or a write fails, then closes the
 * read end. Copy errors are never reported.
 */
class StderrForwarder {
public:
    /// Runs a task in the background; may throw std::system_error
    using Spawner = std::function<void(std::function<void()>)>;

    /// Spawns a detached std::thread
    static void DetachedThread(std::function<void()> task);

    /**
     * @brief Start copying from `read_fd`, which the forwarder takes over
     *
     * @return Ok, or Launch failure when the task could not be spawned; the
     *         descriptor is closed in that case
     */
    [[nodiscard]] static Result<Unit, NodeClientFailure> Start(
        int read_fd,
        const Spawner& spawn = DetachedThread);

    /// Blocking copy loop; closes `read_fd` when done
    static void Forward(int read_fd) noexcept;
};

} // namespace c11n::node
