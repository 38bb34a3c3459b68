#pragma once

#include "c11n/node/node_process.hpp"
#include "c11n/configuration/supervisor_config.hpp"

#include <string>

namespace c11n::node {

using configuration::SupervisorConfig;

/**
 * @brief Starts the constellation node as a child process
 *
 * The child gets the configuration path as its only argument. Its stderr is
 * copied to ours by a detached thread for as long as the pipe stays open;
 * that copy never reports errors.
 */
class NodeSupervisor {
public:
    explicit NodeSupervisor(SupervisorConfig config = SupervisorConfig::Default());

    /**
     * @brief Launch the node and wait until it is considered ready
     *
     * Ready means the settle delay has elapsed, or, with readiness polling
     * enabled, that the node answered `/upcheck` within the polling timeout.
     *
     * @param config_path Path handed to the node as its single argument
     * @return Ok(process) or Launch failure; a child that never became ready
     *         is terminated before the failure is returned
     */
    [[nodiscard]] Result<NodeProcess, NodeClientFailure> Launch(const std::string& config_path) const;

    [[nodiscard]] const SupervisorConfig& Config() const noexcept { return config_; }

private:
    SupervisorConfig config_;
};

} // namespace c11n::node
