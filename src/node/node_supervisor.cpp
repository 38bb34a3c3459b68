#include "c11n/node/node_supervisor.hpp"
#include "c11n/node/health_prober.hpp"
#include "c11n/node/stderr_forwarder.hpp"
#include "c11n/transport/local_transport.hpp"
#include "c11n/debug/ipc_logger.hpp"

#include <fmt/core.h>

#include <array>
#include <cerrno>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace c11n::node {

using debug::Component;

namespace {
    constexpr int kExecFailedExitCode = 127;

    std::string ErrnoText(const int error) {
        return std::generic_category().message(error);
    }

    void ClosePipe(std::array<int, 2>& fds) noexcept {
        for (int& fd : fds) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }
    }

    bool OpenPipe(std::array<int, 2>& fds) noexcept {
        return ::pipe2(fds.data(), O_CLOEXEC) == 0;
    }

    /// Reads the errno written by a child whose exec failed; 0 when exec succeeded
    int ReadExecStatus(const int status_fd) noexcept {
        int child_errno = 0;
        while (true) {
            const ssize_t n = ::read(status_fd, &child_errno, sizeof(child_errno));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
        }
    }
}

NodeSupervisor::NodeSupervisor(SupervisorConfig config)
    : config_(std::move(config)) {}

Result<NodeProcess, NodeClientFailure> NodeSupervisor::Launch(const std::string& config_path) const {
    const std::string& executable = config_.Executable();

    std::array<int, 2> stderr_pipe{-1, -1};
    std::array<int, 2> status_pipe{-1, -1};
    if (!OpenPipe(stderr_pipe) || !OpenPipe(status_pipe)) {
        const int error = errno;
        ClosePipe(stderr_pipe);
        return Result<NodeProcess, NodeClientFailure>::Err(
            NodeClientFailure::Launch(fmt::format("pipe() failed: {}", ErrnoText(error))));
    }

    // argv is built before fork; the child only calls async-signal-safe functions
    std::string argument = config_path;
    std::array<char*, 3> argv{
        const_cast<char*>(executable.c_str()),
        argument.data(),
        nullptr
    };

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int error = errno;
        ClosePipe(stderr_pipe);
        ClosePipe(status_pipe);
        return Result<NodeProcess, NodeClientFailure>::Err(
            NodeClientFailure::Launch(fmt::format("fork() failed: {}", ErrnoText(error))));
    }

    if (pid == 0) {
        if (::dup2(stderr_pipe[1], STDERR_FILENO) < 0) {
            const int error = errno;
            (void)::write(status_pipe[1], &error, sizeof(error));
            ::_exit(kExecFailedExitCode);
        }
        ::execvp(argv[0], argv.data());
        const int error = errno;
        (void)::write(status_pipe[1], &error, sizeof(error));
        ::_exit(kExecFailedExitCode);
    }

    ::close(stderr_pipe[1]);
    ::close(status_pipe[1]);

    const int exec_errno = ReadExecStatus(status_pipe[0]);
    ::close(status_pipe[0]);
    if (exec_errno != 0) {
        ::close(stderr_pipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        auto failure = NodeClientFailure::Launch(
            fmt::format("Failed to start '{}': {}", executable, ErrnoText(exec_errno)));
        C11N_LOG_FAILURE(Component::Supervisor, failure);
        return Result<NodeProcess, NodeClientFailure>::Err(std::move(failure));
    }

    NodeProcess process(pid);
    if (auto forwarding = StderrForwarder::Start(stderr_pipe[0]); forwarding.IsErr()) {
        if (auto terminated = process.Terminate(); terminated.IsErr()) {
            C11N_LOG_FAILURE(Component::Supervisor, terminated.UnwrapErr());
        }
        auto failure = std::move(forwarding).UnwrapErr();
        C11N_LOG_FAILURE(Component::Supervisor, failure);
        return Result<NodeProcess, NodeClientFailure>::Err(std::move(failure));
    }
    C11N_LOG_MSG(Component::Supervisor,
                 fmt::format("started '{} {}' as pid {}", executable, config_path, pid));

    std::this_thread::sleep_for(config_.SettleDelay());

    if (config_.IsReadinessPollingEnabled()) {
        const HealthProber prober(transport::LocalTransport::Create(config_.ReadinessSocketPath()));
        auto ready = prober.WaitUntilReady(config_.ReadinessTimeout(), config_.ReadinessInterval());
        if (ready.IsErr()) {
            if (auto terminated = process.Terminate(); terminated.IsErr()) {
                C11N_LOG_FAILURE(Component::Supervisor, terminated.UnwrapErr());
            }
            auto failure = NodeClientFailure::Launch(
                fmt::format("Node did not become ready on '{}': {}",
                            config_.ReadinessSocketPath(), ready.UnwrapErr().message));
            C11N_LOG_FAILURE(Component::Supervisor, failure);
            return Result<NodeProcess, NodeClientFailure>::Err(std::move(failure));
        }
    }

    return Result<NodeProcess, NodeClientFailure>::Ok(std::move(process));
}

} // namespace c11n::node
