#include "c11n/node/node_process.hpp"
#include "c11n/debug/ipc_logger.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <system_error>
#include <thread>

#include <signal.h>
#include <sys/wait.h>

namespace c11n::node {

using debug::Component;

namespace {
    constexpr std::chrono::milliseconds kExitPollInterval{10};
    constexpr int kSignalExitBase = 128;

    int DecodeWaitStatus(const int status) {
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return kSignalExitBase + WTERMSIG(status);
        }
        return status;
    }
}

NodeProcess::NodeProcess(const pid_t pid) noexcept
    : pid_(pid) {}

NodeProcess::~NodeProcess() {
    Release();
}

NodeProcess::NodeProcess(NodeProcess&& other) noexcept
    : pid_(other.pid_)
    , exit_status_(other.exit_status_) {
    other.pid_ = -1;
    other.exit_status_.reset();
}

NodeProcess& NodeProcess::operator=(NodeProcess&& other) noexcept {
    if (this != &other) {
        Release();
        pid_ = other.pid_;
        exit_status_ = other.exit_status_;
        other.pid_ = -1;
        other.exit_status_.reset();
    }
    return *this;
}

void NodeProcess::Release() noexcept {
    if (pid_ > 0 && !exit_status_.has_value()) {
        if (auto terminated = Terminate(); terminated.IsErr()) {
            C11N_LOG_FAILURE(Component::Supervisor, terminated.UnwrapErr());
        }
    }
    pid_ = -1;
}

bool NodeProcess::IsRunning() {
    if (pid_ <= 0 || exit_status_.has_value()) {
        return false;
    }
    int status = 0;
    const pid_t reaped = ::waitpid(pid_, &status, WNOHANG);
    if (reaped == 0) {
        return true;
    }
    if (reaped == pid_) {
        exit_status_ = DecodeWaitStatus(status);
    }
    return false;
}

Result<int, NodeClientFailure> NodeProcess::Wait() {
    if (exit_status_.has_value()) {
        return Result<int, NodeClientFailure>::Ok(*exit_status_);
    }
    if (pid_ <= 0) {
        return Result<int, NodeClientFailure>::Err(
            NodeClientFailure::Launch("No node process to wait for"));
    }
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            return Result<int, NodeClientFailure>::Err(
                NodeClientFailure::Launch(
                    fmt::format("waitpid({}) failed: {}", pid_,
                                std::generic_category().message(errno))));
        }
    }
    exit_status_ = DecodeWaitStatus(status);
    C11N_LOG_MSG(Component::Supervisor,
                 fmt::format("node pid {} exited with status {}", pid_, *exit_status_));
    return Result<int, NodeClientFailure>::Ok(*exit_status_);
}

Result<int, NodeClientFailure> NodeProcess::Terminate(const Duration grace) {
    if (!IsRunning()) {
        return Wait();
    }

    ::kill(pid_, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (IsRunning()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            C11N_LOG_MSG(Component::Supervisor,
                         fmt::format("node pid {} ignored SIGTERM, killing", pid_));
            ::kill(pid_, SIGKILL);
            break;
        }
        std::this_thread::sleep_for(kExitPollInterval);
    }
    return Wait();
}

} // namespace c11n::node
