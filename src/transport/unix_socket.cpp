#include "c11n/transport/unix_socket.hpp"
#include "c11n/core/constants.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <system_error>
#include <thread>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace c11n::transport {

using core::ErrorMessages;

namespace {
    constexpr std::chrono::milliseconds kBacklogRetryInterval{5};

    std::string ErrnoText(const int error) {
        return std::generic_category().message(error);
    }

    int RemainingMillis(const UnixSocket::Clock::time_point deadline) {
        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
            deadline - UnixSocket::Clock::now());
        return remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
    }
}

// ============================================================================
// Construction / Destruction
// ============================================================================

Result<UnixSocket, NodeClientFailure> UnixSocket::Connect(
    const std::string& path,
    const Clock::time_point deadline) {
    sockaddr_un addr{};
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        return Result<UnixSocket, NodeClientFailure>::Err(
            NodeClientFailure::Transport(
                fmt::format("{}: '{}'", ErrorMessages::SOCKET_PATH_TOO_LONG, path)));
    }
    addr.sun_family = AF_UNIX;
    path.copy(addr.sun_path, path.size());

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return Result<UnixSocket, NodeClientFailure>::Err(
            NodeClientFailure::Transport(
                fmt::format("socket() failed: {}", ErrnoText(errno))));
    }
    UnixSocket socket(fd);

    while (true) {
        if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0) {
            return Result<UnixSocket, NodeClientFailure>::Ok(std::move(socket));
        }
        const int error = errno;
        if (error == EINTR) {
            continue;
        }
        if (error == EAGAIN) {
            // Listener backlog is full; a non-blocking Unix connect is not
            // queued, so it has to be retried.
            if (Clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(kBacklogRetryInterval);
            continue;
        }
        if (error == EINPROGRESS) {
            auto ready = socket.WaitFor(POLLOUT, deadline);
            if (ready.IsErr()) {
                return Result<UnixSocket, NodeClientFailure>::Err(std::move(ready).UnwrapErr());
            }
            if (!ready.Unwrap()) {
                break;
            }
            int socket_error = 0;
            socklen_t length = sizeof(socket_error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &length) < 0) {
                socket_error = errno;
            }
            if (socket_error != 0) {
                return Result<UnixSocket, NodeClientFailure>::Err(
                    NodeClientFailure::Transport(
                        fmt::format("connect({}) failed: {}", path, ErrnoText(socket_error))));
            }
            return Result<UnixSocket, NodeClientFailure>::Ok(std::move(socket));
        }
        return Result<UnixSocket, NodeClientFailure>::Err(
            NodeClientFailure::Transport(
                fmt::format("connect({}) failed: {}", path, ErrnoText(error))));
    }

    return Result<UnixSocket, NodeClientFailure>::Err(
        NodeClientFailure::Transport(
            fmt::format("{}: {}", ErrorMessages::CONNECT_TIMEOUT, path)));
}

UnixSocket::~UnixSocket() {
    Close();
}

UnixSocket::UnixSocket(UnixSocket&& other) noexcept
    : fd_(other.fd_) {
    other.fd_ = -1;
}

UnixSocket& UnixSocket::operator=(UnixSocket&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void UnixSocket::Close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ============================================================================
// I/O
// ============================================================================

Result<bool, NodeClientFailure> UnixSocket::WaitFor(
    const short events,
    const Clock::time_point deadline) const {
    while (true) {
        const int timeout_ms = RemainingMillis(deadline);
        if (timeout_ms <= 0) {
            return Result<bool, NodeClientFailure>::Ok(false);
        }
        pollfd descriptor{};
        descriptor.fd = fd_;
        descriptor.events = events;
        const int ready = ::poll(&descriptor, 1, timeout_ms);
        if (ready > 0) {
            return Result<bool, NodeClientFailure>::Ok(true);
        }
        if (ready < 0 && errno != EINTR) {
            return Result<bool, NodeClientFailure>::Err(
                NodeClientFailure::Transport(
                    fmt::format("poll() failed: {}", ErrnoText(errno))));
        }
    }
}

Result<Unit, NodeClientFailure> UnixSocket::WriteAll(
    std::string_view data,
    const Clock::time_point deadline,
    std::string_view timeout_message) {
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::send(fd_, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        const int error = errno;
        if (n < 0 && error == EINTR) {
            continue;
        }
        if (n < 0 && (error == EAGAIN || error == EWOULDBLOCK)) {
            auto ready = WaitFor(POLLOUT, deadline);
            if (ready.IsErr()) {
                return Result<Unit, NodeClientFailure>::Err(std::move(ready).UnwrapErr());
            }
            if (!ready.Unwrap()) {
                return Result<Unit, NodeClientFailure>::Err(
                    NodeClientFailure::Transport(std::string(timeout_message)));
            }
            continue;
        }
        return Result<Unit, NodeClientFailure>::Err(
            NodeClientFailure::Transport(
                fmt::format("send() failed: {}", ErrnoText(error))));
    }
    return Result<Unit, NodeClientFailure>::Ok(core::unit);
}

Result<size_t, NodeClientFailure> UnixSocket::ReadSome(
    char* buffer,
    const size_t capacity,
    const Clock::time_point deadline,
    std::string_view timeout_message) {
    while (true) {
        const ssize_t n = ::recv(fd_, buffer, capacity, 0);
        if (n >= 0) {
            return Result<size_t, NodeClientFailure>::Ok(static_cast<size_t>(n));
        }
        const int error = errno;
        if (error == EINTR) {
            continue;
        }
        if (error == EAGAIN || error == EWOULDBLOCK) {
            auto ready = WaitFor(POLLIN, deadline);
            if (ready.IsErr()) {
                return Result<size_t, NodeClientFailure>::Err(std::move(ready).UnwrapErr());
            }
            if (!ready.Unwrap()) {
                return Result<size_t, NodeClientFailure>::Err(
                    NodeClientFailure::Transport(std::string(timeout_message)));
            }
            continue;
        }
        return Result<size_t, NodeClientFailure>::Err(
            NodeClientFailure::Transport(
                fmt::format("recv() failed: {}", ErrnoText(error))));
    }
}

} // namespace c11n::transport
