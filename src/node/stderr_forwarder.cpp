#include "c11n/node/stderr_forwarder.hpp"

#include <fmt/core.h>

#include <array>
#include <cerrno>
#include <system_error>
#include <thread>
#include <utility>

#include <unistd.h>

namespace c11n::node {

void StderrForwarder::DetachedThread(std::function<void()> task) {
    std::thread(std::move(task)).detach();
}

Result<Unit, NodeClientFailure> StderrForwarder::Start(const int read_fd, const Spawner& spawn) {
    try {
        spawn([read_fd] { Forward(read_fd); });
    } catch (const std::system_error& e) {
        ::close(read_fd);
        return Result<Unit, NodeClientFailure>::Err(
            NodeClientFailure::Launch(
                fmt::format("Failed to start stderr forwarder: {}", e.what())));
    }
    return Result<Unit, NodeClientFailure>::Ok(core::unit);
}

void StderrForwarder::Forward(const int read_fd) noexcept {
    std::array<char, 4096> buffer{};
    while (true) {
        const ssize_t n = ::read(read_fd, buffer.data(), buffer.size());
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        ssize_t offset = 0;
        while (offset < n) {
            const ssize_t written = ::write(STDERR_FILENO, buffer.data() + offset,
                                            static_cast<size_t>(n - offset));
            if (written < 0 && errno == EINTR) {
                continue;
            }
            if (written <= 0) {
                ::close(read_fd);
                return;
            }
            offset += written;
        }
    }
    ::close(read_fd);
}

} // namespace c11n::node
