#pragma once

#include "c11n/core/result.hpp"
#include "c11n/core/failures.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace c11n::transport {

using core::Result;
using core::Unit;
using core::NodeClientFailure;

/**
 * @brief RAII stream socket connected to a Unix domain socket path
 *
 * The descriptor stays in non-blocking mode; every blocking operation waits
 * with poll() against an absolute deadline, so no call can outlive the
 * transport's timeouts.
 *
 * This class is:
 * - Move-only (non-copyable) - ensures single ownership of the descriptor
 * - Not thread-safe - one exchange uses one socket from one thread
 */
class UnixSocket {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Connect to `path`
     *
     * @param path     Filesystem path of the listening socket
     * @param deadline Give up with a Transport failure after this instant
     * @return Ok(socket) or Transport failure (missing socket, refused,
     *         timeout, path too long)
     */
    [[nodiscard]] static Result<UnixSocket, NodeClientFailure> Connect(
        const std::string& path,
        Clock::time_point deadline);

    ~UnixSocket();

    UnixSocket(UnixSocket&& other) noexcept;
    UnixSocket& operator=(UnixSocket&& other) noexcept;

    UnixSocket(const UnixSocket&) = delete;
    UnixSocket& operator=(const UnixSocket&) = delete;

    /**
     * @brief Write all of `data` before `deadline`
     */
    [[nodiscard]] Result<Unit, NodeClientFailure> WriteAll(
        std::string_view data,
        Clock::time_point deadline,
        std::string_view timeout_message);

    /**
     * @brief Read whatever is available, waiting until `deadline`
     *
     * @return Ok(n) with n > 0 bytes read, Ok(0) on orderly shutdown by the
     *         peer, or Transport failure on error or timeout
     */
    [[nodiscard]] Result<size_t, NodeClientFailure> ReadSome(
        char* buffer,
        size_t capacity,
        Clock::time_point deadline,
        std::string_view timeout_message);

    void Close() noexcept;

private:
    explicit UnixSocket(const int fd) noexcept : fd_(fd) {}

    /// Wait for `events` on the descriptor; Ok(false) means the deadline passed
    [[nodiscard]] Result<bool, NodeClientFailure> WaitFor(short events, Clock::time_point deadline) const;

    int fd_ = -1;
};

} // namespace c11n::transport
