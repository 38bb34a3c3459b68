#pragma once

#include "c11n/core/result.hpp"
#include "c11n/core/failures.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace c11n::encoding {

using core::Result;
using core::Unit;
using core::NodeClientFailure;

/**
 * @brief Standard (RFC 4648, padded) base64 over libsodium
 *
 * Participant keys, lookup keys and transaction hashes travel as standard
 * base64 text in headers and path segments; the send endpoints answer with
 * a base64 body.
 */
class Base64 {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Decode calls it implicitly; encoding
     * needs no library state.
     */
    static Result<Unit, NodeClientFailure> Initialize();

    [[nodiscard]] static std::string Encode(std::span<const uint8_t> data);

    /**
     * @brief Decode standard base64 text
     *
     * CR and LF anywhere in the input are skipped. Any other character
     * outside the alphabet, bad padding or trailing garbage is a Decoding
     * failure.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, NodeClientFailure> Decode(std::string_view text);

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    Base64() = delete;
};

} // namespace c11n::encoding
