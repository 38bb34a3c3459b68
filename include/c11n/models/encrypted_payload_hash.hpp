#pragma once
#include "c11n/core/result.hpp"
#include "c11n/core/failures.hpp"
#include "c11n/core/constants.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
namespace c11n::models {
using core::Result;
using core::NodeClientFailure;
class EncryptedPayloadHash {
public:
    static constexpr size_t SIZE = core::NodeConstants::ENCRYPTED_PAYLOAD_HASH_SIZE;
    using Bytes = std::array<uint8_t, SIZE>;
    explicit EncryptedPayloadHash(const Bytes& bytes) noexcept : bytes_(bytes) {}
    EncryptedPayloadHash(const EncryptedPayloadHash&) = default;
    EncryptedPayloadHash(EncryptedPayloadHash&&) noexcept = default;
    EncryptedPayloadHash& operator=(const EncryptedPayloadHash&) = default;
    EncryptedPayloadHash& operator=(EncryptedPayloadHash&&) noexcept = default;
    ~EncryptedPayloadHash() = default;
    [[nodiscard]] static Result<EncryptedPayloadHash, NodeClientFailure> FromBytes(std::span<const uint8_t> bytes);
    [[nodiscard]] static Result<EncryptedPayloadHash, NodeClientFailure> FromBase64(std::string_view b64);
    [[nodiscard]] std::string ToBase64() const;
    [[nodiscard]] std::span<const uint8_t> GetBytesSpan() const noexcept {
        return std::span<const uint8_t>(bytes_);
    }
    [[nodiscard]] const Bytes& GetBytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] bool operator==(const EncryptedPayloadHash& other) const noexcept {
        return bytes_ == other.bytes_;
    }
private:
    Bytes bytes_;
};
}
