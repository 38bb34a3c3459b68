#include "c11n/models/encrypted_payload_hash.hpp"
#include "c11n/encoding/base64.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace c11n::models {
    Result<EncryptedPayloadHash, NodeClientFailure> EncryptedPayloadHash::FromBytes(
        const std::span<const uint8_t> bytes) {
        if (bytes.size() != SIZE) {
            return Result<EncryptedPayloadHash, NodeClientFailure>::Err(
                NodeClientFailure::InvalidInput(
                    fmt::format("{} (got {})", core::ErrorMessages::INVALID_HASH_SIZE, bytes.size())));
        }
        Bytes copy{};
        std::copy(bytes.begin(), bytes.end(), copy.begin());
        return Result<EncryptedPayloadHash, NodeClientFailure>::Ok(EncryptedPayloadHash(copy));
    }

    Result<EncryptedPayloadHash, NodeClientFailure> EncryptedPayloadHash::FromBase64(
        const std::string_view b64) {
        auto decoded = encoding::Base64::Decode(b64);
        if (decoded.IsErr()) {
            return Result<EncryptedPayloadHash, NodeClientFailure>::Err(
                NodeClientFailure::InvalidInput(
                    fmt::format("Transaction hash is not base64: {}", decoded.UnwrapErr().message)));
        }
        return FromBytes(decoded.Unwrap());
    }

    std::string EncryptedPayloadHash::ToBase64() const {
        return encoding::Base64::Encode(bytes_);
    }
}
