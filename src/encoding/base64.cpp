#include "c11n/encoding/base64.hpp"
#include "c11n/core/constants.hpp"

#include <sodium.h>

#include <utility>

namespace c11n::encoding {

namespace {
    constexpr int kVariant = sodium_base64_VARIANT_ORIGINAL;
    constexpr const char* kIgnoredCharacters = "\r\n";
}

Result<Unit, NodeClientFailure> Base64::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, NodeClientFailure>::Err(
            NodeClientFailure::InvalidInput(
                std::string(core::ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, NodeClientFailure>::Ok(core::unit);
}

std::string Base64::Encode(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }

    // encoded_len counts the trailing NUL
    const size_t encoded_len = sodium_base64_encoded_len(data.size(), kVariant);
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), kVariant);
    encoded.resize(encoded_len - 1);
    return encoded;
}

Result<std::vector<uint8_t>, NodeClientFailure> Base64::Decode(std::string_view text) {
    auto init_result = Initialize();
    if (init_result.IsErr()) {
        return Result<std::vector<uint8_t>, NodeClientFailure>::Err(
            std::move(init_result).UnwrapErr());
    }
    if (text.empty()) {
        return Result<std::vector<uint8_t>, NodeClientFailure>::Ok({});
    }

    std::vector<uint8_t> decoded(text.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          text.data(), text.size(),
                          kIgnoredCharacters, &decoded_len,
                          nullptr, kVariant) != 0) {
        return Result<std::vector<uint8_t>, NodeClientFailure>::Err(
            NodeClientFailure::Decoding(std::string(core::ErrorMessages::INVALID_BASE64)));
    }
    decoded.resize(decoded_len);
    return Result<std::vector<uint8_t>, NodeClientFailure>::Ok(std::move(decoded));
}

} // namespace c11n::encoding
