#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace c11n::encoding {

/**
 * @brief Comma-separated participant lists as carried by the node API
 *
 * Recipients go out in the `c11n-to` header, and the participants of a
 * transaction come back in a response body, in the same form.
 */
class ParticipantList {
public:
    /// Comma-join base64 identifiers; an empty list yields an empty string
    [[nodiscard]] static std::string Join(const std::vector<std::string>& b64_keys);

    /// Base64-encode raw public keys, preserving order
    [[nodiscard]] static std::vector<std::string> EncodeKeys(
        const std::vector<std::vector<uint8_t>>& raw_keys);

    /**
     * @brief Split a body on ','
     *
     * Mirrors a plain string split: the result always has at least one
     * element, so an empty body yields `{""}`, not `{}`. Callers that need an
     * empty list must check for that case themselves.
     */
    [[nodiscard]] static std::vector<std::string> Split(std::string_view body);

private:
    ParticipantList() = delete;
};

} // namespace c11n::encoding
