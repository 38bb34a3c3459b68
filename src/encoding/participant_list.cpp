#include "c11n/encoding/participant_list.hpp"
#include "c11n/encoding/base64.hpp"
#include "c11n/core/constants.hpp"

namespace c11n::encoding {

std::string ParticipantList::Join(const std::vector<std::string>& b64_keys) {
    std::string joined;
    for (size_t i = 0; i < b64_keys.size(); ++i) {
        if (i > 0) {
            joined.push_back(core::NodeConstants::PARTICIPANT_SEPARATOR);
        }
        joined += b64_keys[i];
    }
    return joined;
}

std::vector<std::string> ParticipantList::EncodeKeys(
    const std::vector<std::vector<uint8_t>>& raw_keys) {
    std::vector<std::string> encoded;
    encoded.reserve(raw_keys.size());
    for (const auto& key : raw_keys) {
        encoded.push_back(Base64::Encode(key));
    }
    return encoded;
}

std::vector<std::string> ParticipantList::Split(std::string_view body) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t separator = body.find(core::NodeConstants::PARTICIPANT_SEPARATOR, start);
        if (separator == std::string_view::npos) {
            parts.emplace_back(body.substr(start));
            return parts;
        }
        parts.emplace_back(body.substr(start, separator - start));
        start = separator + 1;
    }
}

} // namespace c11n::encoding
