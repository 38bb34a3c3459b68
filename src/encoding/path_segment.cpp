#include "c11n/encoding/path_segment.hpp"

#include <fmt/core.h>

#include <utility>

namespace c11n::encoding {

namespace {
    constexpr char kHexDigits[] = "0123456789ABCDEF";

    int HexValue(const char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    }
}

std::string PathSegment::Escape(std::string_view segment) {
    std::string escaped;
    escaped.reserve(segment.size() * 3);
    for (const char c : segment) {
        if (IsUnreserved(c)) {
            escaped.push_back(c);
            continue;
        }
        const auto byte = static_cast<unsigned char>(c);
        escaped.push_back('%');
        escaped.push_back(kHexDigits[byte >> 4]);
        escaped.push_back(kHexDigits[byte & 0x0F]);
    }
    return escaped;
}

Result<std::string, NodeClientFailure> PathSegment::Unescape(std::string_view escaped) {
    std::string segment;
    segment.reserve(escaped.size());
    for (size_t i = 0; i < escaped.size(); ++i) {
        if (escaped[i] != '%') {
            segment.push_back(escaped[i]);
            continue;
        }
        if (i + 2 >= escaped.size()) {
            return Result<std::string, NodeClientFailure>::Err(
                NodeClientFailure::Decoding(
                    fmt::format("Truncated percent escape at offset {}", i)));
        }
        const int high = HexValue(escaped[i + 1]);
        const int low = HexValue(escaped[i + 2]);
        if (high < 0 || low < 0) {
            return Result<std::string, NodeClientFailure>::Err(
                NodeClientFailure::Decoding(
                    fmt::format("Invalid percent escape at offset {}", i)));
        }
        segment.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return Result<std::string, NodeClientFailure>::Ok(std::move(segment));
}

} // namespace c11n::encoding
