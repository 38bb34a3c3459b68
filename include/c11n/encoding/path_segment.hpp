#pragma once
#include "c11n/core/result.hpp"
#include "c11n/core/failures.hpp"
#include <string>
#include <string_view>
namespace c11n::encoding {
using core::Result;
using core::NodeClientFailure;
class PathSegment {
public:
    // Percent-encodes every byte outside the RFC 3986 unreserved set, so
    // base64 '+', '/' and '=' never reach the node unescaped.
    [[nodiscard]] static std::string Escape(std::string_view segment);
    [[nodiscard]] static Result<std::string, NodeClientFailure> Unescape(std::string_view escaped);
    [[nodiscard]] static constexpr bool IsUnreserved(const char c) noexcept {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
            || c == '-' || c == '.' || c == '_' || c == '~';
    }
private:
    PathSegment() = delete;
};
}
