#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
namespace c11n::core {
enum class NodeClientFailureType {
    Launch,
    Transport,
    UnexpectedStatus,
    Decoding,
    InvalidInput
};
using HeaderList = std::vector<std::pair<std::string, std::string>>;
class NodeClientFailure {
public:
    NodeClientFailureType type;
    std::string message;
    std::optional<int> status_code;
    HeaderList headers;
    NodeClientFailure(const NodeClientFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static NodeClientFailure Launch(std::string msg) {
        return {NodeClientFailureType::Launch, std::move(msg)};
    }
    static NodeClientFailure Transport(std::string msg) {
        return {NodeClientFailureType::Transport, std::move(msg)};
    }
    static NodeClientFailure UnexpectedStatus(std::string msg, const int status, HeaderList response_headers) {
        NodeClientFailure failure{NodeClientFailureType::UnexpectedStatus, std::move(msg)};
        failure.status_code = status;
        failure.headers = std::move(response_headers);
        return failure;
    }
    static NodeClientFailure Decoding(std::string msg) {
        return {NodeClientFailureType::Decoding, std::move(msg)};
    }
    static NodeClientFailure InvalidInput(std::string msg) {
        return {NodeClientFailureType::InvalidInput, std::move(msg)};
    }
    // Transport is the only retryable kind.
    [[nodiscard]] bool IsRetryable() const noexcept {
        return type == NodeClientFailureType::Transport;
    }
};
[[nodiscard]] inline const char* FailureTypeName(const NodeClientFailureType type) noexcept {
    switch (type) {
        case NodeClientFailureType::Launch: return "Launch";
        case NodeClientFailureType::Transport: return "Transport";
        case NodeClientFailureType::UnexpectedStatus: return "UnexpectedStatus";
        case NodeClientFailureType::Decoding: return "Decoding";
        case NodeClientFailureType::InvalidInput: return "InvalidInput";
    }
    return "Unknown";
}
}
