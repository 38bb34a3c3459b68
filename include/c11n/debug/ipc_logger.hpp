#pragma once

/**
 * @file ipc_logger.hpp
 * @brief Debug tracing for node IPC traffic and process supervision.
 *
 * Traces request lines, status codes, header names and body sizes to stderr.
 * Payload bytes and key material are never printed.
 *
 * Enable via CMake: -DC11N_DEBUG_IPC=ON
 */

#include "c11n/core/failures.hpp"

#include <cstddef>
#include <cstdio>
#include <string>

namespace c11n::debug {

// ============================================================================
// Component identifiers - always defined so types are available
// ============================================================================

enum class Component {
    Transport,
    Client,
    Prober,
    Supervisor
};

#ifdef C11N_DEBUG_IPC

inline const char* ComponentToString(Component component) {
    switch (component) {
        case Component::Transport: return "TRANSPORT";
        case Component::Client: return "CLIENT";
        case Component::Prober: return "PROBER";
        case Component::Supervisor: return "SUPERVISOR";
    }
    return "UNKNOWN";
}

// ============================================================================
// Core logging macros
// ============================================================================

#define C11N_LOG_MSG(component, message) \
    do { \
        fprintf(stderr, "[C11N-DEBUG] %s %s\n", \
            ::c11n::debug::ComponentToString(component), \
            std::string(message).c_str()); \
        fflush(stderr); \
    } while(0)

#define C11N_LOG_REQUEST(method, target, body_size) \
    do { \
        fprintf(stderr, "[C11N-DEBUG] %s -> %s /%s (%zu body bytes)\n", \
            ::c11n::debug::ComponentToString(::c11n::debug::Component::Transport), \
            std::string(method).c_str(), \
            std::string(target).c_str(), \
            static_cast<size_t>(body_size)); \
        fflush(stderr); \
    } while(0)

#define C11N_LOG_RESPONSE(status, body_size) \
    do { \
        fprintf(stderr, "[C11N-DEBUG] %s <- %d (%zu body bytes)\n", \
            ::c11n::debug::ComponentToString(::c11n::debug::Component::Transport), \
            static_cast<int>(status), \
            static_cast<size_t>(body_size)); \
        fflush(stderr); \
    } while(0)

#define C11N_LOG_FAILURE(component, failure) \
    do { \
        fprintf(stderr, "[C11N-DEBUG] %s failed [%s]: %s\n", \
            ::c11n::debug::ComponentToString(component), \
            ::c11n::core::FailureTypeName((failure).type), \
            (failure).message.c_str()); \
        fflush(stderr); \
    } while(0)

#else // !C11N_DEBUG_IPC

#define C11N_LOG_MSG(component, message) ((void)0)
#define C11N_LOG_REQUEST(method, target, body_size) ((void)0)
#define C11N_LOG_RESPONSE(status, body_size) ((void)0)
#define C11N_LOG_FAILURE(component, failure) ((void)0)

#endif // C11N_DEBUG_IPC

} // namespace c11n::debug
