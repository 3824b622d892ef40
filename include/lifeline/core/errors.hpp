#pragma once
// ============================================================================
// LIFELINE - Error Taxonomy
// ============================================================================
// Exceptions raised by transports and configuration, and the typed error
// codes the request path returns to callers instead of throwing.
// ============================================================================

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lifeline {

// ============================================================================
// Gateway Exceptions
// ============================================================================

/// Base for every failure reported by a gateway transport
class GatewayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Network-level or gateway-unavailable failure. Retried with backoff.
class TransientConnectionError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/// Authentication refused or waiting on out-of-band second factor approval
class AuthenticationError : public GatewayError {
public:
    AuthenticationError(const std::string& what, bool pending_second_factor)
        : GatewayError(what), pending_second_factor_(pending_second_factor) {}

    [[nodiscard]] bool pending_second_factor() const noexcept { return pending_second_factor_; }

private:
    bool pending_second_factor_;
};

/// Contract unknown to the gateway or malformed contract key
class QualificationError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/// Gateway did not answer before the deadline
class RequestTimeoutError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/// Call aborted because its cancellation flag was raised
class RequestCancelledError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/// Gateway answered with a body that could not be decoded
class InvalidResponseError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

/// Invalid or unreadable configuration
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Failure Classes (input to the retry policy)
// ============================================================================

enum class FailureClass : uint8_t {
    Transient = 0,
    AuthPendingSecondFactor = 1,
    AuthRejected = 2
};

[[nodiscard]] constexpr std::string_view to_string(FailureClass cls) noexcept {
    switch (cls) {
        case FailureClass::Transient:               return "transient";
        case FailureClass::AuthPendingSecondFactor: return "auth_pending_2fa";
        case FailureClass::AuthRejected:            return "auth_rejected";
    }
    return "unknown";
}

// ============================================================================
// Request Errors (returned, never thrown)
// ============================================================================

enum class RequestError : uint8_t {
    None = 0,
    SessionNotReady,
    UnsafeModeRejected,
    NotQualified,
    WindowTooLarge,
    InvalidWindow,
    RequestTimeout,
    SessionClosed,
    Degraded,
    TransportFailure,
    InvalidResponse,
    StaleData
};

[[nodiscard]] constexpr std::string_view to_string(RequestError error) noexcept {
    switch (error) {
        case RequestError::None:               return "none";
        case RequestError::SessionNotReady:    return "session_not_ready";
        case RequestError::UnsafeModeRejected: return "unsafe_mode_rejected";
        case RequestError::NotQualified:       return "not_qualified";
        case RequestError::WindowTooLarge:     return "window_too_large";
        case RequestError::InvalidWindow:      return "invalid_window";
        case RequestError::RequestTimeout:     return "request_timeout";
        case RequestError::SessionClosed:      return "session_closed";
        case RequestError::Degraded:           return "degraded";
        case RequestError::TransportFailure:   return "transport_failure";
        case RequestError::InvalidResponse:    return "invalid_response";
        case RequestError::StaleData:          return "stale_data";
    }
    return "unknown";
}

}  // namespace lifeline
