#pragma once
// ============================================================================
// LIFELINE - Session Types
// ============================================================================
// The single logical gateway session and the events its transitions emit.
// ============================================================================

#include "lifeline/core/contract.hpp"
#include "lifeline/core/errors.hpp"
#include "lifeline/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lifeline::session {

// ============================================================================
// Connection State
// ============================================================================

enum class SessionState : uint8_t {
    Disconnected = 0,
    Connecting = 1,
    Authenticating = 2,
    Ready = 3,
    Reconnecting = 4
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Disconnected:   return "DISCONNECTED";
        case SessionState::Connecting:     return "CONNECTING";
        case SessionState::Authenticating: return "AUTHENTICATING";
        case SessionState::Ready:          return "READY";
        case SessionState::Reconnecting:   return "RECONNECTING";
    }
    return "UNKNOWN";
}

// ============================================================================
// Qualification
// ============================================================================

struct QualificationResult {
    RequestError error = RequestError::None;
    std::optional<QualifiedContract> contract;
    std::string detail;
    bool from_cache = false;

    [[nodiscard]] bool ok() const noexcept { return error == RequestError::None && contract.has_value(); }
};

// ============================================================================
// Session
// ============================================================================

/// Recreated on every (re)connect; qualification never survives a reconnect
struct Session {
    ClientId id = 0;
    uint64_t generation = 0;
    SessionState state = SessionState::Disconnected;
    Timestamp created_at{};
    Timestamp last_heartbeat_at{};
    std::unordered_map<ContractKey, QualificationResult> qualified_contracts;
};

enum class AttemptOutcome : uint8_t {
    Pending = 0,
    Success = 1,
    Failure = 2
};

struct ConnectionAttempt {
    uint32_t attempt_number = 0;
    MonoTime started_at{};
    AttemptOutcome outcome = AttemptOutcome::Pending;
    std::optional<FailureClass> failure_class;
};

/// Read-only view for monitoring
struct SessionSnapshot {
    SessionState state = SessionState::Disconnected;
    ClientId client_id = 0;
    uint64_t generation = 0;
    Timestamp created_at{};
    Timestamp last_heartbeat_at{};
    Timestamp ready_since{};
    size_t qualified_count = 0;
    uint64_t reconnect_count = 0;
    uint32_t attempt_number = 0;

    [[nodiscard]] std::chrono::seconds uptime() const noexcept {
        if (state != SessionState::Ready) return std::chrono::seconds{0};
        return std::chrono::duration_cast<std::chrono::seconds>(now() - ready_since);
    }
};

// ============================================================================
// Events
// ============================================================================

struct SessionEvent {
    SessionState from = SessionState::Disconnected;
    SessionState to = SessionState::Disconnected;
    ClientId client_id = 0;
    uint64_t generation = 0;
    uint32_t attempt_number = 0;
    Timestamp at{};
    std::string reason;
    std::optional<DegradationReason> escalation;  // set when the coordinator must act
};

class ISessionListener {
public:
    virtual ~ISessionListener() = default;
    virtual void on_session_event(const SessionEvent& event) = 0;
};

}  // namespace lifeline::session
