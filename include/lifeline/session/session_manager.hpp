#pragma once
// ============================================================================
// LIFELINE - Session Manager
// ============================================================================
// Owns the single logical gateway session and drives its state machine:
//
//   DISCONNECTED -> CONNECTING -> AUTHENTICATING -> READY
//        ^              ^                             |
//        |              +------- RECONNECTING <-------+  (transport error,
//        +--------------------------+                    handshake failure,
//                  (budget exhausted / auth rejected)    health verdict)
//
// One supervisory worker (Boost.Asio io_context thread) runs connection
// attempts and backoff timers. All transitions go through one lock-protected
// mutator; listeners are notified in transition order outside that lock.
// ============================================================================

#include "lifeline/config/config.hpp"
#include "lifeline/gateway/gateway_transport.hpp"
#include "lifeline/resilience/backoff_policy.hpp"
#include "lifeline/resilience/health_monitor.hpp"
#include "lifeline/session/client_id_allocator.hpp"
#include "lifeline/session/session.hpp"

#include <memory>
#include <optional>
#include <string>

namespace lifeline::session {

class SessionManager : public resilience::IProbeTarget, public resilience::IHealthListener {
public:
    SessionManager(const config::CoreConfig& config,
                   std::shared_ptr<gateway::IGatewayTransport> transport,
                   std::shared_ptr<ClientIdAllocator> allocator,
                   resilience::BackoffPolicy backoff);
    ~SessionManager() override;

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Register before connect(); listeners must outlive the manager.
    /// Listeners must not call connect() from their callback.
    void add_listener(ISessionListener* listener);

    /// Start connecting if DISCONNECTED (no-op otherwise), then block until
    /// READY, DISCONNECTED or the startup timeout. Returns the state observed.
    SessionState connect();

    /// Graceful close. No degradation event.
    void disconnect();

    /// disconnect() and stop the worker. Idempotent.
    void shutdown();

    [[nodiscard]] SessionState current_state() const noexcept;
    [[nodiscard]] SessionSnapshot snapshot() const;

    /// At most one gateway qualification per contract per session.
    /// Positive and negative (unknown contract) results are cached.
    [[nodiscard]] QualificationResult qualify(const ContractKey& key, MonoTime deadline);

    /// Cached positive qualification for the current session
    [[nodiscard]] std::optional<QualifiedContract> lookup_qualified(const ContractKey& key) const;

    /// Escalate a transport failure seen on a data call (READY -> RECONNECTING)
    void report_transport_failure(const std::string& detail);

    // IProbeTarget
    [[nodiscard]] bool probe_ready() const override;
    [[nodiscard]] uint64_t probe_generation() const override;
    void probe(MonoTime deadline) override;

    // IHealthListener
    void on_health_signal(const resilience::HealthSignal& signal) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lifeline::session
