#pragma once
// ============================================================================
// LIFELINE - Degradation Coordinator
// ============================================================================
// Process-wide arbiter of "is it safe to act". Enters capital-preservation
// mode immediately on any trigger and leaves it only when the session is
// READY, enough consecutive healthy samples have been seen since, and every
// trigger-specific release condition holds:
//
//   connection_exhausted   nothing extra
//   authentication_failed  explicit acknowledge_authentication()
//   data_stale             market data fresh again
//   manual_override        explicit clear_manual_override()
//   startup_timeout        nothing extra (connect() gave up waiting while
//                          the session was still retrying)
// ============================================================================

#include "lifeline/config/config.hpp"
#include "lifeline/core/types.hpp"
#include "lifeline/resilience/health_monitor.hpp"
#include "lifeline/session/session.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lifeline::resilience {

struct DegradationEvent {
    uint64_t id = 0;
    DegradationReason trigger_reason = DegradationReason::ManualOverride;
    std::string detail;
    Timestamp entered_at{};
    std::optional<Timestamp> recovered_at;

    [[nodiscard]] bool is_open() const noexcept { return !recovered_at.has_value(); }
};

class IDegradationListener {
public:
    virtual ~IDegradationListener() = default;
    virtual void on_degradation_entered(const DegradationEvent& event) = 0;
    virtual void on_degradation_recovered(const DegradationEvent& /*event*/) {}
};

class DegradationCoordinator : public session::ISessionListener, public IHealthListener {
public:
    explicit DegradationCoordinator(const config::DegradationConfig& config);

    // Non-copyable
    DegradationCoordinator(const DegradationCoordinator&) = delete;
    DegradationCoordinator& operator=(const DegradationCoordinator&) = delete;

    /// Register before wiring; listeners must outlive the coordinator
    void subscribe(IDegradationListener* listener);

    /// Absolute veto for order-affecting actions. Lock-free.
    [[nodiscard]] bool safe_mode_active() const noexcept {
        return safe_mode_active_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_safe_to_act() const noexcept { return !safe_mode_active(); }

    [[nodiscard]] std::optional<DegradationEvent> open_event() const;

    /// Closed events, oldest first (bounded)
    [[nodiscard]] std::vector<DegradationEvent> history() const;

    /// Enter (or extend) degraded mode. Never blocks on I/O.
    void trigger(DegradationReason reason, const std::string& detail);

    void trigger_manual_override(const std::string& detail);
    void clear_manual_override();

    /// Operator confirmation that an authentication failure was dealt with
    void acknowledge_authentication();

    /// Classify the state connect() returned in. READY needs nothing and
    /// DISCONNECTED was already escalated by the session itself. Any other
    /// state means the startup timeout expired with retries still scheduled.
    void note_connect_result(session::SessionState state);

    /// Consecutive healthy samples observed since the session became READY
    [[nodiscard]] uint32_t healthy_streak() const;

    // ISessionListener
    void on_session_event(const session::SessionEvent& event) override;

    // IHealthListener
    void on_health_sample(const HealthSample& sample) override;
    void on_health_signal(const HealthSignal& signal) override;

private:
    struct Notification {
        bool entered = false;
        DegradationEvent event;
    };

    /// Returns the notification to deliver once mutex_ is released
    std::optional<Notification> try_recover_locked();
    void deliver(const std::optional<Notification>& notification);

    config::DegradationConfig config_;
    std::atomic<bool> safe_mode_active_{false};

    mutable std::mutex mutex_;
    std::optional<DegradationEvent> open_;
    std::set<DegradationReason> blockers_;  // release conditions still outstanding
    std::deque<DegradationEvent> history_;
    uint64_t next_event_id_ = 1;

    bool session_ready_ = false;
    uint64_t ready_generation_ = 0;
    uint32_t healthy_streak_ = 0;
    bool data_fresh_ = true;

    std::vector<IDegradationListener*> listeners_;
};

}  // namespace lifeline::resilience
