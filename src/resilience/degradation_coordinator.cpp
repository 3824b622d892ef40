// ============================================================================
// LIFELINE - Degradation Coordinator Implementation
// ============================================================================

#include "lifeline/resilience/degradation_coordinator.hpp"
#include "lifeline/utils/logger.hpp"

namespace lifeline::resilience {

DegradationCoordinator::DegradationCoordinator(const config::DegradationConfig& config)
    : config_(config) {}

void DegradationCoordinator::subscribe(IDegradationListener* listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(listener);
}

std::optional<DegradationEvent> DegradationCoordinator::open_event() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::vector<DegradationEvent> DegradationCoordinator::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {history_.begin(), history_.end()};
}

uint32_t DegradationCoordinator::healthy_streak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return healthy_streak_;
}

// ============================================================================
// Entry
// ============================================================================

void DegradationCoordinator::trigger(DegradationReason reason, const std::string& detail) {
    std::optional<Notification> notification;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        switch (reason) {
            case DegradationReason::AuthenticationFailed:
            case DegradationReason::ManualOverride:
                blockers_.insert(reason);
                break;
            case DegradationReason::DataStale:
                data_fresh_ = false;
                blockers_.insert(reason);
                break;
            case DegradationReason::ConnectionExhausted:
            case DegradationReason::StartupTimeout:
                break;
        }

        if (open_) {
            LOG_WARN("Additional degradation trigger {} while event {} ({}) is open: {}",
                     to_string(reason), open_->id, to_string(open_->trigger_reason), detail);
            return;
        }

        DegradationEvent event;
        event.id = next_event_id_++;
        event.trigger_reason = reason;
        event.detail = detail;
        event.entered_at = now();
        open_ = event;
        healthy_streak_ = 0;
        safe_mode_active_.store(true, std::memory_order_release);

        LOG_CRITICAL("SAFE MODE ENTERED [{}]: {}", to_string(reason), detail);
        notification = Notification{true, event};
    }
    deliver(notification);
}

void DegradationCoordinator::trigger_manual_override(const std::string& detail) {
    trigger(DegradationReason::ManualOverride, detail);
}

// ============================================================================
// Release Conditions
// ============================================================================

void DegradationCoordinator::clear_manual_override() {
    std::optional<Notification> notification;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (blockers_.erase(DegradationReason::ManualOverride) != 0) {
            LOG_INFO("Manual override cleared");
        }
        notification = try_recover_locked();
    }
    deliver(notification);
}

void DegradationCoordinator::acknowledge_authentication() {
    std::optional<Notification> notification;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (blockers_.erase(DegradationReason::AuthenticationFailed) != 0) {
            LOG_INFO("Authentication failure acknowledged");
        }
        notification = try_recover_locked();
    }
    deliver(notification);
}

void DegradationCoordinator::note_connect_result(session::SessionState state) {
    if (state == session::SessionState::Ready || state == session::SessionState::Disconnected) {
        return;
    }
    trigger(DegradationReason::StartupTimeout,
            "startup timeout expired in state " + std::string(session::to_string(state)) +
                ", retries still scheduled");
}

void DegradationCoordinator::on_session_event(const session::SessionEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (event.to == session::SessionState::Ready) {
            session_ready_ = true;
            ready_generation_ = event.generation;
        } else {
            session_ready_ = false;
        }
        healthy_streak_ = 0;
    }

    if (event.escalation) {
        trigger(*event.escalation, event.reason);
    }
}

void DegradationCoordinator::on_health_sample(const HealthSample& sample) {
    std::optional<Notification> notification;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ready_ || sample.generation != ready_generation_) return;

        if (sample.status == SampleStatus::Ok) {
            ++healthy_streak_;
        } else {
            healthy_streak_ = 0;
        }
        notification = try_recover_locked();
    }
    deliver(notification);
}

void DegradationCoordinator::on_health_signal(const HealthSignal& signal) {
    switch (signal.kind) {
        case HealthSignalKind::StalePersistent:
            trigger(DegradationReason::DataStale,
                    "no market data for " + std::to_string(signal.data_age.count()) + " s");
            break;
        case HealthSignalKind::Fresh: {
            std::optional<Notification> notification;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                data_fresh_ = true;
                blockers_.erase(DegradationReason::DataStale);
                notification = try_recover_locked();
            }
            deliver(notification);
            break;
        }
        case HealthSignalKind::Degrading:
        case HealthSignalKind::Stale:
            break;
    }
}

// ============================================================================
// Recovery
// ============================================================================

std::optional<DegradationCoordinator::Notification> DegradationCoordinator::try_recover_locked() {
    if (!open_) return std::nullopt;
    if (!session_ready_ || healthy_streak_ < config_.recovery_healthy_samples) return std::nullopt;
    if (!blockers_.empty() || !data_fresh_) return std::nullopt;

    open_->recovered_at = now();
    DegradationEvent closed = *open_;
    open_.reset();

    history_.push_back(closed);
    while (history_.size() > config_.history_size) {
        history_.pop_front();
    }
    safe_mode_active_.store(false, std::memory_order_release);

    const auto duration = std::chrono::duration_cast<std::chrono::seconds>(
        *closed.recovered_at - closed.entered_at);
    LOG_WARN("SAFE MODE CLEARED [{}] after {} s ({} healthy samples)",
             to_string(closed.trigger_reason), duration.count(), healthy_streak_);
    return Notification{false, closed};
}

void DegradationCoordinator::deliver(const std::optional<Notification>& notification) {
    if (!notification) return;

    std::vector<IDegradationListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }

    for (auto* listener : listeners) {
        try {
            if (notification->entered) {
                listener->on_degradation_entered(notification->event);
            } else {
                listener->on_degradation_recovered(notification->event);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Degradation listener failed: {}", e.what());
        }
    }
}

}  // namespace lifeline::resilience
