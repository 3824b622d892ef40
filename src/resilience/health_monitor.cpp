// ============================================================================
// LIFELINE - Health Monitor Implementation
// ============================================================================
// Probe runs outside any lock; sample ingestion and listener notification are
// serialized so listeners observe samples in probe order.
// ============================================================================

#include "lifeline/resilience/health_monitor.hpp"
#include "lifeline/core/errors.hpp"
#include "lifeline/utils/logger.hpp"

#include <boost/asio.hpp>

#include <optional>
#include <thread>

namespace lifeline::resilience {

namespace net = boost::asio;

// ============================================================================
// Health Monitor Implementation
// ============================================================================

struct HealthMonitor::Impl {
    Impl(const config::HealthConfig& config, IProbeTarget& target, MonoClockFn clock)
        : config_(config), target_(target), clock_(std::move(clock)) {}

    // ------------------------------------------------------------------------
    // Evaluation (mutex_ held)
    // ------------------------------------------------------------------------

    void ingest_locked(const HealthSample& sample, std::vector<HealthSignal>& signals) {
        // New session: failures of the previous one do not count
        if (sample.generation != window_generation_) {
            window_generation_ = sample.generation;
            consecutive_failures_ = 0;
        }

        samples_.push(sample);

        if (sample.status == SampleStatus::Ok) {
            consecutive_failures_ = 0;
            return;
        }

        ++consecutive_failures_;
        if (consecutive_failures_ == config_.failure_threshold) {
            HealthSignal signal;
            signal.kind = HealthSignalKind::Degrading;
            signal.at = now();
            signal.consecutive_failures = consecutive_failures_;
            signal.generation = sample.generation;
            signals.push_back(signal);
        }
    }

    void evaluate_staleness_locked(std::vector<HealthSignal>& signals) {
        if (!last_market_update_) return;

        const auto age = clock_() - *last_market_update_;
        if (age <= config_.staleness_threshold) return;

        HealthSignal signal;
        signal.at = now();
        signal.data_age = std::chrono::duration_cast<std::chrono::seconds>(age);
        signal.generation = window_generation_;

        if (!stale_open_) {
            stale_open_ = true;
            signal.kind = HealthSignalKind::Stale;
            signals.push_back(signal);
        }
        if (!stale_escalated_ && age > config_.staleness_threshold + config_.stale_grace_period) {
            stale_escalated_ = true;
            signal.kind = HealthSignalKind::StalePersistent;
            signals.push_back(signal);
        }
    }

    // ------------------------------------------------------------------------
    // Notification (notify_mutex_ held, mutex_ released)
    // ------------------------------------------------------------------------

    void notify(const std::optional<HealthSample>& sample, const std::vector<HealthSignal>& signals) {
        std::vector<IHealthListener*> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listeners = listeners_;
        }

        if (sample) {
            if (sample->status == SampleStatus::Ok) {
                LOG_TRACE("Health probe ok ({} us)", sample->round_trip_latency.count());
            } else {
                LOG_WARN("Health probe {} ({}/{})", to_string(sample->status),
                         consecutive_failures(), config_.failure_threshold);
            }
            for (auto* listener : listeners) {
                listener->on_health_sample(*sample);
            }
        }

        for (const auto& signal : signals) {
            switch (signal.kind) {
                case HealthSignalKind::Degrading:
                    LOG_WARN("Session degrading: {} consecutive failed probes",
                             signal.consecutive_failures);
                    break;
                case HealthSignalKind::Stale:
                    LOG_WARN("Market data stale: last update {} s ago", signal.data_age.count());
                    break;
                case HealthSignalKind::StalePersistent:
                    LOG_ERROR("Market data stale beyond grace period: last update {} s ago",
                              signal.data_age.count());
                    break;
                case HealthSignalKind::Fresh:
                    LOG_INFO("Market data fresh again");
                    break;
            }
            for (auto* listener : listeners) {
                listener->on_health_signal(signal);
            }
        }
    }

    uint32_t consecutive_failures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return consecutive_failures_;
    }

    // ------------------------------------------------------------------------
    // Timer Loop
    // ------------------------------------------------------------------------

    void schedule(HealthMonitor* self) {
        timer_->expires_after(config_.probe_interval);
        timer_->async_wait([this, self](const boost::system::error_code& ec) {
            if (ec) return;
            try {
                self->run_cycle();
            } catch (const std::exception& e) {
                LOG_ERROR("Health cycle failed: {}", e.what());
            }
            schedule(self);
        });
    }

    // Members
    config::HealthConfig config_;
    IProbeTarget& target_;
    MonoClockFn clock_;

    mutable std::mutex mutex_;
    std::mutex notify_mutex_;
    HistoryRing<HealthSample, SAMPLE_WINDOW> samples_;
    uint32_t consecutive_failures_ = 0;
    uint64_t window_generation_ = 0;
    std::optional<MonoTime> last_market_update_;  // armed on first READY
    bool stale_open_ = false;
    bool stale_escalated_ = false;
    std::vector<IHealthListener*> listeners_;

    std::unique_ptr<net::io_context> io_context_;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work_;
    std::unique_ptr<net::steady_timer> timer_;
    std::thread thread_;
};

// ============================================================================
// HealthMonitor Public Interface
// ============================================================================

HealthMonitor::HealthMonitor(const config::HealthConfig& config, IProbeTarget& target,
                             MonoClockFn clock)
    : impl_(std::make_unique<Impl>(config, target, std::move(clock))) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::add_listener(IHealthListener* listener) {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    impl_->listeners_.push_back(listener);
}

void HealthMonitor::start() {
    if (running_.exchange(true)) return;

    impl_->io_context_ = std::make_unique<net::io_context>(1);
    impl_->work_.emplace(net::make_work_guard(*impl_->io_context_));
    impl_->timer_ = std::make_unique<net::steady_timer>(*impl_->io_context_);
    impl_->schedule(this);
    impl_->thread_ = std::thread([this] { impl_->io_context_->run(); });

    LOG_INFO("Health monitor started (interval {} ms, threshold {})",
             impl_->config_.probe_interval.count(), impl_->config_.failure_threshold);
}

void HealthMonitor::stop() {
    if (!running_.exchange(false)) return;

    net::post(*impl_->io_context_, [this] { impl_->timer_->cancel(); });
    impl_->work_.reset();
    impl_->io_context_->stop();
    if (impl_->thread_.joinable()) {
        impl_->thread_.join();
    }
    impl_->timer_.reset();
    impl_->io_context_.reset();

    LOG_INFO("Health monitor stopped");
}

void HealthMonitor::run_cycle() {
    const bool ready = impl_->target_.probe_ready();
    const uint64_t generation = impl_->target_.probe_generation();

    std::optional<HealthSample> sample;
    if (ready) {
        HealthSample s;
        s.generation = generation;
        const auto started = mono_now();
        try {
            impl_->target_.probe(started + impl_->config_.probe_timeout);
            s.status = SampleStatus::Ok;
        } catch (const RequestTimeoutError& e) {
            s.status = SampleStatus::Timeout;
            LOG_DEBUG("Health probe timed out: {}", e.what());
        } catch (const std::exception& e) {
            s.status = SampleStatus::Error;
            LOG_DEBUG("Health probe failed: {}", e.what());
        }
        s.round_trip_latency =
            std::chrono::duration_cast<std::chrono::microseconds>(mono_now() - started);
        s.timestamp = now();
        sample = s;
    }

    std::lock_guard<std::mutex> notify_lock(impl_->notify_mutex_);
    std::vector<HealthSignal> signals;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        if (ready && !impl_->last_market_update_) {
            impl_->last_market_update_ = impl_->clock_();
        }
        if (sample) {
            impl_->ingest_locked(*sample, signals);
        }
        impl_->evaluate_staleness_locked(signals);
    }
    impl_->notify(sample, signals);
}

void HealthMonitor::note_market_update() {
    std::lock_guard<std::mutex> notify_lock(impl_->notify_mutex_);
    std::vector<HealthSignal> signals;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        impl_->last_market_update_ = impl_->clock_();
        if (impl_->stale_open_) {
            HealthSignal signal;
            signal.kind = HealthSignalKind::Fresh;
            signal.at = now();
            signal.generation = impl_->window_generation_;
            signals.push_back(signal);
        }
        impl_->stale_open_ = false;
        impl_->stale_escalated_ = false;
    }
    impl_->notify(std::nullopt, signals);
}

void HealthMonitor::record_request_timeout() {
    HealthSample sample;
    sample.timestamp = now();
    sample.status = SampleStatus::Timeout;
    sample.generation = impl_->target_.probe_generation();

    std::lock_guard<std::mutex> notify_lock(impl_->notify_mutex_);
    std::vector<HealthSignal> signals;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        impl_->ingest_locked(sample, signals);
    }
    impl_->notify(sample, signals);
}

uint32_t HealthMonitor::consecutive_failures() const {
    return impl_->consecutive_failures();
}

std::vector<HealthSample> HealthMonitor::recent_samples() const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    return impl_->samples_.snapshot();
}

std::optional<std::chrono::seconds> HealthMonitor::data_age() const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    if (!impl_->last_market_update_) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::seconds>(impl_->clock_() -
                                                           *impl_->last_market_update_);
}

}  // namespace lifeline::resilience
