#pragma once
// ============================================================================
// LIFELINE - Health Monitor
// ============================================================================
// Independent periodic probe of the active session. Produces one HealthSample
// per cycle, counts consecutive failures, tracks market-data age.
// Only signals listeners; never mutates session state itself.
//
// Signals:
//   Degrading        consecutive non-ok samples reached the threshold
//   Stale            no market update for longer than the staleness threshold
//   StalePersistent  stale episode outlived the grace period (escalates)
//   Fresh            market data arrived and closed a stale episode
// ============================================================================

#include "lifeline/config/config.hpp"
#include "lifeline/core/ring_buffer.hpp"
#include "lifeline/core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lifeline::resilience {

// ============================================================================
// Samples and Signals
// ============================================================================

enum class SampleStatus : uint8_t {
    Ok = 0,
    Timeout = 1,
    Error = 2
};

[[nodiscard]] constexpr std::string_view to_string(SampleStatus status) noexcept {
    switch (status) {
        case SampleStatus::Ok:      return "ok";
        case SampleStatus::Timeout: return "timeout";
        case SampleStatus::Error:   return "error";
    }
    return "unknown";
}

struct HealthSample {
    Timestamp timestamp{};
    std::chrono::microseconds round_trip_latency{0};
    SampleStatus status = SampleStatus::Ok;
    uint64_t generation = 0;        // session generation the probe ran against
};

enum class HealthSignalKind : uint8_t {
    Degrading = 0,
    Stale = 1,
    StalePersistent = 2,
    Fresh = 3
};

[[nodiscard]] constexpr std::string_view to_string(HealthSignalKind kind) noexcept {
    switch (kind) {
        case HealthSignalKind::Degrading:       return "degrading";
        case HealthSignalKind::Stale:           return "stale";
        case HealthSignalKind::StalePersistent: return "stale_persistent";
        case HealthSignalKind::Fresh:           return "fresh";
    }
    return "unknown";
}

struct HealthSignal {
    HealthSignalKind kind = HealthSignalKind::Degrading;
    Timestamp at{};
    uint32_t consecutive_failures = 0;
    std::chrono::seconds data_age{0};
    uint64_t generation = 0;
};

// ============================================================================
// Collaborator Interfaces
// ============================================================================

class IHealthListener {
public:
    virtual ~IHealthListener() = default;

    virtual void on_health_sample(const HealthSample& /*sample*/) {}
    virtual void on_health_signal(const HealthSignal& /*signal*/) {}
};

/// What the monitor probes (implemented by the session manager)
class IProbeTarget {
public:
    virtual ~IProbeTarget() = default;

    /// True while a session is READY
    [[nodiscard]] virtual bool probe_ready() const = 0;

    /// Identity of the current session; changes on every reconnect
    [[nodiscard]] virtual uint64_t probe_generation() const = 0;

    /// Heartbeat the gateway. Throws RequestTimeoutError or GatewayError.
    virtual void probe(MonoTime deadline) = 0;
};

// ============================================================================
// Health Monitor
// ============================================================================

class HealthMonitor {
public:
    static constexpr size_t SAMPLE_WINDOW = 64;

    HealthMonitor(const config::HealthConfig& config, IProbeTarget& target,
                  MonoClockFn clock = mono_now);
    ~HealthMonitor();

    // Non-copyable
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /// Register before start(); listeners must outlive the monitor
    void add_listener(IHealthListener* listener);

    /// Run cycles every probe_interval on a dedicated timer thread
    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    /// One probe + staleness evaluation. Public so callers can step it.
    void run_cycle();

    /// A market update was received (resets data age, closes stale episodes)
    void note_market_update();

    /// A data request timed out; recorded as a Timeout sample
    void record_request_timeout();

    [[nodiscard]] uint32_t consecutive_failures() const;
    [[nodiscard]] std::vector<HealthSample> recent_samples() const;

    /// Age of the latest market update. nullopt until the first READY session.
    [[nodiscard]] std::optional<std::chrono::seconds> data_age() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::atomic<bool> running_{false};
};

}  // namespace lifeline::resilience
