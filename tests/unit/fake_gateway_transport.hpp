#pragma once
// ============================================================================
// LIFELINE - Test Doubles
// ============================================================================
// Scripted gateway transport and probe target shared by the unit tests.
// ============================================================================

#include "lifeline/config/config.hpp"
#include "lifeline/core/errors.hpp"
#include "lifeline/gateway/gateway_transport.hpp"
#include "lifeline/resilience/health_monitor.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace lifeline::test {

using namespace std::chrono_literals;

enum class Fault {
    None,
    Transient,
    AuthPending,
    AuthRejected,
    Timeout,
    Invalid
};

inline void throw_fault(Fault fault, const std::string& where) {
    switch (fault) {
        case Fault::None:
            return;
        case Fault::Transient:
            throw TransientConnectionError(where + ": connection refused");
        case Fault::AuthPending:
            throw AuthenticationError(where + ": waiting for second factor", true);
        case Fault::AuthRejected:
            throw AuthenticationError(where + ": invalid credentials", false);
        case Fault::Timeout:
            throw RequestTimeoutError(where + ": deadline exceeded");
        case Fault::Invalid:
            throw InvalidResponseError(where + ": malformed body");
    }
}

/// Poll until pred holds or timeout elapses
inline bool wait_for(const std::function<bool()>& pred,
                     std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

// ============================================================================
// Fake Gateway Transport
// ============================================================================

class FakeGatewayTransport : public gateway::IGatewayTransport {
public:
    // ------------------------------------------------------------------------
    // Scripting
    // ------------------------------------------------------------------------

    void fail_opens(int count, Fault fault = Fault::Transient) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int i = 0; i < count; ++i) open_faults_.push_back(fault);
    }

    void fail_auths(int count, Fault fault) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int i = 0; i < count; ++i) auth_faults_.push_back(fault);
    }

    void set_heartbeat_fault(Fault fault) { heartbeat_fault_.store(fault); }
    void set_snapshot_fault(Fault fault) { snapshot_fault_.store(fault); }
    void set_snapshot_delay(std::chrono::milliseconds delay) { snapshot_delay_.store(delay.count()); }
    void set_qualify_delay(std::chrono::milliseconds delay) { qualify_delay_.store(delay.count()); }
    void set_qualify_fault(Fault fault) { qualify_fault_.store(fault); }

    void set_unknown(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        unknown_.insert(key);
    }

    void set_quote(const Quote& quote) {
        std::lock_guard<std::mutex> lock(mutex_);
        quote_ = quote;
    }

    void set_bars(std::vector<Bar> bars) {
        std::lock_guard<std::mutex> lock(mutex_);
        bars_ = std::move(bars);
    }

    // ------------------------------------------------------------------------
    // Observation
    // ------------------------------------------------------------------------

    std::atomic<int> open_calls{0};
    std::atomic<int> auth_calls{0};
    std::atomic<int> heartbeat_calls{0};
    std::atomic<int> qualify_calls{0};
    std::atomic<int> snapshot_calls{0};
    std::atomic<int> historical_calls{0};
    std::atomic<int> close_calls{0};
    std::atomic<int> cancelled_calls{0};

    std::atomic<int> active_data_calls{0};
    std::atomic<int> max_concurrent_data_calls{0};
    std::atomic<int> max_concurrent_same_contract{0};

    std::vector<ClientId> client_ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return client_ids_;
    }

    // ------------------------------------------------------------------------
    // IGatewayTransport
    // ------------------------------------------------------------------------

    void open(const config::GatewayEndpoint& /*endpoint*/, ClientId client_id,
              MonoTime /*deadline*/) override {
        ++open_calls;
        Fault fault = Fault::None;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            client_ids_.push_back(client_id);
            if (!open_faults_.empty()) {
                fault = open_faults_.front();
                open_faults_.pop_front();
            }
        }
        throw_fault(fault, "open");
    }

    void authenticate(MonoTime /*deadline*/) override {
        ++auth_calls;
        Fault fault = Fault::None;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!auth_faults_.empty()) {
                fault = auth_faults_.front();
                auth_faults_.pop_front();
            }
        }
        throw_fault(fault, "authenticate");
    }

    void heartbeat(MonoTime /*deadline*/) override {
        ++heartbeat_calls;
        throw_fault(heartbeat_fault_.load(), "heartbeat");
    }

    QualifiedContract qualify(const ContractKey& key, const ContractSpec& spec,
                              MonoTime deadline) override {
        ++qualify_calls;
        const auto delay = std::chrono::milliseconds(qualify_delay_.load());
        if (delay.count() > 0) {
            if (mono_now() + delay > deadline) {
                std::this_thread::sleep_until(deadline);
                throw RequestTimeoutError("qualify: deadline exceeded");
            }
            std::this_thread::sleep_for(delay);
        }
        throw_fault(qualify_fault_.load(), "qualify");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (unknown_.count(key.str()) != 0) {
                throw QualificationError("No contract found for " + key.str());
            }
        }
        QualifiedContract contract;
        contract.key = key;
        contract.con_id = 1000 + static_cast<ConId>(std::hash<ContractKey>{}(key) % 100000);
        contract.spec = spec;
        return contract;
    }

    Quote request_snapshot(const QualifiedContract& contract,
                           const gateway::RequestContext& ctx) override {
        ++snapshot_calls;
        ActiveCall active(*this, contract.key);
        pause(std::chrono::milliseconds(snapshot_delay_.load()), ctx);
        throw_fault(snapshot_fault_.load(), "snapshot");

        std::lock_guard<std::mutex> lock(mutex_);
        Quote quote = quote_;
        quote.con_id = contract.con_id;
        if (quote.timestamp == Timestamp{}) quote.timestamp = now();
        return quote;
    }

    std::vector<Bar> request_historical(const QualifiedContract& contract,
                                        const HistoricalWindow& /*window*/,
                                        const gateway::RequestContext& ctx) override {
        ++historical_calls;
        ActiveCall active(*this, contract.key);
        pause(std::chrono::milliseconds(snapshot_delay_.load()), ctx);
        throw_fault(snapshot_fault_.load(), "historical");

        std::lock_guard<std::mutex> lock(mutex_);
        return bars_;
    }

    void close() noexcept override { ++close_calls; }

private:
    /// Tracks concurrency for the duration of one data call
    struct ActiveCall {
        FakeGatewayTransport& owner;
        ContractKey key;

        ActiveCall(FakeGatewayTransport& o, const ContractKey& k) : owner(o), key(k) {
            const int now_active = ++owner.active_data_calls;
            bump(owner.max_concurrent_data_calls, now_active);
            std::lock_guard<std::mutex> lock(owner.mutex_);
            bump(owner.max_concurrent_same_contract, ++owner.per_contract_[key]);
        }

        ~ActiveCall() {
            --owner.active_data_calls;
            std::lock_guard<std::mutex> lock(owner.mutex_);
            --owner.per_contract_[key];
        }

        static void bump(std::atomic<int>& max, int value) {
            int current = max.load();
            while (value > current && !max.compare_exchange_weak(current, value)) {}
        }
    };

    /// Sleep that honors the call's deadline and cancel flag
    void pause(std::chrono::milliseconds delay, const gateway::RequestContext& ctx) {
        const auto until = mono_now() + delay;
        while (mono_now() < until) {
            if (ctx.is_cancelled()) {
                ++cancelled_calls;
                throw RequestCancelledError("cancelled");
            }
            if (ctx.expired()) {
                throw RequestTimeoutError("deadline exceeded");
            }
            std::this_thread::sleep_for(1ms);
        }
    }

    mutable std::mutex mutex_;
    std::deque<Fault> open_faults_;
    std::deque<Fault> auth_faults_;
    std::atomic<Fault> heartbeat_fault_{Fault::None};
    std::atomic<Fault> snapshot_fault_{Fault::None};
    std::atomic<Fault> qualify_fault_{Fault::None};
    std::atomic<int64_t> snapshot_delay_{0};
    std::atomic<int64_t> qualify_delay_{0};
    std::set<std::string> unknown_;
    std::vector<ClientId> client_ids_;
    std::unordered_map<ContractKey, int> per_contract_;

    Quote quote_ = [] {
        Quote q;
        q.bid = 449.95;
        q.ask = 450.05;
        q.last = 450.00;
        q.volume = 1200.0;
        return q;
    }();
    std::vector<Bar> bars_;
};

// ============================================================================
// Fake Probe Target
// ============================================================================

class FakeProbeTarget : public resilience::IProbeTarget {
public:
    std::atomic<bool> ready{true};
    std::atomic<uint64_t> generation{1};
    std::atomic<Fault> fault{Fault::None};
    std::atomic<int> probe_calls{0};

    bool probe_ready() const override { return ready.load(); }
    uint64_t probe_generation() const override { return generation.load(); }

    void probe(MonoTime /*deadline*/) override {
        ++probe_calls;
        throw_fault(fault.load(), "probe");
    }
};

// ============================================================================
// Manual Clock
// ============================================================================

class ManualClock {
public:
    void advance(std::chrono::milliseconds delta) { offset_ms_ += delta.count(); }

    [[nodiscard]] MonoClockFn fn() {
        return [this] { return base_ + std::chrono::milliseconds(offset_ms_.load()); };
    }

private:
    MonoTime base_ = mono_now();
    std::atomic<int64_t> offset_ms_{0};
};

// ============================================================================
// Configuration
// ============================================================================

/// Defaults scaled down to milliseconds so state machines settle quickly
inline config::CoreConfig fast_config() {
    config::CoreConfig config;
    config.session.startup_timeout = std::chrono::seconds(5);
    config.session.handshake_timeout = 500ms;
    config.session.qualification_timeout = 1000ms;

    config.backoff.max_attempts = 30;
    config.backoff.initial_delay = 5ms;
    config.backoff.multiplier = 2.0;
    config.backoff.max_delay = 20ms;
    config.backoff.jitter_ratio = 0.0;
    config.backoff.second_factor_wait = 10ms;

    config.health.probe_interval = 5ms;
    config.health.probe_timeout = 100ms;

    config.gate.default_timeout = 1000ms;
    config.logging.console = false;
    config.logging.log_file.clear();
    return config;
}

/// Friday 2026-02-06, hh:mm UTC (RTH is 14:30-21:00 UTC)
inline Timestamp friday_utc(int hours, int minutes) {
    constexpr int64_t MIDNIGHT_MS = 1770336000000;
    return from_epoch_ms(MIDNIGHT_MS + (hours * 60 + minutes) * 60'000LL);
}

}  // namespace lifeline::test
