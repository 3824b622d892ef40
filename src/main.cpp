// ============================================================================
// LIFELINE - Gateway Supervisor Daemon
// ============================================================================
// Keeps one market-data gateway session alive and reports whether it is safe
// to act on it.
//
// Architecture:
//   [Session Worker] --events--> [Coordinator] --entered/recovered--> [Gate]
//          ^                          ^
//          |  degrading / stale       |  samples / stale_persistent
//   [Health Monitor] -----------------+
//
// The process never exits on gateway trouble: it stays up in capital
// preservation mode and keeps retrying on a slow cadence.
// ============================================================================

#include "lifeline/config/config.hpp"
#include "lifeline/core/errors.hpp"
#include "lifeline/gateway/rest_transport.hpp"
#include "lifeline/request/request_gate.hpp"
#include "lifeline/resilience/backoff_policy.hpp"
#include "lifeline/resilience/degradation_coordinator.hpp"
#include "lifeline/resilience/health_monitor.hpp"
#include "lifeline/session/client_id_allocator.hpp"
#include "lifeline/session/session_manager.hpp"
#include "lifeline/utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace {
    std::atomic<bool> g_running{true};

    void signal_handler(int /*signal*/) {
        g_running.store(false, std::memory_order_release);
    }

    constexpr auto LOOP_TICK = std::chrono::milliseconds(200);
}

using namespace lifeline;

// ============================================================================
// Configuration
// ============================================================================

config::CoreConfig load_daemon_config(const std::string& path) {
    if (std::filesystem::exists(path)) {
        return config::load_config(path);
    }

    // No file: defaults plus environment (container deployments)
    config::CoreConfig config;
    config::apply_env_overrides(config, config::process_env());
    config.validate();
    return config;
}

// ============================================================================
// Daemon
// ============================================================================

class LifelineDaemon {
public:
    explicit LifelineDaemon(const config::CoreConfig& config)
        : config_(config),
          transport_(std::make_shared<gateway::RestGatewayTransport>()),
          allocator_(std::make_shared<session::ClientIdAllocator>(config.session.reserved_client_ids)),
          coordinator_(config.degradation),
          session_(config, transport_, allocator_,
                   resilience::BackoffPolicy(
                       config.backoff,
                       resilience::BackoffPolicy::random_jitter(
                           static_cast<uint64_t>(to_epoch_ms(now()))))),
          monitor_(config.health, session_),
          gate_(config, session_, transport_, &monitor_) {
        session_.add_listener(&coordinator_);
        session_.add_listener(&gate_);
        monitor_.add_listener(&session_);
        monitor_.add_listener(&coordinator_);
        coordinator_.subscribe(&gate_);
    }

    ~LifelineDaemon() { stop(); }

    // Non-copyable
    LifelineDaemon(const LifelineDaemon&) = delete;
    LifelineDaemon& operator=(const LifelineDaemon&) = delete;

    void start() {
        LOG_INFO("========================================");
        LOG_INFO("  LIFELINE - Gateway Supervisor");
        LOG_INFO("  Gateway:   {}:{}{}", config_.gateway.host, config_.gateway.port,
                 config_.gateway.base_path);
        LOG_INFO("  Retries:   {} (initial {} ms, max {} ms)", config_.backoff.max_attempts,
                 config_.backoff.initial_delay.count(), config_.backoff.max_delay.count());
        LOG_INFO("  Startup:   {} s", config_.session.startup_timeout.count());
        LOG_INFO("  Watchlist: {} contracts", config_.daemon.watchlist.size());
        LOG_INFO("========================================");

        monitor_.start();
        begin_connect();
    }

    /// Supervisory loop; returns when g_running drops
    void run() {
        auto next_status = mono_now() + config_.daemon.status_interval;
        auto next_poll = mono_now();
        auto next_reconnect = mono_now() + config_.daemon.reconnect_interval;

        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(LOOP_TICK);
            const auto t = mono_now();

            collect_connect_result();

            if (!connect_pending_.valid() &&
                session_.current_state() == session::SessionState::Disconnected &&
                t >= next_reconnect) {
                LOG_WARN("Session DISCONNECTED, starting a new connection cycle");
                begin_connect();
                next_reconnect = t + config_.daemon.reconnect_interval;
            }

            if (t >= next_poll) {
                poll_watchlist();
                next_poll = t + config_.daemon.poll_interval;
            }

            if (t >= next_status) {
                log_status();
                next_status = t + config_.daemon.status_interval;
            }
        }
    }

    void stop() {
        if (stopped_) return;
        stopped_ = true;

        LOG_INFO("Stopping...");
        monitor_.stop();
        session_.shutdown();
        gate_.cancel_all(RequestError::SessionClosed);
        if (connect_pending_.valid()) {
            connect_pending_.wait();
            collect_connect_result();
        }
        log_status();
    }

private:
    void begin_connect() {
        connect_pending_ = std::async(std::launch::async, [this] { return session_.connect(); });
    }

    void collect_connect_result() {
        if (!connect_pending_.valid()) return;
        if (connect_pending_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return;

        const auto state = connect_pending_.get();
        if (state == session::SessionState::Ready) {
            const auto snap = session_.snapshot();
            LOG_INFO("Gateway session READY (client id {}, generation {})", snap.client_id,
                     snap.generation);
            return;
        }
        if (stopped_) return;

        LOG_CRITICAL("Gateway session not ready after connect: state {}", session::to_string(state));
        coordinator_.note_connect_result(state);
    }

    void poll_watchlist() {
        if (session_.current_state() != session::SessionState::Ready) return;

        for (const auto& key : config_.daemon.watchlist) {
            DataRequest request;
            request.contract_key = ContractKey(key);
            request.kind = RequestKind::MarketSnapshot;
            request.mode = DataMode::Snapshot;
            request.issued_at = now();

            const auto result = gate_.submit(request);
            if (!result.ok()) {
                LOG_WARN("Snapshot {} failed: {} {}", key, to_string(result.error), result.detail);
                continue;
            }
            LOG_DEBUG("Snapshot {} last={} bid={} ask={}", key,
                      result.quote->last.value_or(0.0), result.quote->bid.value_or(0.0),
                      result.quote->ask.value_or(0.0));
        }
    }

    void log_status() {
        const auto snap = session_.snapshot();
        const auto age = monitor_.data_age();
        const auto open = coordinator_.open_event();

        LOG_INFO("Status: session={} client_id={} gen={} uptime={}s reconnects={} "
                 "qualified={} data_age={} safe_mode={}",
                 session::to_string(snap.state), snap.client_id, snap.generation,
                 snap.uptime().count(), snap.reconnect_count, snap.qualified_count,
                 age ? std::to_string(age->count()) + "s" : std::string("n/a"),
                 coordinator_.safe_mode_active() ? "ACTIVE" : "off");
        if (open) {
            LOG_WARN("Open degradation event #{} [{}]: {}", open->id,
                     to_string(open->trigger_reason), open->detail);
        }
    }

    config::CoreConfig config_;
    std::shared_ptr<gateway::RestGatewayTransport> transport_;
    std::shared_ptr<session::ClientIdAllocator> allocator_;

    // Declaration order is teardown order in reverse: the gate goes first,
    // the coordinator outlives everything that notifies it.
    resilience::DegradationCoordinator coordinator_;
    session::SessionManager session_;
    resilience::HealthMonitor monitor_;
    request::RequestGate gate_;

    std::future<session::SessionState> connect_pending_;
    bool stopped_ = false;
};

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    std::string config_path = "config/lifeline.yaml";
    if (argc > 1 && argv[1][0] != '-') {
        config_path = argv[1];
    }

    config::CoreConfig config;
    try {
        config = load_daemon_config(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] Invalid configuration (" << config_path << "): " << e.what() << "\n";
        return 1;
    }

    utils::Logger::initialize(config.logging);
    LOG_INFO("Configuration loaded from {}",
             std::filesystem::exists(config_path) ? config_path : std::string("environment"));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int exit_code = 0;
    try {
        LifelineDaemon daemon(config);
        daemon.start();
        daemon.run();
        daemon.stop();
    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception: {}", e.what());
        exit_code = 1;
    }

    utils::Logger::shutdown();
    return exit_code;
}
