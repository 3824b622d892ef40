#pragma once
// ============================================================================
// LIFELINE - Core Configuration
// ============================================================================
// Immutable configuration consumed at construction time. Loaded from YAML
// with GATEWAY_* environment overrides (see config_loader.cpp).
// ============================================================================

#include "lifeline/core/trading_hours.hpp"
#include "lifeline/core/types.hpp"
#include "lifeline/utils/logger.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lifeline::config {

using std::chrono::milliseconds;
using std::chrono::seconds;

// ============================================================================
// Sections
// ============================================================================

struct GatewayEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 5000;
    std::string base_path = "/v1/api";
    bool verify_tls = false;            // gateway ships a self-signed certificate
};

struct SessionConfig {
    seconds startup_timeout{300};       // bound on connect()
    milliseconds handshake_timeout{10000};  // per attempt, open + authenticate
    milliseconds qualification_timeout{5000};
    std::vector<ClientId> reserved_client_ids{100};  // 100 = external health-check probe
};

struct BackoffConfig {
    uint32_t max_attempts = 30;         // retry budget
    milliseconds initial_delay{5000};
    double multiplier = 2.0;
    milliseconds max_delay{30000};
    double jitter_ratio = 0.1;          // +/- 10%
    milliseconds second_factor_wait{60000};  // fixed wait while 2FA is pending
};

struct HealthConfig {
    milliseconds probe_interval{10000};
    milliseconds probe_timeout{5000};
    uint32_t failure_threshold = 3;     // consecutive non-ok samples
    seconds staleness_threshold{300};   // 5 minutes without market data
    seconds stale_grace_period{0};      // extra time before data_stale escalates
};

struct GateConfig {
    uint32_t max_in_flight = 4;
    uint32_t worker_threads = 4;
    milliseconds default_timeout{10000};
    seconds max_window{3600};           // 1 RTH hour
    uint32_t max_bars = 1000;
    TradingHours trading_hours;
};

struct DegradationConfig {
    uint32_t recovery_healthy_samples = 3;
    size_t history_size = 64;
};

/// Supervisory loop of the lifeline executable
struct DaemonConfig {
    std::vector<std::string> watchlist{"SPY"};  // contract keys polled by snapshot
    seconds poll_interval{60};
    seconds status_interval{60};
    seconds reconnect_interval{300};            // retry cadence while DISCONNECTED
};

// ============================================================================
// Aggregate
// ============================================================================

struct CoreConfig {
    GatewayEndpoint gateway;
    SessionConfig session;
    BackoffConfig backoff;
    HealthConfig health;
    GateConfig gate;
    DegradationConfig degradation;
    DaemonConfig daemon;
    utils::LogConfig logging;

    /// Throws ConfigError on the first invalid value
    void validate() const;
};

// ============================================================================
// Loading
// ============================================================================

/// Environment lookup (injectable for tests)
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

/// Reads the process environment
[[nodiscard]] EnvLookup process_env();

/// Load from a YAML file, apply environment overrides, validate
[[nodiscard]] CoreConfig load_config(const std::string& path, const EnvLookup& env = process_env());

/// Load from YAML text (no environment overrides), validate
[[nodiscard]] CoreConfig load_config_from_string(const std::string& yaml);

/// Apply GATEWAY_HOST, GATEWAY_PORT, GATEWAY_MAX_RETRIES, GATEWAY_STARTUP_TIMEOUT,
/// GATEWAY_RETRY_INTERVAL and LOG_LEVEL
void apply_env_overrides(CoreConfig& config, const EnvLookup& env);

}  // namespace lifeline::config
