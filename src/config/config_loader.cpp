// ============================================================================
// LIFELINE - Configuration Loader
// ============================================================================
// yaml-cpp backed loader. Every key is optional; missing keys keep the
// defaults declared in config.hpp.
// ============================================================================

#include "lifeline/config/config.hpp"
#include "lifeline/core/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

namespace lifeline::config {

namespace {

// ============================================================================
// Helpers
// ============================================================================

template <typename Rep, typename Period>
void read_duration(const YAML::Node& node, const char* key,
                   std::chrono::duration<Rep, Period>& out) {
    if (node[key]) {
        out = std::chrono::duration<Rep, Period>(node[key].as<Rep>());
    }
}

template <typename T>
void read_value(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

/// "HH:MM" -> minutes since midnight
std::chrono::minutes parse_clock_time(const std::string& text) {
    const auto colon = text.find(':');
    if (colon == std::string::npos) {
        throw ConfigError("expected HH:MM, got '" + text + "'");
    }
    try {
        const int hours = std::stoi(text.substr(0, colon));
        const int minutes = std::stoi(text.substr(colon + 1));
        if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
            throw ConfigError("time of day out of range: '" + text + "'");
        }
        return std::chrono::minutes(hours * 60 + minutes);
    } catch (const std::logic_error&) {
        throw ConfigError("expected HH:MM, got '" + text + "'");
    }
}

double parse_number(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        const double parsed = std::stod(value, &used);
        if (used != value.size()) {
            throw ConfigError(name + " is not a number: '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigError(name + " is not a number: '" + value + "'");
    }
}

void require(bool condition, const char* message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

// ============================================================================
// Section Parsers
// ============================================================================

void parse_gateway(const YAML::Node& node, GatewayEndpoint& gw) {
    read_value(node, "host", gw.host);
    if (node["port"]) {
        const int port = node["port"].as<int>();
        if (port <= 0 || port > 65535) {
            throw ConfigError("gateway.port out of range: " + std::to_string(port));
        }
        gw.port = static_cast<uint16_t>(port);
    }
    read_value(node, "base_path", gw.base_path);
    read_value(node, "verify_tls", gw.verify_tls);
}

void parse_session(const YAML::Node& node, SessionConfig& session) {
    read_duration(node, "startup_timeout_s", session.startup_timeout);
    read_duration(node, "handshake_timeout_ms", session.handshake_timeout);
    read_duration(node, "qualification_timeout_ms", session.qualification_timeout);
    if (node["reserved_client_ids"]) {
        session.reserved_client_ids = node["reserved_client_ids"].as<std::vector<ClientId>>();
    }
}

void parse_backoff(const YAML::Node& node, BackoffConfig& backoff) {
    read_value(node, "max_attempts", backoff.max_attempts);
    read_duration(node, "initial_delay_ms", backoff.initial_delay);
    read_value(node, "multiplier", backoff.multiplier);
    read_duration(node, "max_delay_ms", backoff.max_delay);
    read_value(node, "jitter_ratio", backoff.jitter_ratio);
    read_duration(node, "second_factor_wait_ms", backoff.second_factor_wait);
}

void parse_health(const YAML::Node& node, HealthConfig& health) {
    read_duration(node, "probe_interval_ms", health.probe_interval);
    read_duration(node, "probe_timeout_ms", health.probe_timeout);
    read_value(node, "failure_threshold", health.failure_threshold);
    read_duration(node, "staleness_threshold_s", health.staleness_threshold);
    read_duration(node, "stale_grace_period_s", health.stale_grace_period);
}

void parse_gate(const YAML::Node& node, GateConfig& gate) {
    read_value(node, "max_in_flight", gate.max_in_flight);
    read_value(node, "worker_threads", gate.worker_threads);
    read_duration(node, "default_timeout_ms", gate.default_timeout);
    read_duration(node, "max_window_s", gate.max_window);
    read_value(node, "max_bars", gate.max_bars);

    if (const auto hours = node["trading_hours"]) {
        if (hours["open"]) {
            gate.trading_hours.open = parse_clock_time(hours["open"].as<std::string>());
        }
        if (hours["close"]) {
            gate.trading_hours.close = parse_clock_time(hours["close"].as<std::string>());
        }
        read_duration(hours, "utc_offset_minutes", gate.trading_hours.utc_offset);
    }
}

void parse_degradation(const YAML::Node& node, DegradationConfig& degradation) {
    read_value(node, "recovery_healthy_samples", degradation.recovery_healthy_samples);
    read_value(node, "history_size", degradation.history_size);
}

void parse_daemon(const YAML::Node& node, DaemonConfig& daemon) {
    if (node["watchlist"]) {
        daemon.watchlist = node["watchlist"].as<std::vector<std::string>>();
    }
    read_duration(node, "poll_interval_s", daemon.poll_interval);
    read_duration(node, "status_interval_s", daemon.status_interval);
    read_duration(node, "reconnect_interval_s", daemon.reconnect_interval);
}

void parse_logging(const YAML::Node& node, utils::LogConfig& logging) {
    if (node["level"]) {
        logging.level = utils::parse_log_level(node["level"].as<std::string>());
    }
    read_value(node, "file", logging.log_file);
    read_value(node, "console", logging.console);
    read_value(node, "async", logging.async);
    read_value(node, "queue_size", logging.queue_size);
    read_value(node, "max_file_size_mb", logging.max_file_size_mb);
    read_value(node, "max_files", logging.max_files);
}

CoreConfig from_yaml(const YAML::Node& yaml) {
    CoreConfig config;
    if (!yaml || yaml.IsNull()) {
        return config;
    }
    if (!yaml.IsMap()) {
        throw ConfigError("configuration root must be a mapping");
    }

    if (yaml["gateway"]) parse_gateway(yaml["gateway"], config.gateway);
    if (yaml["session"]) parse_session(yaml["session"], config.session);
    if (yaml["backoff"]) parse_backoff(yaml["backoff"], config.backoff);
    if (yaml["health"]) parse_health(yaml["health"], config.health);
    if (yaml["gate"]) parse_gate(yaml["gate"], config.gate);
    if (yaml["degradation"]) parse_degradation(yaml["degradation"], config.degradation);
    if (yaml["daemon"]) parse_daemon(yaml["daemon"], config.daemon);
    if (yaml["logging"]) parse_logging(yaml["logging"], config.logging);
    return config;
}

}  // namespace

// ============================================================================
// Validation
// ============================================================================

void CoreConfig::validate() const {
    require(!gateway.host.empty(), "gateway.host must not be empty");
    require(gateway.port != 0, "gateway.port must be non-zero");

    require(session.startup_timeout.count() > 0, "session.startup_timeout_s must be positive");
    require(session.handshake_timeout.count() > 0, "session.handshake_timeout_ms must be positive");
    require(session.qualification_timeout.count() > 0,
            "session.qualification_timeout_ms must be positive");
    for (ClientId id : session.reserved_client_ids) {
        require(id > 0, "session.reserved_client_ids must be positive");
    }

    require(backoff.max_attempts >= 1, "backoff.max_attempts must be at least 1");
    require(backoff.initial_delay.count() > 0, "backoff.initial_delay_ms must be positive");
    require(backoff.multiplier > 1.0, "backoff.multiplier must be greater than 1");
    require(backoff.max_delay >= backoff.initial_delay,
            "backoff.max_delay_ms must not be below initial_delay_ms");
    require(backoff.jitter_ratio >= 0.0 && backoff.jitter_ratio < 1.0,
            "backoff.jitter_ratio must be in [0, 1)");
    require(backoff.second_factor_wait.count() > 0, "backoff.second_factor_wait_ms must be positive");

    require(health.probe_interval.count() > 0, "health.probe_interval_ms must be positive");
    require(health.probe_timeout.count() > 0, "health.probe_timeout_ms must be positive");
    require(health.failure_threshold >= 1, "health.failure_threshold must be at least 1");
    require(health.staleness_threshold.count() > 0, "health.staleness_threshold_s must be positive");
    require(health.stale_grace_period.count() >= 0, "health.stale_grace_period_s must not be negative");

    require(gate.max_in_flight >= 1, "gate.max_in_flight must be at least 1");
    require(gate.worker_threads >= 1, "gate.worker_threads must be at least 1");
    require(gate.default_timeout.count() > 0, "gate.default_timeout_ms must be positive");
    require(gate.max_window.count() > 0, "gate.max_window_s must be positive");
    require(gate.max_bars >= 1, "gate.max_bars must be at least 1");
    require(gate.trading_hours.open < gate.trading_hours.close,
            "gate.trading_hours.open must be before close");

    require(degradation.recovery_healthy_samples >= 1,
            "degradation.recovery_healthy_samples must be at least 1");
    require(degradation.history_size >= 1, "degradation.history_size must be at least 1");

    require(daemon.poll_interval.count() > 0, "daemon.poll_interval_s must be positive");
    require(daemon.status_interval.count() > 0, "daemon.status_interval_s must be positive");
    require(daemon.reconnect_interval.count() > 0, "daemon.reconnect_interval_s must be positive");
    for (const auto& key : daemon.watchlist) {
        if (key.empty() || key.size() > ContractKey::MAX_LENGTH) {
            throw ConfigError("daemon.watchlist entry '" + key + "' is empty or too long");
        }
    }
}

// ============================================================================
// Environment Overrides
// ============================================================================

EnvLookup process_env() {
    return [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') return std::nullopt;
        return std::string(value);
    };
}

void apply_env_overrides(CoreConfig& config, const EnvLookup& env) {
    if (auto host = env("GATEWAY_HOST")) {
        config.gateway.host = *host;
    }
    if (auto port = env("GATEWAY_PORT")) {
        const double value = parse_number("GATEWAY_PORT", *port);
        if (value <= 0 || value > 65535) {
            throw ConfigError("GATEWAY_PORT out of range: " + *port);
        }
        config.gateway.port = static_cast<uint16_t>(value);
    }
    if (auto retries = env("GATEWAY_MAX_RETRIES")) {
        const double value = parse_number("GATEWAY_MAX_RETRIES", *retries);
        if (value < 1) {
            throw ConfigError("GATEWAY_MAX_RETRIES must be at least 1");
        }
        config.backoff.max_attempts = static_cast<uint32_t>(value);
    }
    if (auto timeout = env("GATEWAY_STARTUP_TIMEOUT")) {
        config.session.startup_timeout =
            seconds(static_cast<int64_t>(parse_number("GATEWAY_STARTUP_TIMEOUT", *timeout)));
    }
    if (auto interval = env("GATEWAY_RETRY_INTERVAL")) {
        // seconds, fractional allowed
        config.backoff.initial_delay = milliseconds(
            static_cast<int64_t>(parse_number("GATEWAY_RETRY_INTERVAL", *interval) * 1000.0));
        if (config.backoff.max_delay < config.backoff.initial_delay) {
            config.backoff.max_delay = config.backoff.initial_delay;
        }
    }
    if (auto level = env("LOG_LEVEL")) {
        config.logging.level = utils::parse_log_level(*level);
    }
}

// ============================================================================
// Entry Points
// ============================================================================

CoreConfig load_config(const std::string& path, const EnvLookup& env) {
    CoreConfig config;
    try {
        config = from_yaml(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("failed to load " + path + ": " + e.what());
    }
    apply_env_overrides(config, env);
    config.validate();
    return config;
}

CoreConfig load_config_from_string(const std::string& yaml) {
    CoreConfig config;
    try {
        config = from_yaml(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("failed to parse configuration: ") + e.what());
    }
    config.validate();
    return config;
}

}  // namespace lifeline::config
