// ============================================================================
// LIFELINE - Retry/Backoff Policy Implementation
// ============================================================================

#include "lifeline/resilience/backoff_policy.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <mutex>
#include <random>

namespace lifeline::resilience {

BackoffPolicy::BackoffPolicy(const config::BackoffConfig& config, JitterSource jitter)
    : config_(config), jitter_(jitter ? std::move(jitter) : no_jitter()) {}

std::chrono::milliseconds BackoffPolicy::base_delay(uint32_t attempt_number) const noexcept {
    const uint32_t exponent = attempt_number > 0 ? attempt_number - 1 : 0;
    const double initial = static_cast<double>(config_.initial_delay.count());
    const double cap = static_cast<double>(config_.max_delay.count());

    const double raw = initial * std::pow(config_.multiplier, static_cast<double>(exponent));
    const double capped = std::isfinite(raw) ? std::min(raw, cap) : cap;
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

BackoffDecision BackoffPolicy::decide(uint32_t attempt_number, FailureClass failure) const {
    if (failure == FailureClass::AuthRejected) {
        return BackoffDecision::stop();
    }
    if (attempt_number >= config_.max_attempts) {
        return BackoffDecision::stop();
    }
    if (failure == FailureClass::AuthPendingSecondFactor) {
        return BackoffDecision::retry_after(config_.second_factor_wait);
    }

    const double base = static_cast<double>(base_delay(attempt_number).count());
    const double j = std::clamp(jitter_(), -1.0, 1.0);
    const double jittered = base * (1.0 + config_.jitter_ratio * j);
    const double bounded =
        std::clamp(jittered, 0.0, static_cast<double>(config_.max_delay.count()));
    return BackoffDecision::retry_after(std::chrono::milliseconds(static_cast<int64_t>(bounded)));
}

JitterSource BackoffPolicy::no_jitter() {
    return [] { return 0.0; };
}

JitterSource BackoffPolicy::random_jitter(uint64_t seed) {
    struct State {
        std::mutex mutex;
        std::mt19937_64 engine;
        std::uniform_real_distribution<double> dist{-1.0, 1.0};
    };
    auto state = std::make_shared<State>();
    state->engine.seed(seed);

    return [state] {
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->dist(state->engine);
    };
}

}  // namespace lifeline::resilience
