#pragma once
// ============================================================================
// LIFELINE - Retry/Backoff Policy
// ============================================================================
// Pure retry decision: exponential growth with jitter, capped, with a finite
// attempt budget. Holds no mutable state; jitter comes from an injected source.
// ============================================================================

#include "lifeline/config/config.hpp"
#include "lifeline/core/errors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

namespace lifeline::resilience {

struct BackoffDecision {
    bool give_up = false;
    std::chrono::milliseconds wait{0};

    [[nodiscard]] static BackoffDecision retry_after(std::chrono::milliseconds delay) noexcept {
        return {false, delay};
    }

    [[nodiscard]] static BackoffDecision stop() noexcept {
        return {true, std::chrono::milliseconds{0}};
    }
};

/// Returns a value in [-1, 1]; scaled by the configured jitter ratio
using JitterSource = std::function<double()>;

class BackoffPolicy {
public:
    explicit BackoffPolicy(const config::BackoffConfig& config, JitterSource jitter = {});

    /// attempt_number: 1-based count of failed attempts so far
    [[nodiscard]] BackoffDecision decide(uint32_t attempt_number, FailureClass failure) const;

    /// Delay before jitter: initial * multiplier^(attempt-1), capped at max_delay
    [[nodiscard]] std::chrono::milliseconds base_delay(uint32_t attempt_number) const noexcept;

    [[nodiscard]] uint32_t budget() const noexcept { return config_.max_attempts; }

    /// Jitter source that always returns 0
    [[nodiscard]] static JitterSource no_jitter();

    /// Uniform jitter from a seeded generator (thread-safe)
    [[nodiscard]] static JitterSource random_jitter(uint64_t seed);

private:
    config::BackoffConfig config_;
    JitterSource jitter_;
};

}  // namespace lifeline::resilience
