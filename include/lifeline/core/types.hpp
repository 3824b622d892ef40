#pragma once
// ============================================================================
// LIFELINE - Core Types
// ============================================================================
// Fundamental type definitions shared by the session, health and request
// layers. Wall-clock timestamps for data, monotonic time for deadlines.
// ============================================================================

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace lifeline {

// ============================================================================
// Time Types
// ============================================================================

/// Nanosecond precision wall-clock timestamp
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Duration in nanoseconds
using Duration = std::chrono::nanoseconds;

/// Monotonic time used for deadlines and intervals
using MonoClock = std::chrono::steady_clock;
using MonoTime = MonoClock::time_point;

/// Injectable monotonic clock (tests drive time manually)
using MonoClockFn = std::function<MonoTime()>;

/// Get current timestamp with nanosecond precision
[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

[[nodiscard]] inline MonoTime mono_now() noexcept {
    return MonoClock::now();
}

/// Convert timestamp to Unix epoch milliseconds (gateway format)
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/// Convert Unix epoch milliseconds to Timestamp
[[nodiscard]] inline Timestamp from_epoch_ms(int64_t epoch_ms) noexcept {
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

// ============================================================================
// Identity Types
// ============================================================================

/// Gateway client identity. Positive, 32-bit (gateway API constraint).
using ClientId = int32_t;

/// Gateway contract identifier returned by qualification
using ConId = int64_t;

/// Fixed-size contract key (e.g. "SPY" or "SPY-20260206-C-450")
/// Stored inline to avoid heap allocation on the request path.
/// Keys longer than MAX_LENGTH are never truncated: they are kept empty and
/// flagged oversized, and no oversized key names a contract.
class ContractKey {
public:
    static constexpr size_t MAX_LENGTH = 47;

    ContractKey() noexcept : length_(0), oversized_(false) { data_[0] = '\0'; }

    explicit ContractKey(std::string_view key) noexcept
        : length_(0), oversized_(key.size() > MAX_LENGTH) {
        if (!oversized_) {
            length_ = static_cast<uint8_t>(key.size());
            std::copy_n(key.data(), length_, data_);
        }
        data_[length_] = '\0';
    }

    [[nodiscard]] std::string_view view() const noexcept {
        return {data_, length_};
    }

    [[nodiscard]] std::string str() const { return std::string(view()); }
    [[nodiscard]] const char* c_str() const noexcept { return data_; }
    [[nodiscard]] size_t size() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }
    [[nodiscard]] bool oversized() const noexcept { return oversized_; }

    bool operator==(const ContractKey& other) const noexcept {
        return oversized_ == other.oversized_ && view() == other.view();
    }

    bool operator!=(const ContractKey& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const ContractKey& other) const noexcept {
        if (oversized_ != other.oversized_) return other.oversized_;
        return view() < other.view();
    }

private:
    char data_[MAX_LENGTH + 1];
    uint8_t length_;
    bool oversized_;
};

// ============================================================================
// Market Data
// ============================================================================

/// One-shot market snapshot. Absent prices are nullopt.
struct Quote {
    ConId con_id = 0;
    std::optional<double> bid;
    std::optional<double> ask;
    std::optional<double> last;
    double volume = 0.0;
    Timestamp timestamp{};  // gateway update time, epoch if unknown

    /// At least one price, every present price positive, volume non-negative
    [[nodiscard]] bool is_valid() const noexcept {
        if (!bid && !ask && !last) return false;
        const auto positive = [](const std::optional<double>& p) {
            return !p || (std::isfinite(*p) && *p > 0.0);
        };
        return positive(bid) && positive(ask) && positive(last) &&
               std::isfinite(volume) && volume >= 0.0;
    }
};

/// OHLCV bar
struct Bar {
    Timestamp time{};
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    /// OHLC integrity: high bounds open/close, low bounds them from below
    [[nodiscard]] bool is_valid() const noexcept {
        if (open <= 0.0 || high <= 0.0 || low <= 0.0 || close <= 0.0) return false;
        if (volume < 0.0) return false;
        if (high < open || high < close) return false;
        if (low > open || low > close) return false;
        return high >= low;
    }
};

// ============================================================================
// Request Types
// ============================================================================

/// Delivery mode. Only Snapshot is ever allowed through to the gateway.
enum class DataMode : uint8_t {
    Snapshot = 0,
    Streaming = 1
};

enum class RequestKind : uint8_t {
    MarketSnapshot = 0,
    HistoricalBars = 1
};

/// Half-open historical window [start, end)
struct HistoricalWindow {
    Timestamp start{};
    Timestamp end{};
    std::chrono::seconds bar_size{60};

    [[nodiscard]] Duration length() const noexcept { return end - start; }

    /// Number of bars the gateway would return (rounded up)
    [[nodiscard]] int64_t bar_count() const noexcept {
        if (bar_size.count() <= 0 || end <= start) return 0;
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(end - start).count();
        return (secs + bar_size.count() - 1) / bar_size.count();
    }
};

/// Outbound data request as submitted by callers
struct DataRequest {
    ContractKey contract_key;
    RequestKind kind = RequestKind::MarketSnapshot;
    DataMode mode = DataMode::Snapshot;
    std::optional<HistoricalWindow> window;          // HistoricalBars only
    std::optional<std::chrono::milliseconds> timeout;  // default from config
    Timestamp issued_at{};
};

// ============================================================================
// Degradation
// ============================================================================

enum class DegradationReason : uint8_t {
    ConnectionExhausted = 0,
    DataStale = 1,
    AuthenticationFailed = 2,
    ManualOverride = 3,
    StartupTimeout = 4
};

[[nodiscard]] constexpr std::string_view to_string(DegradationReason reason) noexcept {
    switch (reason) {
        case DegradationReason::ConnectionExhausted:  return "connection_exhausted";
        case DegradationReason::DataStale:            return "data_stale";
        case DegradationReason::AuthenticationFailed: return "authentication_failed";
        case DegradationReason::ManualOverride:       return "manual_override";
        case DegradationReason::StartupTimeout:       return "startup_timeout";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(RequestKind kind) noexcept {
    return kind == RequestKind::MarketSnapshot ? "snapshot" : "historical";
}

}  // namespace lifeline

// ============================================================================
// Hash specialization for ContractKey (for use in unordered containers)
// ============================================================================

template <>
struct std::hash<lifeline::ContractKey> {
    size_t operator()(const lifeline::ContractKey& key) const noexcept {
        return std::hash<std::string_view>{}(key.view());
    }
};
