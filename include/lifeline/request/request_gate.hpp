#pragma once
// ============================================================================
// LIFELINE - Request Gate
// ============================================================================
// Sole path from callers to the gateway for market data. Validates every
// request locally before any network call, in this order:
//
//   1. mode must be Snapshot            -> UnsafeModeRejected
//   2. session must be READY            -> SessionNotReady
//   3. historical window bounds and RTH -> InvalidWindow / WindowTooLarge
//   4. contract qualified (qualifies once on demand) -> NotQualified
//
// Accepted requests run on a worker pool under a deadline. Requests for the
// same contract are serialized; distinct contracts run concurrently up to
// max_in_flight. Leaving READY cancels in-flight calls with SessionClosed,
// entering degraded mode cancels them with Degraded.
// ============================================================================

#include "lifeline/config/config.hpp"
#include "lifeline/core/errors.hpp"
#include "lifeline/core/types.hpp"
#include "lifeline/gateway/gateway_transport.hpp"
#include "lifeline/resilience/degradation_coordinator.hpp"
#include "lifeline/resilience/health_monitor.hpp"
#include "lifeline/session/session_manager.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lifeline::request {

struct SubmitResult {
    uint64_t request_id = 0;
    RequestError error = RequestError::None;
    std::string detail;
    std::optional<Quote> quote;     // MarketSnapshot
    std::vector<Bar> bars;          // HistoricalBars, invalid bars removed
    uint32_t dropped_bars = 0;
    bool qualified_on_demand = false;

    [[nodiscard]] bool ok() const noexcept { return error == RequestError::None; }
};

class RequestGate : public session::ISessionListener, public resilience::IDegradationListener {
public:
    /// monitor may be null (no timeout samples, no data-age tracking)
    RequestGate(const config::CoreConfig& config,
                session::SessionManager& session,
                std::shared_ptr<gateway::IGatewayTransport> transport,
                resilience::HealthMonitor* monitor = nullptr);
    ~RequestGate() override;

    // Non-copyable
    RequestGate(const RequestGate&) = delete;
    RequestGate& operator=(const RequestGate&) = delete;

    /// Blocking; returns within the request deadline (plus local queueing)
    [[nodiscard]] SubmitResult submit(const DataRequest& request);

    /// Complete every in-flight call with reason and raise its cancel flag
    void cancel_all(RequestError reason);

    [[nodiscard]] size_t in_flight() const;

    // ISessionListener
    void on_session_event(const session::SessionEvent& event) override;

    // IDegradationListener
    void on_degradation_entered(const resilience::DegradationEvent& event) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lifeline::request
