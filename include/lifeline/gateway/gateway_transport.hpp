#pragma once
// ============================================================================
// LIFELINE - Gateway Transport Interface
// ============================================================================
// Abstract connection to the market-data gateway. Implementations report
// failures by throwing the GatewayError hierarchy (core/errors.hpp) and must
// honor the deadline passed to every call.
//
// Implementations must be safe to call from several threads at once: the
// session worker, the health probe and the request workers share one
// transport.
// ============================================================================

#include "lifeline/config/config.hpp"
#include "lifeline/core/contract.hpp"
#include "lifeline/core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace lifeline::gateway {

// ============================================================================
// Per-call Context
// ============================================================================

struct RequestContext {
    uint64_t request_id = 0;
    MonoTime deadline{};
    std::shared_ptr<std::atomic<bool>> cancelled = std::make_shared<std::atomic<bool>>(false);

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled && cancelled->load(std::memory_order_acquire);
    }

    [[nodiscard]] bool expired() const noexcept { return mono_now() >= deadline; }
};

// ============================================================================
// Transport Interface
// ============================================================================

class IGatewayTransport {
public:
    virtual ~IGatewayTransport() = default;

    /// Establish the transport-level connection under the given client identity
    virtual void open(const config::GatewayEndpoint& endpoint, ClientId client_id,
                      MonoTime deadline) = 0;

    /// Complete the authentication handshake. Throws AuthenticationError.
    virtual void authenticate(MonoTime deadline) = 0;

    /// Lightweight liveness probe
    virtual void heartbeat(MonoTime deadline) = 0;

    /// Resolve a contract spec to a gateway contract. Throws QualificationError.
    [[nodiscard]] virtual QualifiedContract qualify(const ContractKey& key,
                                                    const ContractSpec& spec,
                                                    MonoTime deadline) = 0;

    /// One-shot market snapshot (never a streaming subscription)
    [[nodiscard]] virtual Quote request_snapshot(const QualifiedContract& contract,
                                                 const RequestContext& ctx) = 0;

    /// Historical bars for a bounded RTH window
    [[nodiscard]] virtual std::vector<Bar> request_historical(const QualifiedContract& contract,
                                                              const HistoricalWindow& window,
                                                              const RequestContext& ctx) = 0;

    /// Drop the connection. Safe to call when not open.
    virtual void close() noexcept = 0;
};

}  // namespace lifeline::gateway
