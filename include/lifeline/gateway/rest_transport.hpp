#pragma once
// ============================================================================
// LIFELINE - REST Gateway Transport
// ============================================================================
// HTTPS/JSON transport for the gateway's local REST bridge.
// Boost.Beast over OpenSSL; one short-lived connection per call, each bounded
// by the caller's deadline and aborted when the call's cancel flag is raised.
// ============================================================================

#include "lifeline/gateway/gateway_transport.hpp"

#include <memory>

namespace lifeline::gateway {

class RestGatewayTransport : public IGatewayTransport {
public:
    RestGatewayTransport();
    ~RestGatewayTransport() override;

    // Non-copyable
    RestGatewayTransport(const RestGatewayTransport&) = delete;
    RestGatewayTransport& operator=(const RestGatewayTransport&) = delete;

    void open(const config::GatewayEndpoint& endpoint, ClientId client_id,
              MonoTime deadline) override;
    void authenticate(MonoTime deadline) override;
    void heartbeat(MonoTime deadline) override;

    [[nodiscard]] QualifiedContract qualify(const ContractKey& key, const ContractSpec& spec,
                                            MonoTime deadline) override;

    [[nodiscard]] Quote request_snapshot(const QualifiedContract& contract,
                                         const RequestContext& ctx) override;

    [[nodiscard]] std::vector<Bar> request_historical(const QualifiedContract& contract,
                                                      const HistoricalWindow& window,
                                                      const RequestContext& ctx) override;

    void close() noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lifeline::gateway
