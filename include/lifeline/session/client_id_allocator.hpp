#pragma once
// ============================================================================
// LIFELINE - Client Identity Allocator
// ============================================================================
// Produces gateway client ids that never repeat within the process and are
// unlikely to collide with a previous process (seeded from wall-clock ms).
// Reserved ids (e.g. the external health-check probe) are never issued.
// ============================================================================

#include "lifeline/core/types.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <unordered_set>
#include <vector>

namespace lifeline::session {

class ClientIdAllocator {
public:
    /// Seed defaults to epoch milliseconds modulo 1,000,000
    explicit ClientIdAllocator(const std::vector<ClientId>& reserved = {},
                               std::optional<ClientId> seed = std::nullopt);

    // Non-copyable
    ClientIdAllocator(const ClientIdAllocator&) = delete;
    ClientIdAllocator& operator=(const ClientIdAllocator&) = delete;

    /// Next identity. Thread-safe, lock-free.
    [[nodiscard]] ClientId next() noexcept;

    [[nodiscard]] bool is_reserved(ClientId id) const noexcept;

    /// Identities issued so far
    [[nodiscard]] uint64_t issued() const noexcept {
        return issued_.load(std::memory_order_relaxed);
    }

private:
    std::unordered_set<ClientId> reserved_;
    std::atomic<uint64_t> counter_;
    std::atomic<uint64_t> issued_{0};
};

}  // namespace lifeline::session
