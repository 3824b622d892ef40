// ============================================================================
// LIFELINE - Client Identity Allocator Implementation
// ============================================================================

#include "lifeline/session/client_id_allocator.hpp"

#include <limits>

namespace lifeline::session {

namespace {

constexpr uint64_t ID_SPACE = static_cast<uint64_t>(std::numeric_limits<ClientId>::max());

uint64_t default_seed() noexcept {
    return static_cast<uint64_t>(to_epoch_ms(now()) % 1'000'000);
}

/// Map a counter value into [1, INT32_MAX]
ClientId to_client_id(uint64_t raw) noexcept {
    return static_cast<ClientId>((raw % ID_SPACE) + 1);
}

}  // namespace

ClientIdAllocator::ClientIdAllocator(const std::vector<ClientId>& reserved,
                                     std::optional<ClientId> seed)
    : reserved_(reserved.begin(), reserved.end())
    , counter_(seed && *seed > 0 ? static_cast<uint64_t>(*seed - 1) : default_seed()) {}

ClientId ClientIdAllocator::next() noexcept {
    while (true) {
        const ClientId id = to_client_id(counter_.fetch_add(1, std::memory_order_relaxed));
        if (!is_reserved(id)) {
            issued_.fetch_add(1, std::memory_order_relaxed);
            return id;
        }
    }
}

bool ClientIdAllocator::is_reserved(ClientId id) const noexcept {
    return reserved_.count(id) != 0;
}

}  // namespace lifeline::session
