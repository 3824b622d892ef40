#pragma once
// ============================================================================
// LIFELINE - History Ring Buffer
// ============================================================================
// Fixed-capacity ring that overwrites the oldest entry when full.
// Power-of-2 size for fast modulo (bitwise AND).
// Not synchronized: owners guard it with their own lock.
// ============================================================================

#include <array>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <vector>

namespace lifeline {

// ============================================================================
// Concept for Ring Buffer Elements
// ============================================================================

template <typename T>
concept RingBufferElement = std::is_trivially_copyable_v<T> && std::is_default_constructible_v<T>;

// ============================================================================
// History Ring
// ============================================================================

template <RingBufferElement T, size_t Capacity>
class HistoryRing {
public:
    static_assert(std::has_single_bit(Capacity), "Capacity must be a power of 2");
    static_assert(Capacity >= 2, "Capacity must be at least 2");

    static constexpr size_t MASK = Capacity - 1;

    HistoryRing() = default;

    /// Append, discarding the oldest entry when full
    void push(const T& item) noexcept {
        buffer_[head_ & MASK] = item;
        ++head_;
    }

    /// Most recent entry
    [[nodiscard]] std::optional<T> latest() const noexcept {
        if (head_ == 0) return std::nullopt;
        return buffer_[(head_ - 1) & MASK];
    }

    /// i-th most recent entry (0 = latest)
    [[nodiscard]] std::optional<T> recent(size_t i) const noexcept {
        if (i >= size()) return std::nullopt;
        return buffer_[(head_ - 1 - i) & MASK];
    }

    /// Entries oldest first
    [[nodiscard]] std::vector<T> snapshot() const {
        std::vector<T> out;
        const size_t n = size();
        out.reserve(n);
        for (size_t i = head_ - n; i < head_; ++i) {
            out.push_back(buffer_[i & MASK]);
        }
        return out;
    }

    void clear() noexcept { head_ = 0; }

    [[nodiscard]] size_t size() const noexcept {
        return head_ < Capacity ? static_cast<size_t>(head_) : Capacity;
    }

    [[nodiscard]] bool empty() const noexcept { return head_ == 0; }
    [[nodiscard]] static constexpr size_t capacity() noexcept { return Capacity; }

    /// Total pushes since construction or last clear()
    [[nodiscard]] uint64_t total() const noexcept { return head_; }

private:
    std::array<T, Capacity> buffer_{};
    uint64_t head_ = 0;
};

}  // namespace lifeline
