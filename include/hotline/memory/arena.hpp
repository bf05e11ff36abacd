#pragma once

/// @file arena.hpp
/// @brief Arena allocator - per-frame scratch memory with bulk release

#include "allocator.hpp"
#include <algorithm>
#include <cstring>
#include <vector>

namespace hotline_memory {

/// Linear scratch allocator backing the artifacts' temp_alloc
///
/// Allocations are served linearly from a contiguous buffer and are only
/// released in bulk by reset(), which the drive loop calls once per frame.
class Arena final : public IAllocator {
public:
    /// Create a new arena with the given capacity in bytes
    explicit Arena(std::size_t capacity)
        : m_buffer(capacity)
        , m_capacity(capacity) {}

    /// Create with capacity in KB
    [[nodiscard]] static Arena with_capacity_kb(std::size_t kb) {
        return Arena(kb * 1024);
    }

    // =========================================================================
    // IAllocator Interface
    // =========================================================================

    [[nodiscard]] void* allocate(std::size_t size, std::size_t align) override {
        if (align == 0) {
            align = k_default_alignment;
        }
        if (!is_power_of_two(align)) {
            return nullptr;
        }

        const std::uintptr_t base = reinterpret_cast<std::uintptr_t>(m_buffer.data());
        const std::size_t aligned_offset = align_up(base + m_offset, align) - base;

        // Compared against the remaining space so huge sizes cannot wrap
        if (aligned_offset > m_capacity || size > m_capacity - aligned_offset) {
            ++m_failed_allocations;
            return nullptr;
        }

        m_offset = aligned_offset + size;
        m_peak = std::max(m_peak, m_offset);
        return m_buffer.data() + aligned_offset;
    }

    void deallocate(void* /*ptr*/, std::size_t /*size*/, std::size_t /*align*/) override {
        // Released in bulk by reset()
    }

    [[nodiscard]] std::size_t used() const noexcept override {
        return m_offset;
    }

    // =========================================================================
    // Arena-Specific API
    // =========================================================================

    /// Release every allocation made since the last reset
    void reset() noexcept {
        m_offset = 0;
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return m_capacity;
    }

    /// Highest offset reached since construction
    [[nodiscard]] std::size_t peak() const noexcept {
        return m_peak;
    }

    /// Allocations rejected because the arena was exhausted
    [[nodiscard]] std::size_t failed_allocations() const noexcept {
        return m_failed_allocations;
    }

    /// Allocate zeroed memory
    template<typename T>
    [[nodiscard]] T* alloc_zeroed(std::size_t count) {
        T* ptr = static_cast<T*>(allocate(sizeof(T) * count, alignof(T)));
        if (ptr) {
            std::memset(ptr, 0, sizeof(T) * count);
        }
        return ptr;
    }

private:
    std::vector<std::uint8_t> m_buffer;
    std::size_t m_capacity;
    std::size_t m_offset = 0;
    std::size_t m_peak = 0;
    std::size_t m_failed_allocations = 0;
};

} // namespace hotline_memory
