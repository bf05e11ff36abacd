#pragma once

/// @file allocator.hpp
/// @brief Base allocator interface for hotline_memory

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <new>

namespace hotline_memory {

// =============================================================================
// Alignment Utilities
// =============================================================================

/// Align a value up to the given alignment
[[nodiscard]] constexpr std::size_t align_up(std::size_t value, std::size_t align) noexcept {
    return (value + align - 1) & ~(align - 1);
}

/// Check if a value is a power of two
[[nodiscard]] constexpr bool is_power_of_two(std::size_t value) noexcept {
    return value != 0 && (value & (value - 1)) == 0;
}

/// Check if a pointer is aligned
[[nodiscard]] inline bool is_aligned(const void* ptr, std::size_t align) noexcept {
    return (reinterpret_cast<std::uintptr_t>(ptr) & (align - 1)) == 0;
}

/// Alignment used when a caller passes zero
inline constexpr std::size_t k_default_alignment = alignof(std::max_align_t);

// =============================================================================
// Allocator Interface
// =============================================================================

/// Common interface for backing allocators
class IAllocator {
public:
    virtual ~IAllocator() = default;

    /// Allocate memory with the given size and alignment
    [[nodiscard]] virtual void* allocate(std::size_t size, std::size_t align) = 0;

    /// Deallocate memory previously returned by allocate with the same size and alignment
    virtual void deallocate(void* ptr, std::size_t size, std::size_t align) = 0;

    /// Get the currently used memory
    [[nodiscard]] virtual std::size_t used() const noexcept = 0;
};

// =============================================================================
// SystemAllocator
// =============================================================================

/// Default backing allocator over aligned global operator new/delete
class SystemAllocator final : public IAllocator {
public:
    [[nodiscard]] void* allocate(std::size_t size, std::size_t align) override {
        if (align == 0) {
            align = k_default_alignment;
        }
        if (!is_power_of_two(align)) {
            return nullptr;
        }
        void* ptr = ::operator new(size == 0 ? 1 : size, std::align_val_t{align}, std::nothrow);
        if (ptr) {
            m_used += size;
        }
        return ptr;
    }

    void deallocate(void* ptr, std::size_t size, std::size_t align) override {
        if (!ptr) {
            return;
        }
        if (align == 0) {
            align = k_default_alignment;
        }
        ::operator delete(ptr, std::align_val_t{align});
        m_used -= size;
    }

    [[nodiscard]] std::size_t used() const noexcept override {
        return m_used;
    }

private:
    std::size_t m_used = 0;
};

} // namespace hotline_memory
