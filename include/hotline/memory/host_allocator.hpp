#pragma once

/// @file host_allocator.hpp
/// @brief Host-side allocator bundle exposed to artifacts through the C ABI table

#include "arena.hpp"
#include "tracking.hpp"

#include <hotline/artifact/abi.h>

namespace hotline_memory {

/// Owns the tracking allocator and the frame scratch arena for one process.
///
/// The C table returned by api() stays valid for the lifetime of this object;
/// artifacts keep the pointer across frames, so the HostAllocator must outlive
/// every loaded artifact version.
class HostAllocator {
public:
    explicit HostAllocator(std::size_t scratch_capacity);
    HostAllocator(IAllocator& backing, std::size_t scratch_capacity);

    HostAllocator(const HostAllocator&) = delete;
    HostAllocator& operator=(const HostAllocator&) = delete;

    /// Table handed to artifacts via attach_allocator
    [[nodiscard]] const hotline_allocator_api_v1* api() const noexcept { return &m_api; }

    [[nodiscard]] TrackingAllocator& tracking() noexcept { return m_tracking; }
    [[nodiscard]] const TrackingAllocator& tracking() const noexcept { return m_tracking; }

    [[nodiscard]] Arena& scratch() noexcept { return m_scratch; }
    [[nodiscard]] const Arena& scratch() const noexcept { return m_scratch; }

    /// Release transient per-frame allocations
    void end_frame() noexcept { m_scratch.reset(); }

private:
    void init_api() noexcept;

    static void* api_alloc(void* ctx, std::size_t size, std::size_t align, const char* file, int line);
    static void api_free(void* ctx, void* ptr, const char* file, int line);
    static void* api_resize(void* ctx, void* ptr, std::size_t new_size, std::size_t align,
                            const char* file, int line);
    static void* api_temp_alloc(void* ctx, std::size_t size, std::size_t align);

    SystemAllocator m_system;
    TrackingAllocator m_tracking;
    Arena m_scratch;
    hotline_allocator_api_v1 m_api{};
};

} // namespace hotline_memory
