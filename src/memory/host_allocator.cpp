/// @file host_allocator.cpp
/// @brief HostAllocator implementation

#include <hotline/memory/host_allocator.hpp>

namespace hotline_memory {

HostAllocator::HostAllocator(std::size_t scratch_capacity)
    : m_tracking(m_system)
    , m_scratch(scratch_capacity)
{
    init_api();
}

HostAllocator::HostAllocator(IAllocator& backing, std::size_t scratch_capacity)
    : m_tracking(backing)
    , m_scratch(scratch_capacity)
{
    init_api();
}

void HostAllocator::init_api() noexcept {
    m_api.abi_version = HOTLINE_ABI_VERSION_V1;
    m_api.ctx = this;
    m_api.alloc = &HostAllocator::api_alloc;
    m_api.free = &HostAllocator::api_free;
    m_api.resize = &HostAllocator::api_resize;
    m_api.temp_alloc = &HostAllocator::api_temp_alloc;
}

void* HostAllocator::api_alloc(void* ctx, std::size_t size, std::size_t align, const char* file, int line) {
    auto* self = static_cast<HostAllocator*>(ctx);
    return self->m_tracking.allocate(size, align, CallSite{file, line});
}

void HostAllocator::api_free(void* ctx, void* ptr, const char* file, int line) {
    auto* self = static_cast<HostAllocator*>(ctx);
    // A false return is recorded as a bad free; the drive loop halts on it.
    self->m_tracking.deallocate(ptr, CallSite{file, line});
}

void* HostAllocator::api_resize(void* ctx, void* ptr, std::size_t new_size, std::size_t align,
                                const char* file, int line) {
    auto* self = static_cast<HostAllocator*>(ctx);
    return self->m_tracking.resize(ptr, new_size, align, CallSite{file, line});
}

void* HostAllocator::api_temp_alloc(void* ctx, std::size_t size, std::size_t align) {
    auto* self = static_cast<HostAllocator*>(ctx);
    return self->m_scratch.allocate(size, align);
}

} // namespace hotline_memory
