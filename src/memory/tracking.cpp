/// @file tracking.cpp
/// @brief TrackingAllocator implementation

#include <hotline/memory/tracking.hpp>
#include <hotline/core/log.hpp>

#include <algorithm>
#include <cstring>

namespace hotline_memory {

TrackingAllocator::TrackingAllocator(IAllocator& backing)
    : m_backing(backing) {}

TrackingAllocator::~TrackingAllocator() {
    // Blocks still live here were already reported by the owner's final drain,
    // or the process is going down after a bad free. Return them quietly.
    for (auto& [ptr, record] : m_records) {
        m_backing.deallocate(record.address, record.size, record.align);
    }
}

// =============================================================================
// Allocation
// =============================================================================

void* TrackingAllocator::allocate(std::size_t size, std::size_t align, CallSite site) {
    if (align == 0) {
        align = k_default_alignment;
    }

    void* ptr = m_backing.allocate(size, align);
    if (!ptr) {
        hotline_core::memory_logger()->warn("Allocation of {} bytes failed at {}", size, site.to_string());
        return nullptr;
    }

    insert_record(ptr, size, align, site);
    return ptr;
}

bool TrackingAllocator::deallocate(void* ptr, CallSite site) {
    if (!ptr) {
        return true;
    }

    auto it = m_records.find(ptr);
    if (it == m_records.end()) {
        record_bad_free(ptr, site);
        return false;
    }

    const AllocationRecord record = it->second;
    m_records.erase(it);

    m_live_bytes -= record.size;
    ++m_total_deallocations;
    m_backing.deallocate(record.address, record.size, record.align);
    return true;
}

void* TrackingAllocator::resize(void* ptr, std::size_t new_size, std::size_t align, CallSite site) {
    if (!ptr) {
        return allocate(new_size, align, site);
    }

    auto it = m_records.find(ptr);
    if (it == m_records.end()) {
        record_bad_free(ptr, site);
        return nullptr;
    }

    const std::size_t old_size = it->second.size;
    void* fresh = allocate(new_size, align == 0 ? it->second.align : align, site);
    if (!fresh) {
        return nullptr;
    }

    std::memcpy(fresh, ptr, std::min(old_size, new_size));
    deallocate(ptr, site);
    return fresh;
}

void TrackingAllocator::insert_record(void* ptr, std::size_t size, std::size_t align, CallSite site) {
    AllocationRecord record;
    record.address = ptr;
    record.size = size;
    record.align = align;
    record.site = site;
    record.sequence = m_next_sequence++;

    m_records[ptr] = record;

    m_live_bytes += size;
    m_peak_bytes = std::max(m_peak_bytes, m_live_bytes);
    ++m_total_allocations;
}

void TrackingAllocator::record_bad_free(void* ptr, CallSite site) {
    m_bad_frees.push_back(BadFreeRecord{ptr, site});
    hotline_core::memory_logger()->error("Bad free of {} at {}", ptr, site.to_string());
}

// =============================================================================
// Reporting
// =============================================================================

LeakReport TrackingAllocator::drain_and_report() {
    LeakReport report;
    report.leaks.reserve(m_records.size());

    for (auto& [ptr, record] : m_records) {
        report.leaks.push_back(record);
        report.total_bytes += record.size;
    }

    std::sort(report.leaks.begin(), report.leaks.end(),
        [](const AllocationRecord& a, const AllocationRecord& b) {
            return a.sequence < b.sequence;
        });

    auto logger = hotline_core::memory_logger();
    for (const auto& leak : report.leaks) {
        logger->warn("{}: Leaked {} bytes", leak.site.to_string(), leak.size);
        m_backing.deallocate(leak.address, leak.size, leak.align);
    }

    if (report.has_leaks()) {
        logger->warn("Leak report: {} allocation(s), {} bytes", report.count(), report.total_bytes);
    } else {
        logger->debug("Leak report: no leaks");
    }

    m_records.clear();
    m_live_bytes = 0;
    return report;
}

void TrackingAllocator::report_bad_frees() const {
    auto logger = hotline_core::memory_logger();
    for (const auto& bad : m_bad_frees) {
        logger->error("Bad free at: {} (address {})", bad.site.to_string(), bad.address);
    }
}

// =============================================================================
// Queries
// =============================================================================

bool TrackingAllocator::is_tracked(const void* ptr) const {
    return m_records.find(ptr) != m_records.end();
}

const AllocationRecord* TrackingAllocator::find(const void* ptr) const {
    auto it = m_records.find(ptr);
    return it != m_records.end() ? &it->second : nullptr;
}

} // namespace hotline_memory
