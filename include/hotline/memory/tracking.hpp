#pragma once

/// @file tracking.hpp
/// @brief Tracking allocator - records live allocations, detects leaks and bad frees

#include "allocator.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace hotline_memory {

// =============================================================================
// Records
// =============================================================================

/// Source location of an allocation or deallocation request
struct CallSite {
    const char* file = nullptr;
    int line = 0;

    [[nodiscard]] std::string to_string() const {
        if (!file) {
            return "<unknown>";
        }
        return std::string(file) + ":" + std::to_string(line);
    }
};

/// One outstanding allocation
struct AllocationRecord {
    void* address = nullptr;
    std::size_t size = 0;
    std::size_t align = 0;
    CallSite site;
    std::uint64_t sequence = 0;  // Creation order
};

/// A deallocation that matched no live allocation
struct BadFreeRecord {
    void* address = nullptr;
    CallSite site;
};

/// Result of drain_and_report
struct LeakReport {
    std::vector<AllocationRecord> leaks;  // In creation order
    std::size_t total_bytes = 0;

    [[nodiscard]] bool has_leaks() const noexcept { return !leaks.empty(); }
    [[nodiscard]] std::size_t count() const noexcept { return leaks.size(); }
};

// =============================================================================
// TrackingAllocator
// =============================================================================

/// Wraps a backing allocator and keeps one AllocationRecord per live block.
///
/// Frees of unknown addresses are recorded as bad frees and never forwarded
/// to the backing allocator. Not thread-safe; owned by the drive-loop thread.
class TrackingAllocator {
public:
    explicit TrackingAllocator(IAllocator& backing);
    ~TrackingAllocator();

    TrackingAllocator(const TrackingAllocator&) = delete;
    TrackingAllocator& operator=(const TrackingAllocator&) = delete;

    // =========================================================================
    // Allocation
    // =========================================================================

    /// Allocate and record. Returns nullptr if the backing allocator fails.
    [[nodiscard]] void* allocate(std::size_t size, std::size_t align, CallSite site = {});

    /// Release a tracked block. Returns false (and records a bad free) if the
    /// address has no live record. Null is a no-op.
    bool deallocate(void* ptr, CallSite site = {});

    /// Grow or shrink a tracked block, preserving its prefix.
    /// Null behaves as allocate; an unknown address is a bad free.
    [[nodiscard]] void* resize(void* ptr, std::size_t new_size, std::size_t align, CallSite site = {});

    // =========================================================================
    // Reporting
    // =========================================================================

    /// Report every live record as a leak, release the blocks and clear the table
    LeakReport drain_and_report();

    /// Log every recorded bad free
    void report_bad_frees() const;

    /// Forget recorded bad frees
    void clear_bad_frees() noexcept { m_bad_frees.clear(); }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool is_tracked(const void* ptr) const;
    [[nodiscard]] const AllocationRecord* find(const void* ptr) const;

    [[nodiscard]] std::size_t live_count() const noexcept { return m_records.size(); }
    [[nodiscard]] std::size_t live_bytes() const noexcept { return m_live_bytes; }
    [[nodiscard]] std::size_t peak_bytes() const noexcept { return m_peak_bytes; }
    [[nodiscard]] std::uint64_t total_allocations() const noexcept { return m_total_allocations; }
    [[nodiscard]] std::uint64_t total_deallocations() const noexcept { return m_total_deallocations; }

    [[nodiscard]] bool has_bad_frees() const noexcept { return !m_bad_frees.empty(); }
    [[nodiscard]] const std::vector<BadFreeRecord>& bad_frees() const noexcept { return m_bad_frees; }

private:
    void insert_record(void* ptr, std::size_t size, std::size_t align, CallSite site);
    void record_bad_free(void* ptr, CallSite site);

    IAllocator& m_backing;
    std::unordered_map<const void*, AllocationRecord> m_records;
    std::vector<BadFreeRecord> m_bad_frees;

    std::uint64_t m_next_sequence = 0;
    std::uint64_t m_total_allocations = 0;
    std::uint64_t m_total_deallocations = 0;
    std::size_t m_live_bytes = 0;
    std::size_t m_peak_bytes = 0;
};

} // namespace hotline_memory
