#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for hotline_memory

namespace hotline_memory {

// Allocators
class IAllocator;
class SystemAllocator;
class Arena;
class TrackingAllocator;
class HostAllocator;

// Records
struct CallSite;
struct AllocationRecord;
struct BadFreeRecord;
struct LeakReport;

} // namespace hotline_memory
