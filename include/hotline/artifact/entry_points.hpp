#pragma once

/// @file entry_points.hpp
/// @brief Typed entry-point table and its registration list
///
/// Each exported function is resolved as `<prefix><logical name>` and written
/// into a typed slot of ArtifactApi. Adding an entry point means adding one
/// field and one row to k_entry_points.

#include <hotline/artifact/abi.h>

#include <array>
#include <cstddef>
#include <type_traits>

namespace hotline_artifact {

// =============================================================================
// ArtifactApi
// =============================================================================

/// Resolved callables of one loaded artifact version
struct ArtifactApi {
    using VoidFn = void (*)();
    using BoolFn = bool (*)();
    using MemoryFn = void* (*)();
    using MemorySizeFn = std::size_t (*)();
    using HotReloadedFn = void (*)(void*);
    using AttachAllocatorFn = void (*)(const hotline_allocator_api_v1*);

    VoidFn init_window = nullptr;
    VoidFn init = nullptr;
    VoidFn update = nullptr;
    BoolFn should_close = nullptr;
    VoidFn shutdown = nullptr;
    VoidFn shutdown_window = nullptr;
    MemoryFn get_memory = nullptr;
    MemorySizeFn get_memory_size = nullptr;
    HotReloadedFn hot_reloaded = nullptr;
    BoolFn force_reload_requested = nullptr;
    BoolFn force_restart_requested = nullptr;

    // Optional
    AttachAllocatorFn attach_allocator = nullptr;
};

// =============================================================================
// Registration Table
// =============================================================================

/// One row of the registration table
struct EntryPoint {
    const char* name;  // Logical name, without prefix
    bool required;
    void (*assign)(ArtifactApi& api, void* symbol);
};

namespace detail {

template<auto Member>
void assign_slot(ArtifactApi& api, void* symbol) {
    using Fn = std::remove_reference_t<decltype(api.*Member)>;
    api.*Member = reinterpret_cast<Fn>(symbol);
}

} // namespace detail

/// Default symbol prefix
inline constexpr const char* k_default_symbol_prefix = "game_";

inline constexpr std::array<EntryPoint, 12> k_entry_points{{
    {"init_window", true, &detail::assign_slot<&ArtifactApi::init_window>},
    {"init", true, &detail::assign_slot<&ArtifactApi::init>},
    {"update", true, &detail::assign_slot<&ArtifactApi::update>},
    {"should_close", true, &detail::assign_slot<&ArtifactApi::should_close>},
    {"shutdown", true, &detail::assign_slot<&ArtifactApi::shutdown>},
    {"shutdown_window", true, &detail::assign_slot<&ArtifactApi::shutdown_window>},
    {"get_memory", true, &detail::assign_slot<&ArtifactApi::get_memory>},
    {"get_memory_size", true, &detail::assign_slot<&ArtifactApi::get_memory_size>},
    {"hot_reloaded", true, &detail::assign_slot<&ArtifactApi::hot_reloaded>},
    {"force_reload_requested", true, &detail::assign_slot<&ArtifactApi::force_reload_requested>},
    {"force_restart_requested", true, &detail::assign_slot<&ArtifactApi::force_restart_requested>},
    {"attach_allocator", false, &detail::assign_slot<&ArtifactApi::attach_allocator>},
}};

/// Number of entry points an artifact must export
[[nodiscard]] constexpr std::size_t required_entry_point_count() {
    std::size_t count = 0;
    for (const auto& entry : k_entry_points) {
        if (entry.required) {
            ++count;
        }
    }
    return count;
}

} // namespace hotline_artifact
