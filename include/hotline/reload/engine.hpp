#pragma once

/// @file engine.hpp
/// @brief Reload decision engine - per-frame hot swap / restart state machine

#include "registry.hpp"

#include <hotline/memory/host_allocator.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace hotline_reload {

// =============================================================================
// Types
// =============================================================================

/// The single application state block owned by the active artifact.
/// The host passes the address around and never touches the contents.
struct ApplicationMemory {
    void* address = nullptr;
    std::size_t size = 0;

    /// Read both values from a handle's get_memory/get_memory_size
    [[nodiscard]] static ApplicationMemory from(const ArtifactHandle& handle);
};

enum class ReloadState : std::uint8_t {
    Idle,
    HotSwapPending,
    RestartPending,
};

enum class ReloadOutcome : std::uint8_t {
    None,        // Nothing changed
    HotSwapped,  // New version active, memory block preserved
    Restarted,   // New version active, memory block rebuilt by init()
    BindFailed,  // Bind attempt failed, previous version still active
};

[[nodiscard]] const char* reload_state_name(ReloadState state);
[[nodiscard]] const char* reload_outcome_name(ReloadOutcome outcome);

struct ReloadConfig {
    using Clock = std::chrono::steady_clock;

    /// Minimum time between source timestamp checks. Zero checks every frame.
    std::chrono::milliseconds poll_interval{0};

    /// Time source for the poll interval; defaults to steady_clock::now
    std::function<Clock::time_point()> clock;
};

// =============================================================================
// ReloadEngine
// =============================================================================

/// Decides once per frame whether to hot swap, restart or do nothing, and
/// carries out the decision against the registry and the memory record.
///
/// Priority: force restart, then force reload, then a changed source
/// timestamp. A failed bind leaves every piece of state untouched.
class ReloadEngine {
public:
    struct Stats {
        std::size_t hot_swaps = 0;
        std::size_t restarts = 0;
        std::size_t escalated_restarts = 0;  // Hot swaps turned into restarts by a size change
        std::size_t failed_binds = 0;
        std::size_t leak_reports = 0;        // Restart drains that found leaks
    };

    ReloadEngine(IArtifactBinder& binder, VersionRegistry& registry,
                 hotline_memory::HostAllocator& allocator, ApplicationMemory& memory,
                 ReloadConfig config = {});

    /// Run one frame's reload decision and act on it
    ReloadOutcome evaluate();

    /// Transition input for this frame, without acting on it
    [[nodiscard]] ReloadState decide();

    [[nodiscard]] ReloadState state() const noexcept { return m_state; }
    [[nodiscard]] const Stats& stats() const noexcept { return m_stats; }

    /// Leak report of the most recent restart
    [[nodiscard]] const hotline_memory::LeakReport& last_leak_report() const noexcept { return m_last_leaks; }

private:
    [[nodiscard]] bool source_changed();
    ReloadOutcome hot_swap(ArtifactHandle handle);
    ReloadOutcome restart(ArtifactHandle handle);

    IArtifactBinder& m_binder;
    VersionRegistry& m_registry;
    hotline_memory::HostAllocator& m_allocator;
    ApplicationMemory& m_memory;
    ReloadConfig m_config;

    ReloadState m_state = ReloadState::Idle;
    ReloadConfig::Clock::time_point m_last_poll{};
    bool m_polled = false;

    Stats m_stats;
    hotline_memory::LeakReport m_last_leaks;
};

} // namespace hotline_reload
