/// @file engine.cpp
/// @brief ReloadEngine implementation

#include <hotline/reload/engine.hpp>
#include <hotline/core/log.hpp>

namespace hotline_reload {

ApplicationMemory ApplicationMemory::from(const ArtifactHandle& handle) {
    return ApplicationMemory{handle.api().get_memory(), handle.api().get_memory_size()};
}

const char* reload_state_name(ReloadState state) {
    switch (state) {
        case ReloadState::Idle: return "Idle";
        case ReloadState::HotSwapPending: return "HotSwapPending";
        case ReloadState::RestartPending: return "RestartPending";
        default: return "Unknown";
    }
}

const char* reload_outcome_name(ReloadOutcome outcome) {
    switch (outcome) {
        case ReloadOutcome::None: return "None";
        case ReloadOutcome::HotSwapped: return "HotSwapped";
        case ReloadOutcome::Restarted: return "Restarted";
        case ReloadOutcome::BindFailed: return "BindFailed";
        default: return "Unknown";
    }
}

ReloadEngine::ReloadEngine(IArtifactBinder& binder, VersionRegistry& registry,
                           hotline_memory::HostAllocator& allocator, ApplicationMemory& memory,
                           ReloadConfig config)
    : m_binder(binder)
    , m_registry(registry)
    , m_allocator(allocator)
    , m_memory(memory)
    , m_config(std::move(config))
{
    if (!m_config.clock) {
        m_config.clock = [] { return ReloadConfig::Clock::now(); };
    }
}

// =============================================================================
// Decision
// =============================================================================

bool ReloadEngine::source_changed() {
    const auto* active = m_registry.active();
    if (!active) {
        return false;
    }

    if (m_config.poll_interval.count() > 0) {
        const auto now = m_config.clock();
        if (m_polled && now - m_last_poll < m_config.poll_interval) {
            return false;
        }
        m_last_poll = now;
        m_polled = true;
    }

    auto time = m_binder.source_modification_time();
    if (!time) {
        // Usually the build is rewriting the file; try again later.
        hotline_core::reload_logger()->debug("Source timestamp unavailable: {}", time.error().message());
        return false;
    }

    return *time != active->modification_time();
}

ReloadState ReloadEngine::decide() {
    const auto* active = m_registry.active();
    if (!active) {
        return ReloadState::Idle;
    }

    if (active->api().force_restart_requested()) {
        return ReloadState::RestartPending;
    }
    if (active->api().force_reload_requested()) {
        return ReloadState::HotSwapPending;
    }
    if (source_changed()) {
        return ReloadState::HotSwapPending;
    }
    return ReloadState::Idle;
}

ReloadOutcome ReloadEngine::evaluate() {
    m_state = decide();
    if (m_state == ReloadState::Idle) {
        return ReloadOutcome::None;
    }

    auto logger = hotline_core::reload_logger();
    const auto version = m_registry.next_version();

    logger->debug("{}: binding version {}", reload_state_name(m_state), version);

    auto bound = m_binder.bind(version);
    if (!bound) {
        hotline_core::debug::record_error(bound.error());
        logger->warn("Reload of version {} failed: {}", version, hotline_core::build_error_chain(bound.error()));
        ++m_stats.failed_binds;
        m_state = ReloadState::Idle;
        return ReloadOutcome::BindFailed;
    }
    m_registry.advance_version();

    ArtifactHandle handle = std::move(*bound);

    const std::size_t old_size = m_registry.active()->api().get_memory_size();
    const std::size_t new_size = handle.api().get_memory_size();
    if (m_state == ReloadState::HotSwapPending && new_size != old_size) {
        logger->info("Memory size changed from {} to {} bytes, restarting instead of hot swapping",
            old_size, new_size);
        ++m_stats.escalated_restarts;
        m_state = ReloadState::RestartPending;
    }

    const ReloadOutcome outcome = m_state == ReloadState::HotSwapPending
        ? hot_swap(std::move(handle))
        : restart(std::move(handle));

    m_state = ReloadState::Idle;
    return outcome;
}

// =============================================================================
// Transitions
// =============================================================================

ReloadOutcome ReloadEngine::hot_swap(ArtifactHandle handle) {
    HOTLINE_LOG_SCOPE("hot_swap", "reload");
    handle.attach_allocator(m_allocator.api());
    m_registry.promote(std::move(handle));

    auto* active = m_registry.active();
    active->api().hot_reloaded(m_memory.address);

    ++m_stats.hot_swaps;
    hotline_core::reload_logger()->info("Hot swapped to version {} ({} retired)",
        active->version(), m_registry.retired().size());
    return ReloadOutcome::HotSwapped;
}

ReloadOutcome ReloadEngine::restart(ArtifactHandle handle) {
    HOTLINE_LOG_SCOPE("restart", "reload");
    auto logger = hotline_core::reload_logger();

    if (auto* previous = m_registry.active()) {
        previous->api().shutdown();
    }

    m_last_leaks = m_allocator.tracking().drain_and_report();
    if (m_last_leaks.has_leaks()) {
        ++m_stats.leak_reports;
        hotline_core::debug::record_error(hotline_core::Error(
            hotline_core::AllocatorError::leak_detected(m_last_leaks.count(), m_last_leaks.total_bytes)));
    }

    m_registry.reset(std::move(handle));

    auto* active = m_registry.active();
    active->attach_allocator(m_allocator.api());
    active->api().init();
    m_memory = ApplicationMemory::from(*active);

    ++m_stats.restarts;
    logger->info("Restarted with version {} ({} byte memory block)", active->version(), m_memory.size);
    return ReloadOutcome::Restarted;
}

} // namespace hotline_reload
