/// @file harness.cpp
/// @brief Harness drive loop implementation

#include <hotline/runtime/harness.hpp>
#include <hotline/core/log.hpp>

#include <fstream>
#include <iostream>

namespace hotline_runtime {

using hotline_core::AllocatorError;
using hotline_core::Error;
using hotline_core::Result;

ExitCode exit_code_for(const Error& error) {
    if (error.is<hotline_core::ConfigError>()) {
        return ExitCode::ConfigError;
    }
    if (const auto* alloc = error.as<AllocatorError>()) {
        if (alloc->kind == AllocatorError::Kind::BadFree) {
            return ExitCode::BadFree;
        }
    }
    return ExitCode::BindFailed;
}

void acknowledge_on_stdin(const std::string& prompt) {
    std::cout << prompt << " Press Enter to continue..." << std::endl;
    std::string line;
    std::getline(std::cin, line);
}

Harness::Harness(HarnessConfig config, AcknowledgeFn acknowledge)
    : m_config(std::move(config))
    , m_acknowledge(std::move(acknowledge))
    , m_allocator(m_config.scratch_kb * 1024)
    , m_binder(hotline_artifact::BinderConfig{m_config.artifact_path, m_config.symbol_prefix})
    , m_registry(m_binder)
{}

Harness::~Harness() = default;

hotline_reload::ReloadEngine::Stats Harness::reload_stats() const {
    return m_engine ? m_engine->stats() : hotline_reload::ReloadEngine::Stats{};
}

void Harness::acknowledge(const std::string& prompt) const {
    if (m_config.interactive && m_acknowledge) {
        m_acknowledge(prompt);
    }
}

// =============================================================================
// Run
// =============================================================================

Result<void> Harness::run() {
    auto logger = hotline_core::runtime_logger();

    auto started = start();
    if (!started) {
        return started;
    }

    const auto* active = m_registry.active();
    while (true) {
        active->api().update();
        ++m_frames;

        const auto outcome = m_engine->evaluate();
        active = m_registry.active();
        if (outcome != hotline_reload::ReloadOutcome::None) {
            logger->debug("Frame {}: {}", m_frames, hotline_reload::reload_outcome_name(outcome));
        }

        auto safe = check_bad_frees();
        if (!safe) {
            // Modules stay loaded until the registry goes away; nothing else is
            // called into the artifact after memory corruption.
            return safe;
        }

        m_allocator.end_frame();

        if (active->api().should_close()) {
            break;
        }
    }

    logger->info("Artifact requested close after {} frame(s)", m_frames);
    return finish();
}

Result<void> Harness::start() {
    auto logger = hotline_core::runtime_logger();

    auto bound = m_binder.bind(m_registry.next_version());
    if (!bound) {
        hotline_core::debug::record_error(bound.error());
        logger->error("Failed to bind initial artifact: {}", hotline_core::build_error_chain(bound.error()));
        return bound.error();
    }
    m_registry.advance_version();
    m_registry.install(std::move(*bound));

    auto* active = m_registry.active();
    active->attach_allocator(m_allocator.api());
    active->api().init_window();
    active->api().init();
    m_memory = hotline_reload::ApplicationMemory::from(*active);

    hotline_reload::ReloadConfig reload_config;
    reload_config.poll_interval = m_config.poll_interval;
    m_engine = std::make_unique<hotline_reload::ReloadEngine>(
        m_binder, m_registry, m_allocator, m_memory, reload_config);

    logger->info("Started version {} ({} byte memory block)", active->version(), m_memory.size);
    return hotline_core::Ok();
}

Result<void> Harness::check_bad_frees() {
    const auto& tracking = m_allocator.tracking();
    if (!tracking.has_bad_frees()) {
        return hotline_core::Ok();
    }

    tracking.report_bad_frees();
    Error error(AllocatorError::bad_free(tracking.bad_frees().size()));
    hotline_core::debug::record_error(error);
    hotline_core::runtime_logger()->critical("{}; halting", error.message());
    hotline_core::flush_all_loggers();

    acknowledge("Bad free detected.");
    return error;
}

Result<void> Harness::finish() {
    auto logger = hotline_core::runtime_logger();
    auto* active = m_registry.active();

    active->api().shutdown();

    auto safe = check_bad_frees();
    if (!safe) {
        return safe;
    }

    m_final_leaks = m_allocator.tracking().drain_and_report();
    if (m_final_leaks.has_leaks()) {
        hotline_core::debug::record_error(Error(
            AllocatorError::leak_detected(m_final_leaks.count(), m_final_leaks.total_bytes)));
        hotline_core::flush_all_loggers();
        acknowledge("Memory leaks detected.");
    }

    // shutdown_window() runs inside the still-loaded active module
    m_registry.shutdown([](hotline_artifact::ArtifactHandle& handle) {
        handle.api().shutdown_window();
    });

    write_exit_signal();
    logger->info("Shutdown complete");
    return hotline_core::Ok();
}

void Harness::write_exit_signal() const {
    std::ofstream signal(m_config.exit_signal, std::ios::trunc);
    if (!signal.is_open()) {
        hotline_core::runtime_logger()->error("Could not write exit signal '{}'", m_config.exit_signal.string());
        return;
    }
    signal << "exit\n";
}

} // namespace hotline_runtime
