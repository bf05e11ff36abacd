#pragma once

/// @file harness.hpp
/// @brief Main drive loop of the hot-reload host

#include "config.hpp"

#include <hotline/artifact/binder.hpp>
#include <hotline/core/error.hpp>
#include <hotline/memory/host_allocator.hpp>
#include <hotline/reload/engine.hpp>
#include <hotline/reload/registry.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace hotline_runtime {

/// Process exit codes of the hotline executable
enum class ExitCode : int {
    Success = 0,
    BindFailed = 1,   // Initial artifact could not be bound
    ConfigError = 2,  // Invalid configuration or command line
    BadFree = 3,      // Artifact freed memory it did not own
};

/// Map the result of Harness::run (or configuration) to an exit code
[[nodiscard]] ExitCode exit_code_for(const hotline_core::Error& error);

/// Blocks until the operator has seen a message. Receives the prompt text.
using AcknowledgeFn = std::function<void(const std::string& prompt)>;

/// Default acknowledgment: print the prompt and wait for Enter on stdin
void acknowledge_on_stdin(const std::string& prompt);

/// Owns every runtime piece of one hosting session and runs the frame loop.
///
/// Startup binds version 0 (any failure is fatal), then each frame calls
/// update(), lets the reload engine act, halts on bad frees and releases
/// frame scratch memory, until the artifact reports should_close().
class Harness {
public:
    explicit Harness(HarnessConfig config, AcknowledgeFn acknowledge = acknowledge_on_stdin);
    ~Harness();

    Harness(const Harness&) = delete;
    Harness& operator=(const Harness&) = delete;

    /// Drive the artifact until it asks to close
    [[nodiscard]] hotline_core::Result<void> run();

    [[nodiscard]] const HarnessConfig& config() const noexcept { return m_config; }
    [[nodiscard]] std::uint64_t frame_count() const noexcept { return m_frames; }

    [[nodiscard]] const hotline_reload::VersionRegistry& registry() const noexcept { return m_registry; }
    [[nodiscard]] const hotline_memory::HostAllocator& allocator() const noexcept { return m_allocator; }
    [[nodiscard]] const hotline_reload::ApplicationMemory& memory() const noexcept { return m_memory; }

    /// Engine statistics; empty before run()
    [[nodiscard]] hotline_reload::ReloadEngine::Stats reload_stats() const;

    /// Leak report of the final drain
    [[nodiscard]] const hotline_memory::LeakReport& final_leak_report() const noexcept { return m_final_leaks; }

private:
    [[nodiscard]] hotline_core::Result<void> start();
    [[nodiscard]] hotline_core::Result<void> check_bad_frees();
    [[nodiscard]] hotline_core::Result<void> finish();
    void write_exit_signal() const;
    void acknowledge(const std::string& prompt) const;

    HarnessConfig m_config;
    AcknowledgeFn m_acknowledge;

    hotline_memory::HostAllocator m_allocator;
    hotline_artifact::ArtifactBinder m_binder;
    hotline_reload::VersionRegistry m_registry;
    hotline_reload::ApplicationMemory m_memory;
    std::unique_ptr<hotline_reload::ReloadEngine> m_engine;

    std::uint64_t m_frames = 0;
    hotline_memory::LeakReport m_final_leaks;
};

} // namespace hotline_runtime
