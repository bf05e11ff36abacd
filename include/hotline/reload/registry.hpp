#pragma once

/// @file registry.hpp
/// @brief Version registry - the active handle and every retired version

#include <hotline/artifact/binder.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace hotline_reload {

using hotline_artifact::ArtifactHandle;
using hotline_artifact::IArtifactBinder;

/// Tracks which artifact version drives the frame and which superseded
/// versions are still loaded.
///
/// Retired versions stay loaded until a full restart or process shutdown: the
/// live memory block may hold pointers to their code or static data.
class VersionRegistry {
public:
    explicit VersionRegistry(IArtifactBinder& binder);

    /// Releases every handle still held. No artifact code is called.
    ~VersionRegistry();

    VersionRegistry(const VersionRegistry&) = delete;
    VersionRegistry& operator=(const VersionRegistry&) = delete;

    /// Set the first active handle at startup
    void install(ArtifactHandle handle);

    /// Hot swap: retire the active handle and activate the new one
    void promote(ArtifactHandle handle);

    /// Full restart: release every retired handle oldest first, then the
    /// active one, and activate the new handle
    void reset(ArtifactHandle handle);

    /// Called with the active handle while it is still loaded
    using BeforeActiveRelease = std::function<void(ArtifactHandle&)>;

    /// Process exit: release every retired handle oldest first, run
    /// before_active_release on the active handle, then release it
    void shutdown(const BeforeActiveRelease& before_active_release = {});

    [[nodiscard]] ArtifactHandle* active() noexcept { return m_active ? &*m_active : nullptr; }
    [[nodiscard]] const ArtifactHandle* active() const noexcept { return m_active ? &*m_active : nullptr; }
    [[nodiscard]] bool has_active() const noexcept { return m_active.has_value(); }

    [[nodiscard]] const std::vector<ArtifactHandle>& retired() const noexcept { return m_retired; }

    /// Version number the next bind should use
    [[nodiscard]] std::uint32_t next_version() const noexcept { return m_next_version; }

    /// Consume a version number after a successful bind
    std::uint32_t advance_version() noexcept { return m_next_version++; }

private:
    void release_retired();
    void release_active();

    IArtifactBinder& m_binder;
    std::optional<ArtifactHandle> m_active;
    std::vector<ArtifactHandle> m_retired;
    std::uint32_t m_next_version = 0;
};

} // namespace hotline_reload
