#pragma once

/// @file binder.hpp
/// @brief Artifact binding: copy, load and resolve a versioned artifact

#include "handle.hpp"

#include <hotline/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace hotline_artifact {

// =============================================================================
// IArtifactBinder
// =============================================================================

/// Produces and releases artifact handles
class IArtifactBinder {
public:
    virtual ~IArtifactBinder() = default;

    /// Bind a new version. All-or-nothing: on error no handle exists and no
    /// copy is left behind.
    [[nodiscard]] virtual hotline_core::Result<ArtifactHandle> bind(std::uint32_t version) = 0;

    /// Unload a handle and delete its copied file
    virtual void release(ArtifactHandle& handle) = 0;

    /// Current modification time of the source artifact
    [[nodiscard]] virtual hotline_core::Result<ArtifactHandle::FileTime> source_modification_time() const = 0;
};

// =============================================================================
// ArtifactBinder
// =============================================================================

struct BinderConfig {
    std::filesystem::path source_path;
    std::string symbol_prefix = k_default_symbol_prefix;
};

/// Binds the artifact at a fixed source path.
///
/// Each version is loaded from a copy named `<stem>_<version><ext>` next to the
/// source so the external build can keep overwriting the original.
class ArtifactBinder : public IArtifactBinder {
public:
    explicit ArtifactBinder(BinderConfig config);

    [[nodiscard]] hotline_core::Result<ArtifactHandle> bind(std::uint32_t version) override;
    void release(ArtifactHandle& handle) override;
    [[nodiscard]] hotline_core::Result<ArtifactHandle::FileTime> source_modification_time() const override;

    /// Path of the copy used for a version
    [[nodiscard]] std::filesystem::path copy_path_for(std::uint32_t version) const;

    [[nodiscard]] const BinderConfig& config() const noexcept { return m_config; }

    /// Resolve every registered entry point from a loaded library.
    /// On failure the error names the first missing required symbol.
    [[nodiscard]] static hotline_core::Result<ArtifactApi> resolve(const DynamicLibrary& library,
                                                                   const std::string& symbol_prefix);

private:
    BinderConfig m_config;
};

} // namespace hotline_artifact
