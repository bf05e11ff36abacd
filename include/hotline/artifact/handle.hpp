#pragma once

/// @file handle.hpp
/// @brief One loaded version of the application logic

#include "entry_points.hpp"
#include "library.hpp"

#include <cstdint>
#include <filesystem>

namespace hotline_artifact {

/// Lifecycle status of a handle
enum class HandleStatus : std::uint8_t {
    Active,   // Drives the current frame
    Retired,  // Superseded by a hot swap, kept loaded
};

[[nodiscard]] const char* handle_status_name(HandleStatus status);

/// A bound artifact version: loader handle, resolved callables, observed
/// modification time and version number.
///
/// Move-only. The loader handle is released when the handle is destroyed or
/// explicitly released through the binder.
class ArtifactHandle {
public:
    using FileTime = std::filesystem::file_time_type;

    ArtifactHandle() = default;
    ArtifactHandle(DynamicLibrary library, ArtifactApi api, std::filesystem::path copy_path,
                   FileTime modification_time, std::uint32_t version);

    ArtifactHandle(const ArtifactHandle&) = delete;
    ArtifactHandle& operator=(const ArtifactHandle&) = delete;
    ArtifactHandle(ArtifactHandle&&) noexcept = default;
    ArtifactHandle& operator=(ArtifactHandle&&) noexcept = default;

    [[nodiscard]] const ArtifactApi& api() const noexcept { return m_api; }
    [[nodiscard]] DynamicLibrary& library() noexcept { return m_library; }
    [[nodiscard]] const DynamicLibrary& library() const noexcept { return m_library; }

    [[nodiscard]] const std::filesystem::path& copy_path() const noexcept { return m_copy_path; }
    [[nodiscard]] FileTime modification_time() const noexcept { return m_modification_time; }
    [[nodiscard]] std::uint32_t version() const noexcept { return m_version; }

    [[nodiscard]] HandleStatus status() const noexcept { return m_status; }
    void set_status(HandleStatus status) noexcept { m_status = status; }
    [[nodiscard]] bool is_active() const noexcept { return m_status == HandleStatus::Active; }

    /// Hand the host allocator table to the artifact if it exports attach_allocator.
    /// @return true if the artifact accepted the table
    bool attach_allocator(const hotline_allocator_api_v1* table) const;

    /// Drop the loader handle and callables. The copied file is left alone.
    void unload() noexcept;

    [[nodiscard]] bool is_loaded() const noexcept { return m_api.update != nullptr; }

private:
    DynamicLibrary m_library;
    ArtifactApi m_api;
    std::filesystem::path m_copy_path;
    FileTime m_modification_time{};
    std::uint32_t m_version = 0;
    HandleStatus m_status = HandleStatus::Active;
};

} // namespace hotline_artifact
