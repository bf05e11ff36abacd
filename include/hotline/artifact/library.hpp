#pragma once

/// @file library.hpp
/// @brief Cross-platform dynamic library loading with RAII
///
/// Wraps the platform loader APIs:
/// - Windows: LoadLibrary/GetProcAddress/FreeLibrary
/// - Linux/macOS: dlopen/dlsym/dlclose

#include <hotline/core/error.hpp>

#include <filesystem>
#include <string>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace hotline_artifact {

// =============================================================================
// Platform Types
// =============================================================================

#ifdef _WIN32
using NativeLibraryHandle = HMODULE;
#else
using NativeLibraryHandle = void*;
#endif

// =============================================================================
// DynamicLibrary
// =============================================================================

/// RAII wrapper for a dynamically loaded code module
///
/// Unloads the module when destroyed. Move-only: exactly one owner releases
/// the loader handle.
class DynamicLibrary {
public:
    DynamicLibrary() = default;
    ~DynamicLibrary();

    DynamicLibrary(const DynamicLibrary&) = delete;
    DynamicLibrary& operator=(const DynamicLibrary&) = delete;

    DynamicLibrary(DynamicLibrary&& other) noexcept;
    DynamicLibrary& operator=(DynamicLibrary&& other) noexcept;

    /// Load a module from path. Symbols are resolved eagerly and kept local
    /// to the module so successive versions never alias each other.
    ///
    /// @return Loaded library, or a LoadFailed ArtifactError carrying the loader message
    [[nodiscard]] static hotline_core::Result<DynamicLibrary> load(const std::filesystem::path& path);

    [[nodiscard]] bool is_loaded() const noexcept { return m_handle != nullptr; }
    [[nodiscard]] explicit operator bool() const noexcept { return is_loaded(); }

    /// Unload the module. Safe to call more than once.
    void unload() noexcept;

    /// Get a symbol, or nullptr if absent
    [[nodiscard]] void* get_symbol(const char* name) const noexcept;

    [[nodiscard]] void* get_symbol(const std::string& name) const noexcept {
        return get_symbol(name.c_str());
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }
    [[nodiscard]] NativeLibraryHandle native_handle() const noexcept { return m_handle; }

    /// Last loader error message
    [[nodiscard]] static std::string get_last_error();

private:
    DynamicLibrary(NativeLibraryHandle handle, std::filesystem::path path);

    NativeLibraryHandle m_handle = nullptr;
    std::filesystem::path m_path;
};

// =============================================================================
// Platform Helpers
// =============================================================================

namespace platform {

/// Shared library extension for the current platform, including the dot
[[nodiscard]] const char* shared_library_extension();

} // namespace platform

} // namespace hotline_artifact
