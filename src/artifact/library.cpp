/// @file library.cpp
/// @brief Cross-platform dynamic library loading implementation

#include <hotline/artifact/library.hpp>

#include <system_error>
#include <utility>

namespace hotline_artifact {

namespace {

// =============================================================================
// Native loader primitives
// =============================================================================

#ifdef _WIN32

NativeLibraryHandle open_native(const std::filesystem::path& path) {
    return LoadLibraryW(path.wstring().c_str());
}

void close_native(NativeLibraryHandle handle) {
    FreeLibrary(handle);
}

void* find_native(NativeLibraryHandle handle, const char* name) {
    return reinterpret_cast<void*>(GetProcAddress(handle, name));
}

std::string native_error() {
    const DWORD code = GetLastError();
    if (code == 0) {
        return "No error";
    }
    return std::system_category().message(static_cast<int>(code))
        + " (error " + std::to_string(code) + ")";
}

#else

NativeLibraryHandle open_native(const std::filesystem::path& path) {
    // Bound eagerly, symbols local to this version
    return dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
}

void close_native(NativeLibraryHandle handle) {
    dlclose(handle);
}

void* find_native(NativeLibraryHandle handle, const char* name) {
    dlerror();
    return dlsym(handle, name);
}

std::string native_error() {
    const char* error = dlerror();
    return error ? std::string(error) : "No error";
}

#endif

} // anonymous namespace

// =============================================================================
// DynamicLibrary
// =============================================================================

DynamicLibrary::DynamicLibrary(NativeLibraryHandle handle, std::filesystem::path path)
    : m_handle(handle)
    , m_path(std::move(path))
{}

DynamicLibrary::~DynamicLibrary() {
    unload();
}

DynamicLibrary::DynamicLibrary(DynamicLibrary&& other) noexcept
    : m_handle(std::exchange(other.m_handle, nullptr))
    , m_path(std::move(other.m_path))
{}

DynamicLibrary& DynamicLibrary::operator=(DynamicLibrary&& other) noexcept {
    if (this != &other) {
        unload();
        m_handle = std::exchange(other.m_handle, nullptr);
        m_path = std::move(other.m_path);
    }
    return *this;
}

hotline_core::Result<DynamicLibrary> DynamicLibrary::load(const std::filesystem::path& path) {
#ifndef _WIN32
    dlerror();
#endif
    NativeLibraryHandle handle = open_native(path);
    if (!handle) {
        return hotline_core::Error(hotline_core::ArtifactError::load_failed(path.string(), native_error()));
    }
    return DynamicLibrary(handle, path);
}

void DynamicLibrary::unload() noexcept {
    if (m_handle) {
        close_native(m_handle);
        m_handle = nullptr;
    }
    m_path.clear();
}

void* DynamicLibrary::get_symbol(const char* name) const noexcept {
    if (!m_handle || !name) {
        return nullptr;
    }
    return find_native(m_handle, name);
}

std::string DynamicLibrary::get_last_error() {
    return native_error();
}

// =============================================================================
// Platform Helpers
// =============================================================================

namespace platform {

const char* shared_library_extension() {
#ifdef _WIN32
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

} // namespace platform

} // namespace hotline_artifact
