/// @file handle.cpp
/// @brief ArtifactHandle implementation

#include <hotline/artifact/handle.hpp>

namespace hotline_artifact {

const char* handle_status_name(HandleStatus status) {
    switch (status) {
        case HandleStatus::Active: return "Active";
        case HandleStatus::Retired: return "Retired";
        default: return "Unknown";
    }
}

ArtifactHandle::ArtifactHandle(DynamicLibrary library, ArtifactApi api, std::filesystem::path copy_path,
                               FileTime modification_time, std::uint32_t version)
    : m_library(std::move(library))
    , m_api(api)
    , m_copy_path(std::move(copy_path))
    , m_modification_time(modification_time)
    , m_version(version)
{}

bool ArtifactHandle::attach_allocator(const hotline_allocator_api_v1* table) const {
    if (!m_api.attach_allocator || !table) {
        return false;
    }
    m_api.attach_allocator(table);
    return true;
}

void ArtifactHandle::unload() noexcept {
    // Callables point into the module; clear them before it goes away.
    m_api = ArtifactApi{};
    m_library.unload();
}

} // namespace hotline_artifact
