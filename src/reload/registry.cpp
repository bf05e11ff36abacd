/// @file registry.cpp
/// @brief VersionRegistry implementation

#include <hotline/reload/registry.hpp>
#include <hotline/core/log.hpp>

namespace hotline_reload {

VersionRegistry::VersionRegistry(IArtifactBinder& binder)
    : m_binder(binder) {}

VersionRegistry::~VersionRegistry() {
    release_retired();
    release_active();
}

void VersionRegistry::install(ArtifactHandle handle) {
    if (m_active) {
        hotline_core::reload_logger()->warn("install() replacing active version {}", m_active->version());
        release_active();
    }
    handle.set_status(hotline_artifact::HandleStatus::Active);
    m_active = std::move(handle);
}

void VersionRegistry::promote(ArtifactHandle handle) {
    if (m_active) {
        // Not released here: the memory block may still reference this version.
        m_active->set_status(hotline_artifact::HandleStatus::Retired);
        hotline_core::reload_logger()->debug("Retired version {} ({} retired)",
            m_active->version(), m_retired.size() + 1);
        m_retired.push_back(std::move(*m_active));
    }
    handle.set_status(hotline_artifact::HandleStatus::Active);
    m_active = std::move(handle);
}

void VersionRegistry::reset(ArtifactHandle handle) {
    // Safe only after the active artifact's shutdown(): nothing live can point
    // into these modules any more.
    release_retired();
    release_active();
    handle.set_status(hotline_artifact::HandleStatus::Active);
    m_active = std::move(handle);
}

void VersionRegistry::shutdown(const BeforeActiveRelease& before_active_release) {
    release_retired();
    if (m_active && before_active_release) {
        before_active_release(*m_active);
    }
    release_active();
}

void VersionRegistry::release_retired() {
    for (auto& handle : m_retired) {
        m_binder.release(handle);
    }
    m_retired.clear();
}

void VersionRegistry::release_active() {
    if (m_active) {
        m_binder.release(*m_active);
        m_active.reset();
    }
}

} // namespace hotline_reload
