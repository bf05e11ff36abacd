/// @file binder.cpp
/// @brief ArtifactBinder implementation

#include <hotline/artifact/binder.hpp>
#include <hotline/core/log.hpp>

#include <system_error>

namespace hotline_artifact {

namespace {

void remove_copy(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::remove(path, ec) && ec) {
        hotline_core::artifact_logger()->warn("Could not delete artifact copy '{}': {}",
            path.string(), ec.message());
    }
}

} // anonymous namespace

ArtifactBinder::ArtifactBinder(BinderConfig config)
    : m_config(std::move(config)) {}

std::filesystem::path ArtifactBinder::copy_path_for(std::uint32_t version) const {
    const auto& source = m_config.source_path;
    std::string name = source.stem().string() + "_" + std::to_string(version) + source.extension().string();
    return source.parent_path() / name;
}

hotline_core::Result<ArtifactHandle::FileTime> ArtifactBinder::source_modification_time() const {
    std::error_code ec;
    auto time = std::filesystem::last_write_time(m_config.source_path, ec);
    if (ec) {
        return hotline_core::Error(hotline_core::ArtifactError::unavailable(
            m_config.source_path.string(), ec.message()));
    }
    return time;
}

hotline_core::Result<ArtifactApi> ArtifactBinder::resolve(const DynamicLibrary& library,
                                                          const std::string& symbol_prefix) {
    ArtifactApi api;

    for (const auto& entry : k_entry_points) {
        std::string symbol = symbol_prefix + entry.name;
        void* address = library.get_symbol(symbol);

        if (!address) {
            if (entry.required) {
                return hotline_core::Error(hotline_core::ArtifactError::symbol_missing(
                    library.path().string(), symbol));
            }
            continue;
        }

        entry.assign(api, address);
    }

    return api;
}

hotline_core::Result<ArtifactHandle> ArtifactBinder::bind(std::uint32_t version) {
    HOTLINE_LOG_SCOPE("bind", "artifact");
    auto logger = hotline_core::artifact_logger();

    auto time = source_modification_time();
    if (!time) {
        return time.error();
    }

    const auto copy_path = copy_path_for(version);

    std::error_code ec;
    std::filesystem::copy_file(m_config.source_path, copy_path,
        std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        remove_copy(copy_path);
        return hotline_core::Error(hotline_core::ArtifactError::copy_failed(
            m_config.source_path.string(), copy_path.string(), ec.message()));
    }

    auto library = DynamicLibrary::load(copy_path);
    if (!library) {
        remove_copy(copy_path);
        return library.error();
    }

    auto api = resolve(*library, m_config.symbol_prefix);
    if (!api) {
        library->unload();
        remove_copy(copy_path);
        return api.error();
    }

    logger->info("Bound artifact version {} from '{}'", version, copy_path.string());
    if (!api->attach_allocator) {
        logger->debug("Artifact version {} does not export {}attach_allocator",
            version, m_config.symbol_prefix);
    }

    return ArtifactHandle(std::move(*library), *api, copy_path, *time, version);
}

void ArtifactBinder::release(ArtifactHandle& handle) {
    if (!handle.library().is_loaded() && handle.copy_path().empty()) {
        return;
    }

    const auto copy_path = handle.copy_path();
    const auto version = handle.version();

    handle.unload();

    std::error_code ec;
    if (!copy_path.empty() && !std::filesystem::remove(copy_path, ec)) {
        if (ec) {
            hotline_core::artifact_logger()->warn("Could not delete artifact copy '{}': {}",
                copy_path.string(), ec.message());
        } else {
            hotline_core::artifact_logger()->debug("Artifact copy '{}' was already gone", copy_path.string());
        }
    }

    hotline_core::artifact_logger()->debug("Released artifact version {}", version);
}

} // namespace hotline_artifact
