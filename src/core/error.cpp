/// @file error.cpp
/// @brief Error handling implementation for hotline_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error formatting with kind details and context
/// - Explicit template instantiations for common Result types
/// - Error statistics

#include <hotline/core/error.hpp>
#include <atomic>
#include <sstream>

namespace hotline_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_artifact_error(const ArtifactError& err) {
    std::ostringstream oss;
    oss << "[ArtifactError:" << artifact_error_kind_name(err.kind) << "] " << err.message;
    if (!err.symbol.empty()) {
        oss << " (symbol: " << err.symbol << ")";
    }
    return oss.str();
}

std::string format_allocator_error(const AllocatorError& err) {
    std::ostringstream oss;
    oss << "[AllocatorError] " << err.message;
    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ArtifactError>) {
            oss << detail::format_artifact_error(err);
        } else if constexpr (std::is_same_v<T, AllocatorError>) {
            oss << detail::format_allocator_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> artifact_errors{0};
    std::atomic<std::uint64_t> allocator_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ArtifactError>()) {
        s_error_stats.artifact_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<AllocatorError>()) {
        s_error_stats.allocator_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t artifact_error_count() {
    return s_error_stats.artifact_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.artifact_errors.store(0, std::memory_order_relaxed);
    s_error_stats.allocator_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Artifact: " << s_error_stats.artifact_errors.load() << "\n"
        << "  Allocator: " << s_error_stats.allocator_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace hotline_core
