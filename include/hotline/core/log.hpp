#pragma once

/// @file log.hpp
/// @brief Logging utilities for hotline

#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define HOTLINE_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define HOTLINE_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define HOTLINE_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define HOTLINE_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define HOTLINE_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define HOTLINE_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace hotline_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the default logger pattern and level
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Artifact binding logger
std::shared_ptr<spdlog::logger> artifact_logger();

/// Version registry and reload engine logger
std::shared_ptr<spdlog::logger> reload_logger();

/// Allocator tracking logger
std::shared_ptr<spdlog::logger> memory_logger();

/// Drive loop logger
std::shared_ptr<spdlog::logger> runtime_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope that traces entry, exit and elapsed time of a block
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "hotline");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define HOTLINE_CONCAT_IMPL(a, b) a##b
#define HOTLINE_CONCAT(a, b) HOTLINE_CONCAT_IMPL(a, b)
#define HOTLINE_LOG_SCOPE(name, logger_name) \
    ::hotline_core::LogScope HOTLINE_CONCAT(_log_scope_, __LINE__)(name, logger_name)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace hotline_core
