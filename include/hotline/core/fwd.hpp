#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for hotline_core

#include <cstdint>

namespace hotline_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ArtifactError;
struct AllocatorError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace hotline_core
