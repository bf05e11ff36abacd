#pragma once

/// @file error.hpp
/// @brief Error handling types for hotline_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace hotline_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    LoadError,
    SymbolMissing,
    ParseError,
    MemoryCorruption,
    MemoryLeak,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::LoadError: return "LoadError";
        case ErrorCode::SymbolMissing: return "SymbolMissing";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::MemoryCorruption: return "MemoryCorruption";
        case ErrorCode::MemoryLeak: return "MemoryLeak";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Artifact binding errors
struct ArtifactError {
    enum class Kind : std::uint8_t {
        ArtifactUnavailable,     // Source artifact cannot be stat'd
        CopyFailed,              // Versioned copy could not be written
        LoadFailed,              // Platform loader rejected the copy
        SymbolResolutionFailed,  // A required entry point is missing
    };

    Kind kind;
    std::string message;
    std::string path;
    std::string symbol;  // For SymbolResolutionFailed

    [[nodiscard]] static ArtifactError unavailable(const std::string& path, const std::string& reason) {
        return ArtifactError{Kind::ArtifactUnavailable,
            "Artifact unavailable '" + path + "': " + reason, path, {}};
    }

    [[nodiscard]] static ArtifactError copy_failed(const std::string& from, const std::string& to,
                                                   const std::string& reason) {
        return ArtifactError{Kind::CopyFailed,
            "Failed to copy '" + from + "' to '" + to + "': " + reason, to, {}};
    }

    [[nodiscard]] static ArtifactError load_failed(const std::string& path, const std::string& reason) {
        return ArtifactError{Kind::LoadFailed,
            "Failed to load '" + path + "': " + reason, path, {}};
    }

    [[nodiscard]] static ArtifactError symbol_missing(const std::string& path, const std::string& symbol) {
        return ArtifactError{Kind::SymbolResolutionFailed,
            "Missing entry point '" + symbol + "' in '" + path + "'", path, symbol};
    }
};

/// Get artifact error kind name
[[nodiscard]] inline const char* artifact_error_kind_name(ArtifactError::Kind kind) {
    switch (kind) {
        case ArtifactError::Kind::ArtifactUnavailable: return "ArtifactUnavailable";
        case ArtifactError::Kind::CopyFailed: return "CopyFailed";
        case ArtifactError::Kind::LoadFailed: return "LoadFailed";
        case ArtifactError::Kind::SymbolResolutionFailed: return "SymbolResolutionFailed";
        default: return "Unknown";
    }
}

/// Allocator safety findings
struct AllocatorError {
    enum class Kind : std::uint8_t {
        BadFree,       // Deallocation with no live allocation record
        LeakDetected,  // Allocations still live at drain time
    };

    Kind kind;
    std::string message;
    std::size_t count = 0;  // Number of offending records
    std::size_t bytes = 0;  // For LeakDetected

    [[nodiscard]] static AllocatorError bad_free(std::size_t count) {
        return AllocatorError{Kind::BadFree,
            "Bad free detected (" + std::to_string(count) + " occurrence(s))", count, 0};
    }

    [[nodiscard]] static AllocatorError leak_detected(std::size_t count, std::size_t bytes) {
        return AllocatorError{Kind::LeakDetected,
            "Leaked " + std::to_string(bytes) + " bytes in " + std::to_string(count) + " allocation(s)",
            count, bytes};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,
        ParseFailed,
        InvalidValue,
        UnknownOption,
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, path};
    }

    [[nodiscard]] static ConfigError parse_failed(const std::string& source, const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Failed to parse '" + source + "': " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, key};
    }

    [[nodiscard]] static ConfigError unknown_option(const std::string& option) {
        return ConfigError{Kind::UnknownOption, "Unknown option: " + option, option};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ArtifactError,
        AllocatorError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ArtifactError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(AllocatorError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ArtifactError::Kind kind) {
        switch (kind) {
            case ArtifactError::Kind::ArtifactUnavailable: return ErrorCode::NotFound;
            case ArtifactError::Kind::CopyFailed: return ErrorCode::IOError;
            case ArtifactError::Kind::LoadFailed: return ErrorCode::LoadError;
            case ArtifactError::Kind::SymbolResolutionFailed: return ErrorCode::SymbolMissing;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(AllocatorError::Kind kind) {
        switch (kind) {
            case AllocatorError::Kind::BadFree: return ErrorCode::MemoryCorruption;
            case AllocatorError::Kind::LeakDetected: return ErrorCode::MemoryLeak;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::NotFound;
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::UnknownOption: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind details and context entries
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Get count of artifact binding errors
std::uint64_t artifact_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace hotline_core
