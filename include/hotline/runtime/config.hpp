#pragma once

/// @file config.hpp
/// @brief Harness configuration: defaults, hotline.toml and command-line overrides

#include <hotline/core/error.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace hotline_runtime {

/// Everything the host needs to run
struct HarnessConfig {
    // [artifact]
    std::filesystem::path artifact_path = default_artifact_path();
    std::string symbol_prefix = "game_";

    // [reload]
    std::chrono::milliseconds poll_interval{0};

    // [runtime]
    std::filesystem::path exit_signal = "exit_signal.tmp";
    bool interactive = true;
    std::size_t scratch_kb = 1024;

    // [log]
    std::string log_level = "info";
    std::filesystem::path log_directory;

    // Command line only
    std::filesystem::path config_file;
    bool show_help = false;

    /// build/hot_reload/game.<platform extension>
    [[nodiscard]] static std::filesystem::path default_artifact_path();

    /// Check value ranges and names
    [[nodiscard]] hotline_core::Result<void> validate() const;
};

/// Default config file looked up in the working directory
inline constexpr const char* k_default_config_file = "hotline.toml";

/// Largest frame scratch arena accepted (1 GiB)
inline constexpr std::size_t k_max_scratch_kb = 1024 * 1024;

/// Apply the contents of a TOML document on top of base
[[nodiscard]] hotline_core::Result<HarnessConfig> parse_config_string(
    const std::string& content,
    const std::string& source_name,
    HarnessConfig base = {});

/// Apply a TOML file on top of base
[[nodiscard]] hotline_core::Result<HarnessConfig> load_config_file(
    const std::filesystem::path& path,
    HarnessConfig base = {});

/// Build the configuration from defaults, the config file and the command line.
///
/// The config file is `--config <file>` if given (must exist), otherwise
/// hotline.toml in the working directory if present. Command-line options
/// override file values.
[[nodiscard]] hotline_core::Result<HarnessConfig> parse_command_line(int argc, const char* const* argv);

/// Help text for the command line
[[nodiscard]] std::string usage(const std::string& program);

} // namespace hotline_runtime
