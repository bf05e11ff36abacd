/// @file config.cpp
/// @brief Harness configuration loading

#include <hotline/runtime/config.hpp>
#include <hotline/artifact/library.hpp>
#include <hotline/core/log.hpp>

#include <toml++/toml.hpp>

#include <charconv>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <string_view>

namespace hotline_runtime {

using hotline_core::ConfigError;
using hotline_core::Error;
using hotline_core::Result;

std::filesystem::path HarnessConfig::default_artifact_path() {
    return std::filesystem::path("build") / "hot_reload"
        / (std::string("game") + hotline_artifact::platform::shared_library_extension());
}

Result<void> HarnessConfig::validate() const {
    if (artifact_path.empty()) {
        return Error(ConfigError::invalid_value("artifact.path", "must not be empty"));
    }
    if (symbol_prefix.empty()) {
        return Error(ConfigError::invalid_value("artifact.symbol_prefix", "must not be empty"));
    }
    if (poll_interval.count() < 0) {
        return Error(ConfigError::invalid_value("reload.poll_interval_ms", "must not be negative"));
    }
    if (exit_signal.empty()) {
        return Error(ConfigError::invalid_value("runtime.exit_signal", "must not be empty"));
    }
    if (scratch_kb == 0) {
        return Error(ConfigError::invalid_value("runtime.scratch_kb", "must be at least 1"));
    }
    if (scratch_kb > k_max_scratch_kb) {
        return Error(ConfigError::invalid_value("runtime.scratch_kb",
            "must not exceed " + std::to_string(k_max_scratch_kb)));
    }
    if (!hotline_core::parse_log_level(log_level)) {
        return Error(ConfigError::invalid_value("log.level", "unknown level '" + log_level + "'"));
    }
    return hotline_core::Ok();
}

// =============================================================================
// TOML
// =============================================================================

namespace {

/// Read an optional key; a present key of the wrong type is an error
template<typename T>
Result<std::optional<T>> read_key(const toml::table& tbl, const char* section, const char* key) {
    auto node = tbl[section][key];
    if (!node) {
        return std::optional<T>{};
    }
    auto value = node.template value<T>();
    if (!value) {
        return Error(ConfigError::invalid_value(
            std::string(section) + "." + key, "wrong type"));
    }
    return std::optional<T>{*value};
}

Result<void> apply_table(const toml::table& tbl, HarnessConfig& config) {
    // [artifact]
    auto path = read_key<std::string>(tbl, "artifact", "path");
    if (!path) return path.error();
    if (*path) config.artifact_path = **path;

    auto prefix = read_key<std::string>(tbl, "artifact", "symbol_prefix");
    if (!prefix) return prefix.error();
    if (*prefix) config.symbol_prefix = **prefix;

    // [reload]
    auto poll = read_key<std::int64_t>(tbl, "reload", "poll_interval_ms");
    if (!poll) return poll.error();
    if (*poll) {
        if (**poll < 0) {
            return Error(ConfigError::invalid_value("reload.poll_interval_ms", "must not be negative"));
        }
        config.poll_interval = std::chrono::milliseconds(**poll);
    }

    // [runtime]
    auto exit_signal = read_key<std::string>(tbl, "runtime", "exit_signal");
    if (!exit_signal) return exit_signal.error();
    if (*exit_signal) config.exit_signal = **exit_signal;

    auto interactive = read_key<bool>(tbl, "runtime", "interactive");
    if (!interactive) return interactive.error();
    if (*interactive) config.interactive = **interactive;

    auto scratch = read_key<std::int64_t>(tbl, "runtime", "scratch_kb");
    if (!scratch) return scratch.error();
    if (*scratch) {
        if (**scratch <= 0) {
            return Error(ConfigError::invalid_value("runtime.scratch_kb", "must be at least 1"));
        }
        config.scratch_kb = static_cast<std::size_t>(**scratch);
    }

    // [log]
    auto level = read_key<std::string>(tbl, "log", "level");
    if (!level) return level.error();
    if (*level) config.log_level = **level;

    auto directory = read_key<std::string>(tbl, "log", "directory");
    if (!directory) return directory.error();
    if (*directory) config.log_directory = **directory;

    return hotline_core::Ok();
}

} // anonymous namespace

Result<HarnessConfig> parse_config_string(const std::string& content, const std::string& source_name,
                                          HarnessConfig base) {
    try {
        toml::table tbl = toml::parse(content, source_name);

        auto applied = apply_table(tbl, base);
        if (!applied) {
            return applied.error();
        }
    } catch (const toml::parse_error& err) {
        return Error(ConfigError::parse_failed(source_name, std::string(err.description())));
    }

    auto valid = base.validate();
    if (!valid) {
        return valid.error();
    }
    return base;
}

Result<HarnessConfig> load_config_file(const std::filesystem::path& path, HarnessConfig base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ConfigError::file_not_found(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_config_string(buffer.str(), path.string(), std::move(base));
    if (config) {
        config->config_file = path;
    }
    return config;
}

// =============================================================================
// Command Line
// =============================================================================

namespace {

template<typename T>
Result<T> parse_number(const std::string& option, std::string_view text) {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return Error(ConfigError::invalid_value(option, "expected a number, got '" + std::string(text) + "'"));
    }
    return value;
}

bool takes_value(std::string_view option) {
    return option == "--config" || option == "--artifact" || option == "--prefix"
        || option == "--poll-ms" || option == "--exit-signal" || option == "--scratch-kb"
        || option == "--log-level" || option == "--log-dir";
}

} // anonymous namespace

Result<HarnessConfig> parse_command_line(int argc, const char* const* argv) {
    // First pass: locate the config file and validate option shapes
    std::optional<std::filesystem::path> config_path;
    bool show_help = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            show_help = true;
        } else if (arg == "--non-interactive") {
            // Applied below
        } else if (takes_value(arg)) {
            if (i + 1 >= argc) {
                return Error(ConfigError::invalid_value(std::string(arg), "missing value"));
            }
            if (arg == "--config") {
                config_path = argv[i + 1];
            }
            ++i;
        } else {
            return Error(ConfigError::unknown_option(std::string(arg)));
        }
    }

    HarnessConfig config;
    config.show_help = show_help;
    if (show_help) {
        return config;
    }

    if (config_path) {
        auto loaded = load_config_file(*config_path, config);
        if (!loaded) {
            return loaded.error();
        }
        config = std::move(*loaded);
    } else if (std::filesystem::exists(k_default_config_file)) {
        auto loaded = load_config_file(k_default_config_file, config);
        if (!loaded) {
            return loaded.error();
        }
        config = std::move(*loaded);
    }

    // Second pass: overrides
    for (int i = 1; i < argc; ++i) {
        std::string option = argv[i];
        if (option == "--non-interactive") {
            config.interactive = false;
            continue;
        }
        if (!takes_value(option)) {
            continue;
        }

        std::string value = argv[++i];
        if (option == "--artifact") {
            config.artifact_path = value;
        } else if (option == "--prefix") {
            config.symbol_prefix = value;
        } else if (option == "--poll-ms") {
            auto ms = parse_number<std::int64_t>(option, value);
            if (!ms) return ms.error();
            config.poll_interval = std::chrono::milliseconds(*ms);
        } else if (option == "--exit-signal") {
            config.exit_signal = value;
        } else if (option == "--scratch-kb") {
            auto kb = parse_number<std::size_t>(option, value);
            if (!kb) return kb.error();
            config.scratch_kb = *kb;
        } else if (option == "--log-level") {
            config.log_level = value;
        } else if (option == "--log-dir") {
            config.log_directory = value;
        }
    }

    auto valid = config.validate();
    if (!valid) {
        return valid.error();
    }
    return config;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Hosts a hot-reloadable application artifact.\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>       Configuration file (default: " << k_default_config_file << " if present)\n"
        << "  --artifact <path>     Artifact to load (default: " << HarnessConfig::default_artifact_path().string() << ")\n"
        << "  --prefix <prefix>     Entry point symbol prefix (default: game_)\n"
        << "  --poll-ms <n>         Minimum milliseconds between artifact timestamp checks (default: 0)\n"
        << "  --exit-signal <path>  Marker file written on clean shutdown (default: exit_signal.tmp)\n"
        << "  --scratch-kb <n>      Per-frame scratch arena size in KiB (default: 1024)\n"
        << "  --log-level <level>   trace, debug, info, warn, error, critical or off (default: info)\n"
        << "  --log-dir <dir>       Also write rotating log files to this directory\n"
        << "  --non-interactive     Do not wait for Enter after leaks or bad frees\n"
        << "  --help                Show this help\n";
    return out.str();
}

} // namespace hotline_runtime
