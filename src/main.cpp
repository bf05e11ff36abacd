/// @file main.cpp
/// @brief hotline entry point - hosts a hot-reloadable application artifact
///
/// Loads the artifact named by the configuration, drives its frame loop and
/// swaps in rebuilt versions as they appear on disk. Leaks and bad frees made
/// through the host allocator are reported on restart and shutdown.

#include <hotline/core/log.hpp>
#include <hotline/runtime/config.hpp>
#include <hotline/runtime/harness.hpp>

#include <iostream>

namespace {

void setup_logging(const hotline_runtime::HarnessConfig& config) {
    hotline_core::LogConfig log_config;
    log_config.level = hotline_core::parse_log_level(config.log_level).value_or(spdlog::level::info);
    if (!config.log_directory.empty()) {
        log_config.file_enabled = true;
        log_config.log_directory = config.log_directory.string();
    }

    hotline_core::init_logging();
    hotline_core::configure_logging(log_config);
    HOTLINE_LOG_DEBUG("Log level set to {}", hotline_core::log_level_name(log_config.level));
}

} // anonymous namespace

int main(int argc, char** argv) {
    auto config = hotline_runtime::parse_command_line(argc, argv);
    if (!config) {
        std::cerr << "Error: " << hotline_core::build_error_chain(config.error()) << "\n\n";
        std::cerr << hotline_runtime::usage(argv[0]);
        return static_cast<int>(hotline_runtime::ExitCode::ConfigError);
    }

    if (config->show_help) {
        std::cout << hotline_runtime::usage(argv[0]);
        return static_cast<int>(hotline_runtime::ExitCode::Success);
    }

    setup_logging(*config);

    auto logger = hotline_core::runtime_logger();
    logger->info("Hosting '{}' (prefix '{}')", config->artifact_path.string(), config->symbol_prefix);
    if (!config->config_file.empty()) {
        logger->info("Configuration loaded from '{}'", config->config_file.string());
    }

    int exit_code = static_cast<int>(hotline_runtime::ExitCode::Success);
    {
        hotline_runtime::Harness harness(std::move(*config));
        auto result = harness.run();
        if (!result) {
            exit_code = static_cast<int>(hotline_runtime::exit_code_for(result.error()));
            logger->error("Exiting with code {}: {}", exit_code, result.error().message());
        }
    }

    logger->debug("{}", hotline_core::debug::error_stats_summary());
    hotline_core::shutdown_logging();
    return exit_code;
}
