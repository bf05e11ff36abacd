/// @file test_config.cpp
/// @brief Tests for harness configuration loading

#include <catch2/catch_test_macros.hpp>
#include <hotline/runtime/config.hpp>

#include "../fixtures/fixture_support.hpp"

#include <fstream>
#include <string>
#include <vector>

using namespace hotline_runtime;

namespace {

hotline_core::Result<HarnessConfig> parse_args(std::vector<const char*> args) {
    args.insert(args.begin(), "hotline");
    return parse_command_line(static_cast<int>(args.size()), args.data());
}

bool is_config_error(const hotline_core::Error& error, hotline_core::ConfigError::Kind kind) {
    const auto* config = error.as<hotline_core::ConfigError>();
    return config != nullptr && config->kind == kind;
}

} // anonymous namespace

TEST_CASE("HarnessConfig: defaults", "[runtime][config]") {
    HarnessConfig config;

    REQUIRE(config.artifact_path == HarnessConfig::default_artifact_path());
    REQUIRE(config.artifact_path.parent_path() == std::filesystem::path("build") / "hot_reload");
    REQUIRE(config.artifact_path.stem() == "game");
    REQUIRE(config.symbol_prefix == "game_");
    REQUIRE(config.poll_interval.count() == 0);
    REQUIRE(config.exit_signal == "exit_signal.tmp");
    REQUIRE(config.interactive);
    REQUIRE(config.scratch_kb == 1024);
    REQUIRE(config.log_level == "info");
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("HarnessConfig: validation", "[runtime][config]") {
    HarnessConfig config;

    SECTION("empty prefix") {
        config.symbol_prefix.clear();
        REQUIRE(config.validate().is_err());
    }

    SECTION("negative poll interval") {
        config.poll_interval = std::chrono::milliseconds(-5);
        REQUIRE(config.validate().is_err());
    }

    SECTION("unknown log level") {
        config.log_level = "loud";
        auto result = config.validate();
        REQUIRE(result.is_err());
        REQUIRE(is_config_error(result.error(), hotline_core::ConfigError::Kind::InvalidValue));
        REQUIRE(result.error().as<hotline_core::ConfigError>()->key == "log.level");
    }

    SECTION("zero scratch") {
        config.scratch_kb = 0;
        REQUIRE(config.validate().is_err());
    }

    SECTION("scratch above the limit") {
        config.scratch_kb = k_max_scratch_kb;
        REQUIRE(config.validate().is_ok());

        config.scratch_kb = k_max_scratch_kb + 1;
        auto result = config.validate();
        REQUIRE(result.is_err());
        REQUIRE(is_config_error(result.error(), hotline_core::ConfigError::Kind::InvalidValue));
        REQUIRE(result.error().as<hotline_core::ConfigError>()->key == "runtime.scratch_kb");
    }
}

TEST_CASE("parse_config_string: full document", "[runtime][config]") {
    const std::string toml = R"(
[artifact]
path = "out/logic.so"
symbol_prefix = "app_"

[reload]
poll_interval_ms = 250

[runtime]
exit_signal = "done.tmp"
interactive = false
scratch_kb = 64

[log]
level = "debug"
directory = "logs"
)";

    auto config = parse_config_string(toml, "test.toml");
    REQUIRE(config.is_ok());
    REQUIRE(config->artifact_path == "out/logic.so");
    REQUIRE(config->symbol_prefix == "app_");
    REQUIRE(config->poll_interval.count() == 250);
    REQUIRE(config->exit_signal == "done.tmp");
    REQUIRE_FALSE(config->interactive);
    REQUIRE(config->scratch_kb == 64);
    REQUIRE(config->log_level == "debug");
    REQUIRE(config->log_directory == "logs");
}

TEST_CASE("parse_config_string: partial document keeps defaults", "[runtime][config]") {
    auto config = parse_config_string("[reload]\npoll_interval_ms = 10\n", "partial.toml");
    REQUIRE(config.is_ok());
    REQUIRE(config->poll_interval.count() == 10);
    REQUIRE(config->symbol_prefix == "game_");
    REQUIRE(config->interactive);
}

TEST_CASE("parse_config_string: errors", "[runtime][config]") {
    SECTION("syntax") {
        auto config = parse_config_string("[artifact\npath = 1", "broken.toml");
        REQUIRE(config.is_err());
        REQUIRE(is_config_error(config.error(), hotline_core::ConfigError::Kind::ParseFailed));
        REQUIRE(config.error().message().find("broken.toml") != std::string::npos);
    }

    SECTION("wrong type") {
        auto config = parse_config_string("[runtime]\ninteractive = \"yes\"\n", "typed.toml");
        REQUIRE(config.is_err());
        REQUIRE(config.error().as<hotline_core::ConfigError>()->key == "runtime.interactive");
    }

    SECTION("negative interval") {
        auto config = parse_config_string("[reload]\npoll_interval_ms = -1\n", "negative.toml");
        REQUIRE(config.is_err());
        REQUIRE(is_config_error(config.error(), hotline_core::ConfigError::Kind::InvalidValue));
    }
}

TEST_CASE("load_config_file", "[runtime][config]") {
    hotline_test::ScratchDir dir("config_file");
    const auto path = dir.path() / "hotline.toml";
    {
        std::ofstream file(path);
        file << "[artifact]\nsymbol_prefix = \"demo_\"\n";
    }

    auto config = load_config_file(path);
    REQUIRE(config.is_ok());
    REQUIRE(config->symbol_prefix == "demo_");
    REQUIRE(config->config_file == path);

    auto missing = load_config_file(dir.path() / "absent.toml");
    REQUIRE(missing.is_err());
    REQUIRE(is_config_error(missing.error(), hotline_core::ConfigError::Kind::FileNotFound));
}

TEST_CASE("parse_command_line", "[runtime][config]") {
    SECTION("overrides") {
        auto config = parse_args({"--artifact", "bin/game.so", "--prefix", "x_", "--poll-ms", "40",
                                  "--exit-signal", "bye.tmp", "--scratch-kb", "8", "--log-level", "warn",
                                  "--log-dir", "logs", "--non-interactive"});
        REQUIRE(config.is_ok());
        REQUIRE(config->artifact_path == "bin/game.so");
        REQUIRE(config->symbol_prefix == "x_");
        REQUIRE(config->poll_interval.count() == 40);
        REQUIRE(config->exit_signal == "bye.tmp");
        REQUIRE(config->scratch_kb == 8);
        REQUIRE(config->log_level == "warn");
        REQUIRE(config->log_directory == "logs");
        REQUIRE_FALSE(config->interactive);
    }

    SECTION("command line beats config file") {
        hotline_test::ScratchDir dir("config_cli");
        const auto path = dir.path() / "custom.toml";
        {
            std::ofstream file(path);
            file << "[artifact]\nsymbol_prefix = \"file_\"\n[reload]\npoll_interval_ms = 5\n";
        }
        const std::string path_text = path.string();

        auto config = parse_args({"--config", path_text.c_str(), "--prefix", "cli_"});
        REQUIRE(config.is_ok());
        REQUIRE(config->symbol_prefix == "cli_");
        REQUIRE(config->poll_interval.count() == 5);
    }

    SECTION("help") {
        auto config = parse_args({"--help"});
        REQUIRE(config.is_ok());
        REQUIRE(config->show_help);
        REQUIRE(usage("hotline").find("--artifact") != std::string::npos);
    }

    SECTION("unknown option") {
        auto config = parse_args({"--bogus"});
        REQUIRE(config.is_err());
        REQUIRE(is_config_error(config.error(), hotline_core::ConfigError::Kind::UnknownOption));
    }

    SECTION("missing value") {
        auto config = parse_args({"--poll-ms"});
        REQUIRE(config.is_err());
    }

    SECTION("huge scratch size") {
        auto config = parse_args({"--scratch-kb", "99999999999999"});
        REQUIRE(config.is_err());
        REQUIRE(is_config_error(config.error(), hotline_core::ConfigError::Kind::InvalidValue));
    }

    SECTION("huge scratch size in the config file") {
        auto config = parse_config_string("[runtime]\nscratch_kb = 99999999999999\n", "huge.toml");
        REQUIRE(config.is_err());
        REQUIRE(is_config_error(config.error(), hotline_core::ConfigError::Kind::InvalidValue));
    }

    SECTION("bad number") {
        auto config = parse_args({"--poll-ms", "soon"});
        REQUIRE(config.is_err());
        REQUIRE(config.error().as<hotline_core::ConfigError>()->key == "--poll-ms");
    }

    SECTION("missing config file") {
        auto config = parse_args({"--config", "does/not/exist.toml"});
        REQUIRE(config.is_err());
        REQUIRE(is_config_error(config.error(), hotline_core::ConfigError::Kind::FileNotFound));
    }
}
