// hotline_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <hotline/core/log.hpp>
#include <string>

using namespace hotline_core;

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("info") == spdlog::level::info);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::warn)) == "warn");
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
}

TEST_CASE("Named loggers", "[core][log]") {
    auto first = get_logger("artifact");
    auto second = artifact_logger();
    REQUIRE(first == second);
    REQUIRE(first->name() == "artifact");

    REQUIRE(reload_logger()->name() == "reload");
    REQUIRE(memory_logger()->name() == "memory");
    REQUIRE(runtime_logger()->name() == "runtime");
}

TEST_CASE("Global log level applies to named loggers", "[core][log]") {
    auto previous = get_global_log_level();

    set_global_log_level(spdlog::level::err);
    REQUIRE(get_global_log_level() == spdlog::level::err);
    REQUIRE(reload_logger()->level() == spdlog::level::err);

    set_global_log_level(previous);
}

TEST_CASE("LogScope traces a block", "[core][log]") {
    auto previous = get_global_log_level();
    set_global_log_level(spdlog::level::trace);

    {
        HOTLINE_LOG_SCOPE("scoped block", "runtime");
        HOTLINE_LOG_SCOPE("nested block", "runtime");
        REQUIRE(runtime_logger()->should_log(spdlog::level::trace));
    }

    set_global_log_level(previous);
}
