// lumen_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <lumen/core/log.hpp>
#include <string>

using namespace lumen_core;

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
}

TEST_CASE("Named loggers are shared", "[core][log]") {
    auto a = get_logger("lumen_test");
    auto b = get_logger("lumen_test");
    REQUIRE(a == b);
    REQUIRE(gfx_logger()->name() == "lumen_gfx");
    REQUIRE(core_logger()->name() == "lumen_core");
}

TEST_CASE("Global level reaches existing loggers", "[core][log]") {
    auto logger = get_logger("lumen_level_test");
    const auto previous = get_global_log_level();

    set_global_log_level(spdlog::level::debug);
    REQUIRE(logger->level() == spdlog::level::debug);
    REQUIRE(get_global_log_level() == spdlog::level::debug);

    set_logger_level("lumen_level_test", spdlog::level::err);
    REQUIRE(logger->level() == spdlog::level::err);

    LogConfig config;
    config.level = spdlog::level::warn;
    configure_logging(config);
    REQUIRE(logger->level() == spdlog::level::warn);

    set_global_log_level(previous);
}

TEST_CASE("Per-logger levels override the global level", "[core][log]") {
    const auto previous = get_global_log_level();
    set_global_log_level(spdlog::level::info);

    SECTION("an override set before creation is applied on creation") {
        set_logger_level("lumen_late_logger", spdlog::level::trace);
        REQUIRE(get_logger("lumen_late_logger")->level() == spdlog::level::trace);

        set_global_log_level(spdlog::level::err);
        REQUIRE(get_logger("lumen_late_logger")->level() == spdlog::level::trace);

        clear_logger_level("lumen_late_logger");
        REQUIRE(get_logger("lumen_late_logger")->level() == spdlog::level::err);
    }

    SECTION("configure_logging installs the configured overrides") {
        auto logger = get_logger("lumen_override_test");

        LogConfig config;
        config.level = spdlog::level::warn;
        config.logger_levels["lumen_override_test"] = spdlog::level::debug;
        configure_logging(config);
        REQUIRE(logger->level() == spdlog::level::debug);
        REQUIRE(get_global_log_level() == spdlog::level::warn);

        configure_logging(LogConfig{});
        REQUIRE(logger->level() == spdlog::level::info);
    }

    set_global_log_level(previous);
}

TEST_CASE("LogScope traces without side effects", "[core][log]") {
    {
        LUMEN_LOG_SCOPE("flush");
    }
    flush_all_loggers();
    SUCCEED();
}
