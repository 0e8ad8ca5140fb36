// lumen_gfx ContextConfig tests

#include <catch2/catch_test_macros.hpp>
#include <lumen/gfx/config.hpp>
#include <filesystem>
#include <fstream>

using namespace lumen_gfx;
using lumen_core::ConfigError;
using lumen_core::ErrorCode;

namespace {

ConfigError::Kind config_kind(const lumen_core::Error& error) {
    const auto* config = error.as<ConfigError>();
    REQUIRE(config != nullptr);
    return config->kind;
}

/// Temporary file removed when the test ends
struct TempFile {
    explicit TempFile(const std::string& name, const std::string& content)
        : path(std::filesystem::temp_directory_path() / name)
    {
        std::ofstream out(path);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::filesystem::path path;
};

} // anonymous namespace

TEST_CASE("ContextConfig defaults", "[gfx][config]") {
    ContextConfig config;
    REQUIRE(config.backend == BackendKind::Null);
    REQUIRE(config.texture_units == 16);
    REQUIRE(config.vertex_attributes == 16);
    REQUIRE(config.validate().is_ok());

    auto j = config.to_json();
    REQUIRE(j["backend"] == "null");
    REQUIRE_FALSE(j.contains("log_directory"));

    auto parsed = ContextConfig::from_json(j);
    REQUIRE(parsed.is_ok());
    REQUIRE(*parsed == config);
}

TEST_CASE("ContextConfig from JSON", "[gfx][config]") {
    auto config = ContextConfig::from_json_string(R"({
        "backend": "opengl",
        "texture_units": 8,
        "strict_uniforms": true,
        "allow_reordering": true,
        "log_level": "debug",
        "logger_levels": {"lumen_gfx": "trace"},
        "log_directory": "logs",
        "unknown_key": [1, 2, 3]
    })");
    REQUIRE(config.is_ok());
    REQUIRE(config->backend == BackendKind::OpenGL);
    REQUIRE(config->texture_units == 8);
    REQUIRE(config->vertex_attributes == 16);

    StateCacheLimits limits = config->cache_limits();
    REQUIRE(limits.texture_units == 8);
    REQUIRE(limits.vertex_attributes == 16);

    DrawListOptions options = config->draw_list_options();
    REQUIRE(options.strict_uniforms);
    REQUIRE(options.allow_reordering);

    lumen_core::LogConfig log = config->log_config();
    REQUIRE(log.level == spdlog::level::debug);
    REQUIRE(log.file_enabled);
    REQUIRE(log.log_directory == "logs");
    REQUIRE(log.logger_levels.at("lumen_gfx") == spdlog::level::trace);

    auto round_trip = ContextConfig::from_json(config->to_json());
    REQUIRE(*round_trip == *config);
}

TEST_CASE("ContextConfig rejects bad documents", "[gfx][config]") {
    SECTION("malformed JSON") {
        auto r = ContextConfig::from_json_string("{ \"backend\": ");
        REQUIRE(r.error().code() == ErrorCode::ParseError);
        REQUIRE(config_kind(r.error()) == ConfigError::Kind::ParseError);
    }

    SECTION("not an object") {
        auto r = ContextConfig::from_json_string("[16]");
        REQUIRE(config_kind(r.error()) == ConfigError::Kind::ParseError);
    }

    SECTION("wrong type") {
        auto r = ContextConfig::from_json_string(R"({"texture_units": "many"})");
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(r.error().as<ConfigError>()->field == "texture_units");
    }

    SECTION("negative count") {
        auto r = ContextConfig::from_json_string(R"({"vertex_attributes": -1})");
        REQUIRE(config_kind(r.error()) == ConfigError::Kind::InvalidValue);
    }

    SECTION("unknown backend") {
        auto r = ContextConfig::from_json_string(R"({"backend": "vulkan"})");
        REQUIRE(r.error().as<ConfigError>()->field == "backend");
    }

    SECTION("flag that is not a boolean") {
        auto r = ContextConfig::from_json_string(R"({"strict_uniforms": 1})");
        REQUIRE(r.error().as<ConfigError>()->field == "strict_uniforms");
    }

    SECTION("unknown log level") {
        auto r = ContextConfig::from_json_string(R"({"log_level": "loud"})");
        REQUIRE(r.error().as<ConfigError>()->field == "log_level");
    }

    SECTION("logger levels must be level names") {
        auto wrong_shape = ContextConfig::from_json_string(R"({"logger_levels": ["trace"]})");
        REQUIRE(wrong_shape.error().as<ConfigError>()->field == "logger_levels");

        auto unknown = ContextConfig::from_json_string(R"({"logger_levels": {"lumen_gfx": "loud"}})");
        REQUIRE(unknown.error().as<ConfigError>()->field == "logger_levels.lumen_gfx");
    }
}

TEST_CASE("ContextConfig range checks", "[gfx][config]") {
    ContextConfig config;

    config.texture_units = 0;
    REQUIRE(config.validate().is_err());
    config.texture_units = ContextConfig::max_texture_units + 1;
    REQUIRE(config.validate().is_err());
    config.texture_units = ContextConfig::max_texture_units;
    REQUIRE(config.validate().is_ok());

    config.vertex_attributes = 33;
    REQUIRE(config.validate().error().as<ConfigError>()->field == "vertex_attributes");
    config.vertex_attributes = 1;
    REQUIRE(config.validate().is_ok());
}

TEST_CASE("load_context_config", "[gfx][config]") {
    SECTION("reads a file") {
        TempFile file("lumen_config_ok.json", R"({"texture_units": 4})");
        auto config = load_context_config(file.path);
        REQUIRE(config.is_ok());
        REQUIRE(config->texture_units == 4);
    }

    SECTION("missing file") {
        auto config = load_context_config(std::filesystem::temp_directory_path() / "lumen_no_such_config.json");
        REQUIRE(config.error().code() == ErrorCode::IOError);
    }

    SECTION("parse failures carry the path") {
        TempFile file("lumen_config_bad.json", "{ not json");
        auto config = load_context_config(file.path);
        REQUIRE(config.error().code() == ErrorCode::ParseError);
        REQUIRE(*config.error().get_context("path") == file.path.string());
    }
}
