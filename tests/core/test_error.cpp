// lumen_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <lumen/core/error.hpp>
#include <string>
#include <vector>

using namespace lumen_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Backend lost");
        REQUIRE(err.message() == "Backend lost");
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE(err.is<std::string>());
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Texture unit 99 exceeds the 16 configured units");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message().find("99") != std::string::npos);
    }

    SECTION("context accumulates") {
        Error err = GraphicsError::not_found("Buffer#3v1");
        err.with_context("command", "4").with_context("shader", "Shader#0v1");
        REQUIRE(err.context().size() == 2);
        REQUIRE(*err.get_context("command") == "4");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("GraphicsError factories map to error codes", "[core][error]") {
    SECTION("stale handle") {
        Error err = GraphicsError::stale_handle("Texture#2v1");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.is_graphics(GraphicsError::Kind::StaleHandle));
        REQUIRE(err.as<GraphicsError>()->resource == "Texture#2v1");
    }

    SECTION("not found") {
        Error err = GraphicsError::not_found("Buffer#null");
        REQUIRE(err.code() == ErrorCode::NotFound);
    }

    SECTION("compile and link errors keep the diagnostic") {
        Error compile = GraphicsError::compile_error("fragment", "0:3: syntax error");
        REQUIRE(compile.code() == ErrorCode::CompileError);
        REQUIRE(compile.as<GraphicsError>()->diagnostic == "0:3: syntax error");

        Error link = GraphicsError::link_error("main() missing");
        REQUIRE(link.code() == ErrorCode::CompileError);
        REQUIRE(link.is_graphics(GraphicsError::Kind::LinkError));
    }

    SECTION("buffer overflow") {
        Error err = GraphicsError::buffer_overflow(8, 16, 12);
        REQUIRE(err.code() == ErrorCode::OutOfRange);
        REQUIRE(err.message().find("12") != std::string::npos);
    }

    SECTION("uniform errors are validation errors") {
        REQUIRE(Error(GraphicsError::missing_uniform("u_color")).code() == ErrorCode::ValidationError);
        REQUIRE(Error(GraphicsError::unknown_uniform("u_color")).code() == ErrorCode::ValidationError);
        REQUIRE(Error(GraphicsError::uniform_type_mismatch("u_color", "vec4", "float")).code() ==
                ErrorCode::ValidationError);
    }

    SECTION("is_graphics rejects other kinds") {
        Error err = GraphicsError::invalid_dimensions("viewport", 0, 10);
        REQUIRE(err.is_graphics(GraphicsError::Kind::InvalidDimensions));
        REQUIRE_FALSE(err.is_graphics(GraphicsError::Kind::BufferOverflow));
        REQUIRE_FALSE(Error("plain").is_graphics(GraphicsError::Kind::InvalidDimensions));
    }
}

TEST_CASE("ConfigError and HandleError codes", "[core][error]") {
    REQUIRE(Error(ConfigError::parse_error("unexpected '}'")).code() == ErrorCode::ParseError);
    REQUIRE(Error(ConfigError::invalid_value("texture_units", "0")).code() == ErrorCode::InvalidArgument);
    REQUIRE(Error(ConfigError::io_error("ctx.json", "missing")).code() == ErrorCode::IOError);
    REQUIRE(Error(HandleError::null()).code() == ErrorCode::InvalidArgument);
    REQUIRE(Error(HandleError::stale()).code() == ErrorCode::InvalidState);
}

TEST_CASE("build_error_chain", "[core][error]") {
    Error err = GraphicsError::compile_error("vertex", "ERROR: 0:1: 'foo' undeclared");
    err.with_context("label", "sprite");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[CompileError]") != std::string::npos);
    REQUIRE(chain.find("GraphicsError:CompileError") != std::string::npos);
    REQUIRE(chain.find("'foo' undeclared") != std::string::npos);
    REQUIRE(chain.find("label: sprite") != std::string::npos);
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();

    debug::record_error(GraphicsError::stale_handle("Shader#1v2"));
    debug::record_error(ConfigError::parse_error("eof"));
    debug::record_error(Error("generic"));

    REQUIRE(debug::total_error_count() == 3);
    REQUIRE(debug::graphics_error_count() == 1);
    REQUIRE(debug::error_stats_summary().find("Config: 1") != std::string::npos);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
    }

    SECTION("Err keeps the error kind") {
        Result<int> r = Err<int>(GraphicsError::buffer_overflow(0, 24, 12));
        REQUIRE(r.is_err());
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::BufferOverflow));
    }

    SECTION("Err void from message") {
        Result<void> r = Err("failed");
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "failed");
    }
}

TEST_CASE("Result access and unwrap", "[core][result]") {
    SECTION("value_or") {
        Result<int> ok = Ok(7);
        Result<int> err = Err<int>(Error("error"));
        REQUIRE(ok.value_or(0) == 7);
        REQUIRE(err.value_or(0) == 0);
    }

    SECTION("unwrap on error throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS(r.unwrap());

        Result<void> v = Err(Error("error"));
        REQUIRE_THROWS(v.unwrap());
    }

    SECTION("move value out") {
        Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
        std::vector<int> v = std::move(r).value();
        REQUIRE(v.size() == 3);
    }

    SECTION("boolean conversion") {
        REQUIRE(static_cast<bool>(Result<int>(Ok(1))));
        REQUIRE_FALSE(static_cast<bool>(Result<int>(Err<int>(Error("e")))));
    }
}

TEST_CASE("Result combinators", "[core][result]") {
    SECTION("map") {
        Result<int> r = Ok(21);
        auto doubled = r.map([](int x) { return x * 2; });
        REQUIRE(doubled.value() == 42);

        Result<int> e = Err<int>(Error("error"));
        REQUIRE(e.map([](int x) { return x * 2; }).is_err());
    }

    SECTION("and_then short-circuits on error") {
        bool called = false;
        Result<int> r = Err<int>(GraphicsError::not_found("Buffer#0v1"));
        auto next = r.and_then([&called](int x) -> Result<std::string> {
            called = true;
            return Ok(std::to_string(x));
        });
        REQUIRE(next.is_err());
        REQUIRE_FALSE(called);
        REQUIRE(next.error().code() == ErrorCode::NotFound);
    }

    SECTION("or_else recovers") {
        Result<int> r = Err<int>(Error("error"));
        auto recovered = r.or_else([](const Error&) -> Result<int> { return Ok(0); });
        REQUIRE(recovered.value() == 0);
    }
}
