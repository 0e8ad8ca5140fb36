#pragma once

/// @file config.hpp
/// @brief JSON-loadable graphics context configuration

#include "fwd.hpp"
#include "backend.hpp"
#include "state_cache.hpp"
#include "draw_list.hpp"
#include <lumen/core/error.hpp>
#include <lumen/core/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace lumen_gfx {

/// Settings for GraphicsContext creation.
///
/// Example document:
/// @code
/// {
///     "backend": "null",
///     "texture_units": 16,
///     "vertex_attributes": 16,
///     "strict_uniforms": false,
///     "allow_reordering": false,
///     "log_level": "info",
///     "logger_levels": { "lumen_gfx": "trace" },
///     "log_directory": "logs"
/// }
/// @endcode
struct ContextConfig {
    static constexpr std::uint32_t max_texture_units = 64;
    static constexpr std::uint32_t max_vertex_attributes = 32;

    BackendKind backend = BackendKind::Null;
    std::uint32_t texture_units = 16;
    std::uint32_t vertex_attributes = 16;
    bool strict_uniforms = false;
    bool allow_reordering = false;
    std::string log_level = "info";
    std::map<std::string, std::string> logger_levels;  // logger name -> level name
    std::string log_directory;  // empty: console only

    /// Missing keys keep their defaults; unknown keys are ignored
    [[nodiscard]] static lumen_core::Result<ContextConfig> from_json(const nlohmann::json& j);
    [[nodiscard]] static lumen_core::Result<ContextConfig> from_json_string(const std::string& json_str);
    [[nodiscard]] nlohmann::json to_json() const;

    /// Range checks shared by from_json and GraphicsContext::create
    [[nodiscard]] lumen_core::Result<void> validate() const;

    [[nodiscard]] StateCacheLimits cache_limits() const {
        return StateCacheLimits{texture_units, vertex_attributes};
    }

    [[nodiscard]] DrawListOptions draw_list_options() const {
        return DrawListOptions{allow_reordering, strict_uniforms};
    }

    /// Logging setup derived from log_level and log_directory
    [[nodiscard]] lumen_core::LogConfig log_config() const;

    bool operator==(const ContextConfig&) const = default;
};

/// Read and parse a configuration file
[[nodiscard]] lumen_core::Result<ContextConfig> load_context_config(const std::filesystem::path& path);

} // namespace lumen_gfx
