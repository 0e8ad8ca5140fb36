/// @file config.cpp
/// @brief ContextConfig JSON parsing

#include <lumen/gfx/config.hpp>
#include <fstream>
#include <iterator>

namespace lumen_gfx {

using lumen_core::ConfigError;
using lumen_core::Err;
using lumen_core::Ok;
using lumen_core::Result;

namespace {

Result<std::uint32_t> read_count(const nlohmann::json& j, const char* field, std::uint32_t fallback) {
    if (!j.contains(field)) {
        return Ok(fallback);
    }
    const auto& value = j[field];
    if (!value.is_number_integer()) {
        return Err<std::uint32_t>(ConfigError::invalid_value(field, "expected an integer"));
    }
    const auto n = value.get<std::int64_t>();
    if (n < 0 || n > static_cast<std::int64_t>(UINT32_MAX)) {
        return Err<std::uint32_t>(ConfigError::invalid_value(field, std::to_string(n) + " is out of range"));
    }
    return Ok(static_cast<std::uint32_t>(n));
}

Result<bool> read_flag(const nlohmann::json& j, const char* field, bool fallback) {
    if (!j.contains(field)) {
        return Ok(fallback);
    }
    if (!j[field].is_boolean()) {
        return Err<bool>(ConfigError::invalid_value(field, "expected true or false"));
    }
    return Ok(j[field].get<bool>());
}

Result<std::string> read_string(const nlohmann::json& j, const char* field, const std::string& fallback) {
    if (!j.contains(field)) {
        return Ok(fallback);
    }
    if (!j[field].is_string()) {
        return Err<std::string>(ConfigError::invalid_value(field, "expected a string"));
    }
    return Ok(j[field].get<std::string>());
}

Result<std::map<std::string, std::string>> read_levels(const nlohmann::json& j, const char* field) {
    std::map<std::string, std::string> levels;
    if (!j.contains(field)) {
        return Ok(std::move(levels));
    }
    const auto& value = j[field];
    if (!value.is_object()) {
        return Err<std::map<std::string, std::string>>(
            ConfigError::invalid_value(field, "expected an object of logger names to levels"));
    }
    for (const auto& [name, level] : value.items()) {
        if (!level.is_string()) {
            return Err<std::map<std::string, std::string>>(
                ConfigError::invalid_value(std::string(field) + "." + name, "expected a string"));
        }
        levels[name] = level.get<std::string>();
    }
    return Ok(std::move(levels));
}

} // anonymous namespace

// =============================================================================
// ContextConfig
// =============================================================================

Result<ContextConfig> ContextConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<ContextConfig>(ConfigError::parse_error("top-level value must be an object"));
    }

    ContextConfig config;

    auto backend = read_string(j, "backend", backend_kind_name(config.backend));
    if (!backend) {
        return Err<ContextConfig>(backend.error());
    }
    auto kind = parse_backend_kind(*backend);
    if (!kind) {
        return Err<ContextConfig>(ConfigError::invalid_value("backend", "unknown backend '" + *backend + "'"));
    }
    config.backend = *kind;

    auto units = read_count(j, "texture_units", config.texture_units);
    if (!units) {
        return Err<ContextConfig>(units.error());
    }
    config.texture_units = *units;

    auto attributes = read_count(j, "vertex_attributes", config.vertex_attributes);
    if (!attributes) {
        return Err<ContextConfig>(attributes.error());
    }
    config.vertex_attributes = *attributes;

    auto strict = read_flag(j, "strict_uniforms", config.strict_uniforms);
    if (!strict) {
        return Err<ContextConfig>(strict.error());
    }
    config.strict_uniforms = *strict;

    auto reordering = read_flag(j, "allow_reordering", config.allow_reordering);
    if (!reordering) {
        return Err<ContextConfig>(reordering.error());
    }
    config.allow_reordering = *reordering;

    auto level = read_string(j, "log_level", config.log_level);
    if (!level) {
        return Err<ContextConfig>(level.error());
    }
    config.log_level = *level;

    auto overrides = read_levels(j, "logger_levels");
    if (!overrides) {
        return Err<ContextConfig>(overrides.error());
    }
    config.logger_levels = std::move(*overrides);

    auto directory = read_string(j, "log_directory", config.log_directory);
    if (!directory) {
        return Err<ContextConfig>(directory.error());
    }
    config.log_directory = *directory;

    if (auto valid = config.validate(); !valid) {
        return Err<ContextConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<ContextConfig> ContextConfig::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::exception& e) {
        return Err<ContextConfig>(ConfigError::parse_error(e.what()));
    }
    return from_json(j);
}

nlohmann::json ContextConfig::to_json() const {
    nlohmann::json j;
    j["backend"] = backend_kind_name(backend);
    j["texture_units"] = texture_units;
    j["vertex_attributes"] = vertex_attributes;
    j["strict_uniforms"] = strict_uniforms;
    j["allow_reordering"] = allow_reordering;
    j["log_level"] = log_level;
    if (!logger_levels.empty()) {
        j["logger_levels"] = logger_levels;
    }
    if (!log_directory.empty()) {
        j["log_directory"] = log_directory;
    }
    return j;
}

Result<void> ContextConfig::validate() const {
    if (texture_units < 1 || texture_units > max_texture_units) {
        return Err(ConfigError::invalid_value("texture_units",
            std::to_string(texture_units) + " is outside [1, " + std::to_string(max_texture_units) + "]"));
    }
    if (vertex_attributes < 1 || vertex_attributes > max_vertex_attributes) {
        return Err(ConfigError::invalid_value("vertex_attributes",
            std::to_string(vertex_attributes) + " is outside [1, " + std::to_string(max_vertex_attributes) + "]"));
    }
    if (!lumen_core::parse_log_level(log_level)) {
        return Err(ConfigError::invalid_value("log_level", "unknown level '" + log_level + "'"));
    }
    for (const auto& [name, level] : logger_levels) {
        if (!lumen_core::parse_log_level(level)) {
            return Err(ConfigError::invalid_value("logger_levels." + name, "unknown level '" + level + "'"));
        }
    }
    return Ok();
}

lumen_core::LogConfig ContextConfig::log_config() const {
    lumen_core::LogConfig log;
    log.level = lumen_core::parse_log_level(log_level).value_or(spdlog::level::info);
    for (const auto& [name, level] : logger_levels) {
        log.logger_levels[name] = lumen_core::parse_log_level(level).value_or(log.level);
    }
    log.log_directory = log_directory;
    log.file_enabled = !log_directory.empty();
    return log;
}

Result<ContextConfig> load_context_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<ContextConfig>(ConfigError::io_error(path.string(), "file could not be opened"));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Err<ContextConfig>(ConfigError::io_error(path.string(), "read failed"));
    }

    auto config = ContextConfig::from_json_string(content);
    if (!config) {
        config.error().with_context("path", path.string());
    }
    return config;
}

} // namespace lumen_gfx
