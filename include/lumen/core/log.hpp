#pragma once

/// @file log.hpp
/// @brief Logging utilities for lumen

#include "fwd.hpp"
#include <spdlog/spdlog.h>
#include <map>
#include <string>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define LUMEN_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define LUMEN_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define LUMEN_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define LUMEN_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define LUMEN_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define LUMEN_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace lumen_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the default logger pattern and level
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
    /// Per-logger levels that win over `level`, e.g. {"lumen_gfx", trace}
    std::map<std::string, spdlog::level::level_enum> logger_levels;
};

/// Configure logging system; applies to loggers created afterwards and
/// updates the level of existing ones. Replaces every per-logger override.
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for lumen_core
std::shared_ptr<spdlog::logger> core_logger();

/// Logger for resource, state and draw traffic
std::shared_ptr<spdlog::logger> gfx_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Level for every logger without an override
void set_global_log_level(spdlog::level::level_enum level);

/// Override one logger; remembered if the logger is created later
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Return a logger to the global level
void clear_logger_level(const std::string& name);

spdlog::level::level_enum get_global_log_level();

/// Parse log level from string ("trace", "debug", "info", "warn", ...)
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "lumen_gfx");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define LUMEN_LOG_SCOPE(name) ::lumen_core::LogScope _log_scope_##__LINE__(name)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Drop all named loggers and shut spdlog down
void shutdown_logging();

} // namespace lumen_core
