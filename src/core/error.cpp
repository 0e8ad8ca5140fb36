/// @file error.cpp
/// @brief Error handling implementation for lumen_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error formatting for logs and diagnostics
/// - Explicit template instantiations for common Result types
/// - Process-wide error counters

#include <lumen/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace lumen_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* graphics_kind_name(GraphicsError::Kind kind) {
    switch (kind) {
        case GraphicsError::Kind::StaleHandle: return "StaleHandle";
        case GraphicsError::Kind::NotFound: return "NotFound";
        case GraphicsError::Kind::CompileError: return "CompileError";
        case GraphicsError::Kind::LinkError: return "LinkError";
        case GraphicsError::Kind::BufferOverflow: return "BufferOverflow";
        case GraphicsError::Kind::InvalidDimensions: return "InvalidDimensions";
        case GraphicsError::Kind::MissingUniform: return "MissingUniform";
        case GraphicsError::Kind::UnknownUniform: return "UnknownUniform";
        case GraphicsError::Kind::UniformTypeMismatch: return "UniformTypeMismatch";
        case GraphicsError::Kind::KindMismatch: return "KindMismatch";
        case GraphicsError::Kind::IncompleteFramebuffer: return "IncompleteFramebuffer";
        case GraphicsError::Kind::ResourceCreationFailed: return "ResourceCreationFailed";
        default: return "Unknown";
    }
}

/// Format graphics error with resource and backend diagnostic
std::string format_graphics_error(const GraphicsError& err) {
    std::ostringstream oss;
    oss << "[GraphicsError:" << graphics_kind_name(err.kind) << "] " << err.message;

    if (!err.resource.empty() && err.message.find(err.resource) == std::string::npos) {
        oss << " (resource: " << err.resource << ")";
    }
    if (!err.diagnostic.empty()) {
        oss << "\n" << err.diagnostic;
    }

    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    return oss.str();
}

std::string format_handle_error(const HandleError& err) {
    std::ostringstream oss;
    oss << "[HandleError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, GraphicsError>) {
            oss << detail::format_graphics_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        } else if constexpr (std::is_same_v<T, HandleError>) {
            oss << detail::format_handle_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> graphics_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> handle_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<GraphicsError>()) {
        s_error_stats.graphics_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<HandleError>()) {
        s_error_stats.handle_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

std::uint64_t graphics_error_count() {
    return s_error_stats.graphics_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.graphics_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.handle_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Graphics: " << s_error_stats.graphics_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Handle: " << s_error_stats.handle_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace lumen_core
