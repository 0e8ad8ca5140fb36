#pragma once

/// @file error.hpp
/// @brief Error handling types for lumen_core

#include "fwd.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace lumen_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    CompileError,
    ValidationError,
    OutOfRange,
    OutOfMemory,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::CompileError: return "CompileError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::OutOfRange: return "OutOfRange";
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Graphics resource, state and draw errors
struct GraphicsError {
    enum class Kind : std::uint8_t {
        StaleHandle,            // Key generation mismatch (resource destroyed)
        NotFound,               // Key index out of range or null key
        CompileError,           // Shader stage failed to compile
        LinkError,              // Program failed to link
        BufferOverflow,         // Write or resize outside buffer capacity
        InvalidDimensions,      // Zero or negative size
        MissingUniform,         // Declared uniform never supplied
        UnknownUniform,         // Supplied uniform not declared by shader
        UniformTypeMismatch,    // Value type differs from declaration
        KindMismatch,           // Key refers to a different resource kind
        IncompleteFramebuffer,  // Backend rejected attachment set
        ResourceCreationFailed, // Backend could not allocate an object
    };

    Kind kind;
    std::string message;
    std::string resource;    // Key or resource description
    std::string diagnostic;  // Backend info log for compile/link failures

    [[nodiscard]] static GraphicsError stale_handle(const std::string& key) {
        return GraphicsError{Kind::StaleHandle, "Stale resource key: " + key, key, {}};
    }

    [[nodiscard]] static GraphicsError not_found(const std::string& key) {
        return GraphicsError{Kind::NotFound, "Resource not found: " + key, key, {}};
    }

    [[nodiscard]] static GraphicsError compile_error(const std::string& stage, const std::string& log) {
        return GraphicsError{Kind::CompileError, stage + " shader failed to compile", stage, log};
    }

    [[nodiscard]] static GraphicsError link_error(const std::string& log) {
        return GraphicsError{Kind::LinkError, "Shader program failed to link", {}, log};
    }

    [[nodiscard]] static GraphicsError buffer_overflow(std::size_t offset, std::size_t size, std::size_t capacity) {
        return GraphicsError{Kind::BufferOverflow,
            "Range [" + std::to_string(offset) + ", +" + std::to_string(size) +
            ") exceeds buffer capacity " + std::to_string(capacity), {}, {}};
    }

    [[nodiscard]] static GraphicsError invalid_dimensions(const std::string& what, std::int64_t width, std::int64_t height) {
        return GraphicsError{Kind::InvalidDimensions,
            "Invalid " + what + " dimensions: " + std::to_string(width) + "x" + std::to_string(height),
            what, {}};
    }

    [[nodiscard]] static GraphicsError missing_uniform(const std::string& name) {
        return GraphicsError{Kind::MissingUniform, "Uniform never supplied: " + name, name, {}};
    }

    [[nodiscard]] static GraphicsError unknown_uniform(const std::string& name) {
        return GraphicsError{Kind::UnknownUniform, "Shader does not declare uniform: " + name, name, {}};
    }

    [[nodiscard]] static GraphicsError uniform_type_mismatch(const std::string& name,
                                                             const std::string& expected,
                                                             const std::string& found) {
        return GraphicsError{Kind::UniformTypeMismatch,
            "Uniform '" + name + "' expects " + expected + ", got " + found, name, {}};
    }

    [[nodiscard]] static GraphicsError kind_mismatch(const std::string& key, const std::string& expected) {
        return GraphicsError{Kind::KindMismatch, "Key " + key + " is not a " + expected, key, {}};
    }

    [[nodiscard]] static GraphicsError incomplete_framebuffer(const std::string& status) {
        return GraphicsError{Kind::IncompleteFramebuffer, "Framebuffer incomplete: " + status, {}, status};
    }

    [[nodiscard]] static GraphicsError resource_creation_failed(const std::string& what, const std::string& reason) {
        return GraphicsError{Kind::ResourceCreationFailed, "Failed to create " + what + ": " + reason, what, {}};
    }
};

/// Configuration loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        ParseError,    // Malformed document
        InvalidValue,  // Field present but out of range or wrong type
        IOError,       // File could not be read
    };

    Kind kind;
    std::string message;
    std::string field;

    [[nodiscard]] static ConfigError parse_error(const std::string& reason) {
        return ConfigError{Kind::ParseError, "Config parse error: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& field_name, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + field_name + "': " + reason, field_name};
    }

    [[nodiscard]] static ConfigError io_error(const std::string& path, const std::string& reason) {
        return ConfigError{Kind::IOError, "Cannot read '" + path + "': " + reason, path};
    }
};

/// Handle errors
struct HandleError {
    enum class Kind : std::uint8_t {
        Null,         // Handle is null
        Stale,        // Handle generation mismatch (already freed)
        OutOfBounds,  // Handle index out of bounds
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static HandleError null() {
        return HandleError{Kind::Null, "Handle is null"};
    }

    [[nodiscard]] static HandleError stale() {
        return HandleError{Kind::Stale, "Handle is stale (generation mismatch)"};
    }

    [[nodiscard]] static HandleError out_of_bounds() {
        return HandleError{Kind::OutOfBounds, "Handle index out of bounds"};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        GraphicsError,
        ConfigError,
        HandleError,
        std::string  // Generic message
    >;

    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(GraphicsError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(HandleError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// True if this is a GraphicsError of the given kind
    [[nodiscard]] bool is_graphics(GraphicsError::Kind kind) const {
        const auto* gfx = as<GraphicsError>();
        return gfx != nullptr && gfx->kind == kind;
    }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(GraphicsError::Kind kind) {
        switch (kind) {
            case GraphicsError::Kind::StaleHandle: return ErrorCode::InvalidState;
            case GraphicsError::Kind::NotFound: return ErrorCode::NotFound;
            case GraphicsError::Kind::CompileError: return ErrorCode::CompileError;
            case GraphicsError::Kind::LinkError: return ErrorCode::CompileError;
            case GraphicsError::Kind::BufferOverflow: return ErrorCode::OutOfRange;
            case GraphicsError::Kind::InvalidDimensions: return ErrorCode::InvalidArgument;
            case GraphicsError::Kind::MissingUniform: return ErrorCode::ValidationError;
            case GraphicsError::Kind::UnknownUniform: return ErrorCode::ValidationError;
            case GraphicsError::Kind::UniformTypeMismatch: return ErrorCode::ValidationError;
            case GraphicsError::Kind::KindMismatch: return ErrorCode::InvalidArgument;
            case GraphicsError::Kind::IncompleteFramebuffer: return ErrorCode::InvalidState;
            case GraphicsError::Kind::ResourceCreationFailed: return ErrorCode::OutOfMemory;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::ParseError: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::IOError: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(HandleError::Kind kind) {
        switch (kind) {
            case HandleError::Kind::Null: return ErrorCode::InvalidArgument;
            case HandleError::Kind::Stale: return ErrorCode::InvalidState;
            case HandleError::Kind::OutOfBounds: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

    /// Handle error case
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (m_value.has_value()) {
            return Result<T, E>(std::move(*m_value));
        }
        return func(m_error);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

std::uint64_t total_error_count();

std::uint64_t graphics_error_count();

void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace lumen_core
