#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for lumen_core module

#include <cstdint>

namespace lumen_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct GraphicsError;
struct ConfigError;
struct HandleError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Handle Types
// =============================================================================

template<typename T>
struct Handle;

template<typename T>
class HandleAllocator;

template<typename T>
class HandleMap;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace lumen_core
