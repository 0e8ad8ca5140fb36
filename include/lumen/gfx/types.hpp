#pragma once

/// @file types.hpp
/// @brief Small value types shared across lumen_gfx

#include "fwd.hpp"
#include <algorithm>
#include <cstdint>
#include <cstddef>

namespace lumen_gfx {

// =============================================================================
// Rect
// =============================================================================

/// Integer rectangle in backend pixel coordinates (origin bottom-left)
struct Rect {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t width = 0;
    std::int32_t height = 0;

    [[nodiscard]] static constexpr Rect from_size(std::int32_t w, std::int32_t h) noexcept {
        return Rect{0, 0, w, h};
    }

    /// Zero or negative extent
    [[nodiscard]] constexpr bool is_empty() const noexcept {
        return width <= 0 || height <= 0;
    }

    constexpr bool operator==(const Rect&) const noexcept = default;
};

// =============================================================================
// Color
// =============================================================================

/// Linear RGBA color; components clamp to [0, 1] when submitted
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    [[nodiscard]] static constexpr Color black() noexcept { return {0.0f, 0.0f, 0.0f, 1.0f}; }
    [[nodiscard]] static constexpr Color white() noexcept { return {1.0f, 1.0f, 1.0f, 1.0f}; }
    [[nodiscard]] static constexpr Color transparent() noexcept { return {0.0f, 0.0f, 0.0f, 0.0f}; }

    [[nodiscard]] Color clamped() const noexcept {
        return Color{
            std::clamp(r, 0.0f, 1.0f),
            std::clamp(g, 0.0f, 1.0f),
            std::clamp(b, 0.0f, 1.0f),
            std::clamp(a, 0.0f, 1.0f)};
    }

    constexpr bool operator==(const Color&) const noexcept = default;
};

// =============================================================================
// State Change
// =============================================================================

/// Outcome of a state cache operation
enum class StateChange : std::uint8_t {
    Unchanged,  // Requested value already mirrored; no backend call
    Changed     // Backend call issued and mirror updated
};

// =============================================================================
// Buffers
// =============================================================================

/// Buffer binding target
enum class BufferKind : std::uint8_t {
    Vertex,
    Index,
    Uniform
};

constexpr std::size_t BUFFER_KIND_COUNT = 3;

/// Expected update frequency
enum class BufferUsage : std::uint8_t {
    Static,   // Written once, drawn many times
    Dynamic,  // Rewritten occasionally
    Stream    // Rewritten every frame
};

[[nodiscard]] inline const char* buffer_kind_name(BufferKind kind) noexcept {
    switch (kind) {
        case BufferKind::Vertex: return "Vertex";
        case BufferKind::Index: return "Index";
        case BufferKind::Uniform: return "Uniform";
        default: return "Unknown";
    }
}

[[nodiscard]] inline const char* buffer_usage_name(BufferUsage usage) noexcept {
    switch (usage) {
        case BufferUsage::Static: return "Static";
        case BufferUsage::Dynamic: return "Dynamic";
        case BufferUsage::Stream: return "Stream";
        default: return "Unknown";
    }
}

// =============================================================================
// Draw Topology
// =============================================================================

enum class DrawMode : std::uint8_t {
    Points,
    Lines,
    LineLoop,
    LineStrip,
    Triangles,
    TriangleStrip,
    TriangleFan
};

enum class IndexType : std::uint8_t {
    U16,
    U32
};

[[nodiscard]] constexpr std::size_t index_type_size(IndexType type) noexcept {
    return type == IndexType::U16 ? 2 : 4;
}

[[nodiscard]] inline const char* draw_mode_name(DrawMode mode) noexcept {
    switch (mode) {
        case DrawMode::Points: return "Points";
        case DrawMode::Lines: return "Lines";
        case DrawMode::LineLoop: return "LineLoop";
        case DrawMode::LineStrip: return "LineStrip";
        case DrawMode::Triangles: return "Triangles";
        case DrawMode::TriangleStrip: return "TriangleStrip";
        case DrawMode::TriangleFan: return "TriangleFan";
        default: return "Unknown";
    }
}

} // namespace lumen_gfx
