#pragma once

/// @file pipeline.hpp
/// @brief Per-draw pipeline state and clear settings for lumen_gfx

#include "fwd.hpp"
#include "types.hpp"
#include "resource.hpp"
#include <lumen/core/error.hpp>
#include <cstdint>
#include <optional>

namespace lumen_gfx {

// =============================================================================
// Blend
// =============================================================================

enum class BlendFactor : std::uint8_t {
    Zero,
    One,
    SrcColor,
    OneMinusSrcColor,
    SrcAlpha,
    OneMinusSrcAlpha,
    DstColor,
    OneMinusDstColor,
    DstAlpha,
    OneMinusDstAlpha,
    ConstantColor,
    OneMinusConstantColor,
    ConstantAlpha,
    OneMinusConstantAlpha,
    SrcAlphaSaturate
};

enum class BlendEquation : std::uint8_t {
    Add,
    Subtract,
    ReverseSubtract,
    Min,
    Max
};

/// Blend state; two disabled states compare equal regardless of factors
struct BlendState {
    bool enabled = true;
    BlendFactor src_rgb = BlendFactor::SrcAlpha;
    BlendFactor dst_rgb = BlendFactor::OneMinusSrcAlpha;
    BlendFactor src_alpha = BlendFactor::One;
    BlendFactor dst_alpha = BlendFactor::OneMinusSrcAlpha;
    BlendEquation equation_rgb = BlendEquation::Add;
    BlendEquation equation_alpha = BlendEquation::Add;
    Color constant = Color::transparent();

    [[nodiscard]] static BlendState alpha() { return BlendState{}; }

    [[nodiscard]] static BlendState premultiplied() {
        BlendState s;
        s.src_rgb = BlendFactor::One;
        return s;
    }

    [[nodiscard]] static BlendState additive() {
        BlendState s;
        s.dst_rgb = BlendFactor::One;
        s.dst_alpha = BlendFactor::One;
        return s;
    }

    [[nodiscard]] static BlendState multiply() {
        BlendState s;
        s.src_rgb = BlendFactor::DstColor;
        s.dst_rgb = BlendFactor::Zero;
        s.src_alpha = BlendFactor::DstAlpha;
        s.dst_alpha = BlendFactor::Zero;
        return s;
    }

    [[nodiscard]] static BlendState disabled() {
        BlendState s;
        s.enabled = false;
        return s;
    }

    bool operator==(const BlendState& other) const {
        if (!enabled || !other.enabled) {
            return enabled == other.enabled;
        }
        return src_rgb == other.src_rgb && dst_rgb == other.dst_rgb &&
               src_alpha == other.src_alpha && dst_alpha == other.dst_alpha &&
               equation_rgb == other.equation_rgb && equation_alpha == other.equation_alpha &&
               constant == other.constant;
    }
};

// =============================================================================
// Depth & Stencil
// =============================================================================

enum class CompareFunction : std::uint8_t {
    Never,
    Less,
    Equal,
    LessEqual,
    Greater,
    NotEqual,
    GreaterEqual,
    Always
};

struct DepthState {
    bool enabled = true;
    CompareFunction function = CompareFunction::Less;
    float range_near = 0.0f;
    float range_far = 1.0f;
    bool write = true;

    [[nodiscard]] static DepthState disabled() {
        DepthState s;
        s.enabled = false;
        return s;
    }

    /// Test against depth but leave the depth buffer untouched
    [[nodiscard]] static DepthState read_only(CompareFunction fn = CompareFunction::LessEqual) {
        DepthState s;
        s.function = fn;
        s.write = false;
        return s;
    }

    bool operator==(const DepthState& other) const {
        if (!enabled || !other.enabled) {
            return enabled == other.enabled;
        }
        return function == other.function && range_near == other.range_near &&
               range_far == other.range_far && write == other.write;
    }
};

enum class StencilOp : std::uint8_t {
    Keep,
    Zero,
    Replace,
    Increment,
    IncrementWrap,
    Decrement,
    DecrementWrap,
    Invert
};

struct StencilState {
    bool enabled = true;
    CompareFunction function = CompareFunction::Always;
    std::int32_t reference = 0;
    std::uint32_t read_mask = 0xFF;
    std::uint32_t write_mask = 0xFF;
    StencilOp fail = StencilOp::Keep;
    StencilOp depth_fail = StencilOp::Keep;
    StencilOp pass = StencilOp::Keep;

    [[nodiscard]] static StencilState disabled() {
        StencilState s;
        s.enabled = false;
        return s;
    }

    bool operator==(const StencilState& other) const {
        if (!enabled || !other.enabled) {
            return enabled == other.enabled;
        }
        return function == other.function && reference == other.reference &&
               read_mask == other.read_mask && write_mask == other.write_mask &&
               fail == other.fail && depth_fail == other.depth_fail && pass == other.pass;
    }
};

// =============================================================================
// Scissor & Culling
// =============================================================================

struct ScissorState {
    bool enabled = true;
    Rect rect;

    [[nodiscard]] static ScissorState of(Rect r) { return ScissorState{true, r}; }
    [[nodiscard]] static ScissorState disabled() { return ScissorState{false, Rect{}}; }

    bool operator==(const ScissorState& other) const {
        if (!enabled || !other.enabled) {
            return enabled == other.enabled;
        }
        return rect == other.rect;
    }
};

enum class CullFace : std::uint8_t {
    Back,
    Front,
    FrontAndBack
};

enum class Winding : std::uint8_t {
    CounterClockwise,
    Clockwise
};

struct CullingState {
    bool enabled = true;
    CullFace face = CullFace::Back;
    Winding front_face = Winding::CounterClockwise;

    [[nodiscard]] static CullingState disabled() {
        CullingState s;
        s.enabled = false;
        return s;
    }

    bool operator==(const CullingState& other) const {
        if (!enabled || !other.enabled) {
            return enabled == other.enabled;
        }
        return face == other.face && front_face == other.front_face;
    }
};

// =============================================================================
// ClearSettings
// =============================================================================

/// Which buffers to clear and with what. Unset components are left alone.
struct ClearSettings {
    std::optional<Color> color = Color::black();
    std::optional<float> depth = 1.0f;
    std::optional<std::int32_t> stencil = 0;
    std::optional<RenderTarget> target;  // unset: clear whatever is bound
    std::optional<Rect> scissor;         // unset: whole target

    [[nodiscard]] static ClearSettings color_only(Color c) {
        ClearSettings s;
        s.color = c;
        s.depth.reset();
        s.stencil.reset();
        return s;
    }

    [[nodiscard]] ClearSettings with_target(RenderTarget t) const {
        ClearSettings s = *this;
        s.target = t;
        return s;
    }

    bool operator==(const ClearSettings&) const = default;
};

// =============================================================================
// PipelineSettings
// =============================================================================

/// Optional per-draw state. Unset fields inherit the current state; set fields
/// force their value.
struct PipelineSettings {
    std::optional<Rect> viewport;
    std::optional<BlendState> blend;
    std::optional<DepthState> depth;
    std::optional<StencilState> stencil;
    std::optional<ScissorState> scissor;
    std::optional<CullingState> culling;
    std::optional<RenderTarget> target;

    [[nodiscard]] PipelineSettings with_viewport(Rect r) const { auto s = *this; s.viewport = r; return s; }
    [[nodiscard]] PipelineSettings with_blend(BlendState b) const { auto s = *this; s.blend = b; return s; }
    [[nodiscard]] PipelineSettings with_depth(DepthState d) const { auto s = *this; s.depth = d; return s; }
    [[nodiscard]] PipelineSettings with_stencil(StencilState st) const { auto s = *this; s.stencil = st; return s; }
    [[nodiscard]] PipelineSettings with_scissor(Rect r) const { auto s = *this; s.scissor = ScissorState::of(r); return s; }
    [[nodiscard]] PipelineSettings without_scissor() const { auto s = *this; s.scissor = ScissorState::disabled(); return s; }
    [[nodiscard]] PipelineSettings with_culling(CullingState c) const { auto s = *this; s.culling = c; return s; }
    [[nodiscard]] PipelineSettings with_target(RenderTarget t) const { auto s = *this; s.target = t; return s; }

    /// Number of fields that are set
    [[nodiscard]] std::size_t set_count() const noexcept;

    [[nodiscard]] bool is_empty() const noexcept { return set_count() == 0; }

    /// Fails with InvalidDimensions for an empty viewport or enabled scissor
    [[nodiscard]] lumen_core::Result<void> validate() const;

    bool operator==(const PipelineSettings&) const = default;
};

/// Field-wise composition: every field set in `override_settings` wins,
/// every other field comes from `base`
[[nodiscard]] PipelineSettings merge(const PipelineSettings& base, const PipelineSettings& override_settings);

} // namespace lumen_gfx
