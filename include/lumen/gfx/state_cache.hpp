#pragma once

/// @file state_cache.hpp
/// @brief Mirror of backend binding state that elides redundant calls
///
/// Every operation compares the requested value with the mirrored one. Equal
/// values return StateChange::Unchanged without touching the backend;
/// different values issue the backend call and update the mirror in the same
/// step. Keys are resolved through the registry first, so a stale key fails
/// before anything is issued.
///
/// Backend state changed outside the cache must be followed by invalidate().

#include "fwd.hpp"
#include "types.hpp"
#include "resource.hpp"
#include "pipeline.hpp"
#include <lumen/core/error.hpp>
#include <spdlog/logger.h>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace lumen_gfx {

/// Limits the cache validates unit and attribute indices against
struct StateCacheLimits {
    std::uint32_t texture_units = 16;
    std::uint32_t vertex_attributes = 16;
};

class StateCache {
public:
    StateCache(IGfxBackend& backend, const ResourceRegistry& registry, StateCacheLimits limits = {});

    StateCache(const StateCache&) = delete;
    StateCache& operator=(const StateCache&) = delete;

    // -------------------------------------------------------------------------
    // Bindings
    // -------------------------------------------------------------------------

    /// A null shader key unbinds the current program
    [[nodiscard]] lumen_core::Result<StateChange> bind_shader(ResourceKey key);

    /// Switches the active unit only when it differs from the mirrored one
    [[nodiscard]] lumen_core::Result<StateChange> bind_texture(std::uint32_t unit, ResourceKey key);
    [[nodiscard]] lumen_core::Result<StateChange> bind_texture(std::uint32_t unit, const Texture& texture);

    [[nodiscard]] lumen_core::Result<StateChange> bind_buffer(BufferKind slot, ResourceKey key);
    [[nodiscard]] lumen_core::Result<StateChange> bind_target(const RenderTarget& target);

    // -------------------------------------------------------------------------
    // Fixed-function state
    // -------------------------------------------------------------------------

    [[nodiscard]] lumen_core::Result<StateChange> set_blend(const BlendState& state);
    [[nodiscard]] lumen_core::Result<StateChange> set_depth(const DepthState& state);
    [[nodiscard]] lumen_core::Result<StateChange> set_stencil(const StencilState& state);
    [[nodiscard]] lumen_core::Result<StateChange> set_viewport(const Rect& rect);
    [[nodiscard]] lumen_core::Result<StateChange> set_scissor(const ScissorState& state);
    [[nodiscard]] lumen_core::Result<StateChange> set_culling(const CullingState& state);

    /// Bit i enables vertex attribute location i
    [[nodiscard]] lumen_core::Result<StateChange> set_enabled_attributes(std::uint32_t mask);

    /// Apply every set field of `settings`; unset fields keep the current state
    [[nodiscard]] lumen_core::Result<void> apply(const PipelineSettings& settings);

    /// Mark every axis unknown; the next call on each axis is issued
    void invalidate();

    // -------------------------------------------------------------------------
    // Mirror (nullopt = unknown)
    // -------------------------------------------------------------------------

    [[nodiscard]] std::optional<ResourceKey> bound_shader() const noexcept { return m_shader; }
    [[nodiscard]] std::optional<ResourceKey> bound_texture(std::uint32_t unit) const;
    [[nodiscard]] std::optional<ResourceKey> bound_buffer(BufferKind slot) const;
    [[nodiscard]] std::optional<std::uint32_t> active_texture_unit() const noexcept { return m_active_unit; }
    [[nodiscard]] std::optional<RenderTarget> target() const noexcept { return m_target; }
    [[nodiscard]] std::optional<BlendState> blend() const noexcept { return m_blend; }
    [[nodiscard]] std::optional<DepthState> depth() const noexcept { return m_depth; }
    [[nodiscard]] std::optional<StencilState> stencil() const noexcept { return m_stencil; }
    [[nodiscard]] std::optional<Rect> viewport() const noexcept { return m_viewport; }
    [[nodiscard]] std::optional<ScissorState> scissor() const noexcept { return m_scissor; }
    [[nodiscard]] std::optional<CullingState> culling() const noexcept { return m_culling; }
    [[nodiscard]] std::optional<std::uint32_t> enabled_attributes() const noexcept { return m_attributes; }

    [[nodiscard]] const StateCacheLimits& limits() const noexcept { return m_limits; }

    // Statistics
    [[nodiscard]] std::uint64_t changed_count() const noexcept { return m_changed; }
    [[nodiscard]] std::uint64_t elided_count() const noexcept { return m_elided; }
    void reset_counters() noexcept { m_changed = 0; m_elided = 0; }

private:
    template<typename T, typename Issue>
    lumen_core::Result<StateChange> update(std::optional<T>& mirror, const T& value, Issue&& issue);

    IGfxBackend& m_backend;
    const ResourceRegistry& m_registry;
    StateCacheLimits m_limits;
    std::shared_ptr<spdlog::logger> m_log;

    std::optional<ResourceKey> m_shader;
    std::optional<std::uint32_t> m_active_unit;
    std::vector<std::optional<ResourceKey>> m_textures;
    std::array<std::optional<ResourceKey>, BUFFER_KIND_COUNT> m_buffers;
    std::optional<RenderTarget> m_target;
    std::optional<BlendState> m_blend;
    std::optional<DepthState> m_depth;
    std::optional<StencilState> m_stencil;
    std::optional<Rect> m_viewport;
    std::optional<ScissorState> m_scissor;
    std::optional<CullingState> m_culling;
    std::optional<std::uint32_t> m_attributes;

    std::uint64_t m_changed = 0;
    std::uint64_t m_elided = 0;
};

} // namespace lumen_gfx
