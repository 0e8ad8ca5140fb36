#pragma once

/// @file context.hpp
/// @brief GraphicsContext: backend, registry, state cache and draw list
///
/// One context per logical graphics context. It is not synchronized; callers
/// serialize access. Draws are validated when recorded and the buffer ranges
/// they read are pinned until the next flush.

#include "fwd.hpp"
#include "backend.hpp"
#include "config.hpp"
#include "draw_list.hpp"
#include "registry.hpp"
#include "state_cache.hpp"
#include <lumen/core/error.hpp>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace lumen_gfx {

class GraphicsContext {
public:
    /// Create the configured backend and configure logging
    [[nodiscard]] static lumen_core::Result<std::unique_ptr<GraphicsContext>> create(const ContextConfig& config = {});

    /// Use a caller-supplied backend (ignores config.backend)
    [[nodiscard]] static lumen_core::Result<std::unique_ptr<GraphicsContext>> create(
        std::unique_ptr<IGfxBackend> backend, const ContextConfig& config = {});

    ~GraphicsContext();

    GraphicsContext(const GraphicsContext&) = delete;
    GraphicsContext& operator=(const GraphicsContext&) = delete;

    // -------------------------------------------------------------------------
    // Recording
    // -------------------------------------------------------------------------

    /// Validate and record a draw
    [[nodiscard]] lumen_core::Result<void> draw(const Shader& shader, const Mesh& mesh,
                                                const PipelineSettings& settings = {},
                                                UniformOverrides uniforms = {});
    [[nodiscard]] lumen_core::Result<void> draw(ResourceKey shader, const Mesh& mesh,
                                                const PipelineSettings& settings = {},
                                                UniformOverrides uniforms = {});
    [[nodiscard]] lumen_core::Result<void> draw(DrawCommand command);

    [[nodiscard]] lumen_core::Result<void> clear(const ClearSettings& settings = {});

    /// Issue every recorded command and release buffer pins
    [[nodiscard]] lumen_core::Result<FlushStats> flush();

    /// Drop recorded commands and release buffer pins
    void discard();

    // -------------------------------------------------------------------------
    // Immediate state
    // -------------------------------------------------------------------------

    /// Bind `shader` and upload `value` if it differs from the cached value
    [[nodiscard]] lumen_core::Result<bool> set_uniform(ResourceKey shader, const std::string& name,
                                                       const UniformValue& value);

    /// Forget mirrored binding state and cached uniforms after outside code
    /// touched the backend
    void invalidate_state();

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] IGfxBackend& backend() noexcept { return *m_backend; }
    [[nodiscard]] ResourceRegistry& registry() noexcept { return *m_registry; }
    [[nodiscard]] const ResourceRegistry& registry() const noexcept { return *m_registry; }
    [[nodiscard]] StateCache& state() noexcept { return *m_cache; }
    [[nodiscard]] const StateCache& state() const noexcept { return *m_cache; }
    [[nodiscard]] DrawList& draw_list() noexcept { return m_draws; }
    [[nodiscard]] const ContextConfig& config() const noexcept { return m_config; }

private:
    GraphicsContext(std::unique_ptr<IGfxBackend> backend, const ContextConfig& config);

    [[nodiscard]] lumen_core::Result<void> validate_draw(const DrawCommand& command) const;

    ContextConfig m_config;
    // Registry releases its objects before the backend is destroyed
    std::unique_ptr<IGfxBackend> m_backend;
    std::unique_ptr<ResourceRegistry> m_registry;
    std::unique_ptr<StateCache> m_cache;
    DrawList m_draws;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace lumen_gfx
