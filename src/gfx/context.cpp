/// @file context.cpp
/// @brief GraphicsContext implementation

#include <lumen/gfx/context.hpp>
#include <lumen/gfx/shader.hpp>
#include <lumen/core/log.hpp>
#include <algorithm>

namespace lumen_gfx {

using lumen_core::Err;
using lumen_core::Error;
using lumen_core::ErrorCode;
using lumen_core::GraphicsError;
using lumen_core::Ok;
using lumen_core::Result;

// =============================================================================
// Construction
// =============================================================================

Result<std::unique_ptr<GraphicsContext>> GraphicsContext::create(const ContextConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return Err<std::unique_ptr<GraphicsContext>>(valid.error());
    }
    lumen_core::configure_logging(config.log_config());

    auto backend = create_backend(config.backend);
    if (!backend) {
        LUMEN_LOG_ERROR("Failed to create {} backend: {}", backend_kind_name(config.backend),
                        backend.error().message());
        return Err<std::unique_ptr<GraphicsContext>>(backend.error());
    }
    return create(std::move(*backend), config);
}

Result<std::unique_ptr<GraphicsContext>> GraphicsContext::create(std::unique_ptr<IGfxBackend> backend,
                                                                 const ContextConfig& config) {
    if (!backend) {
        return Err<std::unique_ptr<GraphicsContext>>(Error(ErrorCode::InvalidArgument, "Backend is null"));
    }
    if (auto valid = config.validate(); !valid) {
        return Err<std::unique_ptr<GraphicsContext>>(valid.error());
    }
    return Ok(std::unique_ptr<GraphicsContext>(new GraphicsContext(std::move(backend), config)));
}

GraphicsContext::GraphicsContext(std::unique_ptr<IGfxBackend> backend, const ContextConfig& config)
    : m_config(config)
    , m_backend(std::move(backend))
    , m_draws(config.draw_list_options())
    , m_log(lumen_core::gfx_logger())
{
    // Never track more units or attributes than the backend exposes
    StateCacheLimits limits = config.cache_limits();
    const BackendLimits& hw = m_backend->limits();
    limits.texture_units = std::min(limits.texture_units, hw.max_texture_units);
    limits.vertex_attributes = std::min(limits.vertex_attributes, hw.max_vertex_attributes);

    m_registry = std::make_unique<ResourceRegistry>(*m_backend);
    m_cache = std::make_unique<StateCache>(*m_backend, *m_registry, limits);

    m_log->info("Graphics context created ({} backend, {} texture units, {} vertex attributes)",
                backend_kind_name(m_backend->kind()), limits.texture_units, limits.vertex_attributes);
}

GraphicsContext::~GraphicsContext() {
    if (!m_draws.is_empty()) {
        m_log->warn("Graphics context destroyed with {} unflushed commands", m_draws.len());
    }
    m_draws.reset();
    m_cache.reset();
    m_registry.reset();
    m_log->debug("Graphics context destroyed");
}

// =============================================================================
// Recording
// =============================================================================

Result<void> GraphicsContext::draw(const Shader& shader, const Mesh& mesh, const PipelineSettings& settings,
                                   UniformOverrides uniforms) {
    return draw(shader.key(), mesh, settings, std::move(uniforms));
}

Result<void> GraphicsContext::draw(ResourceKey shader, const Mesh& mesh, const PipelineSettings& settings,
                                   UniformOverrides uniforms) {
    DrawCommand command;
    command.shader = shader;
    command.mesh = mesh.binding();
    command.uniforms = std::move(uniforms);
    command.settings = settings;
    return draw(std::move(command));
}

Result<void> GraphicsContext::draw(DrawCommand command) {
    if (auto valid = validate_draw(command); !valid) {
        m_log->warn("Draw rejected: {}", lumen_core::build_error_chain(valid.error()));
        lumen_core::debug::record_error(valid.error());
        return valid;
    }

    auto extents = m_registry->draw_extents(command.mesh);
    if (!extents) {
        return Err(extents.error());
    }
    for (const auto& [key, extent] : *extents) {
        m_registry->pin(key, extent);
    }
    m_draws.draw(std::move(command));
    return Ok();
}

Result<void> GraphicsContext::clear(const ClearSettings& settings) {
    if (settings.target && !settings.target->is_backbuffer()) {
        if (auto framebuffer = m_registry->framebuffer(settings.target->framebuffer); !framebuffer) {
            return Err(framebuffer.error());
        }
    }
    if (settings.scissor && settings.scissor->is_empty()) {
        return Err(GraphicsError::invalid_dimensions("scissor", settings.scissor->width, settings.scissor->height));
    }
    m_draws.clear(settings);
    return Ok();
}

Result<FlushStats> GraphicsContext::flush() {
    auto stats = m_draws.flush(*m_cache, *m_registry, *m_backend);
    m_registry->clear_pins();
    return stats;
}

void GraphicsContext::discard() {
    m_draws.reset();
    m_registry->clear_pins();
}

Result<void> GraphicsContext::validate_draw(const DrawCommand& command) const {
    if (auto r = merge(m_draws.defaults(), command.settings).validate(); !r) {
        return r;
    }
    if (command.settings.target && !command.settings.target->is_backbuffer()) {
        if (auto framebuffer = m_registry->framebuffer(command.settings.target->framebuffer); !framebuffer) {
            return Err(framebuffer.error());
        }
    }

    auto shader = m_registry->shader(command.shader);
    if (!shader) {
        return Err(shader.error());
    }
    for (const auto& [name, value] : command.uniforms) {
        if (auto r = shader->get().state.check_uniform(name, value); !r) {
            return r;
        }
    }

    for (const auto& key : command.mesh.referenced_keys()) {
        if (auto buffer = m_registry->buffer(key); !buffer) {
            return Err(buffer.error());
        }
    }
    auto extents = m_registry->draw_extents(command.mesh);
    if (!extents) {
        return Err(extents.error());
    }
    for (const auto& [key, extent] : *extents) {
        const std::size_t size = m_registry->buffer(key)->get().size();
        if (extent > size) {
            return Err(GraphicsError::buffer_overflow(0, extent, size));
        }
    }

    for (const auto& binding : command.textures) {
        if (auto texture = m_registry->texture(binding.texture); !texture) {
            return Err(texture.error());
        }
    }
    return Ok();
}

// =============================================================================
// Immediate state
// =============================================================================

Result<bool> GraphicsContext::set_uniform(ResourceKey shader, const std::string& name, const UniformValue& value) {
    return lumen_gfx::set_uniform(*m_cache, *m_registry, shader, name, value);
}

void GraphicsContext::invalidate_state() {
    m_cache->invalidate();
    m_registry->invalidate_uniforms();
}

} // namespace lumen_gfx
