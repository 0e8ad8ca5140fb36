/// @file state_cache.cpp
/// @brief StateCache implementation

#include <lumen/gfx/state_cache.hpp>
#include <lumen/gfx/backend.hpp>
#include <lumen/gfx/registry.hpp>
#include <lumen/gfx/texture.hpp>
#include <lumen/core/log.hpp>
#include <algorithm>
#include <string>

namespace lumen_gfx {

using lumen_core::Err;
using lumen_core::Error;
using lumen_core::ErrorCode;
using lumen_core::GraphicsError;
using lumen_core::Ok;
using lumen_core::Result;

StateCache::StateCache(IGfxBackend& backend, const ResourceRegistry& registry, StateCacheLimits limits)
    : m_backend(backend)
    , m_registry(registry)
    , m_limits(limits)
    , m_log(lumen_core::gfx_logger())
    , m_textures(limits.texture_units)
{
}

template<typename T, typename Issue>
Result<StateChange> StateCache::update(std::optional<T>& mirror, const T& value, Issue&& issue) {
    if (mirror && *mirror == value) {
        ++m_elided;
        return Ok(StateChange::Unchanged);
    }
    issue();
    mirror = value;
    ++m_changed;
    return Ok(StateChange::Changed);
}

// =============================================================================
// Bindings
// =============================================================================

Result<StateChange> StateCache::bind_shader(ResourceKey key) {
    if (key.kind != ResourceKind::Shader) {
        return Err<StateChange>(GraphicsError::kind_mismatch(key.to_string(), "Shader"));
    }

    BackendId program = NULL_BACKEND_ID;
    if (!key.is_null()) {
        auto shader = m_registry.shader(key);
        if (!shader) {
            return Err<StateChange>(shader.error());
        }
        program = shader->get().program;
    }

    return update(m_shader, key, [&] {
        m_backend.use_program(program);
        m_log->trace("use_program {} ({})", program, key.to_string());
    });
}

Result<StateChange> StateCache::bind_texture(std::uint32_t unit, ResourceKey key) {
    if (unit >= m_limits.texture_units) {
        return Err<StateChange>(Error(ErrorCode::InvalidArgument,
            "Texture unit " + std::to_string(unit) + " exceeds the " +
            std::to_string(m_limits.texture_units) + " configured units"));
    }
    if (key.kind != ResourceKind::Texture) {
        return Err<StateChange>(GraphicsError::kind_mismatch(key.to_string(), "Texture"));
    }

    BackendId id = NULL_BACKEND_ID;
    TextureType type = TextureType::Tex2D;
    if (!key.is_null()) {
        auto texture = m_registry.texture(key);
        if (!texture) {
            return Err<StateChange>(texture.error());
        }
        id = texture->get().id;
        type = texture->get().desc.type;
    }

    return update(m_textures[unit], key, [&] {
        if (m_active_unit != unit) {
            m_backend.set_active_texture_unit(unit);
            m_active_unit = unit;
        }
        m_backend.bind_texture(type, id);
        m_log->trace("bind_texture unit {} -> {}", unit, key.to_string());
    });
}

Result<StateChange> StateCache::bind_texture(std::uint32_t unit, const Texture& texture) {
    return bind_texture(unit, texture.key());
}

Result<StateChange> StateCache::bind_buffer(BufferKind slot, ResourceKey key) {
    if (key.kind != ResourceKind::Buffer) {
        return Err<StateChange>(GraphicsError::kind_mismatch(key.to_string(), "Buffer"));
    }

    BackendId id = NULL_BACKEND_ID;
    if (!key.is_null()) {
        auto buffer = m_registry.buffer(key);
        if (!buffer) {
            return Err<StateChange>(buffer.error());
        }
        id = buffer->get().id;
    }

    return update(m_buffers[static_cast<std::size_t>(slot)], key, [&] {
        m_backend.bind_buffer(slot, id);
        m_log->trace("bind_buffer {} -> {}", buffer_kind_name(slot), key.to_string());
    });
}

Result<StateChange> StateCache::bind_target(const RenderTarget& target) {
    BackendId id = NULL_BACKEND_ID;
    if (!target.is_backbuffer()) {
        auto framebuffer = m_registry.framebuffer(target.framebuffer);
        if (!framebuffer) {
            return Err<StateChange>(framebuffer.error());
        }
        id = framebuffer->get().id;
    }

    return update(m_target, target, [&] {
        m_backend.bind_framebuffer(id);
        m_log->trace("bind_framebuffer {}", target.is_backbuffer() ? "backbuffer" : target.framebuffer.to_string());
    });
}

// =============================================================================
// Fixed-function state
// =============================================================================

Result<StateChange> StateCache::set_blend(const BlendState& state) {
    return update(m_blend, state, [&] { m_backend.set_blend(state); });
}

Result<StateChange> StateCache::set_depth(const DepthState& state) {
    return update(m_depth, state, [&] { m_backend.set_depth(state); });
}

Result<StateChange> StateCache::set_stencil(const StencilState& state) {
    return update(m_stencil, state, [&] { m_backend.set_stencil(state); });
}

Result<StateChange> StateCache::set_viewport(const Rect& rect) {
    if (rect.is_empty()) {
        return Err<StateChange>(GraphicsError::invalid_dimensions("viewport", rect.width, rect.height));
    }
    return update(m_viewport, rect, [&] { m_backend.set_viewport(rect); });
}

Result<StateChange> StateCache::set_scissor(const ScissorState& state) {
    if (state.enabled && state.rect.is_empty()) {
        return Err<StateChange>(GraphicsError::invalid_dimensions("scissor", state.rect.width, state.rect.height));
    }
    return update(m_scissor, state, [&] { m_backend.set_scissor(state); });
}

Result<StateChange> StateCache::set_culling(const CullingState& state) {
    return update(m_culling, state, [&] { m_backend.set_culling(state); });
}

Result<StateChange> StateCache::set_enabled_attributes(std::uint32_t mask) {
    const std::uint32_t count = std::min<std::uint32_t>(m_limits.vertex_attributes, 32);
    if (count < 32 && (mask >> count) != 0) {
        return Err<StateChange>(Error(ErrorCode::InvalidArgument,
            "Attribute mask enables locations beyond the " + std::to_string(count) + " configured attributes"));
    }

    const std::optional<std::uint32_t> previous = m_attributes;
    return update(m_attributes, mask, [&] {
        for (std::uint32_t location = 0; location < count; ++location) {
            const bool enabled = (mask >> location) & 1u;
            if (previous && ((*previous >> location) & 1u) == static_cast<std::uint32_t>(enabled)) {
                continue;
            }
            m_backend.set_vertex_attribute_enabled(location, enabled);
        }
    });
}

Result<void> StateCache::apply(const PipelineSettings& settings) {
    auto check = [](const Result<StateChange>& r) -> Result<void> {
        if (!r) {
            return Err(r.error());
        }
        return Ok();
    };

    if (settings.target) {
        if (auto r = check(bind_target(*settings.target)); !r) return r;
    }
    if (settings.viewport) {
        if (auto r = check(set_viewport(*settings.viewport)); !r) return r;
    }
    if (settings.scissor) {
        if (auto r = check(set_scissor(*settings.scissor)); !r) return r;
    }
    if (settings.blend) {
        if (auto r = check(set_blend(*settings.blend)); !r) return r;
    }
    if (settings.depth) {
        if (auto r = check(set_depth(*settings.depth)); !r) return r;
    }
    if (settings.stencil) {
        if (auto r = check(set_stencil(*settings.stencil)); !r) return r;
    }
    if (settings.culling) {
        if (auto r = check(set_culling(*settings.culling)); !r) return r;
    }
    return Ok();
}

void StateCache::invalidate() {
    m_shader.reset();
    m_active_unit.reset();
    for (auto& texture : m_textures) {
        texture.reset();
    }
    for (auto& buffer : m_buffers) {
        buffer.reset();
    }
    m_target.reset();
    m_blend.reset();
    m_depth.reset();
    m_stencil.reset();
    m_viewport.reset();
    m_scissor.reset();
    m_culling.reset();
    m_attributes.reset();
    m_log->debug("State cache invalidated");
}

std::optional<ResourceKey> StateCache::bound_texture(std::uint32_t unit) const {
    if (unit >= m_textures.size()) {
        return std::nullopt;
    }
    return m_textures[unit];
}

std::optional<ResourceKey> StateCache::bound_buffer(BufferKind slot) const {
    return m_buffers[static_cast<std::size_t>(slot)];
}

} // namespace lumen_gfx
