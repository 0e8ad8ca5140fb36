/// @file shader.cpp
/// @brief Shader capability and scoped binding

#include <lumen/gfx/shader.hpp>
#include <lumen/gfx/registry.hpp>
#include <lumen/core/log.hpp>
#include <algorithm>

namespace lumen_gfx {

using lumen_core::Err;
using lumen_core::Ok;
using lumen_core::Result;

// =============================================================================
// Shader
// =============================================================================

const AttributeDescriptor* Shader::find_attribute(const std::string& name) const {
    const auto& list = attributes();
    auto it = std::find_if(list.begin(), list.end(), [&](const AttributeDescriptor& a) { return a.name == name; });
    return it != list.end() ? &*it : nullptr;
}

const UniformDescriptor* Shader::find_uniform(const std::string& name) const {
    const auto& list = uniforms();
    auto it = std::find_if(list.begin(), list.end(), [&](const UniformDescriptor& u) { return u.name == name; });
    return it != list.end() ? &*it : nullptr;
}

Result<ShaderProgram> ShaderProgram::create(ResourceRegistry& registry, const ShaderSource& source) {
    auto key = registry.create_shader(source);
    if (!key) {
        return Err<ShaderProgram>(key.error());
    }
    return from_key(registry, *key);
}

Result<ShaderProgram> ShaderProgram::from_key(const ResourceRegistry& registry, ResourceKey key) {
    auto shader = registry.shader(key);
    if (!shader) {
        return Err<ShaderProgram>(shader.error());
    }
    const ShaderResource& resource = shader->get();
    return Ok(ShaderProgram(key, resource.attributes, resource.state.uniforms()));
}

Result<bool> set_uniform(StateCache& cache, ResourceRegistry& registry, ResourceKey shader,
                         const std::string& name, const UniformValue& value) {
    auto resource = registry.shader_mut(shader);
    if (!resource) {
        return Err<bool>(resource.error());
    }

    // Validate before binding so a bad name leaves the cache untouched
    if (auto check = resource->get().state.check_uniform(name, value); !check) {
        return Err<bool>(check.error());
    }

    auto bound = cache.bind_shader(shader);
    if (!bound) {
        return Err<bool>(bound.error());
    }
    return resource->get().state.set_uniform(registry.backend(), name, value);
}

// =============================================================================
// ScopedShader
// =============================================================================

Result<ScopedShader> ScopedShader::bind(StateCache& cache, ResourceKey key) {
    std::optional<ResourceKey> saved = cache.bound_shader();
    auto bound = cache.bind_shader(key);
    if (!bound) {
        return Err<ScopedShader>(bound.error());
    }
    return Ok(ScopedShader(cache, key, saved));
}

ScopedShader::ScopedShader(ScopedShader&& other) noexcept
    : m_cache(other.m_cache)
    , m_key(other.m_key)
    , m_saved(other.m_saved)
{
    other.m_cache = nullptr;
}

ScopedShader::~ScopedShader() {
    if (m_cache == nullptr || !m_saved) {
        return;
    }
    auto restored = m_cache->bind_shader(*m_saved);
    if (!restored) {
        // The saved program was destroyed inside the scope
        lumen_core::gfx_logger()->warn("Could not restore {}: {}; unbinding",
                                       m_saved->to_string(), restored.error().message());
        auto unbound = m_cache->bind_shader(ResourceKey::null(ResourceKind::Shader));
        if (!unbound) {
            lumen_core::gfx_logger()->error("Unbinding shader failed: {}", unbound.error().message());
        }
    }
}

} // namespace lumen_gfx
