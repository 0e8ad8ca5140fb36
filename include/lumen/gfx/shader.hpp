#pragma once

/// @file shader.hpp
/// @brief Shader capability and scoped shader binding

#include "fwd.hpp"
#include "resource.hpp"
#include "program.hpp"
#include "state_cache.hpp"
#include <lumen/core/error.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace lumen_gfx {

// =============================================================================
// Shader Capability
// =============================================================================

/// A linked program with ordered attribute and uniform reflection
class Shader {
public:
    virtual ~Shader() = default;

    [[nodiscard]] virtual ResourceKey key() const = 0;
    /// Ordered by location
    [[nodiscard]] virtual const std::vector<AttributeDescriptor>& attributes() const = 0;
    [[nodiscard]] virtual const std::vector<UniformDescriptor>& uniforms() const = 0;

    [[nodiscard]] const AttributeDescriptor* find_attribute(const std::string& name) const;
    [[nodiscard]] const UniformDescriptor* find_uniform(const std::string& name) const;
};

/// Shader resource living in a ResourceRegistry
class ShaderProgram final : public Shader {
public:
    /// Compile and register a program
    [[nodiscard]] static lumen_core::Result<ShaderProgram> create(ResourceRegistry& registry,
                                                                   const ShaderSource& source);

    /// Wrap an existing shader key
    [[nodiscard]] static lumen_core::Result<ShaderProgram> from_key(const ResourceRegistry& registry, ResourceKey key);

    [[nodiscard]] ResourceKey key() const override { return m_key; }
    [[nodiscard]] const std::vector<AttributeDescriptor>& attributes() const override { return m_attributes; }
    [[nodiscard]] const std::vector<UniformDescriptor>& uniforms() const override { return m_uniforms; }

private:
    ShaderProgram(ResourceKey key, std::vector<AttributeDescriptor> attributes,
                  std::vector<UniformDescriptor> uniforms)
        : m_key(key), m_attributes(std::move(attributes)), m_uniforms(std::move(uniforms)) {}

    ResourceKey m_key;
    std::vector<AttributeDescriptor> m_attributes;
    std::vector<UniformDescriptor> m_uniforms;
};

/// Bind `shader` through the cache, then upload `value` if it differs from
/// the shader's cached value.
/// @return true if the backend received an upload
[[nodiscard]] lumen_core::Result<bool> set_uniform(StateCache& cache, ResourceRegistry& registry,
                                                   ResourceKey shader, const std::string& name,
                                                   const UniformValue& value);

// =============================================================================
// ScopedShader
// =============================================================================

/// Binds a shader for the lifetime of the scope and restores the previously
/// bound shader on every exit path. If the previous binding was unknown, the
/// scoped shader stays bound.
class ScopedShader {
public:
    [[nodiscard]] static lumen_core::Result<ScopedShader> bind(StateCache& cache, ResourceKey key);

    ~ScopedShader();

    ScopedShader(const ScopedShader&) = delete;
    ScopedShader& operator=(const ScopedShader&) = delete;
    ScopedShader(ScopedShader&& other) noexcept;
    ScopedShader& operator=(ScopedShader&&) = delete;

    [[nodiscard]] ResourceKey key() const noexcept { return m_key; }
    [[nodiscard]] std::optional<ResourceKey> saved() const noexcept { return m_saved; }

private:
    ScopedShader(StateCache& cache, ResourceKey key, std::optional<ResourceKey> saved)
        : m_cache(&cache), m_key(key), m_saved(saved) {}

    StateCache* m_cache;
    ResourceKey m_key;
    std::optional<ResourceKey> m_saved;
};

/// Run `op` with `key` bound and return its result. `op` returns a
/// lumen_core::Result; a failed bind is returned without calling it.
template<typename F>
auto with_shader(StateCache& cache, ResourceKey key, F&& op) -> std::invoke_result_t<F> {
    using R = std::invoke_result_t<F>;
    auto scope = ScopedShader::bind(cache, key);
    if (!scope) {
        return R(scope.error());
    }
    return std::forward<F>(op)();
}

} // namespace lumen_gfx
