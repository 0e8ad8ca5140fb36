/// @file shader_state.cpp
/// @brief ShaderState implementation

#include <lumen/gfx/shader_state.hpp>
#include <lumen/gfx/backend.hpp>

namespace lumen_gfx {

using lumen_core::Err;
using lumen_core::GraphicsError;
using lumen_core::Ok;
using lumen_core::Result;

ShaderState::ShaderState(std::vector<UniformDescriptor> uniforms)
    : m_uniforms(std::move(uniforms))
    , m_values(m_uniforms.size())
{
    for (std::size_t i = 0; i < m_uniforms.size(); ++i) {
        m_index.emplace(m_uniforms[i].name, i);
    }
}

Result<std::size_t> ShaderState::resolve(const std::string& name, const UniformValue& value) const {
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        return Err<std::size_t>(GraphicsError::unknown_uniform(name));
    }
    const auto& desc = m_uniforms[it->second];
    if (!uniform_accepts(desc.type, value)) {
        return Err<std::size_t>(GraphicsError::uniform_type_mismatch(
            name, shader_data_type_name(desc.type), shader_data_type_name(uniform_value_type(value))));
    }
    return Ok(it->second);
}

Result<void> ShaderState::check_uniform(const std::string& name, const UniformValue& value) const {
    auto slot = resolve(name, value);
    if (!slot) {
        return Err(slot.error());
    }
    return Ok();
}

Result<bool> ShaderState::set_uniform(IGfxBackend& backend, const std::string& name, const UniformValue& value) {
    auto slot = resolve(name, value);
    if (!slot) {
        return Err<bool>(slot.error());
    }

    auto& cached = m_values[*slot];
    if (cached && uniform_bits_equal(*cached, value)) {
        ++m_elided;
        return Ok(false);
    }

    backend.upload_uniform(m_uniforms[*slot].location, value);
    cached = value;
    ++m_uploads;
    return Ok(true);
}

const UniformDescriptor* ShaderState::find(const std::string& name) const {
    auto it = m_index.find(name);
    return it != m_index.end() ? &m_uniforms[it->second] : nullptr;
}

std::optional<UniformValue> ShaderState::cached(const std::string& name) const {
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return m_values[it->second];
}

std::vector<std::string> ShaderState::missing_uniforms() const {
    std::vector<std::string> missing;
    for (std::size_t i = 0; i < m_uniforms.size(); ++i) {
        if (!m_values[i]) {
            missing.push_back(m_uniforms[i].name);
        }
    }
    return missing;
}

void ShaderState::invalidate() {
    for (auto& value : m_values) {
        value.reset();
    }
}

} // namespace lumen_gfx
