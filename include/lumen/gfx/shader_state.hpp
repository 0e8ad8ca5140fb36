#pragma once

/// @file shader_state.hpp
/// @brief Per-program uniform metadata and memoized uniform uploads

#include "fwd.hpp"
#include "program.hpp"
#include <lumen/core/error.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lumen_gfx {

// =============================================================================
// ShaderState
// =============================================================================

/// Uniform cache of one linked program.
///
/// Values are compared bit-exactly against the last upload and only differing
/// values reach the backend. The cache is owned by the shader resource in the
/// registry, so it is discarded together with the program.
class ShaderState {
public:
    ShaderState() = default;
    explicit ShaderState(std::vector<UniformDescriptor> uniforms);

    /// Upload `value` to the program that is currently bound on `backend`.
    /// @return true if the value was uploaded, false if the cache already held it
    [[nodiscard]] lumen_core::Result<bool> set_uniform(IGfxBackend& backend, const std::string& name,
                                                       const UniformValue& value);

    /// Validate name and type without touching the backend
    [[nodiscard]] lumen_core::Result<void> check_uniform(const std::string& name, const UniformValue& value) const;

    [[nodiscard]] const UniformDescriptor* find(const std::string& name) const;

    /// Last uploaded value
    [[nodiscard]] std::optional<UniformValue> cached(const std::string& name) const;

    /// Declared uniforms that have never received a value
    [[nodiscard]] std::vector<std::string> missing_uniforms() const;

    /// Forget every cached value; the next set_uniform of each name uploads
    void invalidate();

    [[nodiscard]] const std::vector<UniformDescriptor>& uniforms() const noexcept { return m_uniforms; }
    [[nodiscard]] std::uint64_t upload_count() const noexcept { return m_uploads; }
    [[nodiscard]] std::uint64_t elided_count() const noexcept { return m_elided; }

private:
    [[nodiscard]] lumen_core::Result<std::size_t> resolve(const std::string& name, const UniformValue& value) const;

    std::vector<UniformDescriptor> m_uniforms;
    std::unordered_map<std::string, std::size_t> m_index;
    std::vector<std::optional<UniformValue>> m_values;
    std::uint64_t m_uploads = 0;
    std::uint64_t m_elided = 0;
};

} // namespace lumen_gfx
