#pragma once

/// @file program.hpp
/// @brief Shader program reflection and uniform values for lumen_gfx

#include "fwd.hpp"
#include "resource.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace lumen_gfx {

// =============================================================================
// ShaderDataType
// =============================================================================

/// Type of a reflected attribute or uniform
enum class ShaderDataType : std::uint8_t {
    Int,
    Float,
    Vec2,
    Vec3,
    Vec4,
    IVec2,
    IVec3,
    IVec4,
    Mat2,
    Mat3,
    Mat4,
    Sampler2D,
    Sampler3D,
    Sampler2DArray,
    SamplerCube
};

[[nodiscard]] const char* shader_data_type_name(ShaderDataType type) noexcept;

[[nodiscard]] constexpr bool is_sampler_type(ShaderDataType type) noexcept {
    return type == ShaderDataType::Sampler2D || type == ShaderDataType::Sampler3D ||
           type == ShaderDataType::Sampler2DArray || type == ShaderDataType::SamplerCube;
}

// =============================================================================
// Descriptors
// =============================================================================

struct AttributeDescriptor {
    std::string name;
    std::int32_t location = -1;
    ShaderDataType type = ShaderDataType::Vec4;

    bool operator==(const AttributeDescriptor&) const = default;
};

/// One addressable uniform. Arrays are reflected as one entry per element,
/// named "name[i]".
struct UniformDescriptor {
    std::string name;
    std::int32_t location = -1;
    ShaderDataType type = ShaderDataType::Float;

    bool operator==(const UniformDescriptor&) const = default;
};

/// Source handed to the program provider
struct ShaderSource {
    std::string vertex;
    std::string fragment;
    std::string label;
};

/// Program provider output
struct CompiledProgram {
    BackendId program = NULL_BACKEND_ID;
    std::vector<AttributeDescriptor> attributes;
    std::vector<UniformDescriptor> uniforms;
};

// =============================================================================
// UniformValue
// =============================================================================

/// Raw value uploaded to a uniform. Samplers take the texture unit as Int.
using UniformValue = std::variant<
    std::int32_t,
    float,
    glm::vec2,
    glm::vec3,
    glm::vec4,
    glm::ivec2,
    glm::ivec3,
    glm::ivec4,
    glm::mat2,
    glm::mat3,
    glm::mat4
>;

/// Type a value would be declared as in GLSL
[[nodiscard]] ShaderDataType uniform_value_type(const UniformValue& value) noexcept;

/// True if a value may be uploaded to a uniform declared as `declared`
[[nodiscard]] bool uniform_accepts(ShaderDataType declared, const UniformValue& value) noexcept;

/// Bit-exact comparison: same alternative and identical bytes.
/// Distinguishes 0.0f from -0.0f and treats identical NaN payloads as equal.
[[nodiscard]] bool uniform_bits_equal(const UniformValue& a, const UniformValue& b) noexcept;

} // namespace lumen_gfx
