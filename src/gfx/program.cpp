/// @file program.cpp
/// @brief Uniform value helpers

#include <lumen/gfx/program.hpp>
#include <cstring>
#include <type_traits>

namespace lumen_gfx {

const char* shader_data_type_name(ShaderDataType type) noexcept {
    switch (type) {
        case ShaderDataType::Int: return "int";
        case ShaderDataType::Float: return "float";
        case ShaderDataType::Vec2: return "vec2";
        case ShaderDataType::Vec3: return "vec3";
        case ShaderDataType::Vec4: return "vec4";
        case ShaderDataType::IVec2: return "ivec2";
        case ShaderDataType::IVec3: return "ivec3";
        case ShaderDataType::IVec4: return "ivec4";
        case ShaderDataType::Mat2: return "mat2";
        case ShaderDataType::Mat3: return "mat3";
        case ShaderDataType::Mat4: return "mat4";
        case ShaderDataType::Sampler2D: return "sampler2D";
        case ShaderDataType::Sampler3D: return "sampler3D";
        case ShaderDataType::Sampler2DArray: return "sampler2DArray";
        case ShaderDataType::SamplerCube: return "samplerCube";
        default: return "unknown";
    }
}

ShaderDataType uniform_value_type(const UniformValue& value) noexcept {
    return std::visit([](const auto& v) -> ShaderDataType {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::int32_t>) {
            return ShaderDataType::Int;
        } else if constexpr (std::is_same_v<T, float>) {
            return ShaderDataType::Float;
        } else if constexpr (std::is_same_v<T, glm::vec2>) {
            return ShaderDataType::Vec2;
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            return ShaderDataType::Vec3;
        } else if constexpr (std::is_same_v<T, glm::vec4>) {
            return ShaderDataType::Vec4;
        } else if constexpr (std::is_same_v<T, glm::ivec2>) {
            return ShaderDataType::IVec2;
        } else if constexpr (std::is_same_v<T, glm::ivec3>) {
            return ShaderDataType::IVec3;
        } else if constexpr (std::is_same_v<T, glm::ivec4>) {
            return ShaderDataType::IVec4;
        } else if constexpr (std::is_same_v<T, glm::mat2>) {
            return ShaderDataType::Mat2;
        } else if constexpr (std::is_same_v<T, glm::mat3>) {
            return ShaderDataType::Mat3;
        } else {
            return ShaderDataType::Mat4;
        }
    }, value);
}

bool uniform_accepts(ShaderDataType declared, const UniformValue& value) noexcept {
    ShaderDataType actual = uniform_value_type(value);
    if (is_sampler_type(declared)) {
        return actual == ShaderDataType::Int;
    }
    return actual == declared;
}

bool uniform_bits_equal(const UniformValue& a, const UniformValue& b) noexcept {
    if (a.index() != b.index()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const T& rhs = std::get<T>(b);
        return std::memcmp(&lhs, &rhs, sizeof(T)) == 0;
    }, a);
}

} // namespace lumen_gfx
