/// @file opengl_backend.cpp
/// @brief OpenGL 3.3 core backend implementation

#include "opengl_backend.hpp"
#include <lumen/core/log.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <algorithm>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace lumen_gfx {
namespace backends {

using lumen_core::Err;
using lumen_core::ErrorCode;
using lumen_core::GraphicsError;
using lumen_core::Ok;
using lumen_core::Result;

// =============================================================================
// Enum Translation
// =============================================================================

namespace {

GLenum buffer_target(BufferKind kind) {
    switch (kind) {
        case BufferKind::Index: return GL_ELEMENT_ARRAY_BUFFER;
        case BufferKind::Uniform: return GL_UNIFORM_BUFFER;
        case BufferKind::Vertex:
        default: return GL_ARRAY_BUFFER;
    }
}

GLenum buffer_binding_query(GLenum target) {
    switch (target) {
        case GL_ELEMENT_ARRAY_BUFFER: return GL_ELEMENT_ARRAY_BUFFER_BINDING;
        case GL_UNIFORM_BUFFER: return GL_UNIFORM_BUFFER_BINDING;
        default: return GL_ARRAY_BUFFER_BINDING;
    }
}

GLenum buffer_usage(BufferUsage usage) {
    switch (usage) {
        case BufferUsage::Dynamic: return GL_DYNAMIC_DRAW;
        case BufferUsage::Stream: return GL_STREAM_DRAW;
        case BufferUsage::Static:
        default: return GL_STATIC_DRAW;
    }
}

GLenum texture_target(TextureType type) {
    switch (type) {
        case TextureType::Volume: return GL_TEXTURE_3D;
        case TextureType::Tex2DArray: return GL_TEXTURE_2D_ARRAY;
        case TextureType::Cube: return GL_TEXTURE_CUBE_MAP;
        case TextureType::Tex2D:
        default: return GL_TEXTURE_2D;
    }
}

GLenum texture_binding_query(GLenum target) {
    switch (target) {
        case GL_TEXTURE_3D: return GL_TEXTURE_BINDING_3D;
        case GL_TEXTURE_2D_ARRAY: return GL_TEXTURE_BINDING_2D_ARRAY;
        case GL_TEXTURE_CUBE_MAP: return GL_TEXTURE_BINDING_CUBE_MAP;
        default: return GL_TEXTURE_BINDING_2D;
    }
}

GLenum wrap_mode(WrapMode mode) {
    switch (mode) {
        case WrapMode::ClampZero: return GL_CLAMP_TO_BORDER;
        case WrapMode::Repeat: return GL_REPEAT;
        case WrapMode::MirroredRepeat: return GL_MIRRORED_REPEAT;
        case WrapMode::Clamp:
        default: return GL_CLAMP_TO_EDGE;
    }
}

GLenum min_filter(const FilterSettings& filter) {
    const bool linear = filter.min == FilterMode::Linear;
    if (!filter.mipmap) {
        return linear ? GL_LINEAR : GL_NEAREST;
    }
    if (*filter.mipmap == FilterMode::Linear) {
        return linear ? GL_LINEAR_MIPMAP_LINEAR : GL_NEAREST_MIPMAP_LINEAR;
    }
    return linear ? GL_LINEAR_MIPMAP_NEAREST : GL_NEAREST_MIPMAP_NEAREST;
}

GLenum blend_factor(BlendFactor factor) {
    switch (factor) {
        case BlendFactor::Zero: return GL_ZERO;
        case BlendFactor::One: return GL_ONE;
        case BlendFactor::SrcColor: return GL_SRC_COLOR;
        case BlendFactor::OneMinusSrcColor: return GL_ONE_MINUS_SRC_COLOR;
        case BlendFactor::SrcAlpha: return GL_SRC_ALPHA;
        case BlendFactor::OneMinusSrcAlpha: return GL_ONE_MINUS_SRC_ALPHA;
        case BlendFactor::DstColor: return GL_DST_COLOR;
        case BlendFactor::OneMinusDstColor: return GL_ONE_MINUS_DST_COLOR;
        case BlendFactor::DstAlpha: return GL_DST_ALPHA;
        case BlendFactor::OneMinusDstAlpha: return GL_ONE_MINUS_DST_ALPHA;
        case BlendFactor::ConstantColor: return GL_CONSTANT_COLOR;
        case BlendFactor::OneMinusConstantColor: return GL_ONE_MINUS_CONSTANT_COLOR;
        case BlendFactor::ConstantAlpha: return GL_CONSTANT_ALPHA;
        case BlendFactor::OneMinusConstantAlpha: return GL_ONE_MINUS_CONSTANT_ALPHA;
        case BlendFactor::SrcAlphaSaturate: return GL_SRC_ALPHA_SATURATE;
        default: return GL_ONE;
    }
}

GLenum blend_equation(BlendEquation eq) {
    switch (eq) {
        case BlendEquation::Subtract: return GL_FUNC_SUBTRACT;
        case BlendEquation::ReverseSubtract: return GL_FUNC_REVERSE_SUBTRACT;
        case BlendEquation::Min: return GL_MIN;
        case BlendEquation::Max: return GL_MAX;
        case BlendEquation::Add:
        default: return GL_FUNC_ADD;
    }
}

GLenum compare_function(CompareFunction fn) {
    switch (fn) {
        case CompareFunction::Never: return GL_NEVER;
        case CompareFunction::Less: return GL_LESS;
        case CompareFunction::Equal: return GL_EQUAL;
        case CompareFunction::LessEqual: return GL_LEQUAL;
        case CompareFunction::Greater: return GL_GREATER;
        case CompareFunction::NotEqual: return GL_NOTEQUAL;
        case CompareFunction::GreaterEqual: return GL_GEQUAL;
        case CompareFunction::Always:
        default: return GL_ALWAYS;
    }
}

GLenum stencil_op(StencilOp op) {
    switch (op) {
        case StencilOp::Zero: return GL_ZERO;
        case StencilOp::Replace: return GL_REPLACE;
        case StencilOp::Increment: return GL_INCR;
        case StencilOp::IncrementWrap: return GL_INCR_WRAP;
        case StencilOp::Decrement: return GL_DECR;
        case StencilOp::DecrementWrap: return GL_DECR_WRAP;
        case StencilOp::Invert: return GL_INVERT;
        case StencilOp::Keep:
        default: return GL_KEEP;
    }
}

GLenum draw_mode(DrawMode mode) {
    switch (mode) {
        case DrawMode::Points: return GL_POINTS;
        case DrawMode::Lines: return GL_LINES;
        case DrawMode::LineLoop: return GL_LINE_LOOP;
        case DrawMode::LineStrip: return GL_LINE_STRIP;
        case DrawMode::TriangleStrip: return GL_TRIANGLE_STRIP;
        case DrawMode::TriangleFan: return GL_TRIANGLE_FAN;
        case DrawMode::Triangles:
        default: return GL_TRIANGLES;
    }
}

GLenum component_type(AttributeComponent component) {
    switch (component) {
        case AttributeComponent::Int: return GL_INT;
        case AttributeComponent::UInt: return GL_UNSIGNED_INT;
        case AttributeComponent::Byte: return GL_BYTE;
        case AttributeComponent::UByte: return GL_UNSIGNED_BYTE;
        case AttributeComponent::Short: return GL_SHORT;
        case AttributeComponent::UShort: return GL_UNSIGNED_SHORT;
        case AttributeComponent::Float:
        default: return GL_FLOAT;
    }
}

std::optional<ShaderDataType> reflected_type(GLenum type) {
    switch (type) {
        case GL_INT: return ShaderDataType::Int;
        case GL_BOOL: return ShaderDataType::Int;
        case GL_FLOAT: return ShaderDataType::Float;
        case GL_FLOAT_VEC2: return ShaderDataType::Vec2;
        case GL_FLOAT_VEC3: return ShaderDataType::Vec3;
        case GL_FLOAT_VEC4: return ShaderDataType::Vec4;
        case GL_INT_VEC2: return ShaderDataType::IVec2;
        case GL_INT_VEC3: return ShaderDataType::IVec3;
        case GL_INT_VEC4: return ShaderDataType::IVec4;
        case GL_FLOAT_MAT2: return ShaderDataType::Mat2;
        case GL_FLOAT_MAT3: return ShaderDataType::Mat3;
        case GL_FLOAT_MAT4: return ShaderDataType::Mat4;
        case GL_SAMPLER_2D: return ShaderDataType::Sampler2D;
        case GL_SAMPLER_3D: return ShaderDataType::Sampler3D;
        case GL_SAMPLER_2D_ARRAY: return ShaderDataType::Sampler2DArray;
        case GL_SAMPLER_CUBE: return ShaderDataType::SamplerCube;
        default: return std::nullopt;
    }
}

FramebufferStatus translate_status(GLenum status) {
    switch (status) {
        case GL_FRAMEBUFFER_COMPLETE: return FramebufferStatus::Complete;
        case GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT: return FramebufferStatus::IncompleteAttachment;
        case GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT: return FramebufferStatus::MissingAttachment;
        case GL_FRAMEBUFFER_UNSUPPORTED: return FramebufferStatus::Unsupported;
        case GL_FRAMEBUFFER_INCOMPLETE_MULTISAMPLE: return FramebufferStatus::IncompleteMultisample;
        default: return FramebufferStatus::Unknown;
    }
}

GLint current_binding(GLenum query) {
    GLint value = 0;
    glGetIntegerv(query, &value);
    return value;
}

} // anonymous namespace

// =============================================================================
// Factory Function
// =============================================================================

Result<std::unique_ptr<IGfxBackend>> create_opengl_backend() {
    auto backend = std::make_unique<OpenGLBackend>();
    auto init = backend->init();
    if (!init) {
        return Err<std::unique_ptr<IGfxBackend>>(init.error());
    }
    return Ok<std::unique_ptr<IGfxBackend>>(std::move(backend));
}

// =============================================================================
// Lifecycle
// =============================================================================

Result<void> OpenGLBackend::init() {
    if (m_initialized) {
        return Ok();
    }

#ifdef LUMEN_PLATFORM_LINUX
    if (glXGetCurrentContext() == nullptr) {
        return Err(lumen_core::Error(ErrorCode::NotSupported, "No current GLX context"));
    }
#endif

    if (!load_gl_functions()) {
        return Err(lumen_core::Error(ErrorCode::NotSupported,
            "OpenGL 3.3 entry points unavailable in the current context"));
    }

    query_limits();

    glGenVertexArrays_ptr(1, &m_vertex_array);
    glBindVertexArray_ptr(m_vertex_array);

    const char* renderer = reinterpret_cast<const char*>(glGetString(GL_RENDERER));
    const char* version = reinterpret_cast<const char*>(glGetString(GL_VERSION));
    LUMEN_LOG_INFO("[OpenGL] {} ({}), {} texture units, {} vertex attributes",
                   renderer ? renderer : "Unknown", version ? version : "Unknown",
                   m_limits.max_texture_units, m_limits.max_vertex_attributes);

    m_initialized = true;
    return Ok();
}

void OpenGLBackend::shutdown() {
    if (!m_initialized) return;

    for (auto& [id, target] : m_buffers) {
        GLuint name = id;
        glDeleteBuffers_ptr(1, &name);
    }
    m_buffers.clear();

    for (auto& [id, target] : m_textures) {
        GLuint name = id;
        glDeleteTextures(1, &name);
    }
    m_textures.clear();

    for (BackendId id : m_framebuffers) {
        GLuint name = id;
        glDeleteFramebuffers_ptr(1, &name);
    }
    m_framebuffers.clear();

    for (BackendId id : m_programs) {
        glDeleteProgram_ptr(id);
    }
    m_programs.clear();

    if (m_vertex_array != 0) {
        glDeleteVertexArrays_ptr(1, &m_vertex_array);
        m_vertex_array = 0;
    }

    m_initialized = false;
}

bool OpenGLBackend::load_gl_functions() {
#ifdef LUMEN_PLATFORM_WINDOWS
    #define LOAD_GL(name) name##_ptr = (decltype(name##_ptr))wglGetProcAddress(#name)
#elif defined(LUMEN_PLATFORM_LINUX)
    #define LOAD_GL(name) name##_ptr = (decltype(name##_ptr))glXGetProcAddress((const GLubyte*)#name)
#else
    #define LOAD_GL(name) name##_ptr = nullptr
#endif

    LOAD_GL(glGenBuffers);
    LOAD_GL(glBindBuffer);
    LOAD_GL(glBufferData);
    LOAD_GL(glBufferSubData);
    LOAD_GL(glDeleteBuffers);
    LOAD_GL(glActiveTexture);
    LOAD_GL(glTexImage3D);
    LOAD_GL(glGenerateMipmap);
    LOAD_GL(glCreateShader);
    LOAD_GL(glShaderSource);
    LOAD_GL(glCompileShader);
    LOAD_GL(glGetShaderiv);
    LOAD_GL(glGetShaderInfoLog);
    LOAD_GL(glDeleteShader);
    LOAD_GL(glCreateProgram);
    LOAD_GL(glAttachShader);
    LOAD_GL(glDetachShader);
    LOAD_GL(glLinkProgram);
    LOAD_GL(glGetProgramiv);
    LOAD_GL(glGetProgramInfoLog);
    LOAD_GL(glDeleteProgram);
    LOAD_GL(glUseProgram);
    LOAD_GL(glGetActiveAttrib);
    LOAD_GL(glGetAttribLocation);
    LOAD_GL(glGetActiveUniform);
    LOAD_GL(glGetUniformLocation);
    LOAD_GL(glUniform1i);
    LOAD_GL(glUniform1f);
    LOAD_GL(glUniform2fv);
    LOAD_GL(glUniform3fv);
    LOAD_GL(glUniform4fv);
    LOAD_GL(glUniform2iv);
    LOAD_GL(glUniform3iv);
    LOAD_GL(glUniform4iv);
    LOAD_GL(glUniformMatrix2fv);
    LOAD_GL(glUniformMatrix3fv);
    LOAD_GL(glUniformMatrix4fv);
    LOAD_GL(glGenFramebuffers);
    LOAD_GL(glBindFramebuffer);
    LOAD_GL(glFramebufferTexture2D);
    LOAD_GL(glCheckFramebufferStatus);
    LOAD_GL(glDeleteFramebuffers);
    LOAD_GL(glGenVertexArrays);
    LOAD_GL(glBindVertexArray);
    LOAD_GL(glDeleteVertexArrays);
    LOAD_GL(glEnableVertexAttribArray);
    LOAD_GL(glDisableVertexAttribArray);
    LOAD_GL(glVertexAttribPointer);
    LOAD_GL(glVertexAttribIPointer);
    LOAD_GL(glVertexAttribDivisor);
    LOAD_GL(glDrawArraysInstanced);
    LOAD_GL(glDrawElementsInstanced);
    LOAD_GL(glBlendFuncSeparate);
    LOAD_GL(glBlendEquationSeparate);
    LOAD_GL(glBlendColor);
    LOAD_GL(glPushDebugGroup);
    LOAD_GL(glPopDebugGroup);

#undef LOAD_GL

    // Debug groups are optional; everything else is GL 3.3 core
    return glGenBuffers_ptr && glBindBuffer_ptr && glBufferData_ptr && glBufferSubData_ptr &&
           glDeleteBuffers_ptr && glActiveTexture_ptr && glTexImage3D_ptr && glGenerateMipmap_ptr &&
           glCreateShader_ptr && glShaderSource_ptr && glCompileShader_ptr && glGetShaderiv_ptr &&
           glGetShaderInfoLog_ptr && glDeleteShader_ptr && glCreateProgram_ptr && glAttachShader_ptr &&
           glDetachShader_ptr && glLinkProgram_ptr && glGetProgramiv_ptr && glGetProgramInfoLog_ptr &&
           glDeleteProgram_ptr && glUseProgram_ptr && glGetActiveAttrib_ptr && glGetAttribLocation_ptr &&
           glGetActiveUniform_ptr && glGetUniformLocation_ptr && glUniform1i_ptr && glUniform1f_ptr &&
           glUniform2fv_ptr && glUniform3fv_ptr && glUniform4fv_ptr && glUniform2iv_ptr &&
           glUniform3iv_ptr && glUniform4iv_ptr && glUniformMatrix2fv_ptr && glUniformMatrix3fv_ptr &&
           glUniformMatrix4fv_ptr && glGenFramebuffers_ptr && glBindFramebuffer_ptr &&
           glFramebufferTexture2D_ptr && glCheckFramebufferStatus_ptr && glDeleteFramebuffers_ptr &&
           glGenVertexArrays_ptr && glBindVertexArray_ptr && glDeleteVertexArrays_ptr &&
           glEnableVertexAttribArray_ptr && glDisableVertexAttribArray_ptr && glVertexAttribPointer_ptr &&
           glVertexAttribIPointer_ptr && glVertexAttribDivisor_ptr && glDrawArraysInstanced_ptr &&
           glDrawElementsInstanced_ptr && glBlendFuncSeparate_ptr && glBlendEquationSeparate_ptr &&
           glBlendColor_ptr;
}

void OpenGLBackend::query_limits() {
    GLint value = 0;
    glGetIntegerv(GL_MAX_COMBINED_TEXTURE_IMAGE_UNITS, &value);
    m_limits.max_texture_units = static_cast<std::uint32_t>(std::max(value, 1));

    glGetIntegerv(GL_MAX_VERTEX_ATTRIBS, &value);
    m_limits.max_vertex_attributes = static_cast<std::uint32_t>(std::clamp(value, 1, 32));

    glGetIntegerv(GL_MAX_TEXTURE_SIZE, &value);
    m_limits.max_texture_size = static_cast<std::uint32_t>(std::max(value, 1));
}

// =============================================================================
// Buffers
// =============================================================================

Result<BackendId> OpenGLBackend::create_buffer(BufferKind kind, BufferUsage usage, std::size_t size, const void* data) {
    GLuint buffer = 0;
    glGenBuffers_ptr(1, &buffer);
    if (buffer == 0) {
        return Err<BackendId>(GraphicsError::resource_creation_failed("buffer", "glGenBuffers returned 0"));
    }

    GLenum target = buffer_target(kind);
    GLint previous = current_binding(buffer_binding_query(target));
    glBindBuffer_ptr(target, buffer);
    glBufferData_ptr(target, static_cast<GLsizeiptr>(size), data, buffer_usage(usage));
    GLenum error = glGetError();
    glBindBuffer_ptr(target, static_cast<GLuint>(previous));

    if (error == GL_OUT_OF_MEMORY) {
        glDeleteBuffers_ptr(1, &buffer);
        return Err<BackendId>(GraphicsError::resource_creation_failed("buffer", "GL_OUT_OF_MEMORY"));
    }

    m_buffers[buffer] = target;
    return Ok(static_cast<BackendId>(buffer));
}

void OpenGLBackend::reallocate_buffer(BackendId id, BufferKind kind, BufferUsage usage,
                                      std::size_t size, const void* data) {
    GLenum target = buffer_target(kind);
    GLint previous = current_binding(buffer_binding_query(target));
    glBindBuffer_ptr(target, id);
    glBufferData_ptr(target, static_cast<GLsizeiptr>(size), data, buffer_usage(usage));
    glBindBuffer_ptr(target, static_cast<GLuint>(previous));
}

void OpenGLBackend::write_buffer(BackendId id, BufferKind kind, std::size_t offset, const void* data, std::size_t size) {
    GLenum target = buffer_target(kind);
    GLint previous = current_binding(buffer_binding_query(target));
    glBindBuffer_ptr(target, id);
    glBufferSubData_ptr(target, static_cast<GLintptr>(offset), static_cast<GLsizeiptr>(size), data);
    glBindBuffer_ptr(target, static_cast<GLuint>(previous));
}

void OpenGLBackend::destroy_buffer(BackendId id) {
    GLuint name = id;
    glDeleteBuffers_ptr(1, &name);
    m_buffers.erase(id);
}

// =============================================================================
// Textures
// =============================================================================

Result<BackendId> OpenGLBackend::create_texture(const TextureDesc& desc, const void* data, std::size_t size) {
    const auto& info = desc.info;
    if (info.width > m_limits.max_texture_size || info.height > m_limits.max_texture_size) {
        return Err<BackendId>(GraphicsError::invalid_dimensions("texture", info.width, info.height));
    }

    GLuint texture = 0;
    glGenTextures(1, &texture);
    if (texture == 0) {
        return Err<BackendId>(GraphicsError::resource_creation_failed("texture", "glGenTextures returned 0"));
    }

    GLenum target = texture_target(desc.type);
    GLint previous = current_binding(texture_binding_query(target));
    glBindTexture(target, texture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

    const GLint internal = static_cast<GLint>(texture_format_to_gl_internal(info.format));
    const GLenum format = texture_format_to_gl_format(info.format);
    const GLenum type = texture_format_to_gl_type(info.format);
    const auto w = static_cast<GLsizei>(info.width);
    const auto h = static_cast<GLsizei>(info.height);
    const std::size_t layer_size = info.byte_size();

    switch (desc.type) {
        case TextureType::Tex2D:
            glTexImage2D(target, 0, internal, w, h, 0, format, type, data);
            break;
        case TextureType::Volume:
        case TextureType::Tex2DArray: {
            auto depth = static_cast<GLsizei>(layer_size > 0 ? std::max<std::size_t>(size / layer_size, 1) : 1);
            glTexImage3D_ptr(target, 0, internal, w, h, depth, 0, format, type, data);
            break;
        }
        case TextureType::Cube: {
            const bool all_faces = data != nullptr && size >= layer_size * 6;
            for (GLenum face = 0; face < 6; ++face) {
                const void* face_data = all_faces ? static_cast<const std::uint8_t*>(data) + face * layer_size : nullptr;
                glTexImage2D(GL_TEXTURE_CUBE_MAP_POSITIVE_X + face, 0, internal, w, h, 0, format, type, face_data);
            }
            break;
        }
    }

    GLenum error = glGetError();
    glBindTexture(target, static_cast<GLuint>(previous));
    if (error != GL_NO_ERROR) {
        glDeleteTextures(1, &texture);
        return Err<BackendId>(GraphicsError::resource_creation_failed(
            "texture", "GL error " + std::to_string(error)));
    }

    m_textures[texture] = target;
    set_texture_sampling(texture, desc.type, info.filter, info.wrap);

    if (info.mipmaps && data != nullptr) {
        previous = current_binding(texture_binding_query(target));
        glBindTexture(target, texture);
        glGenerateMipmap_ptr(target);
        glBindTexture(target, static_cast<GLuint>(previous));
    }

    return Ok(static_cast<BackendId>(texture));
}

void OpenGLBackend::set_texture_sampling(BackendId id, TextureType type,
                                         const FilterSettings& filter, const WrapSettings& wrap) {
    GLenum target = texture_target(type);
    GLint previous = current_binding(texture_binding_query(target));
    glBindTexture(target, id);

    glTexParameteri(target, GL_TEXTURE_MIN_FILTER, static_cast<GLint>(min_filter(filter)));
    glTexParameteri(target, GL_TEXTURE_MAG_FILTER,
                    filter.mag == FilterMode::Linear ? GL_LINEAR : GL_NEAREST);
    glTexParameteri(target, GL_TEXTURE_WRAP_S, static_cast<GLint>(wrap_mode(wrap.s)));
    glTexParameteri(target, GL_TEXTURE_WRAP_T, static_cast<GLint>(wrap_mode(wrap.t)));
    glTexParameteri(target, GL_TEXTURE_WRAP_R, static_cast<GLint>(wrap_mode(wrap.r)));
    if (filter.anisotropy > 1.0f) {
        glTexParameterf(target, GL_TEXTURE_MAX_ANISOTROPY_EXT, filter.anisotropy);
    }

    glBindTexture(target, static_cast<GLuint>(previous));
}

void OpenGLBackend::destroy_texture(BackendId id) {
    GLuint name = id;
    glDeleteTextures(1, &name);
    m_textures.erase(id);
}

// =============================================================================
// Programs
// =============================================================================

Result<GLuint> OpenGLBackend::compile_stage(GLenum stage, const char* stage_name, const std::string& source) {
    GLuint shader = glCreateShader_ptr(stage);
    const GLchar* text = source.c_str();
    glShaderSource_ptr(shader, 1, &text, nullptr);
    glCompileShader_ptr(shader);

    GLint status = GL_FALSE;
    glGetShaderiv_ptr(shader, GL_COMPILE_STATUS, &status);
    if (status != GL_TRUE) {
        GLint length = 0;
        glGetShaderiv_ptr(shader, GL_INFO_LOG_LENGTH, &length);
        std::string log(static_cast<std::size_t>(std::max(length, 1)), '\0');
        glGetShaderInfoLog_ptr(shader, length, nullptr, log.data());
        glDeleteShader_ptr(shader);
        return Err<GLuint>(GraphicsError::compile_error(stage_name, log.c_str()));
    }
    return Ok(shader);
}

void OpenGLBackend::reflect_program(GLuint program, CompiledProgram& out) {
    GLint max_length = 0;
    GLint count = 0;
    std::vector<GLchar> name;

    glGetProgramiv_ptr(program, GL_ACTIVE_ATTRIBUTE_MAX_LENGTH, &max_length);
    glGetProgramiv_ptr(program, GL_ACTIVE_ATTRIBUTES, &count);
    name.assign(static_cast<std::size_t>(std::max(max_length, 1)), '\0');
    for (GLint i = 0; i < count; ++i) {
        GLint size = 0;
        GLenum type = 0;
        glGetActiveAttrib_ptr(program, static_cast<GLuint>(i), max_length, nullptr, &size, &type, name.data());
        auto data_type = reflected_type(type);
        GLint location = glGetAttribLocation_ptr(program, name.data());
        if (!data_type || location < 0) {
            continue;  // gl_ built-ins
        }
        out.attributes.push_back(AttributeDescriptor{name.data(), location, *data_type});
    }
    std::sort(out.attributes.begin(), out.attributes.end(),
              [](const AttributeDescriptor& a, const AttributeDescriptor& b) { return a.location < b.location; });

    glGetProgramiv_ptr(program, GL_ACTIVE_UNIFORM_MAX_LENGTH, &max_length);
    glGetProgramiv_ptr(program, GL_ACTIVE_UNIFORMS, &count);
    name.assign(static_cast<std::size_t>(std::max(max_length, 1)), '\0');
    for (GLint i = 0; i < count; ++i) {
        GLint size = 0;
        GLenum type = 0;
        glGetActiveUniform_ptr(program, static_cast<GLuint>(i), max_length, nullptr, &size, &type, name.data());
        auto data_type = reflected_type(type);
        if (!data_type) {
            continue;
        }

        std::string base = name.data();
        auto bracket = base.find('[');
        if (bracket == std::string::npos) {
            out.uniforms.push_back(UniformDescriptor{base, glGetUniformLocation_ptr(program, base.c_str()), *data_type});
            continue;
        }
        base.erase(bracket);
        for (GLint element = 0; element < size; ++element) {
            std::string element_name = base + "[" + std::to_string(element) + "]";
            GLint location = glGetUniformLocation_ptr(program, element_name.c_str());
            if (location >= 0) {
                out.uniforms.push_back(UniformDescriptor{element_name, location, *data_type});
            }
        }
    }
}

Result<CompiledProgram> OpenGLBackend::compile_program(const ShaderSource& source) {
    auto vertex = compile_stage(GL_VERTEX_SHADER, "vertex", source.vertex);
    if (!vertex) {
        return Err<CompiledProgram>(vertex.error());
    }
    auto fragment = compile_stage(GL_FRAGMENT_SHADER, "fragment", source.fragment);
    if (!fragment) {
        glDeleteShader_ptr(*vertex);
        return Err<CompiledProgram>(fragment.error());
    }

    GLuint program = glCreateProgram_ptr();
    glAttachShader_ptr(program, *vertex);
    glAttachShader_ptr(program, *fragment);
    glLinkProgram_ptr(program);
    glDetachShader_ptr(program, *vertex);
    glDetachShader_ptr(program, *fragment);
    glDeleteShader_ptr(*vertex);
    glDeleteShader_ptr(*fragment);

    GLint status = GL_FALSE;
    glGetProgramiv_ptr(program, GL_LINK_STATUS, &status);
    if (status != GL_TRUE) {
        GLint length = 0;
        glGetProgramiv_ptr(program, GL_INFO_LOG_LENGTH, &length);
        std::string log(static_cast<std::size_t>(std::max(length, 1)), '\0');
        glGetProgramInfoLog_ptr(program, length, nullptr, log.data());
        glDeleteProgram_ptr(program);
        return Err<CompiledProgram>(GraphicsError::link_error(log.c_str()));
    }

    CompiledProgram compiled;
    compiled.program = program;
    reflect_program(program, compiled);
    m_programs.insert(program);
    return Ok(std::move(compiled));
}

void OpenGLBackend::destroy_program(BackendId id) {
    glDeleteProgram_ptr(id);
    m_programs.erase(id);
}

// =============================================================================
// Framebuffers
// =============================================================================

Result<BackendId> OpenGLBackend::create_framebuffer(BackendId color, std::optional<BackendId> depth, bool depth_has_stencil) {
    GLuint framebuffer = 0;
    glGenFramebuffers_ptr(1, &framebuffer);
    if (framebuffer == 0) {
        return Err<BackendId>(GraphicsError::resource_creation_failed("framebuffer", "glGenFramebuffers returned 0"));
    }

    GLint previous = current_binding(GL_FRAMEBUFFER_BINDING);
    glBindFramebuffer_ptr(GL_FRAMEBUFFER, framebuffer);
    glFramebufferTexture2D_ptr(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, color, 0);
    if (depth) {
        glFramebufferTexture2D_ptr(GL_FRAMEBUFFER,
                                   depth_has_stencil ? GL_DEPTH_STENCIL_ATTACHMENT : GL_DEPTH_ATTACHMENT,
                                   GL_TEXTURE_2D, *depth, 0);
    }
    glBindFramebuffer_ptr(GL_FRAMEBUFFER, static_cast<GLuint>(previous));

    m_framebuffers.insert(framebuffer);
    return Ok(static_cast<BackendId>(framebuffer));
}

FramebufferStatus OpenGLBackend::framebuffer_status(BackendId id) {
    GLint previous = current_binding(GL_FRAMEBUFFER_BINDING);
    glBindFramebuffer_ptr(GL_FRAMEBUFFER, id);
    GLenum status = glCheckFramebufferStatus_ptr(GL_FRAMEBUFFER);
    glBindFramebuffer_ptr(GL_FRAMEBUFFER, static_cast<GLuint>(previous));
    return translate_status(status);
}

void OpenGLBackend::destroy_framebuffer(BackendId id) {
    GLuint name = id;
    glDeleteFramebuffers_ptr(1, &name);
    m_framebuffers.erase(id);
}

// =============================================================================
// Binding State
// =============================================================================

void OpenGLBackend::use_program(BackendId id) {
    glUseProgram_ptr(id);
}

void OpenGLBackend::set_active_texture_unit(std::uint32_t unit) {
    glActiveTexture_ptr(GL_TEXTURE0 + unit);
}

void OpenGLBackend::bind_texture(TextureType type, BackendId id) {
    glBindTexture(texture_target(type), id);
}

void OpenGLBackend::bind_buffer(BufferKind kind, BackendId id) {
    glBindBuffer_ptr(buffer_target(kind), id);
}

void OpenGLBackend::bind_framebuffer(BackendId id) {
    glBindFramebuffer_ptr(GL_FRAMEBUFFER, id);
}

void OpenGLBackend::set_blend(const BlendState& state) {
    if (!state.enabled) {
        glDisable(GL_BLEND);
        return;
    }
    glEnable(GL_BLEND);
    glBlendFuncSeparate_ptr(blend_factor(state.src_rgb), blend_factor(state.dst_rgb),
                            blend_factor(state.src_alpha), blend_factor(state.dst_alpha));
    glBlendEquationSeparate_ptr(blend_equation(state.equation_rgb), blend_equation(state.equation_alpha));
    glBlendColor_ptr(state.constant.r, state.constant.g, state.constant.b, state.constant.a);
}

void OpenGLBackend::set_depth(const DepthState& state) {
    if (!state.enabled) {
        glDisable(GL_DEPTH_TEST);
        return;
    }
    glEnable(GL_DEPTH_TEST);
    glDepthFunc(compare_function(state.function));
    glDepthMask(state.write ? GL_TRUE : GL_FALSE);
    glDepthRange(state.range_near, state.range_far);
}

void OpenGLBackend::set_stencil(const StencilState& state) {
    if (!state.enabled) {
        glDisable(GL_STENCIL_TEST);
        return;
    }
    glEnable(GL_STENCIL_TEST);
    glStencilFunc(compare_function(state.function), state.reference, state.read_mask);
    glStencilOp(stencil_op(state.fail), stencil_op(state.depth_fail), stencil_op(state.pass));
    glStencilMask(state.write_mask);
}

void OpenGLBackend::set_viewport(const Rect& rect) {
    glViewport(rect.x, rect.y, rect.width, rect.height);
}

void OpenGLBackend::set_scissor(const ScissorState& state) {
    if (!state.enabled) {
        glDisable(GL_SCISSOR_TEST);
        return;
    }
    glEnable(GL_SCISSOR_TEST);
    glScissor(state.rect.x, state.rect.y, state.rect.width, state.rect.height);
}

void OpenGLBackend::set_culling(const CullingState& state) {
    if (!state.enabled) {
        glDisable(GL_CULL_FACE);
        return;
    }
    glEnable(GL_CULL_FACE);
    switch (state.face) {
        case CullFace::Front: glCullFace(GL_FRONT); break;
        case CullFace::FrontAndBack: glCullFace(GL_FRONT_AND_BACK); break;
        case CullFace::Back:
        default: glCullFace(GL_BACK); break;
    }
    glFrontFace(state.front_face == Winding::Clockwise ? GL_CW : GL_CCW);
}

void OpenGLBackend::set_vertex_attribute_enabled(std::uint32_t location, bool enabled) {
    if (enabled) {
        glEnableVertexAttribArray_ptr(location);
    } else {
        glDisableVertexAttribArray_ptr(location);
    }
}

// =============================================================================
// Draw Submission
// =============================================================================

void OpenGLBackend::set_vertex_attribute(std::uint32_t location, const VertexFormat& format,
                                         std::uint32_t stride, std::uint32_t step) {
    const auto* offset = reinterpret_cast<const void*>(static_cast<std::uintptr_t>(format.offset));
    const bool integer = !format.normalized &&
        (format.component == AttributeComponent::Int || format.component == AttributeComponent::UInt);

    if (integer) {
        glVertexAttribIPointer_ptr(location, format.components, component_type(format.component),
                                   static_cast<GLsizei>(stride), offset);
    } else {
        glVertexAttribPointer_ptr(location, format.components, component_type(format.component),
                                  format.normalized ? GL_TRUE : GL_FALSE, static_cast<GLsizei>(stride), offset);
    }
    glVertexAttribDivisor_ptr(location, step);
}

void OpenGLBackend::upload_uniform(std::int32_t location, const UniformValue& value) {
    std::visit([this, location](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::int32_t>) {
            glUniform1i_ptr(location, v);
        } else if constexpr (std::is_same_v<T, float>) {
            glUniform1f_ptr(location, v);
        } else if constexpr (std::is_same_v<T, glm::vec2>) {
            glUniform2fv_ptr(location, 1, glm::value_ptr(v));
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            glUniform3fv_ptr(location, 1, glm::value_ptr(v));
        } else if constexpr (std::is_same_v<T, glm::vec4>) {
            glUniform4fv_ptr(location, 1, glm::value_ptr(v));
        } else if constexpr (std::is_same_v<T, glm::ivec2>) {
            glUniform2iv_ptr(location, 1, glm::value_ptr(v));
        } else if constexpr (std::is_same_v<T, glm::ivec3>) {
            glUniform3iv_ptr(location, 1, glm::value_ptr(v));
        } else if constexpr (std::is_same_v<T, glm::ivec4>) {
            glUniform4iv_ptr(location, 1, glm::value_ptr(v));
        } else if constexpr (std::is_same_v<T, glm::mat2>) {
            glUniformMatrix2fv_ptr(location, 1, GL_FALSE, glm::value_ptr(v));
        } else if constexpr (std::is_same_v<T, glm::mat3>) {
            glUniformMatrix3fv_ptr(location, 1, GL_FALSE, glm::value_ptr(v));
        } else {
            glUniformMatrix4fv_ptr(location, 1, GL_FALSE, glm::value_ptr(v));
        }
    }, value);
}

void OpenGLBackend::clear(const std::optional<Color>& color, std::optional<float> depth,
                          std::optional<std::int32_t> stencil) {
    GLbitfield mask = 0;
    GLboolean depth_write = GL_TRUE;
    GLint stencil_write = 0;

    if (color) {
        Color c = color->clamped();
        glClearColor(c.r, c.g, c.b, c.a);
        mask |= GL_COLOR_BUFFER_BIT;
    }
    if (depth) {
        glGetBooleanv(GL_DEPTH_WRITEMASK, &depth_write);
        glDepthMask(GL_TRUE);
        glClearDepth(std::clamp(*depth, 0.0f, 1.0f));
        mask |= GL_DEPTH_BUFFER_BIT;
    }
    if (stencil) {
        glGetIntegerv(GL_STENCIL_WRITEMASK, &stencil_write);
        glStencilMask(0xFF);
        glClearStencil(*stencil);
        mask |= GL_STENCIL_BUFFER_BIT;
    }
    if (mask == 0) {
        return;
    }

    glClear(mask);

    // Write masks are part of the mirrored depth/stencil state
    if (depth) {
        glDepthMask(depth_write);
    }
    if (stencil) {
        glStencilMask(static_cast<GLuint>(stencil_write));
    }
}

void OpenGLBackend::draw_arrays(DrawMode mode, std::uint32_t first, std::uint32_t count, std::uint32_t instances) {
    if (instances <= 1) {
        glDrawArrays(draw_mode(mode), static_cast<GLint>(first), static_cast<GLsizei>(count));
    } else {
        glDrawArraysInstanced_ptr(draw_mode(mode), static_cast<GLint>(first), static_cast<GLsizei>(count),
                                  static_cast<GLsizei>(instances));
    }
}

void OpenGLBackend::draw_elements(DrawMode mode, IndexType type, std::uint32_t first,
                                  std::uint32_t count, std::uint32_t instances) {
    const GLenum gl_type = type == IndexType::U16 ? GL_UNSIGNED_SHORT : GL_UNSIGNED_INT;
    const auto* offset = reinterpret_cast<const void*>(
        static_cast<std::uintptr_t>(first) * index_type_size(type));
    if (instances <= 1) {
        glDrawElements(draw_mode(mode), static_cast<GLsizei>(count), gl_type, offset);
    } else {
        glDrawElementsInstanced_ptr(draw_mode(mode), static_cast<GLsizei>(count), gl_type, offset,
                                    static_cast<GLsizei>(instances));
    }
}

void OpenGLBackend::push_debug_group(const std::string& name) {
    if (glPushDebugGroup_ptr) {
        glPushDebugGroup_ptr(GL_DEBUG_SOURCE_APPLICATION, 0, static_cast<GLsizei>(name.size()), name.c_str());
    }
}

void OpenGLBackend::pop_debug_group() {
    if (glPopDebugGroup_ptr) {
        glPopDebugGroup_ptr();
    }
}

// =============================================================================
// Format Translation
// =============================================================================

GLenum OpenGLBackend::texture_format_to_gl_internal(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8: return GL_R8;
        case TextureFormat::Rg8: return GL_RG8;
        case TextureFormat::Rgb8: return GL_RGB8;
        case TextureFormat::Rgba8: return GL_RGBA8;
        case TextureFormat::Srgba8: return GL_SRGB8_ALPHA8;
        case TextureFormat::R16Float: return GL_R16F;
        case TextureFormat::Rgba16Float: return GL_RGBA16F;
        case TextureFormat::R32Float: return GL_R32F;
        case TextureFormat::Rgba32Float: return GL_RGBA32F;
        case TextureFormat::Depth16: return GL_DEPTH_COMPONENT16;
        case TextureFormat::Depth24: return GL_DEPTH_COMPONENT24;
        case TextureFormat::Depth32Float: return GL_DEPTH_COMPONENT32F;
        case TextureFormat::Depth24Stencil8: return GL_DEPTH24_STENCIL8;
        default: return GL_RGBA8;
    }
}

GLenum OpenGLBackend::texture_format_to_gl_format(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8:
        case TextureFormat::R16Float:
        case TextureFormat::R32Float:
            return GL_RED;
        case TextureFormat::Rg8: return GL_RG;
        case TextureFormat::Rgb8: return GL_RGB;
        case TextureFormat::Depth16:
        case TextureFormat::Depth24:
        case TextureFormat::Depth32Float:
            return GL_DEPTH_COMPONENT;
        case TextureFormat::Depth24Stencil8: return GL_DEPTH_STENCIL;
        default: return GL_RGBA;
    }
}

GLenum OpenGLBackend::texture_format_to_gl_type(TextureFormat format) {
    switch (format) {
        case TextureFormat::R16Float:
        case TextureFormat::Rgba16Float:
            return GL_HALF_FLOAT;
        case TextureFormat::R32Float:
        case TextureFormat::Rgba32Float:
        case TextureFormat::Depth32Float:
            return GL_FLOAT;
        case TextureFormat::Depth16: return GL_UNSIGNED_SHORT;
        case TextureFormat::Depth24: return GL_UNSIGNED_INT;
        case TextureFormat::Depth24Stencil8: return GL_UNSIGNED_INT_24_8;
        default: return GL_UNSIGNED_BYTE;
    }
}

} // namespace backends
} // namespace lumen_gfx
