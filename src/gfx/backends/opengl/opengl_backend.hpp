/// @file opengl_backend.hpp
/// @brief OpenGL 3.3 core backend
///
/// - Entry points beyond GL 1.1 are loaded via wglGetProcAddress/glXGetProcAddress
/// - One vertex array object is created at init and stays bound
/// - Resource operations restore any binding they touch, so the state cache
///   mirror stays exact
#pragma once

#include <lumen/gfx/backend.hpp>
#include <unordered_map>
#include <unordered_set>

// Platform detection
#ifdef _WIN32
    #define LUMEN_PLATFORM_WINDOWS 1
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <Windows.h>
    #include <GL/gl.h>
    #include <GL/glext.h>
#elif defined(__linux__)
    #define LUMEN_PLATFORM_LINUX 1
    #include <GL/gl.h>
    #include <GL/glext.h>
    #include <GL/glx.h>
#endif

namespace lumen_gfx {
namespace backends {

// =============================================================================
// OpenGL Backend Class
// =============================================================================

class OpenGLBackend : public IGfxBackend {
public:
    OpenGLBackend() = default;
    ~OpenGLBackend() override { shutdown(); }

    OpenGLBackend(const OpenGLBackend&) = delete;
    OpenGLBackend& operator=(const OpenGLBackend&) = delete;

    /// Load entry points and query limits; needs a current context
    lumen_core::Result<void> init();
    void shutdown();

    [[nodiscard]] bool is_initialized() const noexcept { return m_initialized; }

    // IGfxBackend interface
    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::OpenGL; }
    [[nodiscard]] const BackendLimits& limits() const noexcept override { return m_limits; }

    [[nodiscard]] lumen_core::Result<BackendId> create_buffer(
        BufferKind kind, BufferUsage usage, std::size_t size, const void* data) override;
    void reallocate_buffer(BackendId id, BufferKind kind, BufferUsage usage,
                           std::size_t size, const void* data) override;
    void write_buffer(BackendId id, BufferKind kind, std::size_t offset,
                      const void* data, std::size_t size) override;
    void destroy_buffer(BackendId id) override;

    [[nodiscard]] lumen_core::Result<BackendId> create_texture(
        const TextureDesc& desc, const void* data, std::size_t size) override;
    void set_texture_sampling(BackendId id, TextureType type,
                              const FilterSettings& filter, const WrapSettings& wrap) override;
    void destroy_texture(BackendId id) override;

    [[nodiscard]] lumen_core::Result<CompiledProgram> compile_program(const ShaderSource& source) override;
    void destroy_program(BackendId id) override;

    [[nodiscard]] lumen_core::Result<BackendId> create_framebuffer(
        BackendId color, std::optional<BackendId> depth, bool depth_has_stencil) override;
    [[nodiscard]] FramebufferStatus framebuffer_status(BackendId id) override;
    void destroy_framebuffer(BackendId id) override;

    void use_program(BackendId id) override;
    void set_active_texture_unit(std::uint32_t unit) override;
    void bind_texture(TextureType type, BackendId id) override;
    void bind_buffer(BufferKind kind, BackendId id) override;
    void bind_framebuffer(BackendId id) override;
    void set_blend(const BlendState& state) override;
    void set_depth(const DepthState& state) override;
    void set_stencil(const StencilState& state) override;
    void set_viewport(const Rect& rect) override;
    void set_scissor(const ScissorState& state) override;
    void set_culling(const CullingState& state) override;
    void set_vertex_attribute_enabled(std::uint32_t location, bool enabled) override;

    void set_vertex_attribute(std::uint32_t location, const VertexFormat& format,
                              std::uint32_t stride, std::uint32_t step) override;
    void upload_uniform(std::int32_t location, const UniformValue& value) override;
    void clear(const std::optional<Color>& color, std::optional<float> depth,
               std::optional<std::int32_t> stencil) override;
    void draw_arrays(DrawMode mode, std::uint32_t first, std::uint32_t count,
                     std::uint32_t instances) override;
    void draw_elements(DrawMode mode, IndexType type, std::uint32_t first,
                       std::uint32_t count, std::uint32_t instances) override;

    void push_debug_group(const std::string& name) override;
    void pop_debug_group() override;

private:
    bool m_initialized = false;
    BackendLimits m_limits;
    GLuint m_vertex_array = 0;

    // Live objects, released at shutdown if the owner leaked them
    std::unordered_map<BackendId, GLenum> m_buffers;   // id -> target
    std::unordered_map<BackendId, GLenum> m_textures;  // id -> target
    std::unordered_set<BackendId> m_programs;
    std::unordered_set<BackendId> m_framebuffers;

    // GL function pointers
    PFNGLGENBUFFERSPROC glGenBuffers_ptr = nullptr;
    PFNGLBINDBUFFERPROC glBindBuffer_ptr = nullptr;
    PFNGLBUFFERDATAPROC glBufferData_ptr = nullptr;
    PFNGLBUFFERSUBDATAPROC glBufferSubData_ptr = nullptr;
    PFNGLDELETEBUFFERSPROC glDeleteBuffers_ptr = nullptr;
    PFNGLACTIVETEXTUREPROC glActiveTexture_ptr = nullptr;
    PFNGLTEXIMAGE3DPROC glTexImage3D_ptr = nullptr;
    PFNGLGENERATEMIPMAPPROC glGenerateMipmap_ptr = nullptr;
    PFNGLCREATESHADERPROC glCreateShader_ptr = nullptr;
    PFNGLSHADERSOURCEPROC glShaderSource_ptr = nullptr;
    PFNGLCOMPILESHADERPROC glCompileShader_ptr = nullptr;
    PFNGLGETSHADERIVPROC glGetShaderiv_ptr = nullptr;
    PFNGLGETSHADERINFOLOGPROC glGetShaderInfoLog_ptr = nullptr;
    PFNGLDELETESHADERPROC glDeleteShader_ptr = nullptr;
    PFNGLCREATEPROGRAMPROC glCreateProgram_ptr = nullptr;
    PFNGLATTACHSHADERPROC glAttachShader_ptr = nullptr;
    PFNGLDETACHSHADERPROC glDetachShader_ptr = nullptr;
    PFNGLLINKPROGRAMPROC glLinkProgram_ptr = nullptr;
    PFNGLGETPROGRAMIVPROC glGetProgramiv_ptr = nullptr;
    PFNGLGETPROGRAMINFOLOGPROC glGetProgramInfoLog_ptr = nullptr;
    PFNGLDELETEPROGRAMPROC glDeleteProgram_ptr = nullptr;
    PFNGLUSEPROGRAMPROC glUseProgram_ptr = nullptr;
    PFNGLGETACTIVEATTRIBPROC glGetActiveAttrib_ptr = nullptr;
    PFNGLGETATTRIBLOCATIONPROC glGetAttribLocation_ptr = nullptr;
    PFNGLGETACTIVEUNIFORMPROC glGetActiveUniform_ptr = nullptr;
    PFNGLGETUNIFORMLOCATIONPROC glGetUniformLocation_ptr = nullptr;
    PFNGLUNIFORM1IPROC glUniform1i_ptr = nullptr;
    PFNGLUNIFORM1FPROC glUniform1f_ptr = nullptr;
    PFNGLUNIFORM2FVPROC glUniform2fv_ptr = nullptr;
    PFNGLUNIFORM3FVPROC glUniform3fv_ptr = nullptr;
    PFNGLUNIFORM4FVPROC glUniform4fv_ptr = nullptr;
    PFNGLUNIFORM2IVPROC glUniform2iv_ptr = nullptr;
    PFNGLUNIFORM3IVPROC glUniform3iv_ptr = nullptr;
    PFNGLUNIFORM4IVPROC glUniform4iv_ptr = nullptr;
    PFNGLUNIFORMMATRIX2FVPROC glUniformMatrix2fv_ptr = nullptr;
    PFNGLUNIFORMMATRIX3FVPROC glUniformMatrix3fv_ptr = nullptr;
    PFNGLUNIFORMMATRIX4FVPROC glUniformMatrix4fv_ptr = nullptr;
    PFNGLGENFRAMEBUFFERSPROC glGenFramebuffers_ptr = nullptr;
    PFNGLBINDFRAMEBUFFERPROC glBindFramebuffer_ptr = nullptr;
    PFNGLFRAMEBUFFERTEXTURE2DPROC glFramebufferTexture2D_ptr = nullptr;
    PFNGLCHECKFRAMEBUFFERSTATUSPROC glCheckFramebufferStatus_ptr = nullptr;
    PFNGLDELETEFRAMEBUFFERSPROC glDeleteFramebuffers_ptr = nullptr;
    PFNGLGENVERTEXARRAYSPROC glGenVertexArrays_ptr = nullptr;
    PFNGLBINDVERTEXARRAYPROC glBindVertexArray_ptr = nullptr;
    PFNGLDELETEVERTEXARRAYSPROC glDeleteVertexArrays_ptr = nullptr;
    PFNGLENABLEVERTEXATTRIBARRAYPROC glEnableVertexAttribArray_ptr = nullptr;
    PFNGLDISABLEVERTEXATTRIBARRAYPROC glDisableVertexAttribArray_ptr = nullptr;
    PFNGLVERTEXATTRIBPOINTERPROC glVertexAttribPointer_ptr = nullptr;
    PFNGLVERTEXATTRIBIPOINTERPROC glVertexAttribIPointer_ptr = nullptr;
    PFNGLVERTEXATTRIBDIVISORPROC glVertexAttribDivisor_ptr = nullptr;
    PFNGLDRAWARRAYSINSTANCEDPROC glDrawArraysInstanced_ptr = nullptr;
    PFNGLDRAWELEMENTSINSTANCEDPROC glDrawElementsInstanced_ptr = nullptr;
    PFNGLBLENDFUNCSEPARATEPROC glBlendFuncSeparate_ptr = nullptr;
    PFNGLBLENDEQUATIONSEPARATEPROC glBlendEquationSeparate_ptr = nullptr;
    PFNGLBLENDCOLORPROC glBlendColor_ptr = nullptr;
    PFNGLPUSHDEBUGGROUPPROC glPushDebugGroup_ptr = nullptr;  // optional (GL 4.3 / KHR_debug)
    PFNGLPOPDEBUGGROUPPROC glPopDebugGroup_ptr = nullptr;

    // Internal helper methods
    bool load_gl_functions();
    void query_limits();
    [[nodiscard]] lumen_core::Result<GLuint> compile_stage(GLenum stage, const char* stage_name,
                                                           const std::string& source);
    void reflect_program(GLuint program, CompiledProgram& out);
    static GLenum texture_format_to_gl_internal(TextureFormat format);
    static GLenum texture_format_to_gl_format(TextureFormat format);
    static GLenum texture_format_to_gl_type(TextureFormat format);
};

/// Create and initialize the OpenGL backend (NotSupported without a usable context)
[[nodiscard]] lumen_core::Result<std::unique_ptr<IGfxBackend>> create_opengl_backend();

} // namespace backends
} // namespace lumen_gfx
