#pragma once

/// @file backend.hpp
/// @brief Immediate-mode graphics backend interface for lumen_gfx
///
/// The backend executes concrete resource, state and draw calls. It keeps no
/// binding state of its own that callers rely on: StateCache is the only
/// caller of the state-setting methods and mirrors everything they change.
///
/// Implementations:
/// - NullBackend: headless, records every call (testing, CI, tools)
/// - OpenGLBackend: OpenGL 3.3 core, requires a current context

#include "fwd.hpp"
#include "types.hpp"
#include "resource.hpp"
#include "pipeline.hpp"
#include "program.hpp"
#include "mesh.hpp"
#include <lumen/core/error.hpp>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace lumen_gfx {

// =============================================================================
// Backend Kind & Limits
// =============================================================================

enum class BackendKind : std::uint8_t {
    Null,
    OpenGL
};

[[nodiscard]] inline const char* backend_kind_name(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::Null: return "null";
        case BackendKind::OpenGL: return "opengl";
        default: return "unknown";
    }
}

struct BackendLimits {
    std::uint32_t max_texture_units = 16;
    std::uint32_t max_vertex_attributes = 16;
    std::uint32_t max_texture_size = 16384;
};

// =============================================================================
// IGfxBackend
// =============================================================================

class IGfxBackend {
public:
    virtual ~IGfxBackend() = default;

    [[nodiscard]] virtual BackendKind kind() const noexcept = 0;
    [[nodiscard]] virtual const BackendLimits& limits() const noexcept = 0;

    // Buffers
    [[nodiscard]] virtual lumen_core::Result<BackendId> create_buffer(
        BufferKind kind, BufferUsage usage, std::size_t size, const void* data) = 0;
    /// Replace storage with `size` bytes taken from `data`
    virtual void reallocate_buffer(BackendId id, BufferKind kind, BufferUsage usage,
                                   std::size_t size, const void* data) = 0;
    virtual void write_buffer(BackendId id, BufferKind kind, std::size_t offset,
                              const void* data, std::size_t size) = 0;
    virtual void destroy_buffer(BackendId id) = 0;

    // Textures
    [[nodiscard]] virtual lumen_core::Result<BackendId> create_texture(
        const TextureDesc& desc, const void* data, std::size_t size) = 0;
    virtual void set_texture_sampling(BackendId id, TextureType type,
                                      const FilterSettings& filter, const WrapSettings& wrap) = 0;
    virtual void destroy_texture(BackendId id) = 0;

    // Programs (compiled-program provider)
    [[nodiscard]] virtual lumen_core::Result<CompiledProgram> compile_program(const ShaderSource& source) = 0;
    virtual void destroy_program(BackendId id) = 0;

    // Framebuffers
    [[nodiscard]] virtual lumen_core::Result<BackendId> create_framebuffer(
        BackendId color, std::optional<BackendId> depth, bool depth_has_stencil) = 0;
    [[nodiscard]] virtual FramebufferStatus framebuffer_status(BackendId id) = 0;
    virtual void destroy_framebuffer(BackendId id) = 0;

    // Binding state (issued by StateCache only)
    virtual void use_program(BackendId id) = 0;
    virtual void set_active_texture_unit(std::uint32_t unit) = 0;
    virtual void bind_texture(TextureType type, BackendId id) = 0;
    virtual void bind_buffer(BufferKind kind, BackendId id) = 0;
    virtual void bind_framebuffer(BackendId id) = 0;
    virtual void set_blend(const BlendState& state) = 0;
    virtual void set_depth(const DepthState& state) = 0;
    virtual void set_stencil(const StencilState& state) = 0;
    virtual void set_viewport(const Rect& rect) = 0;
    virtual void set_scissor(const ScissorState& state) = 0;
    virtual void set_culling(const CullingState& state) = 0;
    virtual void set_vertex_attribute_enabled(std::uint32_t location, bool enabled) = 0;

    // Draw submission (issued by DrawList)
    /// Point `location` at the bound vertex buffer
    virtual void set_vertex_attribute(std::uint32_t location, const VertexFormat& format,
                                      std::uint32_t stride, std::uint32_t step) = 0;
    /// Upload to the bound program
    virtual void upload_uniform(std::int32_t location, const UniformValue& value) = 0;
    virtual void clear(const std::optional<Color>& color, std::optional<float> depth,
                       std::optional<std::int32_t> stencil) = 0;
    virtual void draw_arrays(DrawMode mode, std::uint32_t first, std::uint32_t count,
                             std::uint32_t instances) = 0;
    virtual void draw_elements(DrawMode mode, IndexType type, std::uint32_t first,
                               std::uint32_t count, std::uint32_t instances) = 0;

    // Debug annotation
    virtual void push_debug_group(const std::string& name) = 0;
    virtual void pop_debug_group() = 0;
};

/// Create a backend by kind. OpenGL requires a current context on this thread
/// and fails with NotSupported when its entry points cannot be loaded.
[[nodiscard]] lumen_core::Result<std::unique_ptr<IGfxBackend>> create_backend(BackendKind kind);

/// Parse "null" / "opengl"
[[nodiscard]] std::optional<BackendKind> parse_backend_kind(const std::string& name);

// =============================================================================
// ScopedDebugGroup
// =============================================================================

/// Pushes a named debug group for the lifetime of the scope
class ScopedDebugGroup {
public:
    ScopedDebugGroup(IGfxBackend& backend, const std::string& name) : m_backend(backend) {
        m_backend.push_debug_group(name);
    }

    ~ScopedDebugGroup() { m_backend.pop_debug_group(); }

    ScopedDebugGroup(const ScopedDebugGroup&) = delete;
    ScopedDebugGroup& operator=(const ScopedDebugGroup&) = delete;

private:
    IGfxBackend& m_backend;
};

} // namespace lumen_gfx
