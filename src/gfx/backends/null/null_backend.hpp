/// @file null_backend.hpp
/// @brief Headless backend that records every call
///
/// USE CASES:
/// - Headless operation (CI, tools, batch processing)
/// - Testing the registry, state cache and draw list without a GPU
/// - Fallback when no OpenGL context is available
///
/// Programs are "compiled" by scanning GLSL global declarations: vertex stage
/// `in` / `attribute` declarations become attributes, `uniform` declarations
/// of both stages become uniforms (arrays expand to one entry per element).
#pragma once

#include <lumen/gfx/backend.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace lumen_gfx {
namespace backends {

/// Kind of a recorded backend call
enum class NullCall : std::uint8_t {
    CreateBuffer,
    ReallocateBuffer,
    WriteBuffer,
    DestroyBuffer,
    CreateTexture,
    SetTextureSampling,
    DestroyTexture,
    CompileProgram,
    DestroyProgram,
    CreateFramebuffer,
    DestroyFramebuffer,
    UseProgram,
    SetActiveTextureUnit,
    BindTexture,
    BindBuffer,
    BindFramebuffer,
    SetBlend,
    SetDepth,
    SetStencil,
    SetViewport,
    SetScissor,
    SetCulling,
    SetAttributeEnabled,
    SetVertexAttribute,
    UploadUniform,
    Clear,
    DrawArrays,
    DrawElements,
    PushDebugGroup,
    PopDebugGroup
};

[[nodiscard]] const char* null_call_name(NullCall call) noexcept;

/// One recorded call. `id` is the backend object involved (or 0), `arg` a
/// call-specific integer (unit, location, count, enabled flag).
struct NullCallRecord {
    NullCall call;
    BackendId id = NULL_BACKEND_ID;
    std::int64_t arg = 0;
    std::string detail;
};

class NullBackend : public IGfxBackend {
public:
    NullBackend() = default;
    explicit NullBackend(const BackendLimits& limits) : m_limits(limits) {}
    ~NullBackend() override = default;

    // IGfxBackend interface
    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Null; }
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

    // Inspection
    [[nodiscard]] const std::vector<NullCallRecord>& calls() const noexcept { return m_calls; }
    [[nodiscard]] std::size_t count(NullCall call) const;
    [[nodiscard]] std::vector<NullCallRecord> calls_of(NullCall call) const;
    void clear_calls() { m_calls.clear(); }

    /// Backend-side copy of a buffer (nullptr if not live)
    [[nodiscard]] const std::vector<std::uint8_t>* buffer_data(BackendId id) const;
    [[nodiscard]] const TextureDesc* texture_desc(BackendId id) const;
    [[nodiscard]] std::size_t live_buffers() const noexcept { return m_buffers.size(); }
    [[nodiscard]] std::size_t live_textures() const noexcept { return m_textures.size(); }
    [[nodiscard]] std::size_t live_programs() const noexcept { return m_programs.size(); }
    [[nodiscard]] std::size_t live_framebuffers() const noexcept { return m_framebuffers.size(); }
    [[nodiscard]] std::size_t debug_group_depth() const noexcept { return m_debug_groups.size(); }

    // Fault injection
    /// Status reported for framebuffers created from now on
    void set_framebuffer_status(FramebufferStatus status) { m_framebuffer_status = status; }
    /// Make every create_* call fail with ResourceCreationFailed
    void set_fail_allocations(bool fail) { m_fail_allocations = fail; }

private:
    struct TextureEntry {
        TextureDesc desc;
        std::vector<std::uint8_t> pixels;
    };

    struct FramebufferEntry {
        BackendId color = NULL_BACKEND_ID;
        std::optional<BackendId> depth;
        FramebufferStatus status = FramebufferStatus::Complete;
    };

    void record(NullCall call, BackendId id = NULL_BACKEND_ID, std::int64_t arg = 0, std::string detail = {});

    BackendLimits m_limits;
    BackendId m_next_id = 0;
    std::vector<NullCallRecord> m_calls;

    // CPU-side storage
    std::unordered_map<BackendId, std::vector<std::uint8_t>> m_buffers;
    std::unordered_map<BackendId, TextureEntry> m_textures;
    std::unordered_map<BackendId, CompiledProgram> m_programs;
    std::unordered_map<BackendId, FramebufferEntry> m_framebuffers;
    std::vector<std::string> m_debug_groups;

    FramebufferStatus m_framebuffer_status = FramebufferStatus::Complete;
    bool m_fail_allocations = false;
};

/// Factory function to create the null backend
[[nodiscard]] std::unique_ptr<IGfxBackend> create_null_backend();

/// Parse GLSL global declarations of one program into reflection data
[[nodiscard]] lumen_core::Result<CompiledProgram> reflect_glsl(const ShaderSource& source);

} // namespace backends
} // namespace lumen_gfx
