#pragma once

/// @file mapped_mesh.hpp
/// @brief Meshes whose CPU writes are batched into one upload per unmap
///
/// Writes land in the registry's CPU copy of the buffer and widen its
/// modified range. unmap() (or the next DrawList flush that references the
/// buffer) sends that range to the backend in a single write. The registry
/// must outlive every mapped mesh created from it.

#include "fwd.hpp"
#include "mesh.hpp"
#include <lumen/core/error.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace lumen_gfx {

// =============================================================================
// MappedVertexMesh
// =============================================================================

class MappedVertexMesh final : public Mesh {
public:
    /// Dynamic vertex buffer with room for `capacity` vertices of `stride` bytes
    [[nodiscard]] static lumen_core::Result<MappedVertexMesh> create(
        ResourceRegistry& registry, std::vector<VertexFormat> formats, std::uint32_t stride,
        std::uint32_t capacity, DrawMode mode = DrawMode::Triangles);

    /// Whole vertices starting at vertex `first`
    [[nodiscard]] lumen_core::Result<void> set_vertices(std::span<const std::uint8_t> bytes, std::uint32_t first);

    template<typename V>
    [[nodiscard]] lumen_core::Result<void> set_vertices(std::span<const V> vertices, std::uint32_t first) {
        return set_vertices(std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(vertices.data()), vertices.size_bytes()), first);
    }

    /// CPU copy, including writes not yet uploaded
    [[nodiscard]] lumen_core::Result<std::span<const std::uint8_t>> vertices() const;

    /// Ok(false) when nothing was pending
    [[nodiscard]] lumen_core::Result<bool> unmap();

    void set_draw_mode(DrawMode mode) { m_mesh.set_draw_mode(mode); }
    void set_draw_range(std::optional<DrawRange> range) { m_mesh.set_draw_range(range); }

    [[nodiscard]] std::uint32_t capacity() const noexcept { return m_mesh.vertex_count(); }
    [[nodiscard]] std::uint32_t stride() const noexcept { return m_stride; }
    [[nodiscard]] ResourceKey buffer() const noexcept { return m_mesh.buffer(); }
    [[nodiscard]] const VertexMesh& inner() const noexcept { return m_mesh; }

    [[nodiscard]] std::vector<AttachedAttributes> attachments() const override { return m_mesh.attachments(); }
    [[nodiscard]] MeshBinding binding() const override { return m_mesh.binding(); }

private:
    MappedVertexMesh(ResourceRegistry& registry, VertexMesh mesh, std::uint32_t stride)
        : m_registry(&registry), m_mesh(std::move(mesh)), m_stride(stride) {}

    ResourceRegistry* m_registry;
    VertexMesh m_mesh;
    std::uint32_t m_stride;
};

// =============================================================================
// MappedIndexedMesh
// =============================================================================

class MappedIndexedMesh final : public Mesh {
public:
    [[nodiscard]] static lumen_core::Result<MappedIndexedMesh> create(
        ResourceRegistry& registry, std::vector<VertexFormat> formats, std::uint32_t stride,
        std::uint32_t vertex_capacity, std::uint32_t index_capacity, IndexType type = IndexType::U16);

    [[nodiscard]] lumen_core::Result<void> set_vertices(std::span<const std::uint8_t> bytes, std::uint32_t first) {
        return m_vertices.set_vertices(bytes, first);
    }

    template<typename V>
    [[nodiscard]] lumen_core::Result<void> set_vertices(std::span<const V> vertices, std::uint32_t first) {
        return m_vertices.set_vertices(vertices, first);
    }

    /// InvalidArgument unless the mesh was created with IndexType::U16
    [[nodiscard]] lumen_core::Result<void> set_indices(std::span<const std::uint16_t> indices, std::uint32_t first);
    /// InvalidArgument unless the mesh was created with IndexType::U32
    [[nodiscard]] lumen_core::Result<void> set_indices(std::span<const std::uint32_t> indices, std::uint32_t first);

    [[nodiscard]] lumen_core::Result<std::span<const std::uint8_t>> vertices() const { return m_vertices.vertices(); }

    /// Uploads pending vertex and index ranges
    [[nodiscard]] lumen_core::Result<void> unmap();

    void set_draw_mode(DrawMode mode);
    /// Indices to draw; nullopt draws every index
    void set_draw_range(std::optional<DrawRange> range);
    [[nodiscard]] DrawRange draw_range() const noexcept { return m_range.value_or(DrawRange{0, m_index_capacity}); }

    [[nodiscard]] std::uint32_t vertex_capacity() const noexcept { return m_vertices.capacity(); }
    [[nodiscard]] std::uint32_t index_capacity() const noexcept { return m_index_capacity; }
    [[nodiscard]] std::uint32_t stride() const noexcept { return m_vertices.stride(); }
    [[nodiscard]] ResourceKey vertex_buffer() const noexcept { return m_vertices.buffer(); }
    [[nodiscard]] ResourceKey index_buffer() const noexcept { return m_index_buffer; }

    [[nodiscard]] std::vector<AttachedAttributes> attachments() const override { return m_vertices.attachments(); }
    [[nodiscard]] MeshBinding binding() const override;

private:
    MappedIndexedMesh(ResourceRegistry& registry, MappedVertexMesh vertices, ResourceKey index_buffer,
                      IndexType type, std::uint32_t index_capacity)
        : m_registry(&registry), m_vertices(std::move(vertices)), m_index_buffer(index_buffer)
        , m_type(type), m_index_capacity(index_capacity) {}

    [[nodiscard]] lumen_core::Result<void> write_indices(std::span<const std::uint8_t> bytes, IndexType type,
                                                         std::uint32_t first);

    ResourceRegistry* m_registry;
    MappedVertexMesh m_vertices;
    ResourceKey m_index_buffer;
    IndexType m_type;
    std::uint32_t m_index_capacity;
    std::optional<DrawRange> m_range;
};

} // namespace lumen_gfx
