/// @file mapped_mesh.cpp
/// @brief Mapped vertex and indexed meshes

#include <lumen/gfx/mapped_mesh.hpp>
#include <lumen/gfx/registry.hpp>
#include <string>

namespace lumen_gfx {

using lumen_core::Err;
using lumen_core::Error;
using lumen_core::ErrorCode;
using lumen_core::GraphicsError;
using lumen_core::Ok;
using lumen_core::Result;

// =============================================================================
// MappedVertexMesh
// =============================================================================

Result<MappedVertexMesh> MappedVertexMesh::create(ResourceRegistry& registry, std::vector<VertexFormat> formats,
                                                  std::uint32_t stride, std::uint32_t capacity, DrawMode mode) {
    if (stride == 0 || capacity == 0) {
        return Err<MappedVertexMesh>(GraphicsError::invalid_dimensions("mapped vertex mesh", stride, capacity));
    }
    auto buffer = registry.create_buffer(static_cast<std::size_t>(stride) * capacity, BufferKind::Vertex,
                                         BufferUsage::Dynamic);
    if (!buffer) {
        return Err<MappedVertexMesh>(buffer.error());
    }
    return Ok(MappedVertexMesh(registry, VertexMesh(*buffer, std::move(formats), stride, capacity, mode), stride));
}

Result<void> MappedVertexMesh::set_vertices(std::span<const std::uint8_t> bytes, std::uint32_t first) {
    if (bytes.size() % m_stride != 0) {
        return Err(Error(ErrorCode::InvalidArgument,
            std::to_string(bytes.size()) + " bytes is not a whole number of " +
            std::to_string(m_stride) + "-byte vertices"));
    }
    return m_registry->map_write(buffer(), static_cast<std::size_t>(first) * m_stride, bytes);
}

Result<std::span<const std::uint8_t>> MappedVertexMesh::vertices() const {
    return m_registry->read_buffer(buffer());
}

Result<bool> MappedVertexMesh::unmap() {
    return m_registry->unmap_buffer(buffer());
}

// =============================================================================
// MappedIndexedMesh
// =============================================================================

Result<MappedIndexedMesh> MappedIndexedMesh::create(ResourceRegistry& registry, std::vector<VertexFormat> formats,
                                                    std::uint32_t stride, std::uint32_t vertex_capacity,
                                                    std::uint32_t index_capacity, IndexType type) {
    if (index_capacity == 0) {
        return Err<MappedIndexedMesh>(GraphicsError::invalid_dimensions("mapped index buffer", index_capacity, 1));
    }
    auto vertices = MappedVertexMesh::create(registry, std::move(formats), stride, vertex_capacity);
    if (!vertices) {
        return Err<MappedIndexedMesh>(vertices.error());
    }

    auto indices = registry.create_buffer(static_cast<std::size_t>(index_capacity) * index_type_size(type),
                                          BufferKind::Index, BufferUsage::Dynamic);
    if (!indices) {
        if (auto released = registry.destroy_buffer(vertices->buffer()); !released) {
            return Err<MappedIndexedMesh>(released.error());
        }
        return Err<MappedIndexedMesh>(indices.error());
    }
    return Ok(MappedIndexedMesh(registry, std::move(*vertices), *indices, type, index_capacity));
}

Result<void> MappedIndexedMesh::set_indices(std::span<const std::uint16_t> indices, std::uint32_t first) {
    return write_indices(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(indices.data()), indices.size_bytes()), IndexType::U16, first);
}

Result<void> MappedIndexedMesh::set_indices(std::span<const std::uint32_t> indices, std::uint32_t first) {
    return write_indices(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(indices.data()), indices.size_bytes()), IndexType::U32, first);
}

Result<void> MappedIndexedMesh::write_indices(std::span<const std::uint8_t> bytes, IndexType type, std::uint32_t first) {
    if (type != m_type) {
        return Err(Error(ErrorCode::InvalidArgument,
            std::string("Index buffer holds ") + (m_type == IndexType::U16 ? "u16" : "u32") + " indices"));
    }
    return m_registry->map_write(m_index_buffer, static_cast<std::size_t>(first) * index_type_size(type), bytes);
}

Result<void> MappedIndexedMesh::unmap() {
    if (auto r = m_vertices.unmap(); !r) {
        return Err(r.error());
    }
    if (auto r = m_registry->unmap_buffer(m_index_buffer); !r) {
        return Err(r.error());
    }
    return Ok();
}

void MappedIndexedMesh::set_draw_mode(DrawMode mode) {
    m_vertices.set_draw_mode(mode);
}

void MappedIndexedMesh::set_draw_range(std::optional<DrawRange> range) {
    m_range = range;
}

MeshBinding MappedIndexedMesh::binding() const {
    MeshBinding b = m_vertices.binding();
    b.indices = IndexBinding{m_index_buffer, m_type};
    b.range = draw_range();
    return b;
}

} // namespace lumen_gfx
