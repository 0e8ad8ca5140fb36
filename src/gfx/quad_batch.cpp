/// @file quad_batch.cpp
/// @brief QuadBatch implementation

#include <lumen/gfx/quad_batch.hpp>
#include <string>

namespace lumen_gfx {

using lumen_core::Err;
using lumen_core::Error;
using lumen_core::ErrorCode;
using lumen_core::Ok;
using lumen_core::Result;

Result<QuadBatch> QuadBatch::create(ResourceRegistry& registry, std::vector<VertexFormat> formats,
                                    std::uint32_t stride, std::uint32_t capacity) {
    if (capacity == 0 || capacity > MAX_QUADS) {
        return Err<QuadBatch>(Error(ErrorCode::OutOfRange,
            "Quad batch capacity " + std::to_string(capacity) + " outside [1, " + std::to_string(MAX_QUADS) + "]"));
    }

    auto mesh = MappedIndexedMesh::create(registry, std::move(formats), stride, capacity * 4, capacity * 6,
                                          IndexType::U16);
    if (!mesh) {
        return Err<QuadBatch>(mesh.error());
    }

    std::vector<std::uint16_t> indices;
    indices.reserve(static_cast<std::size_t>(capacity) * QUAD_INDICES.size());
    for (std::uint32_t quad = 0; quad < capacity; ++quad) {
        const auto first = static_cast<std::uint16_t>(quad * 4);
        for (std::uint16_t offset : QUAD_INDICES) {
            indices.push_back(static_cast<std::uint16_t>(first + offset));
        }
    }
    if (auto r = mesh->set_indices(std::span<const std::uint16_t>(indices), 0); !r) {
        return Err<QuadBatch>(r.error());
    }
    if (auto r = mesh->unmap(); !r) {
        return Err<QuadBatch>(r.error());
    }
    return Ok(QuadBatch(std::move(*mesh), capacity));
}

QuadBatch::QuadBatch(MappedIndexedMesh mesh, std::uint32_t capacity)
    : m_mesh(std::move(mesh))
    , m_capacity(capacity)
{
    m_mesh.set_draw_range(DrawRange{0, 0});
}

Result<void> QuadBatch::check_quad(std::span<const std::uint8_t> quad) const {
    const std::size_t expected = static_cast<std::size_t>(m_mesh.stride()) * 4;
    if (quad.size() != expected) {
        return Err(Error(ErrorCode::InvalidArgument,
            "Quad holds " + std::to_string(quad.size()) + " bytes, expected " + std::to_string(expected)));
    }
    return Ok();
}

Result<std::uint32_t> QuadBatch::push(std::span<const std::uint8_t> quad) {
    if (is_full()) {
        return Err<std::uint32_t>(Error(ErrorCode::OutOfRange,
            "Quad batch is full (" + std::to_string(m_capacity) + " quads)"));
    }
    if (auto r = check_quad(quad); !r) {
        return Err<std::uint32_t>(r.error());
    }
    if (auto r = m_mesh.set_vertices(quad, m_count * 4); !r) {
        return Err<std::uint32_t>(r.error());
    }

    const std::uint32_t index = m_count++;
    m_mesh.set_draw_range(DrawRange{0, m_count * 6});
    return Ok(index);
}

Result<void> QuadBatch::insert(std::uint32_t index, std::span<const std::uint8_t> quad) {
    if (index >= m_count) {
        return Err(Error(ErrorCode::OutOfRange,
            "Quad " + std::to_string(index) + " not in batch of " + std::to_string(m_count)));
    }
    if (auto r = check_quad(quad); !r) {
        return r;
    }
    return m_mesh.set_vertices(quad, index * 4);
}

Result<std::span<const std::uint8_t>> QuadBatch::quad(std::uint32_t index) const {
    if (index >= m_count) {
        return Err<std::span<const std::uint8_t>>(Error(ErrorCode::OutOfRange,
            "Quad " + std::to_string(index) + " not in batch of " + std::to_string(m_count)));
    }
    auto vertices = m_mesh.vertices();
    if (!vertices) {
        return vertices;
    }
    const std::size_t quad_bytes = static_cast<std::size_t>(m_mesh.stride()) * 4;
    return Ok(vertices->subspan(static_cast<std::size_t>(index) * quad_bytes, quad_bytes));
}

void QuadBatch::clear() {
    m_count = 0;
    m_mesh.set_draw_range(DrawRange{0, 0});
}

} // namespace lumen_gfx
