/// @file mesh.cpp
/// @brief Mesh capability implementations

#include <lumen/gfx/mesh.hpp>
#include <algorithm>

namespace lumen_gfx {

// =============================================================================
// MeshBinding
// =============================================================================

std::vector<std::pair<ResourceKey, std::size_t>> MeshBinding::buffer_extents(std::size_t indexed_vertices) const {
    std::vector<std::pair<ResourceKey, std::size_t>> extents;
    const std::size_t end = static_cast<std::size_t>(range.first) + range.count;

    for (const auto& attachment : attachments) {
        std::size_t elements = 0;
        if (attachment.step > 0) {
            elements = (static_cast<std::size_t>(instance_count) + attachment.step - 1) / attachment.step;
        } else {
            elements = indices ? indexed_vertices : end;
        }
        if (elements == 0 || attachment.formats.empty()) {
            continue;
        }

        std::size_t last_attr_end = 0;
        for (const auto& format : attachment.formats) {
            last_attr_end = std::max(last_attr_end, format.offset + format.byte_size());
        }
        extents.emplace_back(attachment.buffer, (elements - 1) * attachment.stride + last_attr_end);
    }

    if (indices && end > 0) {
        extents.emplace_back(indices->buffer, end * index_type_size(indices->type));
    }
    return extents;
}

std::vector<ResourceKey> MeshBinding::referenced_keys() const {
    std::vector<ResourceKey> keys;
    keys.reserve(attachments.size() + 1);
    for (const auto& attachment : attachments) {
        keys.push_back(attachment.buffer);
    }
    if (indices) {
        keys.push_back(indices->buffer);
    }
    return keys;
}

// =============================================================================
// VertexMesh
// =============================================================================

VertexMesh::VertexMesh(ResourceKey buffer, std::vector<VertexFormat> formats, std::uint32_t stride,
                       std::uint32_t vertex_count, DrawMode mode)
    : m_attributes{buffer, std::move(formats), stride, 0}
    , m_vertex_count(vertex_count)
    , m_mode(mode)
{
}

std::vector<AttachedAttributes> VertexMesh::attachments() const {
    return {m_attributes};
}

MeshBinding VertexMesh::binding() const {
    MeshBinding b;
    b.attachments.push_back(m_attributes);
    b.mode = m_mode;
    b.range = m_range.value_or(DrawRange{0, m_vertex_count});
    return b;
}

// =============================================================================
// IndexedMesh
// =============================================================================

IndexedMesh::IndexedMesh(VertexMesh vertices, ResourceKey index_buffer, IndexType type, std::uint32_t index_count)
    : m_vertices(std::move(vertices))
    , m_indices{index_buffer, type}
    , m_index_count(index_count)
{
}

std::vector<AttachedAttributes> IndexedMesh::attachments() const {
    return m_vertices.attachments();
}

MeshBinding IndexedMesh::binding() const {
    MeshBinding b = m_vertices.binding();
    b.indices = m_indices;
    b.range = m_range.value_or(DrawRange{0, m_index_count});
    return b;
}

// =============================================================================
// MultiMesh
// =============================================================================

MultiMesh::MultiMesh(const Mesh& base, std::uint32_t instance_count)
    : m_base(base.binding())
    , m_instance_count(instance_count)
{
}

MultiMesh& MultiMesh::attach(AttachedAttributes instance_data) {
    if (instance_data.step == 0) {
        instance_data.step = 1;
    }
    m_instanced.push_back(std::move(instance_data));
    return *this;
}

std::vector<AttachedAttributes> MultiMesh::attachments() const {
    std::vector<AttachedAttributes> out = m_base.attachments;
    out.insert(out.end(), m_instanced.begin(), m_instanced.end());
    return out;
}

MeshBinding MultiMesh::binding() const {
    MeshBinding b = m_base;
    b.attachments = attachments();
    b.instance_count = m_instance_count;
    return b;
}

} // namespace lumen_gfx
