#pragma once

/// @file mesh.hpp
/// @brief Mesh capability: vertex layouts bound to registry buffers

#include "fwd.hpp"
#include "types.hpp"
#include "resource.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lumen_gfx {

// =============================================================================
// Vertex Layout
// =============================================================================

enum class AttributeComponent : std::uint8_t {
    Float,
    Int,
    UInt,
    Byte,
    UByte,
    Short,
    UShort
};

[[nodiscard]] constexpr std::size_t attribute_component_size(AttributeComponent c) noexcept {
    switch (c) {
        case AttributeComponent::Byte:
        case AttributeComponent::UByte:
            return 1;
        case AttributeComponent::Short:
        case AttributeComponent::UShort:
            return 2;
        default:
            return 4;
    }
}

/// One named attribute inside an interleaved vertex
struct VertexFormat {
    std::string name;
    std::uint32_t offset = 0;
    AttributeComponent component = AttributeComponent::Float;
    std::uint8_t components = 4;
    bool normalized = false;

    [[nodiscard]] static VertexFormat floats(std::string attr_name, std::uint32_t byte_offset, std::uint8_t count) {
        return VertexFormat{std::move(attr_name), byte_offset, AttributeComponent::Float, count, false};
    }

    /// Four normalized unsigned bytes (packed color)
    [[nodiscard]] static VertexFormat rgba8(std::string attr_name, std::uint32_t byte_offset) {
        return VertexFormat{std::move(attr_name), byte_offset, AttributeComponent::UByte, 4, true};
    }

    [[nodiscard]] std::size_t byte_size() const noexcept {
        return attribute_component_size(component) * components;
    }

    bool operator==(const VertexFormat&) const = default;
};

/// A buffer plus the layout of the attributes it feeds.
/// step 0 advances per vertex; step N advances once every N instances.
struct AttachedAttributes {
    ResourceKey buffer = ResourceKey::null(ResourceKind::Buffer);
    std::vector<VertexFormat> formats;
    std::uint32_t stride = 0;
    std::uint32_t step = 0;

    bool operator==(const AttachedAttributes&) const = default;
};

struct IndexBinding {
    ResourceKey buffer = ResourceKey::null(ResourceKind::Buffer);
    IndexType type = IndexType::U16;

    bool operator==(const IndexBinding&) const = default;
};

/// Vertices (or indices, for indexed meshes) to draw
struct DrawRange {
    std::uint32_t first = 0;
    std::uint32_t count = 0;

    bool operator==(const DrawRange&) const = default;
};

/// Everything needed to bind and draw a mesh, captured by value
struct MeshBinding {
    std::vector<AttachedAttributes> attachments;
    std::optional<IndexBinding> indices;
    DrawMode mode = DrawMode::Triangles;
    DrawRange range;
    std::uint32_t instance_count = 1;

    /// Bytes each referenced buffer must hold for this draw to stay in bounds.
    /// Per-vertex buffers of an indexed draw are bounded by `indexed_vertices`
    /// (highest index read plus one); 0 leaves them out.
    [[nodiscard]] std::vector<std::pair<ResourceKey, std::size_t>> buffer_extents(
        std::size_t indexed_vertices = 0) const;

    /// Every registry key the binding references
    [[nodiscard]] std::vector<ResourceKey> referenced_keys() const;

    bool operator==(const MeshBinding&) const = default;
};

// =============================================================================
// Mesh Capability
// =============================================================================

/// Geometry that can be bound for drawing. Does not own its buffers.
class Mesh {
public:
    virtual ~Mesh() = default;

    [[nodiscard]] virtual std::vector<AttachedAttributes> attachments() const = 0;
    [[nodiscard]] virtual MeshBinding binding() const = 0;
};

/// Non-indexed interleaved vertex buffer
class VertexMesh final : public Mesh {
public:
    VertexMesh(ResourceKey buffer, std::vector<VertexFormat> formats, std::uint32_t stride,
               std::uint32_t vertex_count, DrawMode mode = DrawMode::Triangles);

    void set_draw_mode(DrawMode mode) { m_mode = mode; }
    void set_draw_range(std::optional<DrawRange> range) { m_range = range; }
    void set_vertex_count(std::uint32_t count) { m_vertex_count = count; }

    [[nodiscard]] std::uint32_t vertex_count() const noexcept { return m_vertex_count; }
    [[nodiscard]] ResourceKey buffer() const noexcept { return m_attributes.buffer; }

    [[nodiscard]] std::vector<AttachedAttributes> attachments() const override;
    [[nodiscard]] MeshBinding binding() const override;

private:
    AttachedAttributes m_attributes;
    std::uint32_t m_vertex_count;
    DrawMode m_mode;
    std::optional<DrawRange> m_range;
};

/// Vertex buffer drawn through an index buffer
class IndexedMesh final : public Mesh {
public:
    IndexedMesh(VertexMesh vertices, ResourceKey index_buffer, IndexType type, std::uint32_t index_count);

    void set_draw_range(std::optional<DrawRange> range) { m_range = range; }
    void set_index_count(std::uint32_t count) { m_index_count = count; }

    [[nodiscard]] std::uint32_t index_count() const noexcept { return m_index_count; }

    [[nodiscard]] std::vector<AttachedAttributes> attachments() const override;
    [[nodiscard]] MeshBinding binding() const override;

private:
    VertexMesh m_vertices;
    IndexBinding m_indices;
    std::uint32_t m_index_count;
    std::optional<DrawRange> m_range;
};

/// A base mesh plus per-instance attribute buffers
class MultiMesh final : public Mesh {
public:
    MultiMesh(const Mesh& base, std::uint32_t instance_count);

    /// Attach per-instance data; a step of 0 is promoted to 1
    MultiMesh& attach(AttachedAttributes instance_data);

    void set_instance_count(std::uint32_t count) { m_instance_count = count; }
    [[nodiscard]] std::uint32_t instance_count() const noexcept { return m_instance_count; }

    [[nodiscard]] std::vector<AttachedAttributes> attachments() const override;
    [[nodiscard]] MeshBinding binding() const override;

private:
    MeshBinding m_base;
    std::vector<AttachedAttributes> m_instanced;
    std::uint32_t m_instance_count;
};

} // namespace lumen_gfx
