#pragma once

/// @file quad_batch.hpp
/// @brief Growing batch of quads drawn through one fixed index buffer
///
/// Each quad is four vertices in this order, drawn as two triangles:
///
///     0---3
///     | / |
///     1---2
///
/// The index buffer is written once at creation. Vertex writes are mapped
/// and reach the backend on unmap() or the next flush.

#include "fwd.hpp"
#include "mapped_mesh.hpp"
#include <lumen/core/error.hpp>
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace lumen_gfx {

class QuadBatch final : public Mesh {
public:
    /// Indices of one quad, relative to its first vertex
    static constexpr std::array<std::uint16_t, 6> QUAD_INDICES{0, 1, 3, 1, 2, 3};

    /// Largest capacity whose vertices stay addressable by u16 indices
    static constexpr std::uint32_t MAX_QUADS = 65536 / 4;

    [[nodiscard]] static lumen_core::Result<QuadBatch> create(
        ResourceRegistry& registry, std::vector<VertexFormat> formats, std::uint32_t stride, std::uint32_t capacity);

    /// Append four vertices; OutOfRange once the batch is full
    [[nodiscard]] lumen_core::Result<std::uint32_t> push(std::span<const std::uint8_t> quad);

    template<typename V>
    [[nodiscard]] lumen_core::Result<std::uint32_t> push(const std::array<V, 4>& quad) {
        return push(as_bytes(quad));
    }

    /// Overwrite a quad already pushed
    [[nodiscard]] lumen_core::Result<void> insert(std::uint32_t index, std::span<const std::uint8_t> quad);

    template<typename V>
    [[nodiscard]] lumen_core::Result<void> insert(std::uint32_t index, const std::array<V, 4>& quad) {
        return insert(index, as_bytes(quad));
    }

    /// Vertex bytes of a pushed quad
    [[nodiscard]] lumen_core::Result<std::span<const std::uint8_t>> quad(std::uint32_t index) const;

    /// Forget every quad; the buffers keep their capacity
    void clear();

    [[nodiscard]] lumen_core::Result<void> unmap() { return m_mesh.unmap(); }

    [[nodiscard]] std::uint32_t count() const noexcept { return m_count; }
    [[nodiscard]] std::uint32_t capacity() const noexcept { return m_capacity; }
    [[nodiscard]] bool is_full() const noexcept { return m_count == m_capacity; }
    [[nodiscard]] const MappedIndexedMesh& mesh() const noexcept { return m_mesh; }

    [[nodiscard]] std::vector<AttachedAttributes> attachments() const override { return m_mesh.attachments(); }
    [[nodiscard]] MeshBinding binding() const override { return m_mesh.binding(); }

private:
    QuadBatch(MappedIndexedMesh mesh, std::uint32_t capacity);

    template<typename V>
    [[nodiscard]] static std::span<const std::uint8_t> as_bytes(const std::array<V, 4>& quad) {
        return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(quad.data()), sizeof(V) * 4);
    }

    [[nodiscard]] lumen_core::Result<void> check_quad(std::span<const std::uint8_t> quad) const;

    MappedIndexedMesh m_mesh;
    std::uint32_t m_count = 0;
    std::uint32_t m_capacity;
};

} // namespace lumen_gfx
