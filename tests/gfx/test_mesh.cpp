// lumen_gfx Mesh capability tests

#include <catch2/catch_test_macros.hpp>
#include <lumen/gfx/mesh.hpp>

using namespace lumen_gfx;

namespace {

ResourceKey buffer_key(std::uint32_t index) {
    return ResourceKey{ResourceHandle::create(index, 0), ResourceKind::Buffer};
}

VertexMesh colored_triangle(ResourceKey buffer) {
    return VertexMesh(buffer,
                      {VertexFormat::floats("a_position", 0, 2), VertexFormat::floats("a_color", 8, 4)},
                      24, 3);
}

} // anonymous namespace

TEST_CASE("VertexFormat sizes", "[gfx][mesh]") {
    REQUIRE(VertexFormat::floats("a_uv", 0, 2).byte_size() == 8);
    REQUIRE(VertexFormat::rgba8("a_color", 12).byte_size() == 4);
    REQUIRE(VertexFormat::rgba8("a_color", 12).normalized);
}

TEST_CASE("VertexMesh binding", "[gfx][mesh]") {
    VertexMesh mesh = colored_triangle(buffer_key(1));
    MeshBinding binding = mesh.binding();

    REQUIRE(binding.attachments.size() == 1);
    REQUIRE(binding.attachments[0].stride == 24);
    REQUIRE(binding.attachments[0].step == 0);
    REQUIRE_FALSE(binding.indices.has_value());
    REQUIRE(binding.range == DrawRange{0, 3});
    REQUIRE(binding.instance_count == 1);
    REQUIRE(binding.mode == DrawMode::Triangles);

    SECTION("extent covers the last vertex") {
        auto extents = binding.buffer_extents();
        REQUIRE(extents.size() == 1);
        REQUIRE(extents[0].first == buffer_key(1));
        REQUIRE(extents[0].second == 72);
    }

    SECTION("draw range overrides the vertex count") {
        mesh.set_draw_range(DrawRange{1, 2});
        mesh.set_draw_mode(DrawMode::Lines);
        MeshBinding ranged = mesh.binding();
        REQUIRE(ranged.range == DrawRange{1, 2});
        REQUIRE(ranged.mode == DrawMode::Lines);

        mesh.set_draw_range(std::nullopt);
        mesh.set_vertex_count(6);
        REQUIRE(mesh.binding().range == DrawRange{0, 6});
    }

    SECTION("empty range has no extent") {
        mesh.set_vertex_count(0);
        REQUIRE(mesh.binding().buffer_extents().empty());
    }

    SECTION("a binding is a snapshot") {
        mesh.set_vertex_count(30);
        REQUIRE(binding.range.count == 3);
    }
}

TEST_CASE("IndexedMesh binding", "[gfx][mesh]") {
    IndexedMesh mesh(colored_triangle(buffer_key(1)), buffer_key(2), IndexType::U16, 6);
    MeshBinding binding = mesh.binding();

    REQUIRE(binding.indices.has_value());
    REQUIRE(binding.indices->buffer == buffer_key(2));
    REQUIRE(binding.range == DrawRange{0, 6});
    REQUIRE(mesh.attachments().size() == 1);

    auto extents = binding.buffer_extents();
    REQUIRE(extents.size() == 1);
    REQUIRE(extents[0].first == buffer_key(2));
    REQUIRE(extents[0].second == 12);

    auto keys = binding.referenced_keys();
    REQUIRE(keys.size() == 2);
    REQUIRE(keys[1] == buffer_key(2));

    mesh.set_draw_range(DrawRange{3, 3});
    REQUIRE(mesh.binding().buffer_extents()[0].second == 12);

    SECTION("vertex extent follows the highest index") {
        auto bounded = binding.buffer_extents(3);
        REQUIRE(bounded.size() == 2);
        REQUIRE(bounded[0].first == buffer_key(1));
        REQUIRE(bounded[0].second == 72);
        REQUIRE(bounded[1].first == buffer_key(2));
    }
}

TEST_CASE("MultiMesh attaches per-instance data", "[gfx][mesh]") {
    VertexMesh base = colored_triangle(buffer_key(1));
    MultiMesh mesh(base, 10);

    AttachedAttributes offsets{buffer_key(3), {VertexFormat::floats("a_offset", 0, 2)}, 8, 0};
    mesh.attach(offsets);

    MeshBinding binding = mesh.binding();
    REQUIRE(binding.instance_count == 10);
    REQUIRE(binding.attachments.size() == 2);
    REQUIRE(binding.attachments[1].step == 1);

    auto extents = binding.buffer_extents();
    REQUIRE(extents.size() == 2);
    REQUIRE(extents[1].first == buffer_key(3));
    REQUIRE(extents[1].second == 9 * 8 + 8);

    SECTION("step divides the instance count") {
        MultiMesh halves(base, 10);
        AttachedAttributes colors{buffer_key(4), {VertexFormat::rgba8("a_tint", 0)}, 4, 2};
        halves.attach(colors);
        REQUIRE(halves.binding().buffer_extents()[1].second == 4 * 4 + 4);
    }

    SECTION("instance count updates") {
        mesh.set_instance_count(0);
        REQUIRE(mesh.instance_count() == 0);
        REQUIRE(mesh.binding().instance_count == 0);
    }
}
