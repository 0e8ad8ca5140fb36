// lumen_gfx DrawList tests

#include <catch2/catch_test_macros.hpp>
#include <lumen/gfx/draw_list.hpp>
#include <lumen/gfx/quad_batch.hpp>
#include <lumen/gfx/registry.hpp>
#include <lumen/gfx/state_cache.hpp>
#include <lumen/gfx/texture.hpp>
#include "backends/null/null_backend.hpp"
#include <glm/glm.hpp>
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace lumen_gfx;
using lumen_core::ErrorCode;
using lumen_core::GraphicsError;
using backends::NullBackend;
using backends::NullCall;

namespace {

const ShaderSource kSprite{
    R"(
#version 330 core
layout(location = 0) in vec2 a_position;
layout(location = 1) in vec4 a_color;
uniform mat4 u_projection;
out vec4 v_color;
void main() { v_color = a_color; gl_Position = u_projection * vec4(a_position, 0.0, 1.0); }
)",
    R"(
#version 330 core
in vec4 v_color;
uniform vec4 u_tint;
uniform sampler2D u_texture;
out vec4 frag_color;
void main() { frag_color = texture(u_texture, v_color.xy) * v_color * u_tint; }
)",
    "sprite"};

struct Fixture {
    explicit Fixture(StateCacheLimits limits = {})
        : cache(backend, registry, limits)
    {
        shader = *registry.create_shader(kSprite);
        vertices = *registry.create_buffer(72, BufferKind::Vertex);
        backend.clear_calls();
    }

    [[nodiscard]] VertexMesh triangle(std::uint32_t vertex_count = 3) const {
        return VertexMesh(vertices,
                          {VertexFormat::floats("a_position", 0, 2), VertexFormat::floats("a_color", 8, 4)},
                          24, vertex_count);
    }

    NullBackend backend;
    ResourceRegistry registry{backend};
    StateCache cache;
    ResourceKey shader;
    ResourceKey vertices;
};

PipelineSettings opaque_backbuffer() {
    return PipelineSettings{}
        .with_target(RenderTarget::backbuffer())
        .with_blend(BlendState::disabled());
}

} // anonymous namespace

// =============================================================================
// Recording
// =============================================================================

TEST_CASE("DrawList records snapshots", "[gfx][draw_list]") {
    Fixture f;
    DrawList list;
    VertexMesh mesh = f.triangle();

    list.draw(f.shader, mesh);
    mesh.set_vertex_count(30);

    REQUIRE(list.len() == 1);
    const auto& command = std::get<DrawCommand>(list.commands()[0]);
    REQUIRE(command.mesh.range.count == 3);
    REQUIRE(command.referenced_keys().size() == 2);
}

TEST_CASE("DrawList clamps clear colors", "[gfx][draw_list]") {
    DrawList list;
    list.clear(ClearSettings::color_only(Color{2.0f, 0.5f, -1.0f, 1.0f}));

    const auto& command = std::get<ClearCommand>(list.commands()[0]);
    REQUIRE(command.settings.color == Color{1.0f, 0.5f, 0.0f, 1.0f});
}

TEST_CASE("DrawList merges its defaults under each draw", "[gfx][draw_list]") {
    Fixture f;
    DrawList list;
    list.set_defaults(PipelineSettings{}.with_viewport(Rect::from_size(640, 480)).with_blend(BlendState::alpha()));

    list.draw(f.shader, f.triangle(), PipelineSettings{}.with_blend(BlendState::additive()));

    const auto& settings = std::get<DrawCommand>(list.commands()[0]).settings;
    REQUIRE(settings.viewport == Rect::from_size(640, 480));
    REQUIRE(settings.blend == BlendState::additive());
}

TEST_CASE("DrawList append and reset", "[gfx][draw_list]") {
    Fixture f;
    DrawList shadows;
    shadows.clear();
    shadows.draw(f.shader, f.triangle());

    DrawList main;
    main.clear();
    main.append(std::move(shadows));
    REQUIRE(main.len() == 3);
    REQUIRE(shadows.is_empty());

    main.reset();
    REQUIRE(main.is_empty());
}

// =============================================================================
// Flush
// =============================================================================

TEST_CASE("Flush sets blend once and keeps the shader bound", "[gfx][draw_list]") {
    Fixture f;
    DrawList list;
    VertexMesh mesh = f.triangle();

    list.draw(f.shader, mesh, PipelineSettings{}.with_blend(BlendState::alpha()));
    list.draw(f.shader, mesh, PipelineSettings{});

    auto stats = list.flush(f.cache, f.registry, f.backend);
    REQUIRE(stats.is_ok());
    REQUIRE(stats->draws == 2);
    REQUIRE(stats->state_changes == 4);
    REQUIRE(stats->state_elided == 3);

    auto blends = f.backend.calls_of(NullCall::SetBlend);
    REQUIRE(blends.size() == 1);
    REQUIRE(blends[0].arg == 1);
    REQUIRE(f.backend.count(NullCall::UseProgram) == 1);
    REQUIRE(f.backend.count(NullCall::DrawArrays) == 2);
    REQUIRE(list.is_empty());
}

TEST_CASE("Flush replays commands in submission order", "[gfx][draw_list]") {
    Fixture f;
    DrawList list;

    list.clear();
    list.draw(f.shader, f.triangle());
    list.clear(ClearSettings::color_only(Color::white()));

    auto stats = list.flush(f.cache, f.registry, f.backend);
    REQUIRE(stats->clears == 2);
    REQUIRE(stats->draws == 1);

    std::vector<NullCall> order;
    for (const auto& call : f.backend.calls()) {
        if (call.call == NullCall::Clear || call.call == NullCall::DrawArrays) {
            order.push_back(call.call);
        }
    }
    REQUIRE(order == std::vector<NullCall>{NullCall::Clear, NullCall::DrawArrays, NullCall::Clear});

    auto clears = f.backend.calls_of(NullCall::Clear);
    REQUIRE(clears[0].detail == "color|depth|stencil");
    REQUIRE(clears[1].detail == "color");
}

TEST_CASE("Flush of a clear disables scissoring unless a rect is given", "[gfx][draw_list]") {
    Fixture f;
    DrawList list;

    ClearSettings partial;
    partial.scissor = Rect{0, 0, 8, 8};
    list.clear(partial);
    list.clear();

    REQUIRE(list.flush(f.cache, f.registry, f.backend).is_ok());
    auto scissors = f.backend.calls_of(NullCall::SetScissor);
    REQUIRE(scissors.size() == 2);
    REQUIRE(scissors[0].arg == 1);
    REQUIRE(scissors[1].arg == 0);
}

TEST_CASE("Flush binds vertex attributes by name", "[gfx][draw_list]") {
    Fixture f;
    DrawList list;
    list.draw(f.shader, f.triangle());
    list.draw(f.shader, f.triangle());

    REQUIRE(list.flush(f.cache, f.registry, f.backend).is_ok());

    auto attributes = f.backend.calls_of(NullCall::SetVertexAttribute);
    REQUIRE(attributes.size() == 4);
    REQUIRE(attributes[0].arg == 0);
    REQUIRE(attributes[0].detail == "a_position/24/0");
    REQUIRE(attributes[1].arg == 1);
    REQUIRE(f.backend.count(NullCall::BindBuffer) == 1);
    REQUIRE(f.cache.enabled_attributes() == 0b11u);
}

TEST_CASE("Flush of indexed and instanced meshes", "[gfx][draw_list]") {
    Fixture f;
    auto indices = f.registry.create_buffer(12, BufferKind::Index);
    DrawList list;

    SECTION("indexed") {
        IndexedMesh mesh(f.triangle(), *indices, IndexType::U16, 6);
        list.draw(f.shader, mesh);
        REQUIRE(list.flush(f.cache, f.registry, f.backend).is_ok());

        REQUIRE(f.backend.calls_of(NullCall::DrawElements).front().arg == 6);
        REQUIRE(f.cache.bound_buffer(BufferKind::Index) == *indices);
        REQUIRE(f.backend.count(NullCall::DrawArrays) == 0);
    }

    SECTION("instanced") {
        VertexMesh base = f.triangle();
        MultiMesh mesh(base, 10);
        list.draw(f.shader, mesh);
        REQUIRE(list.flush(f.cache, f.registry, f.backend).is_ok());
        REQUIRE(f.backend.calls_of(NullCall::DrawArrays).front().detail == "Trianglesx10");
    }

    SECTION("empty range is skipped") {
        list.draw(f.shader, f.triangle(0));
        auto stats = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(stats->skipped_draws == 1);
        REQUIRE(stats->draws == 0);
        REQUIRE(f.backend.count(NullCall::DrawArrays) == 0);
    }
}

TEST_CASE("Flush uploads pending mapped writes before drawing", "[gfx][draw_list]") {
    Fixture f;
    auto batch = QuadBatch::create(f.registry,
                                   {VertexFormat::floats("a_position", 0, 2), VertexFormat::floats("a_color", 8, 4)},
                                   24, 4);
    REQUIRE(batch.is_ok());
    std::vector<std::uint8_t> quad(4 * 24, 0);
    REQUIRE(batch->push(quad).is_ok());
    REQUIRE(batch->push(quad).is_ok());
    f.backend.clear_calls();

    DrawList list;
    list.draw(f.shader, *batch);
    auto stats = list.flush(f.cache, f.registry, f.backend);
    REQUIRE(stats.is_ok());
    REQUIRE(stats->buffer_uploads == 1);
    REQUIRE(stats->draws == 1);

    const auto& calls = f.backend.calls();
    auto write = std::find_if(calls.begin(), calls.end(),
                              [](const auto& c) { return c.call == NullCall::WriteBuffer; });
    auto draw = std::find_if(calls.begin(), calls.end(),
                             [](const auto& c) { return c.call == NullCall::DrawElements; });
    REQUIRE(write != calls.end());
    REQUIRE(draw != calls.end());
    REQUIRE(write < draw);
    REQUIRE(write->arg == 2 * 96);
    REQUIRE(draw->arg == 12);
    REQUIRE_FALSE(f.registry.buffer(batch->mesh().vertex_buffer())->get().modified.has_value());

    SECTION("nothing pending uploads nothing") {
        list.draw(f.shader, *batch);
        auto again = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(again->buffer_uploads == 0);
        REQUIRE(f.backend.count(NullCall::WriteBuffer) == 1);
    }
}

TEST_CASE("Flush uploads uniform overrides through the shader cache", "[gfx][draw_list]") {
    Fixture f;
    DrawList list;
    UniformOverrides uniforms{{"u_projection", glm::mat4(1.0f)}, {"u_tint", glm::vec4(1.0f)}};

    list.draw(f.shader, f.triangle(), {}, uniforms);
    list.draw(f.shader, f.triangle(), {}, uniforms);
    list.draw(f.shader, f.triangle(), {}, {{"u_tint", glm::vec4(0.5f)}});

    auto stats = list.flush(f.cache, f.registry, f.backend);
    REQUIRE(stats.is_ok());
    REQUIRE(stats->uniform_uploads == 3);
    REQUIRE(stats->uniforms_elided == 2);
    REQUIRE(f.backend.count(NullCall::UploadUniform) == 3);
}

TEST_CASE("Flush samples a canvas rendered earlier in the list", "[gfx][draw_list]") {
    Fixture f;
    FramebufferDesc desc;
    desc.width = 32;
    desc.height = 32;
    auto canvas = Canvas::create(f.registry, desc);
    REQUIRE(canvas.is_ok());
    f.backend.clear_calls();

    DrawList list;
    list.draw(f.shader, f.triangle(),
              PipelineSettings{}.with_target(canvas->target()).with_viewport(canvas->viewport()));

    DrawCommand composite;
    composite.shader = f.shader;
    composite.mesh = f.triangle().binding();
    composite.textures = {TextureBinding{0, canvas->key()}};
    composite.uniforms = {{"u_texture", 0}};
    composite.settings = PipelineSettings{}.with_target(RenderTarget::backbuffer());
    list.draw(std::move(composite));

    REQUIRE(list.flush(f.cache, f.registry, f.backend).is_ok());

    auto targets = f.backend.calls_of(NullCall::BindFramebuffer);
    REQUIRE(targets.size() == 2);
    REQUIRE(targets[0].id == f.registry.framebuffer(canvas->framebuffer())->get().id);
    REQUIRE(targets[1].id == NULL_BACKEND_ID);
    REQUIRE(f.backend.calls_of(NullCall::BindTexture).front().id == f.registry.texture(canvas->key())->get().id);
    REQUIRE(f.backend.calls_of(NullCall::UploadUniform).front().detail == "int");
}

// =============================================================================
// Validation
// =============================================================================

TEST_CASE("Flush fails before issuing anything on a stale key", "[gfx][draw_list]") {
    Fixture f;
    auto doomed = f.registry.create_shader(kSprite);
    DrawList list;

    list.draw(f.shader, f.triangle());
    list.draw(*doomed, f.triangle());
    REQUIRE(f.registry.destroy_shader(*doomed).is_ok());
    f.backend.clear_calls();

    auto stats = list.flush(f.cache, f.registry, f.backend);
    REQUIRE(stats.error().is_graphics(GraphicsError::Kind::StaleHandle));
    REQUIRE(*stats.error().get_context("command") == "1");
    REQUIRE(f.backend.calls().empty());
    REQUIRE(list.is_empty());
}

TEST_CASE("Flush validation failures", "[gfx][draw_list]") {
    Fixture f;
    DrawList list;

    SECTION("destroyed vertex buffer") {
        list.draw(f.shader, f.triangle());
        REQUIRE(f.registry.destroy_buffer(f.vertices).is_ok());
        f.backend.clear_calls();
        auto r = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::StaleHandle));
    }

    SECTION("mesh reads past the buffer") {
        list.draw(f.shader, f.triangle(4));
        auto r = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::BufferOverflow));
    }

    SECTION("unknown uniform override") {
        list.draw(f.shader, f.triangle(), {}, {{"u_nope", 1.0f}});
        auto r = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::UnknownUniform));
    }

    SECTION("empty viewport") {
        list.draw(f.shader, f.triangle(), PipelineSettings{}.with_viewport(Rect{}));
        auto r = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::InvalidDimensions));
    }

    SECTION("texture unit past the limit") {
        auto image = Image::create(f.registry, TextureDesc::texture_2d(2, 2));
        DrawCommand command;
        command.shader = f.shader;
        command.mesh = f.triangle().binding();
        command.textures = {TextureBinding{16, image->key()}};
        list.draw(std::move(command));
        f.backend.clear_calls();
        auto r = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("destroyed clear target") {
        FramebufferDesc desc;
        desc.width = 4;
        desc.height = 4;
        auto canvas = Canvas::create(f.registry, desc);
        list.clear(ClearSettings{}.with_target(canvas->target()));
        REQUIRE(f.registry.destroy_framebuffer(canvas->framebuffer()).is_ok());
        f.backend.clear_calls();
        auto r = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::StaleHandle));
    }

    REQUIRE(f.backend.count(NullCall::DrawArrays) == 0);
    REQUIRE(f.backend.count(NullCall::Clear) == 0);
    REQUIRE(list.is_empty());
}

TEST_CASE("Attribute locations beyond the configured limit are rejected", "[gfx][draw_list]") {
    Fixture f(StateCacheLimits{16, 1});
    DrawList list;
    list.draw(f.shader, f.triangle());

    auto r = list.flush(f.cache, f.registry, f.backend);
    REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
    REQUIRE(f.backend.calls().empty());
}

TEST_CASE("Strict uniforms require every declared uniform", "[gfx][draw_list]") {
    Fixture f;
    DrawList list(DrawListOptions{false, true});

    SECTION("missing value fails") {
        list.draw(f.shader, f.triangle(), {}, {{"u_tint", glm::vec4(1.0f)}, {"u_texture", 0}});
        auto r = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::MissingUniform));
        REQUIRE(*r.error().get_context("shader") == f.shader.to_string());
    }

    SECTION("values supplied earlier in the list count") {
        list.draw(f.shader, f.triangle(), {},
                  {{"u_projection", glm::mat4(1.0f)}, {"u_tint", glm::vec4(1.0f)}, {"u_texture", 0}});
        list.draw(f.shader, f.triangle());
        REQUIRE(list.flush(f.cache, f.registry, f.backend).is_ok());

        list.draw(f.shader, f.triangle());
        REQUIRE(list.flush(f.cache, f.registry, f.backend).is_ok());
        REQUIRE(f.backend.count(NullCall::DrawArrays) == 3);
    }
}

// =============================================================================
// Reordering
// =============================================================================

TEST_CASE("Reordering groups opaque draws by shader", "[gfx][draw_list]") {
    Fixture f;
    auto other = *f.registry.create_shader(kSprite);
    f.backend.clear_calls();

    auto record = [&](DrawList& list) {
        list.draw(f.shader, f.triangle(), opaque_backbuffer(), {}, true);
        list.draw(other, f.triangle(), opaque_backbuffer(), {}, true);
        list.draw(f.shader, f.triangle(), opaque_backbuffer(), {}, true);
    };

    SECTION("disabled keeps submission order") {
        DrawList list;
        record(list);
        auto stats = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(stats->reordered_runs == 0);
        REQUIRE(f.backend.count(NullCall::UseProgram) == 3);
    }

    SECTION("enabled sorts the run") {
        DrawList list(DrawListOptions{true, false});
        record(list);
        auto stats = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(stats->reordered_runs == 1);
        REQUIRE(f.backend.count(NullCall::UseProgram) == 2);
        REQUIRE(f.backend.count(NullCall::DrawArrays) == 3);
    }

    SECTION("blended draws stay in place") {
        DrawList list(DrawListOptions{true, false});
        PipelineSettings blended = PipelineSettings{}
            .with_target(RenderTarget::backbuffer())
            .with_blend(BlendState::alpha());
        list.draw(f.shader, f.triangle(), blended, {}, true);
        list.draw(other, f.triangle(), blended, {}, true);
        list.draw(f.shader, f.triangle(), blended, {}, true);
        auto stats = list.flush(f.cache, f.registry, f.backend);
        REQUIRE(stats->reordered_runs == 0);
        REQUIRE(f.backend.count(NullCall::UseProgram) == 3);
    }
}

TEST_CASE("Empty flush issues nothing", "[gfx][draw_list]") {
    Fixture f;
    DrawList list;
    auto stats = list.flush(f.cache, f.registry, f.backend);
    REQUIRE(stats->commands == 0);
    REQUIRE(f.backend.calls().empty());
}
