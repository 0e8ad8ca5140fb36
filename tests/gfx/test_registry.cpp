// lumen_gfx ResourceRegistry tests

#include <catch2/catch_test_macros.hpp>
#include <lumen/gfx/registry.hpp>
#include <lumen/gfx/backend.hpp>
#include "backends/null/null_backend.hpp"
#include <algorithm>
#include <cstdint>
#include <numeric>
#include <vector>

using namespace lumen_gfx;
using lumen_core::ErrorCode;
using lumen_core::GraphicsError;
using backends::NullBackend;
using backends::NullCall;

namespace {

std::vector<std::uint8_t> sequence(std::size_t n, std::uint8_t start = 1) {
    std::vector<std::uint8_t> bytes(n);
    std::iota(bytes.begin(), bytes.end(), start);
    return bytes;
}

const ShaderSource kShader{
    R"(
#version 330 core
layout(location = 1) in vec4 a_color;
layout(location = 0) in vec2 a_position;
uniform mat4 u_projection;
out vec4 v_color;
void main() { v_color = a_color; gl_Position = u_projection * vec4(a_position, 0.0, 1.0); }
)",
    R"(
#version 330 core
in vec4 v_color;
uniform vec4 u_tint;
out vec4 frag_color;
void main() { frag_color = v_color * u_tint; }
)",
    "flat"};

} // anonymous namespace

// =============================================================================
// Buffers
// =============================================================================

TEST_CASE("Registry buffer lifecycle", "[gfx][registry]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    auto bytes = sequence(12);
    auto key = registry.create_buffer(bytes, BufferKind::Vertex);
    REQUIRE(key.is_ok());
    REQUIRE(key->kind == ResourceKind::Buffer);
    REQUIRE(registry.contains(*key));
    REQUIRE(registry.len() == 1);
    REQUIRE(backend.count(NullCall::CreateBuffer) == 1);

    SECTION("write, grow, destroy, then stale") {
        auto fresh = sequence(12, 100);
        REQUIRE(registry.write_buffer(*key, 0, fresh).is_ok());
        REQUIRE(registry.resize_buffer(*key, 24).is_ok());

        auto view = registry.read_buffer(*key);
        REQUIRE(view.is_ok());
        REQUIRE(view->size() == 24);
        REQUIRE(std::equal(fresh.begin(), fresh.end(), view->begin()));
        REQUIRE(std::all_of(view->begin() + 12, view->end(), [](std::uint8_t b) { return b == 0; }));

        const BackendId id = registry.buffer(*key)->get().id;
        REQUIRE(*backend.buffer_data(id) == std::vector<std::uint8_t>(view->begin(), view->end()));

        REQUIRE(registry.destroy(*key).is_ok());
        auto stale = registry.read_buffer(*key);
        REQUIRE(stale.is_err());
        REQUIRE(stale.error().is_graphics(GraphicsError::Kind::StaleHandle));
        REQUIRE(backend.buffer_data(id) == nullptr);
    }

    SECTION("shrink truncates") {
        REQUIRE(registry.resize_buffer(*key, 4).is_ok());
        auto view = registry.read_buffer(*key);
        REQUIRE(view->size() == 4);
        REQUIRE((*view)[3] == 4);
    }

    SECTION("write past the end fails without touching the backend") {
        backend.clear_calls();
        auto four = sequence(4);
        auto r = registry.write_buffer(*key, 10, four);
        REQUIRE(r.is_err());
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::BufferOverflow));
        REQUIRE(backend.count(NullCall::WriteBuffer) == 0);
        REQUIRE((*registry.read_buffer(*key))[10] == 11);
    }

    SECTION("offset overflow is rejected") {
        auto one = sequence(1);
        auto r = registry.write_buffer(*key, SIZE_MAX, one);
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::BufferOverflow));
    }

    SECTION("pinned range blocks shrinking") {
        registry.pin(*key, 8);
        registry.pin(*key, 6);
        REQUIRE(registry.pinned_extent(*key) == 8);

        auto r = registry.resize_buffer(*key, 6);
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::BufferOverflow));
        REQUIRE(registry.resize_buffer(*key, 8).is_ok());

        registry.clear_pins();
        REQUIRE(registry.resize_buffer(*key, 2).is_ok());
    }
}

TEST_CASE("Registry rejects zero-sized buffers", "[gfx][registry]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    auto sized = registry.create_buffer(std::size_t{0}, BufferKind::Index);
    REQUIRE(sized.error().is_graphics(GraphicsError::Kind::InvalidDimensions));

    auto empty = registry.create_buffer(std::span<const std::uint8_t>{}, BufferKind::Vertex);
    REQUIRE(empty.error().is_graphics(GraphicsError::Kind::InvalidDimensions));
    REQUIRE(registry.is_empty());
}

TEST_CASE("Registry propagates backend allocation failures", "[gfx][registry]") {
    NullBackend backend;
    ResourceRegistry registry(backend);
    backend.set_fail_allocations(true);

    auto key = registry.create_buffer(16, BufferKind::Vertex, BufferUsage::Stream);
    REQUIRE(key.error().is_graphics(GraphicsError::Kind::ResourceCreationFailed));
    REQUIRE(registry.is_empty());
}

TEST_CASE("Registry releases the backend object when no slot is free", "[gfx][registry]") {
    NullBackend backend;
    ResourceRegistry registry(backend, 2);

    auto first = registry.create_buffer(16, BufferKind::Vertex);
    auto second = registry.create_buffer(16, BufferKind::Vertex);
    REQUIRE(first.is_ok());
    REQUIRE(second.is_ok());

    auto third = registry.create_buffer(16, BufferKind::Vertex);
    REQUIRE(third.error().is_graphics(GraphicsError::Kind::ResourceCreationFailed));
    REQUIRE(backend.live_buffers() == 2);
    REQUIRE(registry.len() == 2);

    auto shader = registry.create_shader(kShader);
    REQUIRE(shader.error().is_graphics(GraphicsError::Kind::ResourceCreationFailed));
    REQUIRE(backend.live_programs() == 0);

    SECTION("a destroyed slot is reused") {
        REQUIRE(registry.destroy_buffer(*first).is_ok());
        auto reused = registry.create_buffer(16, BufferKind::Vertex);
        REQUIRE(reused.is_ok());
        REQUIRE(reused->handle.index() == first->handle.index());
        REQUIRE(backend.live_buffers() == 2);
    }

    SECTION("framebuffer attachments are rolled back") {
        REQUIRE(registry.destroy_buffer(*first).is_ok());
        FramebufferDesc desc;
        desc.width = 4;
        desc.height = 4;
        auto canvas = registry.create_framebuffer(desc);
        REQUIRE(canvas.error().is_graphics(GraphicsError::Kind::ResourceCreationFailed));
        REQUIRE(backend.live_textures() == 0);
        REQUIRE(backend.live_framebuffers() == 0);
        REQUIRE(registry.len() == 1);
    }
}

// =============================================================================
// Generations
// =============================================================================

TEST_CASE("Stale keys never alias a reused slot", "[gfx][registry]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    auto old_key = registry.create_buffer(sequence(4), BufferKind::Vertex);
    REQUIRE(registry.destroy_buffer(*old_key).is_ok());

    auto new_key = registry.create_buffer(sequence(8), BufferKind::Vertex);
    REQUIRE(new_key->index() == old_key->index());
    REQUIRE(new_key->generation() != old_key->generation());

    REQUIRE(registry.buffer(*old_key).error().is_graphics(GraphicsError::Kind::StaleHandle));
    REQUIRE(registry.destroy_buffer(*old_key).error().is_graphics(GraphicsError::Kind::StaleHandle));
    REQUIRE(registry.buffer(*new_key)->get().size() == 8);
}

TEST_CASE("Registry lookup errors", "[gfx][registry]") {
    NullBackend backend;
    ResourceRegistry registry(backend);
    auto key = registry.create_buffer(sequence(4), BufferKind::Uniform);

    SECTION("null key") {
        auto r = registry.get(ResourceKey::null(ResourceKind::Buffer));
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::NotFound));
    }

    SECTION("out of range index") {
        ResourceKey bogus{ResourceHandle::create(99, 0), ResourceKind::Buffer};
        REQUIRE(registry.get(bogus).error().is_graphics(GraphicsError::Kind::NotFound));
        REQUIRE_FALSE(registry.contains(bogus));
    }

    SECTION("wrong kind") {
        ResourceKey as_texture{key->handle, ResourceKind::Texture};
        auto r = registry.destroy(as_texture);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(registry.contains(*key));

        REQUIRE(registry.shader(*key).error().is_graphics(GraphicsError::Kind::KindMismatch));
    }

    SECTION("typed access") {
        REQUIRE(registry.get(*key)->get().kind() == ResourceKind::Buffer);
        REQUIRE(registry.buffer_mut(*key)->get().kind == BufferKind::Uniform);
        REQUIRE(registry.validate(*key).is_ok());
        REQUIRE(registry.len(ResourceKind::Buffer) == 1);
        REQUIRE(registry.len(ResourceKind::Shader) == 0);
    }
}

// =============================================================================
// Textures
// =============================================================================

TEST_CASE("Registry texture creation", "[gfx][registry]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    SECTION("matching pixel data") {
        std::vector<std::uint8_t> pixels(2 * 2 * 4, 0xFF);
        auto key = registry.create_texture(TextureDesc::texture_2d(2, 2), pixels);
        REQUIRE(key.is_ok());
        REQUIRE(registry.texture(*key)->get().desc.info.width == 2);
    }

    SECTION("zero dimensions") {
        auto key = registry.create_texture(TextureDesc::texture_2d(0, 4));
        REQUIRE(key.error().is_graphics(GraphicsError::Kind::InvalidDimensions));
    }

    SECTION("pixel data of the wrong size") {
        std::vector<std::uint8_t> pixels(7);
        auto key = registry.create_texture(TextureDesc::texture_2d(2, 2), pixels);
        REQUIRE(key.error().is_graphics(GraphicsError::Kind::BufferOverflow));
    }

    SECTION("cube maps need six faces") {
        TextureDesc desc = TextureDesc::texture_2d(1, 1);
        desc.type = TextureType::Cube;
        std::vector<std::uint8_t> one_face(4);
        REQUIRE(registry.create_texture(desc, one_face).is_err());
        std::vector<std::uint8_t> six_faces(24);
        REQUIRE(registry.create_texture(desc, six_faces).is_ok());
    }

    SECTION("sampling updates reach the backend once") {
        auto key = registry.create_texture(TextureDesc::texture_2d(4, 4));
        REQUIRE(registry.set_texture_sampling(*key, FilterSettings::nearest(), WrapSettings::repeat()).is_ok());
        REQUIRE(registry.set_texture_sampling(*key, FilterSettings::nearest(), WrapSettings::repeat()).is_ok());
        REQUIRE(backend.count(NullCall::SetTextureSampling) == 1);
        REQUIRE(registry.texture(*key)->get().desc.info.wrap == WrapSettings::repeat());
    }
}

// =============================================================================
// Shaders
// =============================================================================

TEST_CASE("Registry shader creation", "[gfx][registry]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    SECTION("attributes ordered by location") {
        auto key = registry.create_shader(kShader);
        REQUIRE(key.is_ok());
        const ShaderResource& shader = registry.shader(*key)->get();
        REQUIRE(shader.attributes.size() == 2);
        REQUIRE(shader.attributes[0].name == "a_position");
        REQUIRE(shader.attributes[1].name == "a_color");
        REQUIRE(shader.state.uniforms().size() == 2);
        REQUIRE(shader.label == "flat");
    }

    SECTION("compile failure carries the diagnostic and creates nothing") {
        ShaderSource broken = kShader;
        broken.fragment = "#error unsupported path\nvoid main() {}";
        auto key = registry.create_shader(broken);
        REQUIRE(key.error().is_graphics(GraphicsError::Kind::CompileError));
        REQUIRE(key.error().as<GraphicsError>()->diagnostic.find("unsupported path") != std::string::npos);
        REQUIRE(registry.is_empty());
    }

    SECTION("link failure") {
        ShaderSource no_main = kShader;
        no_main.vertex = "in vec2 a_position;";
        auto key = registry.create_shader(no_main);
        REQUIRE(key.error().is_graphics(GraphicsError::Kind::LinkError));
        REQUIRE(backend.live_programs() == 0);
    }

    SECTION("destroy releases the program") {
        auto key = registry.create_shader(kShader);
        REQUIRE(backend.live_programs() == 1);
        REQUIRE(registry.destroy_shader(*key).is_ok());
        REQUIRE(backend.live_programs() == 0);
    }
}

// =============================================================================
// Framebuffers
// =============================================================================

TEST_CASE("Registry framebuffers own their attachments", "[gfx][registry]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    FramebufferDesc desc;
    desc.width = 64;
    desc.height = 32;
    desc.depth_format = TextureFormat::Depth24Stencil8;
    desc.label = "shadow";

    auto key = registry.create_framebuffer(desc);
    REQUIRE(key.is_ok());
    const FramebufferResource fb = registry.framebuffer(*key)->get();
    REQUIRE(fb.depth.has_value());
    REQUIRE(registry.len(ResourceKind::Texture) == 2);
    REQUIRE(backend.calls_of(NullCall::CreateFramebuffer).front().arg == 1);

    SECTION("attachments cannot be destroyed directly") {
        auto r = registry.destroy_texture(fb.color);
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(registry.contains(fb.color));
    }

    SECTION("destroying the framebuffer releases the attachments") {
        REQUIRE(registry.destroy_framebuffer(*key).is_ok());
        REQUIRE_FALSE(registry.contains(fb.color));
        REQUIRE_FALSE(registry.contains(*fb.depth));
        REQUIRE(backend.live_textures() == 0);
        REQUIRE(backend.live_framebuffers() == 0);
    }
}

TEST_CASE("Registry rolls back incomplete framebuffers", "[gfx][registry]") {
    NullBackend backend;
    ResourceRegistry registry(backend);
    backend.set_framebuffer_status(FramebufferStatus::Unsupported);

    FramebufferDesc desc;
    desc.width = 8;
    desc.height = 8;
    desc.depth_format = TextureFormat::Depth24;

    auto key = registry.create_framebuffer(desc);
    REQUIRE(key.error().is_graphics(GraphicsError::Kind::IncompleteFramebuffer));
    REQUIRE(registry.is_empty());
    REQUIRE(backend.live_textures() == 0);
    REQUIRE(backend.live_framebuffers() == 0);
}

TEST_CASE("Registry validates framebuffer formats", "[gfx][registry]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    FramebufferDesc desc;
    desc.width = 8;
    desc.height = 8;
    desc.color_format = TextureFormat::Depth16;
    REQUIRE(registry.create_framebuffer(desc).error().code() == ErrorCode::InvalidArgument);

    desc.color_format = TextureFormat::Rgba8;
    desc.depth_format = TextureFormat::Rgba8;
    REQUIRE(registry.create_framebuffer(desc).error().code() == ErrorCode::InvalidArgument);

    desc.width = 0;
    REQUIRE(registry.create_framebuffer(desc).error().is_graphics(GraphicsError::Kind::InvalidDimensions));
}

// =============================================================================
// Teardown
// =============================================================================

TEST_CASE("Registry destructor releases every backend object", "[gfx][registry]") {
    NullBackend backend;
    {
        ResourceRegistry registry(backend);
        REQUIRE(registry.create_buffer(16, BufferKind::Vertex).is_ok());
        REQUIRE(registry.create_texture(TextureDesc::texture_2d(4, 4)).is_ok());
        REQUIRE(registry.create_shader(kShader).is_ok());

        FramebufferDesc desc;
        desc.width = 4;
        desc.height = 4;
        REQUIRE(registry.create_framebuffer(desc).is_ok());
    }
    REQUIRE(backend.live_buffers() == 0);
    REQUIRE(backend.live_textures() == 0);
    REQUIRE(backend.live_programs() == 0);
    REQUIRE(backend.live_framebuffers() == 0);
}
