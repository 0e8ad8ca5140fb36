// lumen_gfx Image and Canvas tests

#include <catch2/catch_test_macros.hpp>
#include <lumen/gfx/texture.hpp>
#include <lumen/gfx/registry.hpp>
#include "backends/null/null_backend.hpp"
#include <vector>

using namespace lumen_gfx;
using lumen_core::GraphicsError;
using backends::NullBackend;
using backends::NullCall;

TEST_CASE("Image uploads pixels and reports its info", "[gfx][texture]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    std::vector<std::uint8_t> pixels(3 * 2, 0x80);
    TextureDesc desc = TextureDesc::texture_2d(3, 2, TextureFormat::R8);
    desc.label = "mask";

    auto image = Image::create(registry, desc, pixels);
    REQUIRE(image.is_ok());
    REQUIRE(image->width() == 3);
    REQUIRE(image->height() == 2);
    REQUIRE(image->type() == TextureType::Tex2D);
    REQUIRE(image->info().format == TextureFormat::R8);

    const BackendId id = registry.texture(image->key())->get().id;
    REQUIRE(backend.texture_desc(id)->label == "mask");

    SECTION("sampling changes reach the registry and the image") {
        REQUIRE(image->set_sampling(registry, FilterSettings::nearest(), WrapSettings::repeat()).is_ok());
        REQUIRE(image->info().filter == FilterSettings::nearest());
        REQUIRE(registry.texture(image->key())->get().desc.info.wrap == WrapSettings::repeat());
        REQUIRE(backend.texture_desc(id)->info.filter == FilterSettings::nearest());
    }

    SECTION("a destroyed image fails to update") {
        REQUIRE(registry.destroy_texture(image->key()).is_ok());
        auto r = image->set_sampling(registry, FilterSettings::nearest(), WrapSettings{});
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::StaleHandle));
        REQUIRE(image->info().filter == FilterSettings{});
    }
}

TEST_CASE("Image creation errors", "[gfx][texture]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    REQUIRE(Image::create(registry, TextureDesc::texture_2d(0, 0)).is_err());

    BackendLimits small;
    small.max_texture_size = 64;
    NullBackend limited(small);
    ResourceRegistry limited_registry(limited);
    auto big = Image::create(limited_registry, TextureDesc::texture_2d(128, 4));
    REQUIRE(big.error().is_graphics(GraphicsError::Kind::InvalidDimensions));
    REQUIRE(limited_registry.is_empty());
}

TEST_CASE("Canvas exposes its attachments as textures", "[gfx][texture]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    FramebufferDesc desc;
    desc.width = 256;
    desc.height = 128;
    desc.depth_format = TextureFormat::Depth24;
    desc.label = "scene";

    auto canvas = Canvas::create(registry, desc);
    REQUIRE(canvas.is_ok());

    REQUIRE(canvas->width() == 256);
    REQUIRE(canvas->height() == 128);
    REQUIRE(canvas->viewport() == Rect::from_size(256, 128));
    REQUIRE(canvas->key() == canvas->color_texture().key());
    REQUIRE(canvas->target().framebuffer == canvas->framebuffer());

    REQUIRE(canvas->depth_texture().has_value());
    REQUIRE(canvas->depth_texture()->info().format == TextureFormat::Depth24);
    REQUIRE(canvas->depth_texture()->info().filter == FilterSettings::nearest());

    const TextureResource& color = registry.texture(canvas->key())->get();
    REQUIRE(color.is_attachment());
    REQUIRE(color.attached_to == canvas->framebuffer());
    REQUIRE(color.desc.label == "scene.color");

    SECTION("set_sampling updates the color attachment") {
        REQUIRE(canvas->set_sampling(registry, FilterSettings::nearest(), WrapSettings::repeat()).is_ok());
        REQUIRE(canvas->info().wrap == WrapSettings::repeat());
        REQUIRE(backend.count(NullCall::SetTextureSampling) == 1);
    }

    SECTION("destroying the framebuffer stales every view") {
        REQUIRE(registry.destroy_framebuffer(canvas->framebuffer()).is_ok());
        REQUIRE_FALSE(registry.contains(canvas->key()));
        REQUIRE_FALSE(registry.contains(canvas->depth_texture()->key()));
    }
}

TEST_CASE("Canvas without depth", "[gfx][texture]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    FramebufferDesc desc;
    desc.width = 4;
    desc.height = 4;
    auto canvas = Canvas::create(registry, desc);
    REQUIRE(canvas.is_ok());
    REQUIRE_FALSE(canvas->depth_texture().has_value());
    REQUIRE(registry.len(ResourceKind::Texture) == 1);
}

TEST_CASE("TextureView wraps an existing key", "[gfx][texture]") {
    NullBackend backend;
    ResourceRegistry registry(backend);

    auto key = registry.create_texture(TextureDesc::texture_2d(2, 2));
    const TextureDesc stored = registry.texture(*key)->get().desc;
    TextureView view(*key, stored.info, stored.type);

    const Texture& texture = view;
    REQUIRE(texture.key() == *key);
    REQUIRE(texture.width() == 2);
}
