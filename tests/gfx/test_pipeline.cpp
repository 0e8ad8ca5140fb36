// lumen_gfx PipelineSettings, ClearSettings and fixed-function state tests

#include <catch2/catch_test_macros.hpp>
#include <lumen/gfx/pipeline.hpp>

using namespace lumen_gfx;
using lumen_core::ErrorCode;
using lumen_core::GraphicsError;

TEST_CASE("PipelineSettings default to inheriting everything", "[gfx][pipeline]") {
    PipelineSettings settings;
    REQUIRE(settings.is_empty());
    REQUIRE(settings.set_count() == 0);
    REQUIRE(settings.validate().is_ok());
}

TEST_CASE("PipelineSettings builders set one field each", "[gfx][pipeline]") {
    PipelineSettings settings = PipelineSettings{}
        .with_viewport(Rect::from_size(800, 600))
        .with_depth(DepthState::read_only())
        .with_scissor(Rect{10, 10, 100, 50});

    REQUIRE(settings.set_count() == 3);
    REQUIRE(settings.viewport == Rect{0, 0, 800, 600});
    REQUIRE_FALSE(settings.depth->write);
    REQUIRE(settings.scissor->enabled);
    REQUIRE_FALSE(settings.blend.has_value());

    PipelineSettings unscissored = settings.without_scissor();
    REQUIRE_FALSE(unscissored.scissor->enabled);
    REQUIRE(settings.scissor->enabled);
}

TEST_CASE("merge composes field by field", "[gfx][pipeline]") {
    SECTION("viewport from one side and blend from the other") {
        PipelineSettings a = PipelineSettings{}.with_viewport(Rect::from_size(640, 480));
        PipelineSettings b = PipelineSettings{}.with_blend(BlendState::additive());

        PipelineSettings merged = merge(a, b);
        REQUIRE(merged.viewport == Rect::from_size(640, 480));
        REQUIRE(merged.blend == BlendState::additive());
        REQUIRE(merged.set_count() == 2);
    }

    SECTION("override wins where both are set") {
        PipelineSettings base = PipelineSettings{}
            .with_blend(BlendState::alpha())
            .with_culling(CullingState{});
        PipelineSettings over = PipelineSettings{}.with_blend(BlendState::disabled());

        PipelineSettings merged = merge(base, over);
        REQUIRE_FALSE(merged.blend->enabled);
        REQUIRE(merged.culling->enabled);
    }

    SECTION("empty sides are identities") {
        PipelineSettings s = PipelineSettings{}.with_depth(DepthState::disabled());
        REQUIRE(merge(s, PipelineSettings{}) == s);
        REQUIRE(merge(PipelineSettings{}, s) == s);
    }

    SECTION("targets merge like any other field") {
        RenderTarget offscreen = RenderTarget::offscreen(
            ResourceKey{ResourceHandle::create(2, 0), ResourceKind::Framebuffer});
        PipelineSettings merged = merge(PipelineSettings{}.with_target(offscreen), PipelineSettings{});
        REQUIRE(merged.target == offscreen);
        REQUIRE_FALSE(merged.target->is_backbuffer());
    }
}

TEST_CASE("PipelineSettings validation", "[gfx][pipeline]") {
    SECTION("empty viewport") {
        auto r = PipelineSettings{}.with_viewport(Rect{0, 0, 0, 10}).validate();
        REQUIRE(r.error().is_graphics(GraphicsError::Kind::InvalidDimensions));
    }

    SECTION("empty scissor only matters when enabled") {
        REQUIRE(PipelineSettings{}.with_scissor(Rect{}).validate().is_err());
        REQUIRE(PipelineSettings{}.without_scissor().validate().is_ok());
    }

    SECTION("depth range outside [0, 1]") {
        DepthState depth;
        depth.range_far = 2.0f;
        auto r = PipelineSettings{}.with_depth(depth).validate();
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Disabled states compare equal regardless of parameters", "[gfx][pipeline]") {
    BlendState a = BlendState::disabled();
    BlendState b = BlendState::additive();
    b.enabled = false;
    REQUIRE(a == b);
    REQUIRE_FALSE(BlendState::alpha() == BlendState::additive());

    DepthState d1 = DepthState::disabled();
    DepthState d2 = DepthState::read_only(CompareFunction::Always);
    d2.enabled = false;
    REQUIRE(d1 == d2);

    REQUIRE(ScissorState::disabled() == ScissorState{false, Rect{1, 2, 3, 4}});
    REQUIRE_FALSE(ScissorState::of(Rect{0, 0, 4, 4}) == ScissorState::of(Rect{0, 0, 4, 5}));
    REQUIRE(StencilState::disabled() == StencilState::disabled());

    CullingState front_cw{false, CullFace::Front, Winding::Clockwise};
    REQUIRE(CullingState::disabled() == front_cw);
    REQUIRE_FALSE(CullingState{} == CullingState{true, CullFace::Front, Winding::CounterClockwise});
    REQUIRE_FALSE(CullingState{} == CullingState::disabled());
}

TEST_CASE("ClearSettings defaults", "[gfx][pipeline]") {
    ClearSettings settings;
    REQUIRE(settings.color == Color::black());
    REQUIRE(settings.depth == 1.0f);
    REQUIRE(settings.stencil == 0);
    REQUIRE_FALSE(settings.target.has_value());
    REQUIRE_FALSE(settings.scissor.has_value());

    ClearSettings color_only = ClearSettings::color_only(Color::white());
    REQUIRE(color_only.color == Color::white());
    REQUIRE_FALSE(color_only.depth.has_value());
    REQUIRE_FALSE(color_only.stencil.has_value());

    ClearSettings backbuffer = settings.with_target(RenderTarget::backbuffer());
    REQUIRE(backbuffer.target->is_backbuffer());
}

TEST_CASE("Color clamping", "[gfx][pipeline]") {
    Color c{1.5f, -0.25f, 0.5f, 2.0f};
    REQUIRE(c.clamped() == Color{1.0f, 0.0f, 0.5f, 1.0f});
}
