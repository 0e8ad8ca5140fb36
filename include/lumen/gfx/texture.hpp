#pragma once

/// @file texture.hpp
/// @brief Texture capability: sampling parameters plus a bindable key
///
/// Image (read-only pixels) and Canvas (offscreen render target) both
/// implement Texture. A canvas exposes its attachments as TextureViews, so a
/// pass output binds as a shader input through the same StateCache path.

#include "fwd.hpp"
#include "types.hpp"
#include "resource.hpp"
#include <lumen/core/error.hpp>
#include <cstdint>
#include <optional>
#include <span>

namespace lumen_gfx {

// =============================================================================
// Texture
// =============================================================================

class Texture {
public:
    virtual ~Texture() = default;

    [[nodiscard]] virtual ResourceKey key() const = 0;
    [[nodiscard]] virtual TextureInfo info() const = 0;
    [[nodiscard]] virtual TextureType type() const = 0;

    [[nodiscard]] std::uint32_t width() const { return info().width; }
    [[nodiscard]] std::uint32_t height() const { return info().height; }
};

/// Non-owning view of a registry texture
class TextureView final : public Texture {
public:
    TextureView(ResourceKey key, TextureInfo info, TextureType type = TextureType::Tex2D)
        : m_key(key), m_info(info), m_type(type) {}

    [[nodiscard]] ResourceKey key() const override { return m_key; }
    [[nodiscard]] TextureInfo info() const override { return m_info; }
    [[nodiscard]] TextureType type() const override { return m_type; }

private:
    ResourceKey m_key;
    TextureInfo m_info;
    TextureType m_type;
};

// =============================================================================
// Image
// =============================================================================

/// Texture created from pixel data. The registry owns the backend object;
/// release it with ResourceRegistry::destroy_texture(image.key()).
class Image final : public Texture {
public:
    [[nodiscard]] static lumen_core::Result<Image> create(
        ResourceRegistry& registry, const TextureDesc& desc, std::span<const std::uint8_t> pixels = {});

    /// Update filter and wrap modes on the backend object
    [[nodiscard]] lumen_core::Result<void> set_sampling(
        ResourceRegistry& registry, const FilterSettings& filter, const WrapSettings& wrap);

    [[nodiscard]] ResourceKey key() const override { return m_key; }
    [[nodiscard]] TextureInfo info() const override { return m_info; }
    [[nodiscard]] TextureType type() const override { return m_type; }

private:
    Image(ResourceKey key, TextureInfo info, TextureType type)
        : m_key(key), m_info(info), m_type(type) {}

    ResourceKey m_key;
    TextureInfo m_info;
    TextureType m_type;
};

// =============================================================================
// Canvas
// =============================================================================

/// Offscreen render target with a color attachment and an optional depth
/// attachment. Sampling a canvas samples its color attachment.
class Canvas final : public Texture {
public:
    [[nodiscard]] static lumen_core::Result<Canvas> create(ResourceRegistry& registry, const FramebufferDesc& desc);

    [[nodiscard]] ResourceKey key() const override { return m_color.key(); }
    [[nodiscard]] TextureInfo info() const override { return m_color.info(); }
    [[nodiscard]] TextureType type() const override { return TextureType::Tex2D; }

    [[nodiscard]] ResourceKey framebuffer() const noexcept { return m_framebuffer; }
    [[nodiscard]] RenderTarget target() const noexcept { return RenderTarget::offscreen(m_framebuffer); }
    [[nodiscard]] Rect viewport() const;

    [[nodiscard]] const TextureView& color_texture() const noexcept { return m_color; }
    [[nodiscard]] const std::optional<TextureView>& depth_texture() const noexcept { return m_depth; }

    [[nodiscard]] lumen_core::Result<void> set_sampling(
        ResourceRegistry& registry, const FilterSettings& filter, const WrapSettings& wrap);

private:
    Canvas(ResourceKey framebuffer, TextureView color, std::optional<TextureView> depth)
        : m_framebuffer(framebuffer), m_color(color), m_depth(std::move(depth)) {}

    ResourceKey m_framebuffer;
    TextureView m_color;
    std::optional<TextureView> m_depth;
};

} // namespace lumen_gfx
