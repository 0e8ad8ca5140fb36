/// @file texture.cpp
/// @brief Image and Canvas

#include <lumen/gfx/texture.hpp>
#include <lumen/gfx/registry.hpp>

namespace lumen_gfx {

using lumen_core::Err;
using lumen_core::Ok;
using lumen_core::Result;

// =============================================================================
// Image
// =============================================================================

Result<Image> Image::create(ResourceRegistry& registry, const TextureDesc& desc, std::span<const std::uint8_t> pixels) {
    auto key = registry.create_texture(desc, pixels);
    if (!key) {
        return Err<Image>(key.error());
    }
    return Ok(Image(*key, desc.info, desc.type));
}

Result<void> Image::set_sampling(ResourceRegistry& registry, const FilterSettings& filter, const WrapSettings& wrap) {
    auto result = registry.set_texture_sampling(m_key, filter, wrap);
    if (result) {
        m_info.filter = filter;
        m_info.wrap = wrap;
    }
    return result;
}

// =============================================================================
// Canvas
// =============================================================================

Result<Canvas> Canvas::create(ResourceRegistry& registry, const FramebufferDesc& desc) {
    auto key = registry.create_framebuffer(desc);
    if (!key) {
        return Err<Canvas>(key.error());
    }

    const FramebufferResource& fb = registry.framebuffer(*key)->get();
    const TextureResource& color = registry.texture(fb.color)->get();
    TextureView color_view(fb.color, color.desc.info, color.desc.type);

    std::optional<TextureView> depth_view;
    if (fb.depth) {
        const TextureResource& depth = registry.texture(*fb.depth)->get();
        depth_view.emplace(*fb.depth, depth.desc.info, depth.desc.type);
    }
    return Ok(Canvas(*key, color_view, std::move(depth_view)));
}

Rect Canvas::viewport() const {
    const TextureInfo color = m_color.info();
    return Rect::from_size(static_cast<std::int32_t>(color.width), static_cast<std::int32_t>(color.height));
}

Result<void> Canvas::set_sampling(ResourceRegistry& registry, const FilterSettings& filter, const WrapSettings& wrap) {
    auto result = registry.set_texture_sampling(m_color.key(), filter, wrap);
    if (result) {
        TextureInfo info = m_color.info();
        info.filter = filter;
        info.wrap = wrap;
        m_color = TextureView(m_color.key(), info, m_color.type());
    }
    return result;
}

} // namespace lumen_gfx
