#pragma once

/// @file resource.hpp
/// @brief Resource keys, texture formats and resource descriptors for lumen_gfx

#include "fwd.hpp"
#include "types.hpp"
#include <lumen/core/handle.hpp>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace lumen_gfx {

// =============================================================================
// ResourceKind / ResourceKey
// =============================================================================

enum class ResourceKind : std::uint8_t {
    Buffer,
    Texture,
    Shader,
    Framebuffer
};

[[nodiscard]] inline const char* resource_kind_name(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::Buffer: return "Buffer";
        case ResourceKind::Texture: return "Texture";
        case ResourceKind::Shader: return "Shader";
        case ResourceKind::Framebuffer: return "Framebuffer";
        default: return "Unknown";
    }
}

/// Tag for the registry arena
struct GpuResource;

using ResourceHandle = lumen_core::Handle<GpuResource>;

/// Opaque (index, generation, kind) reference to a registry resource.
/// Only valid while the generation matches the registry slot.
struct ResourceKey {
    ResourceHandle handle;
    ResourceKind kind = ResourceKind::Buffer;

    [[nodiscard]] static constexpr ResourceKey null(ResourceKind k) noexcept {
        return ResourceKey{ResourceHandle::null(), k};
    }

    [[nodiscard]] constexpr bool is_null() const noexcept { return handle.is_null(); }
    [[nodiscard]] constexpr std::uint32_t index() const noexcept { return handle.index(); }
    [[nodiscard]] constexpr std::uint32_t generation() const noexcept { return handle.generation(); }

    /// "Texture#3v1" or "Texture#null"
    [[nodiscard]] std::string to_string() const {
        std::string out = resource_kind_name(kind);
        if (is_null()) {
            return out + "#null";
        }
        return out + "#" + std::to_string(index()) + "v" + std::to_string(generation());
    }

    constexpr bool operator==(const ResourceKey&) const noexcept = default;
};

/// Backend object name (GL object id); 0 is never a live object
using BackendId = std::uint32_t;
constexpr BackendId NULL_BACKEND_ID = 0;

// =============================================================================
// RenderTarget
// =============================================================================

/// Default backbuffer or an offscreen framebuffer
struct RenderTarget {
    ResourceKey framebuffer = ResourceKey::null(ResourceKind::Framebuffer);

    [[nodiscard]] static constexpr RenderTarget backbuffer() noexcept { return RenderTarget{}; }

    [[nodiscard]] static constexpr RenderTarget offscreen(ResourceKey key) noexcept {
        return RenderTarget{key};
    }

    [[nodiscard]] constexpr bool is_backbuffer() const noexcept { return framebuffer.is_null(); }

    constexpr bool operator==(const RenderTarget&) const noexcept = default;
};

// =============================================================================
// TextureFormat
// =============================================================================

enum class TextureFormat : std::uint8_t {
    R8,
    Rg8,
    Rgb8,
    Rgba8,
    Srgba8,
    R16Float,
    Rgba16Float,
    R32Float,
    Rgba32Float,
    Depth16,
    Depth24,
    Depth32Float,
    Depth24Stencil8
};

[[nodiscard]] constexpr bool is_depth_format(TextureFormat format) noexcept {
    switch (format) {
        case TextureFormat::Depth16:
        case TextureFormat::Depth24:
        case TextureFormat::Depth32Float:
        case TextureFormat::Depth24Stencil8:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] constexpr bool has_stencil(TextureFormat format) noexcept {
    return format == TextureFormat::Depth24Stencil8;
}

[[nodiscard]] constexpr std::size_t bytes_per_pixel(TextureFormat format) noexcept {
    switch (format) {
        case TextureFormat::R8: return 1;
        case TextureFormat::Rg8: return 2;
        case TextureFormat::Depth16: return 2;
        case TextureFormat::R16Float: return 2;
        case TextureFormat::Rgb8: return 3;
        case TextureFormat::Depth24: return 3;
        case TextureFormat::Rgba8:
        case TextureFormat::Srgba8:
        case TextureFormat::R32Float:
        case TextureFormat::Depth32Float:
        case TextureFormat::Depth24Stencil8:
            return 4;
        case TextureFormat::Rgba16Float: return 8;
        case TextureFormat::Rgba32Float: return 16;
        default: return 4;
    }
}

[[nodiscard]] inline const char* texture_format_name(TextureFormat format) noexcept {
    switch (format) {
        case TextureFormat::R8: return "R8";
        case TextureFormat::Rg8: return "Rg8";
        case TextureFormat::Rgb8: return "Rgb8";
        case TextureFormat::Rgba8: return "Rgba8";
        case TextureFormat::Srgba8: return "Srgba8";
        case TextureFormat::R16Float: return "R16Float";
        case TextureFormat::Rgba16Float: return "Rgba16Float";
        case TextureFormat::R32Float: return "R32Float";
        case TextureFormat::Rgba32Float: return "Rgba32Float";
        case TextureFormat::Depth16: return "Depth16";
        case TextureFormat::Depth24: return "Depth24";
        case TextureFormat::Depth32Float: return "Depth32Float";
        case TextureFormat::Depth24Stencil8: return "Depth24Stencil8";
        default: return "Unknown";
    }
}

// =============================================================================
// Sampling
// =============================================================================

enum class TextureType : std::uint8_t {
    Tex2D,
    Volume,
    Tex2DArray,
    Cube
};

constexpr std::size_t TEXTURE_TYPE_COUNT = 4;

enum class FilterMode : std::uint8_t {
    Nearest,
    Linear
};

enum class WrapMode : std::uint8_t {
    Clamp,
    ClampZero,
    Repeat,
    MirroredRepeat
};

struct FilterSettings {
    FilterMode min = FilterMode::Linear;
    FilterMode mag = FilterMode::Linear;
    std::optional<FilterMode> mipmap;
    float anisotropy = 1.0f;

    [[nodiscard]] static FilterSettings nearest() {
        return FilterSettings{FilterMode::Nearest, FilterMode::Nearest, std::nullopt, 1.0f};
    }

    bool operator==(const FilterSettings&) const = default;
};

struct WrapSettings {
    WrapMode s = WrapMode::Clamp;
    WrapMode t = WrapMode::Clamp;
    WrapMode r = WrapMode::Clamp;

    [[nodiscard]] static WrapSettings repeat() {
        return WrapSettings{WrapMode::Repeat, WrapMode::Repeat, WrapMode::Repeat};
    }

    bool operator==(const WrapSettings&) const = default;
};

/// Format, size and sampling parameters of a texture
struct TextureInfo {
    TextureFormat format = TextureFormat::Rgba8;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    FilterSettings filter;
    WrapSettings wrap;
    bool mipmaps = false;

    /// Size of one tightly packed mip level 0 image
    [[nodiscard]] std::size_t byte_size() const noexcept {
        return static_cast<std::size_t>(width) * height * bytes_per_pixel(format);
    }

    bool operator==(const TextureInfo&) const = default;
};

// =============================================================================
// Descriptors
// =============================================================================

struct TextureDesc {
    TextureInfo info;
    TextureType type = TextureType::Tex2D;
    std::string label;

    [[nodiscard]] static TextureDesc texture_2d(std::uint32_t w, std::uint32_t h,
                                                TextureFormat fmt = TextureFormat::Rgba8) {
        TextureDesc desc;
        desc.info.format = fmt;
        desc.info.width = w;
        desc.info.height = h;
        return desc;
    }
};

/// Offscreen framebuffer: one color attachment and an optional depth attachment
struct FramebufferDesc {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    TextureFormat color_format = TextureFormat::Rgba8;
    std::optional<TextureFormat> depth_format;
    FilterSettings filter;
    WrapSettings wrap;
    std::string label;
};

enum class FramebufferStatus : std::uint8_t {
    Complete,
    IncompleteAttachment,
    MissingAttachment,
    IncompleteDimensions,
    Unsupported,
    IncompleteMultisample,
    Unknown
};

[[nodiscard]] inline const char* framebuffer_status_name(FramebufferStatus status) noexcept {
    switch (status) {
        case FramebufferStatus::Complete: return "Complete";
        case FramebufferStatus::IncompleteAttachment: return "IncompleteAttachment";
        case FramebufferStatus::MissingAttachment: return "MissingAttachment";
        case FramebufferStatus::IncompleteDimensions: return "IncompleteDimensions";
        case FramebufferStatus::Unsupported: return "Unsupported";
        case FramebufferStatus::IncompleteMultisample: return "IncompleteMultisample";
        default: return "Unknown";
    }
}

} // namespace lumen_gfx

template<>
struct std::hash<lumen_gfx::ResourceKey> {
    std::size_t operator()(const lumen_gfx::ResourceKey& key) const noexcept {
        return std::hash<std::uint64_t>{}(key.handle.bits) ^ (static_cast<std::size_t>(key.kind) << 1);
    }
};
