#pragma once

/// @file registry.hpp
/// @brief Generational arena owning every backend resource object
///
/// The registry is the only component that creates or destroys backend
/// objects. Callers hold ResourceKeys; a key resolves only while its
/// generation matches the slot, so a key to a destroyed resource fails with
/// StaleHandle and never reaches a newer resource stored in the same slot.

#include "fwd.hpp"
#include "types.hpp"
#include "resource.hpp"
#include "program.hpp"
#include "shader_state.hpp"
#include <lumen/core/error.hpp>
#include <lumen/core/handle.hpp>
#include <spdlog/logger.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace lumen_gfx {

// =============================================================================
// Resource Records
// =============================================================================

/// Bytes of a buffer's CPU copy written since the last upload
struct ModifiedRange {
    std::size_t offset = 0;
    std::size_t size = 0;

    [[nodiscard]] std::size_t end() const noexcept { return offset + size; }

    bool operator==(const ModifiedRange&) const = default;
};

struct BufferResource {
    BackendId id = NULL_BACKEND_ID;
    BufferKind kind = BufferKind::Vertex;
    BufferUsage usage = BufferUsage::Static;
    std::vector<std::uint8_t> shadow;  // CPU copy of the backend contents
    std::optional<ModifiedRange> modified;  // mapped writes not yet uploaded

    [[nodiscard]] std::size_t size() const noexcept { return shadow.size(); }
};

struct TextureResource {
    BackendId id = NULL_BACKEND_ID;
    TextureDesc desc;
    ResourceKey attached_to = ResourceKey::null(ResourceKind::Framebuffer);

    [[nodiscard]] bool is_attachment() const noexcept { return !attached_to.is_null(); }
};

struct ShaderResource {
    BackendId program = NULL_BACKEND_ID;
    std::vector<AttributeDescriptor> attributes;  // ordered by location
    ShaderState state;
    std::string label;
};

struct FramebufferResource {
    BackendId id = NULL_BACKEND_ID;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    ResourceKey color = ResourceKey::null(ResourceKind::Texture);
    std::optional<ResourceKey> depth;
    std::string label;
};

/// Registry slot payload; alternative order matches ResourceKind
struct GpuResource {
    std::variant<BufferResource, TextureResource, ShaderResource, FramebufferResource> data;

    [[nodiscard]] ResourceKind kind() const noexcept {
        return static_cast<ResourceKind>(data.index());
    }

    template<typename R>
    [[nodiscard]] const R* as() const noexcept { return std::get_if<R>(&data); }

    template<typename R>
    [[nodiscard]] R* as() noexcept { return std::get_if<R>(&data); }
};

template<typename R>
using ResourceRef = std::reference_wrapper<const R>;

template<typename R>
using ResourceMut = std::reference_wrapper<R>;

// =============================================================================
// ResourceRegistry
// =============================================================================

class ResourceRegistry {
public:
    /// `slot_limit` caps how many resources may be live or retired at once
    explicit ResourceRegistry(IGfxBackend& backend,
                              std::size_t slot_limit = lumen_core::handle_constants::MAX_SLOTS);

    /// Releases every live backend object
    ~ResourceRegistry();

    ResourceRegistry(const ResourceRegistry&) = delete;
    ResourceRegistry& operator=(const ResourceRegistry&) = delete;

    // -------------------------------------------------------------------------
    // Buffers
    // -------------------------------------------------------------------------

    [[nodiscard]] lumen_core::Result<ResourceKey> create_buffer(
        std::span<const std::uint8_t> data, BufferKind kind, BufferUsage usage = BufferUsage::Static);

    /// Zero-filled buffer of `size` bytes
    [[nodiscard]] lumen_core::Result<ResourceKey> create_buffer(
        std::size_t size, BufferKind kind, BufferUsage usage = BufferUsage::Static);

    /// BufferOverflow if [offset, offset + bytes.size()) exceeds the capacity
    [[nodiscard]] lumen_core::Result<void> write_buffer(
        ResourceKey key, std::size_t offset, std::span<const std::uint8_t> bytes);

    [[nodiscard]] lumen_core::Result<std::span<const std::uint8_t>> read_buffer(ResourceKey key) const;

    /// Write into the CPU copy only and widen the buffer's modified range.
    /// The bytes reach the backend on unmap_buffer() or the next flush.
    [[nodiscard]] lumen_core::Result<void> map_write(
        ResourceKey key, std::size_t offset, std::span<const std::uint8_t> bytes);

    /// Upload the modified range in one backend write and reset it.
    /// Ok(false) when nothing was pending.
    [[nodiscard]] lumen_core::Result<bool> unmap_buffer(ResourceKey key);

    /// Keeps [0, min(old, new)), zero-fills growth. BufferOverflow when
    /// shrinking below the range pinned by recorded draws.
    [[nodiscard]] lumen_core::Result<void> resize_buffer(ResourceKey key, std::size_t new_size);

    // -------------------------------------------------------------------------
    // Textures, Shaders, Framebuffers
    // -------------------------------------------------------------------------

    [[nodiscard]] lumen_core::Result<ResourceKey> create_texture(
        const TextureDesc& desc, std::span<const std::uint8_t> pixels = {});

    [[nodiscard]] lumen_core::Result<void> set_texture_sampling(
        ResourceKey key, const FilterSettings& filter, const WrapSettings& wrap);

    /// Compile through the backend program provider. No key on failure.
    [[nodiscard]] lumen_core::Result<ResourceKey> create_shader(const ShaderSource& source);

    /// Creates the attachment textures, then the framebuffer. Rolls back on
    /// an incomplete status.
    [[nodiscard]] lumen_core::Result<ResourceKey> create_framebuffer(const FramebufferDesc& desc);

    // -------------------------------------------------------------------------
    // Destruction
    // -------------------------------------------------------------------------

    [[nodiscard]] lumen_core::Result<void> destroy_buffer(ResourceKey key);
    /// Rejects framebuffer attachments
    [[nodiscard]] lumen_core::Result<void> destroy_texture(ResourceKey key);
    [[nodiscard]] lumen_core::Result<void> destroy_shader(ResourceKey key);
    /// Also releases the attachment textures
    [[nodiscard]] lumen_core::Result<void> destroy_framebuffer(ResourceKey key);
    /// Dispatch on the key's kind
    [[nodiscard]] lumen_core::Result<void> destroy(ResourceKey key);

    // -------------------------------------------------------------------------
    // Lookup
    // -------------------------------------------------------------------------

    /// Ok if the key is live and names a resource of its own kind
    [[nodiscard]] lumen_core::Result<void> validate(ResourceKey key) const;

    [[nodiscard]] lumen_core::Result<ResourceRef<GpuResource>> get(ResourceKey key) const;
    [[nodiscard]] lumen_core::Result<ResourceMut<GpuResource>> get_mut(ResourceKey key);

    [[nodiscard]] lumen_core::Result<ResourceRef<BufferResource>> buffer(ResourceKey key) const;
    [[nodiscard]] lumen_core::Result<ResourceMut<BufferResource>> buffer_mut(ResourceKey key);
    [[nodiscard]] lumen_core::Result<ResourceRef<TextureResource>> texture(ResourceKey key) const;
    [[nodiscard]] lumen_core::Result<ResourceMut<TextureResource>> texture_mut(ResourceKey key);
    [[nodiscard]] lumen_core::Result<ResourceRef<ShaderResource>> shader(ResourceKey key) const;
    [[nodiscard]] lumen_core::Result<ResourceMut<ShaderResource>> shader_mut(ResourceKey key);
    [[nodiscard]] lumen_core::Result<ResourceRef<FramebufferResource>> framebuffer(ResourceKey key) const;
    [[nodiscard]] lumen_core::Result<ResourceMut<FramebufferResource>> framebuffer_mut(ResourceKey key);

    [[nodiscard]] bool contains(ResourceKey key) const;
    [[nodiscard]] std::size_t len() const noexcept { return m_resources.len(); }
    [[nodiscard]] std::size_t len(ResourceKind kind) const;
    [[nodiscard]] bool is_empty() const noexcept { return m_resources.is_empty(); }

    /// Forget the cached uniform values of every shader
    void invalidate_uniforms();

    // -------------------------------------------------------------------------
    // In-flight pins
    // -------------------------------------------------------------------------

    /// Bytes a draw of `mesh` reads from each buffer. Indexed draws are
    /// bounded by the highest index in range, read from the CPU copy.
    [[nodiscard]] lumen_core::Result<std::vector<std::pair<ResourceKey, std::size_t>>> draw_extents(
        const MeshBinding& mesh) const;

    /// Record that a pending draw reads `extent` bytes of buffer `key`
    void pin(ResourceKey key, std::size_t extent);
    [[nodiscard]] std::size_t pinned_extent(ResourceKey key) const;
    void clear_pins() { m_pins.clear(); }

    [[nodiscard]] IGfxBackend& backend() noexcept { return m_backend; }

private:
    [[nodiscard]] lumen_core::Result<ResourceRef<GpuResource>> lookup(ResourceKey key, ResourceKind expected) const;
    [[nodiscard]] lumen_core::Result<ResourceMut<GpuResource>> lookup_mut(ResourceKey key, ResourceKind expected);
    /// Releases the backend object if the arena has no free slot left
    [[nodiscard]] lumen_core::Result<ResourceKey> insert(GpuResource resource, ResourceKind kind);
    /// Remove a live slot and release its backend object
    void erase(ResourceKey key);
    void release(const GpuResource& resource);

    IGfxBackend& m_backend;
    lumen_core::HandleMap<GpuResource> m_resources;
    std::unordered_map<ResourceKey, std::size_t> m_pins;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace lumen_gfx
