/// @file registry.cpp
/// @brief ResourceRegistry implementation

#include <lumen/gfx/registry.hpp>
#include <lumen/gfx/backend.hpp>
#include <lumen/gfx/mesh.hpp>
#include <lumen/core/log.hpp>
#include <algorithm>
#include <cstring>

namespace lumen_gfx {

using lumen_core::Err;
using lumen_core::Error;
using lumen_core::ErrorCode;
using lumen_core::GraphicsError;
using lumen_core::HandleError;
using lumen_core::Ok;
using lumen_core::Result;

namespace {

template<typename R>
Result<ResourceRef<R>> narrow(Result<ResourceRef<GpuResource>> resource) {
    if (!resource) {
        return Err<ResourceRef<R>>(resource.error());
    }
    return Ok(std::cref(*resource->get().template as<R>()));
}

template<typename R>
Result<ResourceMut<R>> narrow_mut(Result<ResourceMut<GpuResource>> resource) {
    if (!resource) {
        return Err<ResourceMut<R>>(resource.error());
    }
    return Ok(std::ref(*resource->get().template as<R>()));
}

std::uint32_t read_index(const std::uint8_t* at, IndexType type) {
    if (type == IndexType::U16) {
        std::uint16_t value = 0;
        std::memcpy(&value, at, sizeof(value));
        return value;
    }
    std::uint32_t value = 0;
    std::memcpy(&value, at, sizeof(value));
    return value;
}

/// Layers a pixel upload must cover, or 0 if any whole number of layers is accepted
std::size_t required_layers(TextureType type) {
    switch (type) {
        case TextureType::Tex2D: return 1;
        case TextureType::Cube: return 6;
        default: return 0;
    }
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

ResourceRegistry::ResourceRegistry(IGfxBackend& backend, std::size_t slot_limit)
    : m_backend(backend)
    , m_log(lumen_core::gfx_logger())
{
    m_resources.set_slot_limit(slot_limit);
}

ResourceRegistry::~ResourceRegistry() {
    const std::size_t count = m_resources.len();

    // Framebuffers before the textures they reference
    m_resources.for_each([this](ResourceHandle, const GpuResource& resource) {
        if (resource.kind() == ResourceKind::Framebuffer) {
            release(resource);
        }
    });
    m_resources.for_each([this](ResourceHandle, const GpuResource& resource) {
        if (resource.kind() != ResourceKind::Framebuffer) {
            release(resource);
        }
    });
    m_resources.clear();

    if (count > 0) {
        m_log->debug("Registry released {} resources", count);
    }
}

void ResourceRegistry::release(const GpuResource& resource) {
    std::visit([this](const auto& r) {
        using R = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<R, BufferResource>) {
            m_backend.destroy_buffer(r.id);
        } else if constexpr (std::is_same_v<R, TextureResource>) {
            m_backend.destroy_texture(r.id);
        } else if constexpr (std::is_same_v<R, ShaderResource>) {
            m_backend.destroy_program(r.program);
        } else {
            m_backend.destroy_framebuffer(r.id);
        }
    }, resource.data);
}

Result<ResourceKey> ResourceRegistry::insert(GpuResource resource, ResourceKind kind) {
    if (m_resources.is_full()) {
        release(resource);
        m_log->error("No free registry slot for a {} ({} live)", resource_kind_name(kind), m_resources.len());
        return Err<ResourceKey>(GraphicsError::resource_creation_failed(resource_kind_name(kind), "no free registry slot"));
    }
    return Ok(ResourceKey{m_resources.insert(std::move(resource)), kind});
}

void ResourceRegistry::erase(ResourceKey key) {
    if (auto removed = m_resources.remove(key.handle)) {
        release(*removed);
    }
}

// =============================================================================
// Lookup
// =============================================================================

Result<ResourceRef<GpuResource>> ResourceRegistry::lookup(ResourceKey key, ResourceKind expected) const {
    if (key.kind != expected) {
        return Err<ResourceRef<GpuResource>>(GraphicsError::kind_mismatch(key.to_string(), resource_kind_name(expected)));
    }
    if (auto err = m_resources.check(key.handle)) {
        if (err->kind == HandleError::Kind::Stale) {
            return Err<ResourceRef<GpuResource>>(GraphicsError::stale_handle(key.to_string()));
        }
        return Err<ResourceRef<GpuResource>>(GraphicsError::not_found(key.to_string()));
    }
    const GpuResource* resource = m_resources.get(key.handle);
    if (resource->kind() != expected) {
        return Err<ResourceRef<GpuResource>>(GraphicsError::kind_mismatch(key.to_string(), resource_kind_name(expected)));
    }
    return Ok(std::cref(*resource));
}

Result<ResourceMut<GpuResource>> ResourceRegistry::lookup_mut(ResourceKey key, ResourceKind expected) {
    auto found = lookup(key, expected);
    if (!found) {
        return Err<ResourceMut<GpuResource>>(found.error());
    }
    return Ok(std::ref(*m_resources.get_mut(key.handle)));
}

Result<void> ResourceRegistry::validate(ResourceKey key) const {
    auto found = lookup(key, key.kind);
    if (!found) {
        return Err(found.error());
    }
    return Ok();
}

Result<ResourceRef<GpuResource>> ResourceRegistry::get(ResourceKey key) const {
    return lookup(key, key.kind);
}

Result<ResourceMut<GpuResource>> ResourceRegistry::get_mut(ResourceKey key) {
    return lookup_mut(key, key.kind);
}

Result<ResourceRef<BufferResource>> ResourceRegistry::buffer(ResourceKey key) const {
    return narrow<BufferResource>(lookup(key, ResourceKind::Buffer));
}

Result<ResourceMut<BufferResource>> ResourceRegistry::buffer_mut(ResourceKey key) {
    return narrow_mut<BufferResource>(lookup_mut(key, ResourceKind::Buffer));
}

Result<ResourceRef<TextureResource>> ResourceRegistry::texture(ResourceKey key) const {
    return narrow<TextureResource>(lookup(key, ResourceKind::Texture));
}

Result<ResourceMut<TextureResource>> ResourceRegistry::texture_mut(ResourceKey key) {
    return narrow_mut<TextureResource>(lookup_mut(key, ResourceKind::Texture));
}

Result<ResourceRef<ShaderResource>> ResourceRegistry::shader(ResourceKey key) const {
    return narrow<ShaderResource>(lookup(key, ResourceKind::Shader));
}

Result<ResourceMut<ShaderResource>> ResourceRegistry::shader_mut(ResourceKey key) {
    return narrow_mut<ShaderResource>(lookup_mut(key, ResourceKind::Shader));
}

Result<ResourceRef<FramebufferResource>> ResourceRegistry::framebuffer(ResourceKey key) const {
    return narrow<FramebufferResource>(lookup(key, ResourceKind::Framebuffer));
}

Result<ResourceMut<FramebufferResource>> ResourceRegistry::framebuffer_mut(ResourceKey key) {
    return narrow_mut<FramebufferResource>(lookup_mut(key, ResourceKind::Framebuffer));
}

bool ResourceRegistry::contains(ResourceKey key) const {
    const GpuResource* resource = m_resources.get(key.handle);
    return resource != nullptr && resource->kind() == key.kind;
}

std::size_t ResourceRegistry::len(ResourceKind kind) const {
    std::size_t count = 0;
    m_resources.for_each([&count, kind](ResourceHandle, const GpuResource& resource) {
        if (resource.kind() == kind) {
            ++count;
        }
    });
    return count;
}

void ResourceRegistry::invalidate_uniforms() {
    m_resources.for_each_mut([](ResourceHandle, GpuResource& resource) {
        if (auto* shader = resource.as<ShaderResource>()) {
            shader->state.invalidate();
        }
    });
}

// =============================================================================
// Buffers
// =============================================================================

Result<ResourceKey> ResourceRegistry::create_buffer(std::span<const std::uint8_t> data, BufferKind kind, BufferUsage usage) {
    if (data.empty()) {
        return Err<ResourceKey>(GraphicsError::invalid_dimensions("buffer", 0, 1));
    }

    auto id = m_backend.create_buffer(kind, usage, data.size(), data.data());
    if (!id) {
        m_log->error("Buffer creation failed: {}", id.error().message());
        return Err<ResourceKey>(id.error());
    }

    BufferResource buffer{*id, kind, usage, std::vector<std::uint8_t>(data.begin(), data.end()), std::nullopt};
    auto inserted = insert(GpuResource{std::move(buffer)}, ResourceKind::Buffer);
    if (!inserted) {
        return inserted;
    }
    const ResourceKey key = *inserted;
    m_log->debug("Created {} ({} {} bytes, {})", key.to_string(), buffer_kind_name(kind), data.size(),
                 buffer_usage_name(usage));
    return Ok(key);
}

Result<ResourceKey> ResourceRegistry::create_buffer(std::size_t size, BufferKind kind, BufferUsage usage) {
    if (size == 0) {
        return Err<ResourceKey>(GraphicsError::invalid_dimensions("buffer", 0, 1));
    }
    std::vector<std::uint8_t> zeros(size, 0);
    return create_buffer(std::span<const std::uint8_t>(zeros), kind, usage);
}

Result<void> ResourceRegistry::write_buffer(ResourceKey key, std::size_t offset, std::span<const std::uint8_t> bytes) {
    auto found = buffer_mut(key);
    if (!found) {
        return Err(found.error());
    }
    BufferResource& buffer = found->get();

    const std::size_t capacity = buffer.size();
    if (offset > capacity || bytes.size() > capacity - offset) {
        m_log->warn("Rejected write to {}: [{}, +{}) exceeds {} bytes", key.to_string(), offset, bytes.size(), capacity);
        return Err(GraphicsError::buffer_overflow(offset, bytes.size(), capacity));
    }
    if (bytes.empty()) {
        return Ok();
    }

    std::memcpy(buffer.shadow.data() + offset, bytes.data(), bytes.size());
    m_backend.write_buffer(buffer.id, buffer.kind, offset, bytes.data(), bytes.size());
    return Ok();
}

Result<std::span<const std::uint8_t>> ResourceRegistry::read_buffer(ResourceKey key) const {
    auto found = buffer(key);
    if (!found) {
        return Err<std::span<const std::uint8_t>>(found.error());
    }
    return Ok(std::span<const std::uint8_t>(found->get().shadow));
}

Result<void> ResourceRegistry::map_write(ResourceKey key, std::size_t offset, std::span<const std::uint8_t> bytes) {
    auto found = buffer_mut(key);
    if (!found) {
        return Err(found.error());
    }
    BufferResource& buffer = found->get();

    const std::size_t capacity = buffer.size();
    if (offset > capacity || bytes.size() > capacity - offset) {
        return Err(GraphicsError::buffer_overflow(offset, bytes.size(), capacity));
    }
    if (bytes.empty()) {
        return Ok();
    }

    std::memcpy(buffer.shadow.data() + offset, bytes.data(), bytes.size());

    // One range spanning every write since the last upload
    const std::size_t end = offset + bytes.size();
    if (buffer.modified) {
        const std::size_t begin = std::min(buffer.modified->offset, offset);
        buffer.modified = ModifiedRange{begin, std::max(buffer.modified->end(), end) - begin};
    } else {
        buffer.modified = ModifiedRange{offset, bytes.size()};
    }
    return Ok();
}

Result<bool> ResourceRegistry::unmap_buffer(ResourceKey key) {
    auto found = buffer_mut(key);
    if (!found) {
        return Err<bool>(found.error());
    }
    BufferResource& buffer = found->get();
    if (!buffer.modified) {
        return Ok(false);
    }

    const ModifiedRange range = *buffer.modified;
    m_backend.write_buffer(buffer.id, buffer.kind, range.offset, buffer.shadow.data() + range.offset, range.size);
    buffer.modified.reset();
    m_log->trace("Unmapped {}: uploaded [{}, +{})", key.to_string(), range.offset, range.size);
    return Ok(true);
}

Result<void> ResourceRegistry::resize_buffer(ResourceKey key, std::size_t new_size) {
    auto found = buffer_mut(key);
    if (!found) {
        return Err(found.error());
    }
    if (new_size == 0) {
        return Err(GraphicsError::invalid_dimensions("buffer", 0, 1));
    }

    const std::size_t pinned = pinned_extent(key);
    if (new_size < pinned) {
        m_log->warn("Rejected resize of {} to {} bytes: {} bytes pinned by recorded draws",
                    key.to_string(), new_size, pinned);
        return Err(GraphicsError::buffer_overflow(0, pinned, new_size));
    }

    BufferResource& buffer = found->get();
    const std::size_t old_size = buffer.size();
    if (new_size == old_size) {
        return Ok();
    }

    buffer.shadow.resize(new_size, 0);
    m_backend.reallocate_buffer(buffer.id, buffer.kind, buffer.usage, new_size, buffer.shadow.data());
    buffer.modified.reset();
    m_log->debug("Resized {} from {} to {} bytes", key.to_string(), old_size, new_size);
    return Ok();
}

// =============================================================================
// Textures
// =============================================================================

Result<ResourceKey> ResourceRegistry::create_texture(const TextureDesc& desc, std::span<const std::uint8_t> pixels) {
    if (desc.info.width == 0 || desc.info.height == 0) {
        return Err<ResourceKey>(GraphicsError::invalid_dimensions("texture", desc.info.width, desc.info.height));
    }

    if (!pixels.empty()) {
        const std::size_t layer = desc.info.byte_size();
        const std::size_t layers = required_layers(desc.type);
        const bool valid = layers > 0 ? pixels.size() == layer * layers
                                      : pixels.size() % layer == 0;
        if (!valid) {
            return Err<ResourceKey>(GraphicsError::buffer_overflow(0, pixels.size(), layers > 0 ? layer * layers : layer));
        }
    }

    auto id = m_backend.create_texture(desc, pixels.empty() ? nullptr : pixels.data(), pixels.size());
    if (!id) {
        m_log->error("Texture creation failed ({}): {}", desc.label, id.error().message());
        return Err<ResourceKey>(id.error());
    }

    auto inserted = insert(GpuResource{TextureResource{*id, desc, ResourceKey::null(ResourceKind::Framebuffer)}},
                           ResourceKind::Texture);
    if (!inserted) {
        return inserted;
    }
    const ResourceKey key = *inserted;
    m_log->debug("Created {} ({}x{} {})", key.to_string(), desc.info.width, desc.info.height,
                 texture_format_name(desc.info.format));
    return Ok(key);
}

Result<void> ResourceRegistry::set_texture_sampling(ResourceKey key, const FilterSettings& filter, const WrapSettings& wrap) {
    auto found = texture_mut(key);
    if (!found) {
        return Err(found.error());
    }
    TextureResource& texture = found->get();
    if (texture.desc.info.filter == filter && texture.desc.info.wrap == wrap) {
        return Ok();
    }
    m_backend.set_texture_sampling(texture.id, texture.desc.type, filter, wrap);
    texture.desc.info.filter = filter;
    texture.desc.info.wrap = wrap;
    return Ok();
}

// =============================================================================
// Shaders
// =============================================================================

Result<ResourceKey> ResourceRegistry::create_shader(const ShaderSource& source) {
    auto compiled = m_backend.compile_program(source);
    if (!compiled) {
        const auto* gfx = compiled.error().as<GraphicsError>();
        m_log->error("Shader '{}' failed: {}{}{}", source.label, compiled.error().message(),
                     gfx && !gfx->diagnostic.empty() ? "\n" : "",
                     gfx ? gfx->diagnostic : std::string());
        return Err<ResourceKey>(compiled.error());
    }

    CompiledProgram program = std::move(*compiled);
    std::stable_sort(program.attributes.begin(), program.attributes.end(),
                     [](const AttributeDescriptor& a, const AttributeDescriptor& b) { return a.location < b.location; });

    const std::size_t attribute_count = program.attributes.size();
    const std::size_t uniform_count = program.uniforms.size();
    ShaderResource shader{program.program, std::move(program.attributes),
                          ShaderState(std::move(program.uniforms)), source.label};
    auto inserted = insert(GpuResource{std::move(shader)}, ResourceKind::Shader);
    if (!inserted) {
        return inserted;
    }
    const ResourceKey key = *inserted;
    m_log->debug("Created {} '{}' ({} attributes, {} uniforms)", key.to_string(), source.label,
                 attribute_count, uniform_count);
    return Ok(key);
}

// =============================================================================
// Framebuffers
// =============================================================================

Result<ResourceKey> ResourceRegistry::create_framebuffer(const FramebufferDesc& desc) {
    if (desc.width == 0 || desc.height == 0) {
        return Err<ResourceKey>(GraphicsError::invalid_dimensions("framebuffer", desc.width, desc.height));
    }
    if (is_depth_format(desc.color_format)) {
        return Err<ResourceKey>(Error(ErrorCode::InvalidArgument, "Color attachment cannot use a depth format"));
    }
    if (desc.depth_format && !is_depth_format(*desc.depth_format)) {
        return Err<ResourceKey>(Error(ErrorCode::InvalidArgument, "Depth attachment requires a depth format"));
    }

    TextureDesc color_desc = TextureDesc::texture_2d(desc.width, desc.height, desc.color_format);
    color_desc.info.filter = desc.filter;
    color_desc.info.wrap = desc.wrap;
    color_desc.label = desc.label + ".color";

    auto color = create_texture(color_desc);
    if (!color) {
        return Err<ResourceKey>(color.error());
    }

    std::optional<ResourceKey> depth;
    if (desc.depth_format) {
        TextureDesc depth_desc = TextureDesc::texture_2d(desc.width, desc.height, *desc.depth_format);
        depth_desc.info.filter = FilterSettings::nearest();
        depth_desc.label = desc.label + ".depth";
        auto created = create_texture(depth_desc);
        if (!created) {
            erase(*color);
            return Err<ResourceKey>(created.error());
        }
        depth = *created;
    }

    auto rollback = [this, &color, &depth] {
        erase(*color);
        if (depth) {
            erase(*depth);
        }
    };

    const BackendId color_id = texture(*color)->get().id;
    std::optional<BackendId> depth_id;
    if (depth) {
        depth_id = texture(*depth)->get().id;
    }

    auto id = m_backend.create_framebuffer(color_id, depth_id, desc.depth_format && has_stencil(*desc.depth_format));
    if (!id) {
        rollback();
        m_log->error("Framebuffer creation failed ({}): {}", desc.label, id.error().message());
        return Err<ResourceKey>(id.error());
    }

    FramebufferStatus status = m_backend.framebuffer_status(*id);
    if (status != FramebufferStatus::Complete) {
        m_backend.destroy_framebuffer(*id);
        rollback();
        m_log->error("Framebuffer '{}' incomplete: {}", desc.label, framebuffer_status_name(status));
        return Err<ResourceKey>(GraphicsError::incomplete_framebuffer(framebuffer_status_name(status)));
    }

    FramebufferResource framebuffer{*id, desc.width, desc.height, *color, depth, desc.label};
    auto inserted = insert(GpuResource{std::move(framebuffer)}, ResourceKind::Framebuffer);
    if (!inserted) {
        rollback();
        return inserted;
    }
    const ResourceKey key = *inserted;

    texture_mut(*color)->get().attached_to = key;
    if (depth) {
        texture_mut(*depth)->get().attached_to = key;
    }

    m_log->debug("Created {} '{}' ({}x{}, depth: {})", key.to_string(), desc.label, desc.width, desc.height,
                 desc.depth_format ? texture_format_name(*desc.depth_format) : "none");
    return Ok(key);
}

// =============================================================================
// Destruction
// =============================================================================

Result<void> ResourceRegistry::destroy_buffer(ResourceKey key) {
    auto found = lookup(key, ResourceKind::Buffer);
    if (!found) {
        return Err(found.error());
    }
    erase(key);
    m_pins.erase(key);
    m_log->debug("Destroyed {}", key.to_string());
    return Ok();
}

Result<void> ResourceRegistry::destroy_texture(ResourceKey key) {
    auto found = texture(key);
    if (!found) {
        return Err(found.error());
    }
    if (found->get().is_attachment()) {
        return Err(Error(ErrorCode::InvalidArgument,
            key.to_string() + " is attached to " + found->get().attached_to.to_string() +
            "; destroy the framebuffer instead"));
    }
    erase(key);
    m_log->debug("Destroyed {}", key.to_string());
    return Ok();
}

Result<void> ResourceRegistry::destroy_shader(ResourceKey key) {
    auto found = lookup(key, ResourceKind::Shader);
    if (!found) {
        return Err(found.error());
    }
    erase(key);
    m_log->debug("Destroyed {}", key.to_string());
    return Ok();
}

Result<void> ResourceRegistry::destroy_framebuffer(ResourceKey key) {
    auto found = framebuffer(key);
    if (!found) {
        return Err(found.error());
    }
    const ResourceKey color = found->get().color;
    const std::optional<ResourceKey> depth = found->get().depth;

    erase(key);

    erase(color);
    if (depth) {
        erase(*depth);
    }
    m_log->debug("Destroyed {} and its attachments", key.to_string());
    return Ok();
}

Result<void> ResourceRegistry::destroy(ResourceKey key) {
    switch (key.kind) {
        case ResourceKind::Buffer: return destroy_buffer(key);
        case ResourceKind::Texture: return destroy_texture(key);
        case ResourceKind::Shader: return destroy_shader(key);
        case ResourceKind::Framebuffer: return destroy_framebuffer(key);
        default: return Err(GraphicsError::not_found(key.to_string()));
    }
}

// =============================================================================
// In-flight pins
// =============================================================================

Result<std::vector<std::pair<ResourceKey, std::size_t>>> ResourceRegistry::draw_extents(const MeshBinding& mesh) const {
    using Extents = std::vector<std::pair<ResourceKey, std::size_t>>;

    std::size_t indexed_vertices = 0;
    if (mesh.indices && mesh.range.count > 0) {
        auto found = buffer(mesh.indices->buffer);
        if (!found) {
            return Err<Extents>(found.error());
        }
        const std::vector<std::uint8_t>& indices = found->get().shadow;
        const std::size_t stride = index_type_size(mesh.indices->type);
        const std::size_t begin = static_cast<std::size_t>(mesh.range.first) * stride;
        const std::size_t bytes = static_cast<std::size_t>(mesh.range.count) * stride;
        if (begin > indices.size() || bytes > indices.size() - begin) {
            return Err<Extents>(GraphicsError::buffer_overflow(begin, bytes, indices.size()));
        }

        std::uint32_t highest = 0;
        for (std::size_t at = begin; at < begin + bytes; at += stride) {
            highest = std::max(highest, read_index(indices.data() + at, mesh.indices->type));
        }
        indexed_vertices = static_cast<std::size_t>(highest) + 1;
    }
    return Ok(mesh.buffer_extents(indexed_vertices));
}

void ResourceRegistry::pin(ResourceKey key, std::size_t extent) {
    auto& pinned = m_pins[key];
    pinned = std::max(pinned, extent);
}

std::size_t ResourceRegistry::pinned_extent(ResourceKey key) const {
    auto it = m_pins.find(key);
    return it != m_pins.end() ? it->second : 0;
}

} // namespace lumen_gfx
