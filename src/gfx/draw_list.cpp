/// @file draw_list.cpp
/// @brief DrawList recording and flush

#include <lumen/gfx/draw_list.hpp>
#include <lumen/gfx/backend.hpp>
#include <lumen/gfx/registry.hpp>
#include <lumen/gfx/state_cache.hpp>
#include <lumen/core/log.hpp>
#include <algorithm>
#include <iterator>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace lumen_gfx {

using lumen_core::Err;
using lumen_core::Error;
using lumen_core::ErrorCode;
using lumen_core::GraphicsError;
using lumen_core::Ok;
using lumen_core::Result;

namespace {

Error at_command(Error error, std::size_t index) {
    error.with_context("command", std::to_string(index));
    return error;
}

Result<void> check_target(const ResourceRegistry& registry, const std::optional<RenderTarget>& target) {
    if (!target || target->is_backbuffer()) {
        return Ok();
    }
    auto framebuffer = registry.framebuffer(target->framebuffer);
    if (!framebuffer) {
        return Err(framebuffer.error());
    }
    return Ok();
}

/// Opaque draws into an explicit target; the only ones whose order is free
bool is_reorderable(const Command& command) {
    const auto* draw = std::get_if<DrawCommand>(&command);
    return draw != nullptr && draw->reorder_safe && draw->settings.target.has_value() &&
           draw->settings.blend.has_value() && !draw->settings.blend->enabled;
}

const AttributeDescriptor* find_attribute(const std::vector<AttributeDescriptor>& attributes,
                                          const std::string& name) {
    auto it = std::find_if(attributes.begin(), attributes.end(),
                           [&](const AttributeDescriptor& a) { return a.name == name; });
    return it != attributes.end() && it->location >= 0 ? &*it : nullptr;
}

} // anonymous namespace

// =============================================================================
// DrawCommand
// =============================================================================

std::vector<ResourceKey> DrawCommand::referenced_keys() const {
    std::vector<ResourceKey> keys;
    keys.push_back(shader);
    for (const auto& key : mesh.referenced_keys()) {
        keys.push_back(key);
    }
    for (const auto& binding : textures) {
        keys.push_back(binding.texture);
    }
    if (settings.target && !settings.target->is_backbuffer()) {
        keys.push_back(settings.target->framebuffer);
    }
    return keys;
}

// =============================================================================
// Recording
// =============================================================================

DrawList::DrawList(DrawListOptions options)
    : m_options(options)
    , m_log(lumen_core::gfx_logger())
{
}

void DrawList::clear(const ClearSettings& settings) {
    ClearCommand command{settings};
    if (command.settings.color) {
        command.settings.color = command.settings.color->clamped();
    }
    m_commands.emplace_back(std::move(command));
}

void DrawList::draw(ResourceKey shader, const Mesh& mesh, const PipelineSettings& settings,
                    UniformOverrides uniforms, bool reorder_safe) {
    DrawCommand command;
    command.shader = shader;
    command.mesh = mesh.binding();
    command.uniforms = std::move(uniforms);
    command.settings = settings;
    command.reorder_safe = reorder_safe;
    draw(std::move(command));
}

void DrawList::draw(DrawCommand command) {
    command.settings = merge(m_defaults, command.settings);
    m_commands.emplace_back(std::move(command));
}

void DrawList::append(DrawList&& other) {
    m_commands.reserve(m_commands.size() + other.m_commands.size());
    std::move(other.m_commands.begin(), other.m_commands.end(), std::back_inserter(m_commands));
    other.m_commands.clear();
}

// =============================================================================
// Flush
// =============================================================================

Result<FlushStats> DrawList::flush(StateCache& cache, ResourceRegistry& registry, IGfxBackend& backend) {
    std::vector<Command> commands = std::move(m_commands);
    m_commands.clear();

    FlushStats stats;
    stats.commands = commands.size();
    if (commands.empty()) {
        return Ok(stats);
    }

    if (auto valid = validate(commands, registry, cache); !valid) {
        m_log->warn("Flush of {} commands rejected: {}", commands.size(),
                    lumen_core::build_error_chain(valid.error()));
        lumen_core::debug::record_error(valid.error());
        return Err<FlushStats>(valid.error());
    }

    if (m_options.allow_reordering) {
        stats.reordered_runs = reorder(commands);
    }

    // Mapped writes reach the backend before any draw reads them
    for (const auto& command : commands) {
        const auto* draw = std::get_if<DrawCommand>(&command);
        if (draw == nullptr) {
            continue;
        }
        for (const auto& key : draw->mesh.referenced_keys()) {
            auto uploaded = registry.unmap_buffer(key);
            if (!uploaded) {
                return Err<FlushStats>(uploaded.error());
            }
            if (*uploaded) {
                ++stats.buffer_uploads;
            }
        }
    }

    const std::uint64_t changed_before = cache.changed_count();
    const std::uint64_t elided_before = cache.elided_count();

    for (std::size_t i = 0; i < commands.size(); ++i) {
        if (const auto* clear = std::get_if<ClearCommand>(&commands[i])) {
            if (auto r = execute_clear(*clear, cache, backend); !r) {
                Error error = at_command(r.error(), i);
                m_log->error("Clear failed: {}", lumen_core::build_error_chain(error));
                return Err<FlushStats>(std::move(error));
            }
            ++stats.clears;
            continue;
        }

        auto drawn = execute_draw(std::get<DrawCommand>(commands[i]), cache, registry, backend, stats);
        if (!drawn) {
            Error error = at_command(drawn.error(), i);
            m_log->error("Draw failed: {}", lumen_core::build_error_chain(error));
            return Err<FlushStats>(std::move(error));
        }
        if (*drawn) {
            ++stats.draws;
        } else {
            ++stats.skipped_draws;
        }
    }

    stats.state_changes = cache.changed_count() - changed_before;
    stats.state_elided = cache.elided_count() - elided_before;

    m_log->trace("Flushed {} commands: {} draws, {} clears, {} state changes ({} elided)",
                 stats.commands, stats.draws, stats.clears, stats.state_changes, stats.state_elided);
    return Ok(stats);
}

Result<void> DrawList::validate(const std::vector<Command>& commands, const ResourceRegistry& registry,
                                const StateCache& cache) const {
    const StateCacheLimits& limits = cache.limits();
    const std::uint32_t attribute_limit = std::min<std::uint32_t>(limits.vertex_attributes, 32);

    // Uniform names supplied so far in this list, per shader
    std::unordered_map<ResourceKey, std::unordered_set<std::string>> supplied;

    for (std::size_t i = 0; i < commands.size(); ++i) {
        if (const auto* clear = std::get_if<ClearCommand>(&commands[i])) {
            if (auto r = check_target(registry, clear->settings.target); !r) {
                return Err(at_command(r.error(), i));
            }
            if (clear->settings.scissor && clear->settings.scissor->is_empty()) {
                return Err(at_command(GraphicsError::invalid_dimensions(
                    "scissor", clear->settings.scissor->width, clear->settings.scissor->height), i));
            }
            continue;
        }

        const auto& draw = std::get<DrawCommand>(commands[i]);

        if (auto r = draw.settings.validate(); !r) {
            return Err(at_command(r.error(), i));
        }
        if (auto r = check_target(registry, draw.settings.target); !r) {
            return Err(at_command(r.error(), i));
        }

        auto shader = registry.shader(draw.shader);
        if (!shader) {
            return Err(at_command(shader.error(), i));
        }
        const ShaderResource& program = shader->get();

        for (const auto& key : draw.mesh.referenced_keys()) {
            if (auto buffer = registry.buffer(key); !buffer) {
                return Err(at_command(buffer.error(), i));
            }
        }
        auto extents = registry.draw_extents(draw.mesh);
        if (!extents) {
            return Err(at_command(extents.error(), i));
        }
        for (const auto& [key, extent] : *extents) {
            const std::size_t size = registry.buffer(key)->get().size();
            if (extent > size) {
                return Err(at_command(GraphicsError::buffer_overflow(0, extent, size), i));
            }
        }

        for (const auto& binding : draw.textures) {
            if (binding.unit >= limits.texture_units) {
                return Err(at_command(Error(ErrorCode::InvalidArgument,
                    "Texture unit " + std::to_string(binding.unit) + " exceeds the " +
                    std::to_string(limits.texture_units) + " configured units"), i));
            }
            if (auto texture = registry.texture(binding.texture); !texture) {
                return Err(at_command(texture.error(), i));
            }
        }

        for (const auto& attachment : draw.mesh.attachments) {
            for (const auto& format : attachment.formats) {
                const auto* attribute = find_attribute(program.attributes, format.name);
                if (attribute != nullptr && static_cast<std::uint32_t>(attribute->location) >= attribute_limit) {
                    return Err(at_command(Error(ErrorCode::InvalidArgument,
                        "Attribute '" + attribute->name + "' at location " + std::to_string(attribute->location) +
                        " exceeds the " + std::to_string(attribute_limit) + " configured attributes"), i));
                }
            }
        }

        auto& names = supplied[draw.shader];
        for (const auto& [name, value] : draw.uniforms) {
            if (auto r = program.state.check_uniform(name, value); !r) {
                return Err(at_command(r.error(), i));
            }
            names.insert(name);
        }

        if (m_options.strict_uniforms) {
            for (const auto& name : program.state.missing_uniforms()) {
                if (names.count(name) == 0) {
                    Error error = GraphicsError::missing_uniform(name);
                    error.with_context("shader", draw.shader.to_string());
                    return Err(at_command(std::move(error), i));
                }
            }
        }
    }
    return Ok();
}

std::size_t DrawList::reorder(std::vector<Command>& commands) const {
    std::size_t runs = 0;
    std::size_t i = 0;
    while (i < commands.size()) {
        if (!is_reorderable(commands[i])) {
            ++i;
            continue;
        }

        const PipelineSettings& settings = std::get<DrawCommand>(commands[i]).settings;
        std::size_t end = i + 1;
        while (end < commands.size() && is_reorderable(commands[end]) &&
               std::get<DrawCommand>(commands[end]).settings == settings) {
            ++end;
        }

        if (end - i > 1) {
            std::stable_sort(commands.begin() + static_cast<std::ptrdiff_t>(i),
                             commands.begin() + static_cast<std::ptrdiff_t>(end),
                             [](const Command& a, const Command& b) {
                                 return std::get<DrawCommand>(a).shader.handle.bits <
                                        std::get<DrawCommand>(b).shader.handle.bits;
                             });
            ++runs;
        }
        i = end;
    }
    return runs;
}

Result<void> DrawList::execute_clear(const ClearCommand& command, StateCache& cache, IGfxBackend& backend) {
    const ClearSettings& settings = command.settings;

    if (settings.target) {
        if (auto r = cache.bind_target(*settings.target); !r) {
            return Err(r.error());
        }
    }

    // An unset scissor clears the whole target
    const ScissorState scissor = settings.scissor ? ScissorState::of(*settings.scissor) : ScissorState::disabled();
    if (auto r = cache.set_scissor(scissor); !r) {
        return Err(r.error());
    }

    backend.clear(settings.color, settings.depth, settings.stencil);
    return Ok();
}

Result<bool> DrawList::execute_draw(const DrawCommand& command, StateCache& cache, ResourceRegistry& registry,
                                    IGfxBackend& backend, FlushStats& stats) {
    if (auto r = cache.apply(command.settings); !r) {
        return Err<bool>(r.error());
    }
    if (auto r = cache.bind_shader(command.shader); !r) {
        return Err<bool>(r.error());
    }

    auto shader = registry.shader_mut(command.shader);
    if (!shader) {
        return Err<bool>(shader.error());
    }
    ShaderResource& program = shader->get();

    for (const auto& binding : command.textures) {
        if (auto r = cache.bind_texture(binding.unit, binding.texture); !r) {
            return Err<bool>(r.error());
        }
    }

    for (const auto& [name, value] : command.uniforms) {
        auto uploaded = program.state.set_uniform(backend, name, value);
        if (!uploaded) {
            return Err<bool>(uploaded.error());
        }
        if (*uploaded) {
            ++stats.uniform_uploads;
        } else {
            ++stats.uniforms_elided;
        }
    }

    // Attributes are matched to the shader by name
    std::uint32_t mask = 0;
    for (const auto& attachment : command.mesh.attachments) {
        bool buffer_bound = false;
        for (const auto& format : attachment.formats) {
            const auto* attribute = find_attribute(program.attributes, format.name);
            if (attribute == nullptr) {
                m_log->trace("Shader {} has no attribute '{}'", command.shader.to_string(), format.name);
                continue;
            }
            if (!buffer_bound) {
                if (auto r = cache.bind_buffer(BufferKind::Vertex, attachment.buffer); !r) {
                    return Err<bool>(r.error());
                }
                buffer_bound = true;
            }
            const auto location = static_cast<std::uint32_t>(attribute->location);
            backend.set_vertex_attribute(location, format, attachment.stride, attachment.step);
            mask |= 1u << location;
        }
    }
    if (auto r = cache.set_enabled_attributes(mask); !r) {
        return Err<bool>(r.error());
    }

    const MeshBinding& mesh = command.mesh;
    if (mesh.range.count == 0 || mesh.instance_count == 0) {
        return Ok(false);
    }

    if (mesh.indices) {
        if (auto r = cache.bind_buffer(BufferKind::Index, mesh.indices->buffer); !r) {
            return Err<bool>(r.error());
        }
        backend.draw_elements(mesh.mode, mesh.indices->type, mesh.range.first, mesh.range.count,
                              mesh.instance_count);
    } else {
        backend.draw_arrays(mesh.mode, mesh.range.first, mesh.range.count, mesh.instance_count);
    }
    return Ok(true);
}

} // namespace lumen_gfx
