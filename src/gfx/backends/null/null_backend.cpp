/// @file null_backend.cpp
/// @brief Headless recording backend

#include "null_backend.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <sstream>

namespace lumen_gfx {
namespace backends {

using lumen_core::Err;
using lumen_core::GraphicsError;
using lumen_core::Ok;
using lumen_core::Result;

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<IGfxBackend> create_null_backend() {
    return std::make_unique<NullBackend>();
}

const char* null_call_name(NullCall call) noexcept {
    switch (call) {
        case NullCall::CreateBuffer: return "CreateBuffer";
        case NullCall::ReallocateBuffer: return "ReallocateBuffer";
        case NullCall::WriteBuffer: return "WriteBuffer";
        case NullCall::DestroyBuffer: return "DestroyBuffer";
        case NullCall::CreateTexture: return "CreateTexture";
        case NullCall::SetTextureSampling: return "SetTextureSampling";
        case NullCall::DestroyTexture: return "DestroyTexture";
        case NullCall::CompileProgram: return "CompileProgram";
        case NullCall::DestroyProgram: return "DestroyProgram";
        case NullCall::CreateFramebuffer: return "CreateFramebuffer";
        case NullCall::DestroyFramebuffer: return "DestroyFramebuffer";
        case NullCall::UseProgram: return "UseProgram";
        case NullCall::SetActiveTextureUnit: return "SetActiveTextureUnit";
        case NullCall::BindTexture: return "BindTexture";
        case NullCall::BindBuffer: return "BindBuffer";
        case NullCall::BindFramebuffer: return "BindFramebuffer";
        case NullCall::SetBlend: return "SetBlend";
        case NullCall::SetDepth: return "SetDepth";
        case NullCall::SetStencil: return "SetStencil";
        case NullCall::SetViewport: return "SetViewport";
        case NullCall::SetScissor: return "SetScissor";
        case NullCall::SetCulling: return "SetCulling";
        case NullCall::SetAttributeEnabled: return "SetAttributeEnabled";
        case NullCall::SetVertexAttribute: return "SetVertexAttribute";
        case NullCall::UploadUniform: return "UploadUniform";
        case NullCall::Clear: return "Clear";
        case NullCall::DrawArrays: return "DrawArrays";
        case NullCall::DrawElements: return "DrawElements";
        case NullCall::PushDebugGroup: return "PushDebugGroup";
        case NullCall::PopDebugGroup: return "PopDebugGroup";
        default: return "Unknown";
    }
}

// =============================================================================
// GLSL Declaration Scanner
// =============================================================================

namespace {

std::optional<ShaderDataType> parse_glsl_type(const std::string& token) {
    static const std::unordered_map<std::string, ShaderDataType> types = {
        {"int", ShaderDataType::Int},
        {"bool", ShaderDataType::Int},
        {"float", ShaderDataType::Float},
        {"vec2", ShaderDataType::Vec2},
        {"vec3", ShaderDataType::Vec3},
        {"vec4", ShaderDataType::Vec4},
        {"ivec2", ShaderDataType::IVec2},
        {"ivec3", ShaderDataType::IVec3},
        {"ivec4", ShaderDataType::IVec4},
        {"mat2", ShaderDataType::Mat2},
        {"mat3", ShaderDataType::Mat3},
        {"mat4", ShaderDataType::Mat4},
        {"sampler2D", ShaderDataType::Sampler2D},
        {"sampler3D", ShaderDataType::Sampler3D},
        {"sampler2DArray", ShaderDataType::Sampler2DArray},
        {"samplerCube", ShaderDataType::SamplerCube},
    };
    auto it = types.find(token);
    if (it == types.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool is_precision_or_interpolation(const std::string& token) {
    return token == "highp" || token == "mediump" || token == "lowp" || token == "flat" ||
           token == "smooth" || token == "noperspective" || token == "centroid";
}

/// Drop comments and preprocessor lines
std::string strip_source(const std::string& source) {
    std::string out;
    out.reserve(source.size());
    bool block_comment = false;
    std::istringstream lines(source);
    std::string line;
    while (std::getline(lines, line)) {
        std::string kept;
        for (std::size_t i = 0; i < line.size(); ++i) {
            if (block_comment) {
                if (line.compare(i, 2, "*/") == 0) {
                    block_comment = false;
                    ++i;
                }
                continue;
            }
            if (line.compare(i, 2, "/*") == 0) {
                block_comment = true;
                ++i;
                continue;
            }
            if (line.compare(i, 2, "//") == 0) {
                break;
            }
            kept.push_back(line[i]);
        }
        auto first = kept.find_first_not_of(" \t\r");
        if (first != std::string::npos && kept[first] == '#') {
            continue;
        }
        out += kept;
        out.push_back('\n');
    }
    return out;
}

/// One declared name, with its array length (0 for scalars)
struct DeclaredName {
    std::string name;
    std::uint32_t array_size = 0;
};

std::vector<DeclaredName> parse_names(const std::string& list) {
    std::vector<DeclaredName> names;
    std::stringstream stream(list);
    std::string part;
    while (std::getline(stream, part, ',')) {
        part.erase(std::remove_if(part.begin(), part.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; }),
                   part.end());
        auto eq = part.find('=');
        if (eq != std::string::npos) {
            part.erase(eq);
        }
        if (part.empty()) {
            continue;
        }
        DeclaredName decl;
        auto bracket = part.find('[');
        if (bracket != std::string::npos) {
            auto close = part.find(']', bracket);
            std::string size = part.substr(bracket + 1, close == std::string::npos ? std::string::npos : close - bracket - 1);
            decl.array_size = size.empty() ? 0 : static_cast<std::uint32_t>(std::strtoul(size.c_str(), nullptr, 10));
            part.erase(bracket);
        }
        decl.name = part;
        names.push_back(std::move(decl));
    }
    return names;
}

struct StageScan {
    std::vector<AttributeDescriptor> inputs;
    std::vector<UniformDescriptor> uniforms;
};

StageScan scan_stage(const std::string& source, bool collect_inputs) {
    static const std::regex layout_location(R"(layout\s*\(\s*location\s*=\s*(\d+)\s*\))");
    static const std::regex layout_any(R"(layout\s*\([^)]*\))");

    StageScan scan;
    std::string body = strip_source(source);
    std::stringstream statements(body);
    std::string statement;
    while (std::getline(statements, statement, ';')) {
        // Declarations after a function body start behind its closing brace
        auto close = statement.rfind('}');
        if (close != std::string::npos) {
            statement.erase(0, close + 1);
        }
        const bool has_layout = statement.find("layout") != std::string::npos;
        if (statement.find('{') != std::string::npos ||
            (statement.find('(') != std::string::npos && !has_layout)) {
            continue;
        }

        std::optional<std::int32_t> explicit_location;
        std::smatch match;
        if (std::regex_search(statement, match, layout_location)) {
            explicit_location = std::stoi(match[1].str());
        }
        statement = std::regex_replace(statement, layout_any, " ");

        std::istringstream tokens(statement);
        std::string token;
        std::vector<std::string> words;
        while (tokens >> token) {
            words.push_back(token);
        }

        std::size_t pos = 0;
        while (pos < words.size() && is_precision_or_interpolation(words[pos])) {
            ++pos;
        }
        if (pos >= words.size()) {
            continue;
        }

        const std::string qualifier = words[pos++];
        const bool is_uniform = qualifier == "uniform";
        const bool is_input = qualifier == "in" || qualifier == "attribute";
        if (!is_uniform && !(is_input && collect_inputs)) {
            continue;
        }
        while (pos < words.size() && is_precision_or_interpolation(words[pos])) {
            ++pos;
        }
        if (pos >= words.size()) {
            continue;
        }
        auto type = parse_glsl_type(words[pos++]);
        if (!type) {
            continue;
        }

        std::string rest;
        for (; pos < words.size(); ++pos) {
            rest += words[pos];
            rest.push_back(' ');
        }

        for (const auto& decl : parse_names(rest)) {
            if (is_uniform) {
                if (decl.array_size == 0) {
                    scan.uniforms.push_back(UniformDescriptor{decl.name, -1, *type});
                } else {
                    for (std::uint32_t i = 0; i < decl.array_size; ++i) {
                        scan.uniforms.push_back(UniformDescriptor{
                            decl.name + "[" + std::to_string(i) + "]", -1, *type});
                    }
                }
            } else {
                scan.inputs.push_back(AttributeDescriptor{decl.name, explicit_location.value_or(-1), *type});
                explicit_location.reset();
            }
        }
    }
    return scan;
}

bool has_main(const std::string& source) {
    static const std::regex main_fn(R"(\bvoid\s+main\s*\()");
    return std::regex_search(strip_source(source), main_fn);
}

Result<void> check_stage(const char* stage, const std::string& source) {
    if (source.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Err(GraphicsError::compile_error(stage, "0:0: error: empty shader source"));
    }
    auto directive = source.find("#error");
    if (directive != std::string::npos) {
        auto end = source.find('\n', directive);
        return Err(GraphicsError::compile_error(stage,
            "0:0: error: " + source.substr(directive, end == std::string::npos ? std::string::npos : end - directive)));
    }
    return Ok();
}

} // anonymous namespace

Result<CompiledProgram> reflect_glsl(const ShaderSource& source) {
    if (auto r = check_stage("vertex", source.vertex); !r) {
        return Err<CompiledProgram>(r.error());
    }
    if (auto r = check_stage("fragment", source.fragment); !r) {
        return Err<CompiledProgram>(r.error());
    }
    if (!has_main(source.vertex)) {
        return Err<CompiledProgram>(GraphicsError::link_error("error: vertex stage has no main()"));
    }
    if (!has_main(source.fragment)) {
        return Err<CompiledProgram>(GraphicsError::link_error("error: fragment stage has no main()"));
    }

    StageScan vertex = scan_stage(source.vertex, true);
    StageScan fragment = scan_stage(source.fragment, false);

    CompiledProgram program;

    // Explicit locations first, then declaration order in the gaps
    std::vector<bool> taken;
    for (const auto& attr : vertex.inputs) {
        if (attr.location >= 0) {
            if (taken.size() <= static_cast<std::size_t>(attr.location)) {
                taken.resize(attr.location + 1, false);
            }
            taken[attr.location] = true;
        }
    }
    std::int32_t next = 0;
    for (auto attr : vertex.inputs) {
        if (attr.location < 0) {
            while (static_cast<std::size_t>(next) < taken.size() && taken[next]) {
                ++next;
            }
            attr.location = next++;
        }
        program.attributes.push_back(std::move(attr));
    }
    std::sort(program.attributes.begin(), program.attributes.end(),
              [](const AttributeDescriptor& a, const AttributeDescriptor& b) { return a.location < b.location; });

    std::int32_t uniform_location = 0;
    auto add_uniforms = [&](const std::vector<UniformDescriptor>& list) {
        for (auto uniform : list) {
            auto dup = std::find_if(program.uniforms.begin(), program.uniforms.end(),
                                    [&](const UniformDescriptor& u) { return u.name == uniform.name; });
            if (dup != program.uniforms.end()) {
                continue;
            }
            uniform.location = uniform_location++;
            program.uniforms.push_back(std::move(uniform));
        }
    };
    add_uniforms(vertex.uniforms);
    add_uniforms(fragment.uniforms);

    return Ok(std::move(program));
}

// =============================================================================
// Recording
// =============================================================================

void NullBackend::record(NullCall call, BackendId id, std::int64_t arg, std::string detail) {
    m_calls.push_back(NullCallRecord{call, id, arg, std::move(detail)});
}

std::size_t NullBackend::count(NullCall call) const {
    return static_cast<std::size_t>(std::count_if(m_calls.begin(), m_calls.end(),
        [call](const NullCallRecord& r) { return r.call == call; }));
}

std::vector<NullCallRecord> NullBackend::calls_of(NullCall call) const {
    std::vector<NullCallRecord> out;
    for (const auto& r : m_calls) {
        if (r.call == call) {
            out.push_back(r);
        }
    }
    return out;
}

const std::vector<std::uint8_t>* NullBackend::buffer_data(BackendId id) const {
    auto it = m_buffers.find(id);
    return it != m_buffers.end() ? &it->second : nullptr;
}

const TextureDesc* NullBackend::texture_desc(BackendId id) const {
    auto it = m_textures.find(id);
    return it != m_textures.end() ? &it->second.desc : nullptr;
}

// =============================================================================
// Buffers
// =============================================================================

Result<BackendId> NullBackend::create_buffer(BufferKind kind, BufferUsage usage, std::size_t size, const void* data) {
    if (m_fail_allocations) {
        return Err<BackendId>(GraphicsError::resource_creation_failed("buffer", "allocation disabled"));
    }
    BackendId id = ++m_next_id;
    std::vector<std::uint8_t> storage(size, 0);
    if (data != nullptr && size > 0) {
        std::memcpy(storage.data(), data, size);
    }
    m_buffers[id] = std::move(storage);
    record(NullCall::CreateBuffer, id, static_cast<std::int64_t>(size),
           std::string(buffer_kind_name(kind)) + "/" + buffer_usage_name(usage));
    return Ok(id);
}

void NullBackend::reallocate_buffer(BackendId id, BufferKind kind, BufferUsage usage,
                                    std::size_t size, const void* data) {
    auto it = m_buffers.find(id);
    if (it != m_buffers.end()) {
        it->second.assign(size, 0);
        if (data != nullptr && size > 0) {
            std::memcpy(it->second.data(), data, size);
        }
    }
    record(NullCall::ReallocateBuffer, id, static_cast<std::int64_t>(size),
           std::string(buffer_kind_name(kind)) + "/" + buffer_usage_name(usage));
}

void NullBackend::write_buffer(BackendId id, BufferKind, std::size_t offset, const void* data, std::size_t size) {
    auto it = m_buffers.find(id);
    if (it != m_buffers.end() && offset + size <= it->second.size() && size > 0) {
        std::memcpy(it->second.data() + offset, data, size);
    }
    record(NullCall::WriteBuffer, id, static_cast<std::int64_t>(size), std::to_string(offset));
}

void NullBackend::destroy_buffer(BackendId id) {
    m_buffers.erase(id);
    record(NullCall::DestroyBuffer, id);
}

// =============================================================================
// Textures
// =============================================================================

Result<BackendId> NullBackend::create_texture(const TextureDesc& desc, const void* data, std::size_t size) {
    if (m_fail_allocations) {
        return Err<BackendId>(GraphicsError::resource_creation_failed("texture", "allocation disabled"));
    }
    if (desc.info.width > m_limits.max_texture_size || desc.info.height > m_limits.max_texture_size) {
        return Err<BackendId>(GraphicsError::invalid_dimensions("texture", desc.info.width, desc.info.height));
    }
    BackendId id = ++m_next_id;
    TextureEntry entry{desc, std::vector<std::uint8_t>(desc.info.byte_size(), 0)};
    if (data != nullptr) {
        std::memcpy(entry.pixels.data(), data, std::min(size, entry.pixels.size()));
    }
    m_textures[id] = std::move(entry);
    record(NullCall::CreateTexture, id, 0, texture_format_name(desc.info.format));
    return Ok(id);
}

void NullBackend::set_texture_sampling(BackendId id, TextureType, const FilterSettings& filter, const WrapSettings& wrap) {
    auto it = m_textures.find(id);
    if (it != m_textures.end()) {
        it->second.desc.info.filter = filter;
        it->second.desc.info.wrap = wrap;
    }
    record(NullCall::SetTextureSampling, id);
}

void NullBackend::destroy_texture(BackendId id) {
    m_textures.erase(id);
    record(NullCall::DestroyTexture, id);
}

// =============================================================================
// Programs
// =============================================================================

Result<CompiledProgram> NullBackend::compile_program(const ShaderSource& source) {
    auto reflected = reflect_glsl(source);
    if (!reflected) {
        record(NullCall::CompileProgram, NULL_BACKEND_ID, 0, reflected.error().message());
        return reflected;
    }
    CompiledProgram program = std::move(reflected).value();
    program.program = ++m_next_id;
    m_programs[program.program] = program;
    record(NullCall::CompileProgram, program.program, 0, source.label);
    return Ok(std::move(program));
}

void NullBackend::destroy_program(BackendId id) {
    m_programs.erase(id);
    record(NullCall::DestroyProgram, id);
}

// =============================================================================
// Framebuffers
// =============================================================================

Result<BackendId> NullBackend::create_framebuffer(BackendId color, std::optional<BackendId> depth, bool depth_has_stencil) {
    if (m_fail_allocations) {
        return Err<BackendId>(GraphicsError::resource_creation_failed("framebuffer", "allocation disabled"));
    }
    BackendId id = ++m_next_id;
    FramebufferEntry entry{color, depth, m_framebuffer_status};
    if (m_textures.find(color) == m_textures.end()) {
        entry.status = FramebufferStatus::MissingAttachment;
    }
    m_framebuffers[id] = entry;
    record(NullCall::CreateFramebuffer, id, depth_has_stencil ? 1 : 0);
    return Ok(id);
}

FramebufferStatus NullBackend::framebuffer_status(BackendId id) {
    auto it = m_framebuffers.find(id);
    return it != m_framebuffers.end() ? it->second.status : FramebufferStatus::Unknown;
}

void NullBackend::destroy_framebuffer(BackendId id) {
    m_framebuffers.erase(id);
    record(NullCall::DestroyFramebuffer, id);
}

// =============================================================================
// Binding State
// =============================================================================

void NullBackend::use_program(BackendId id) {
    record(NullCall::UseProgram, id);
}

void NullBackend::set_active_texture_unit(std::uint32_t unit) {
    record(NullCall::SetActiveTextureUnit, NULL_BACKEND_ID, unit);
}

void NullBackend::bind_texture(TextureType type, BackendId id) {
    record(NullCall::BindTexture, id, static_cast<std::int64_t>(type));
}

void NullBackend::bind_buffer(BufferKind kind, BackendId id) {
    record(NullCall::BindBuffer, id, static_cast<std::int64_t>(kind), buffer_kind_name(kind));
}

void NullBackend::bind_framebuffer(BackendId id) {
    record(NullCall::BindFramebuffer, id);
}

void NullBackend::set_blend(const BlendState& state) {
    record(NullCall::SetBlend, NULL_BACKEND_ID, state.enabled ? 1 : 0);
}

void NullBackend::set_depth(const DepthState& state) {
    record(NullCall::SetDepth, NULL_BACKEND_ID, state.enabled ? 1 : 0);
}

void NullBackend::set_stencil(const StencilState& state) {
    record(NullCall::SetStencil, NULL_BACKEND_ID, state.enabled ? 1 : 0);
}

void NullBackend::set_viewport(const Rect& rect) {
    record(NullCall::SetViewport, NULL_BACKEND_ID, 0,
           std::to_string(rect.x) + "," + std::to_string(rect.y) + "," +
           std::to_string(rect.width) + "x" + std::to_string(rect.height));
}

void NullBackend::set_scissor(const ScissorState& state) {
    record(NullCall::SetScissor, NULL_BACKEND_ID, state.enabled ? 1 : 0);
}

void NullBackend::set_culling(const CullingState& state) {
    record(NullCall::SetCulling, NULL_BACKEND_ID, state.enabled ? 1 : 0);
}

void NullBackend::set_vertex_attribute_enabled(std::uint32_t location, bool enabled) {
    record(NullCall::SetAttributeEnabled, NULL_BACKEND_ID, location, enabled ? "on" : "off");
}

// =============================================================================
// Draw Submission
// =============================================================================

void NullBackend::set_vertex_attribute(std::uint32_t location, const VertexFormat& format,
                                       std::uint32_t stride, std::uint32_t step) {
    record(NullCall::SetVertexAttribute, NULL_BACKEND_ID, location,
           format.name + "/" + std::to_string(stride) + "/" + std::to_string(step));
}

void NullBackend::upload_uniform(std::int32_t location, const UniformValue& value) {
    record(NullCall::UploadUniform, NULL_BACKEND_ID, location, shader_data_type_name(uniform_value_type(value)));
}

void NullBackend::clear(const std::optional<Color>& color, std::optional<float> depth,
                        std::optional<std::int32_t> stencil) {
    std::string mask;
    if (color) mask += "color";
    if (depth) mask += mask.empty() ? "depth" : "|depth";
    if (stencil) mask += mask.empty() ? "stencil" : "|stencil";
    record(NullCall::Clear, NULL_BACKEND_ID, 0, mask);
}

void NullBackend::draw_arrays(DrawMode mode, std::uint32_t, std::uint32_t count, std::uint32_t instances) {
    record(NullCall::DrawArrays, NULL_BACKEND_ID, count,
           std::string(draw_mode_name(mode)) + "x" + std::to_string(instances));
}

void NullBackend::draw_elements(DrawMode mode, IndexType, std::uint32_t, std::uint32_t count,
                                std::uint32_t instances) {
    record(NullCall::DrawElements, NULL_BACKEND_ID, count,
           std::string(draw_mode_name(mode)) + "x" + std::to_string(instances));
}

void NullBackend::push_debug_group(const std::string& name) {
    m_debug_groups.push_back(name);
    record(NullCall::PushDebugGroup, NULL_BACKEND_ID, static_cast<std::int64_t>(m_debug_groups.size()), name);
}

void NullBackend::pop_debug_group() {
    if (!m_debug_groups.empty()) {
        m_debug_groups.pop_back();
    }
    record(NullCall::PopDebugGroup, NULL_BACKEND_ID, static_cast<std::int64_t>(m_debug_groups.size()));
}

} // namespace backends
} // namespace lumen_gfx
