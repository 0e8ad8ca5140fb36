#pragma once

/// @file draw_list.hpp
/// @brief Ordered recording of clear and draw commands
///
/// Commands are immutable snapshots taken at record time. flush() validates
/// every referenced key before issuing anything, then replays the commands
/// in submission order through the StateCache. The list is always consumed.

#include "fwd.hpp"
#include "types.hpp"
#include "resource.hpp"
#include "pipeline.hpp"
#include "program.hpp"
#include "mesh.hpp"
#include <lumen/core/error.hpp>
#include <spdlog/logger.h>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lumen_gfx {

// =============================================================================
// Commands
// =============================================================================

using UniformOverrides = std::vector<std::pair<std::string, UniformValue>>;

/// Texture bound to a unit for the duration of a draw
struct TextureBinding {
    std::uint32_t unit = 0;
    ResourceKey texture = ResourceKey::null(ResourceKind::Texture);

    bool operator==(const TextureBinding&) const = default;
};

struct ClearCommand {
    ClearSettings settings;
};

struct DrawCommand {
    ResourceKey shader = ResourceKey::null(ResourceKind::Shader);
    MeshBinding mesh;
    UniformOverrides uniforms;
    std::vector<TextureBinding> textures;
    PipelineSettings settings;
    /// May be reordered among neighbours with identical settings
    bool reorder_safe = false;

    /// Every registry key the command references
    [[nodiscard]] std::vector<ResourceKey> referenced_keys() const;
};

using Command = std::variant<ClearCommand, DrawCommand>;

// =============================================================================
// Options & Statistics
// =============================================================================

struct DrawListOptions {
    /// Stable-sort runs of reorder-safe opaque draws by shader
    bool allow_reordering = false;
    /// Fail flush when a declared uniform has never been supplied
    bool strict_uniforms = false;
};

struct FlushStats {
    std::size_t commands = 0;
    std::size_t draws = 0;
    std::size_t clears = 0;
    std::size_t skipped_draws = 0;      // zero vertices or instances
    std::uint64_t state_changes = 0;
    std::uint64_t state_elided = 0;
    std::uint64_t uniform_uploads = 0;
    std::uint64_t uniforms_elided = 0;
    std::size_t reordered_runs = 0;
    std::size_t buffer_uploads = 0;     // pending mapped ranges written before drawing
};

// =============================================================================
// DrawList
// =============================================================================

class DrawList {
public:
    explicit DrawList(DrawListOptions options = {});

    DrawList(DrawList&&) noexcept = default;
    DrawList& operator=(DrawList&&) noexcept = default;
    DrawList(const DrawList&) = delete;
    DrawList& operator=(const DrawList&) = delete;

    /// Record a clear; the color is clamped to [0, 1]
    void clear(const ClearSettings& settings = {});

    /// Record a draw. The list defaults are merged under `settings`.
    void draw(ResourceKey shader, const Mesh& mesh, const PipelineSettings& settings = {},
              UniformOverrides uniforms = {}, bool reorder_safe = false);

    /// Record a prepared command. The list defaults are merged under its settings.
    void draw(DrawCommand command);

    /// Move every command of `other` to the end of this list
    void append(DrawList&& other);

    /// Drop recorded commands without issuing them
    void reset() { m_commands.clear(); }

    void set_defaults(const PipelineSettings& defaults) { m_defaults = defaults; }
    [[nodiscard]] const PipelineSettings& defaults() const noexcept { return m_defaults; }

    void set_options(const DrawListOptions& options) { m_options = options; }
    [[nodiscard]] const DrawListOptions& options() const noexcept { return m_options; }

    [[nodiscard]] const std::vector<Command>& commands() const noexcept { return m_commands; }
    [[nodiscard]] std::size_t len() const noexcept { return m_commands.size(); }
    [[nodiscard]] bool is_empty() const noexcept { return m_commands.empty(); }

    /// Issue every command and empty the list. On a validation failure no
    /// backend call is made; the list is emptied either way.
    [[nodiscard]] lumen_core::Result<FlushStats> flush(StateCache& cache, ResourceRegistry& registry,
                                                       IGfxBackend& backend);

private:
    [[nodiscard]] lumen_core::Result<void> validate(const std::vector<Command>& commands,
                                                    const ResourceRegistry& registry,
                                                    const StateCache& cache) const;
    [[nodiscard]] std::size_t reorder(std::vector<Command>& commands) const;
    [[nodiscard]] lumen_core::Result<void> execute_clear(const ClearCommand& command, StateCache& cache,
                                                         IGfxBackend& backend);
    [[nodiscard]] lumen_core::Result<bool> execute_draw(const DrawCommand& command, StateCache& cache,
                                                        ResourceRegistry& registry, IGfxBackend& backend,
                                                        FlushStats& stats);

    DrawListOptions m_options;
    PipelineSettings m_defaults;
    std::vector<Command> m_commands;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace lumen_gfx
