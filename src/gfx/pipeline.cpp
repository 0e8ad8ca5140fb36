/// @file pipeline.cpp
/// @brief PipelineSettings composition and validation

#include <lumen/gfx/pipeline.hpp>

namespace lumen_gfx {

namespace {

template<typename T>
std::optional<T> pick(const std::optional<T>& base, const std::optional<T>& over) {
    return over.has_value() ? over : base;
}

} // anonymous namespace

std::size_t PipelineSettings::set_count() const noexcept {
    return static_cast<std::size_t>(viewport.has_value()) +
           static_cast<std::size_t>(blend.has_value()) +
           static_cast<std::size_t>(depth.has_value()) +
           static_cast<std::size_t>(stencil.has_value()) +
           static_cast<std::size_t>(scissor.has_value()) +
           static_cast<std::size_t>(culling.has_value()) +
           static_cast<std::size_t>(target.has_value());
}

lumen_core::Result<void> PipelineSettings::validate() const {
    if (viewport && viewport->is_empty()) {
        return lumen_core::Err(lumen_core::GraphicsError::invalid_dimensions(
            "viewport", viewport->width, viewport->height));
    }
    if (scissor && scissor->enabled && scissor->rect.is_empty()) {
        return lumen_core::Err(lumen_core::GraphicsError::invalid_dimensions(
            "scissor", scissor->rect.width, scissor->rect.height));
    }
    if (depth && depth->enabled && (depth->range_near < 0.0f || depth->range_far > 1.0f)) {
        return lumen_core::Err(lumen_core::Error(lumen_core::ErrorCode::InvalidArgument,
            "Depth range must lie within [0, 1]"));
    }
    return lumen_core::Ok();
}

PipelineSettings merge(const PipelineSettings& base, const PipelineSettings& override_settings) {
    PipelineSettings out;
    out.viewport = pick(base.viewport, override_settings.viewport);
    out.blend = pick(base.blend, override_settings.blend);
    out.depth = pick(base.depth, override_settings.depth);
    out.stencil = pick(base.stencil, override_settings.stencil);
    out.scissor = pick(base.scissor, override_settings.scissor);
    out.culling = pick(base.culling, override_settings.culling);
    out.target = pick(base.target, override_settings.target);
    return out;
}

} // namespace lumen_gfx
