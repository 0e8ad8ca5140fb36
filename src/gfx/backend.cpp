/// @file backend.cpp
/// @brief Backend factory

#include <lumen/gfx/backend.hpp>
#include "backends/null/null_backend.hpp"
#include "backends/opengl/opengl_backend.hpp"

namespace lumen_gfx {

lumen_core::Result<std::unique_ptr<IGfxBackend>> create_backend(BackendKind kind) {
    switch (kind) {
        case BackendKind::OpenGL:
            return backends::create_opengl_backend();
        case BackendKind::Null:
        default:
            return lumen_core::Ok<std::unique_ptr<IGfxBackend>>(backends::create_null_backend());
    }
}

std::optional<BackendKind> parse_backend_kind(const std::string& name) {
    if (name == "null" || name == "headless") return BackendKind::Null;
    if (name == "opengl" || name == "gl") return BackendKind::OpenGL;
    return std::nullopt;
}

} // namespace lumen_gfx
