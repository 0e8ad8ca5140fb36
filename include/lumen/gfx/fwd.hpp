#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for lumen_gfx module

#include <cstdint>

namespace lumen_gfx {

// =============================================================================
// Value Types
// =============================================================================

struct Rect;
struct Color;
struct ResourceKey;
struct RenderTarget;
struct TextureInfo;
struct TextureDesc;
struct FramebufferDesc;

// =============================================================================
// Pipeline State
// =============================================================================

struct BlendState;
struct DepthState;
struct StencilState;
struct ScissorState;
struct CullingState;
struct ClearSettings;
struct PipelineSettings;

// =============================================================================
// Shaders & Meshes
// =============================================================================

struct ShaderSource;
struct AttributeDescriptor;
struct UniformDescriptor;
struct CompiledProgram;
class ShaderState;
class Shader;
class ScopedShader;

struct VertexFormat;
struct AttachedAttributes;
struct MeshBinding;
class Mesh;
class VertexMesh;
class IndexedMesh;
class MultiMesh;
class MappedVertexMesh;
class MappedIndexedMesh;
class QuadBatch;

// =============================================================================
// Textures
// =============================================================================

class Texture;
class TextureView;
class Image;
class Canvas;

// =============================================================================
// Engine
// =============================================================================

class IGfxBackend;
class ResourceRegistry;
class StateCache;
class DrawList;
struct ContextConfig;
class GraphicsContext;

} // namespace lumen_gfx
