#pragma once

/**
 * @file layer.h
 * @brief Layer descriptors: one full-screen shader pass each
 *
 * A layer is supplied by calling code and never modified by the stack.
 * Layers are shared as `std::shared_ptr<const LayerDescriptor>`; the stack
 * uses pointer identity to decide when its materials must be rebuilt.
 *
 * @par Example
 * @code
 * auto glow = makeLayer({
 *     "glow",
 *     R"(
 * @fragment
 * fn fs_main(input: VertexOutput) -> @location(0) vec4f {
 *     let pulse = 0.5 + 0.5 * sin(u.time * u.uRate);
 *     return vec4f(input.uv, pulse, pulse);
 * }
 * )",
 *     {{"uRate", 2.0f}},
 *     nullptr,
 *     BlendMode::Additive
 * });
 * @endcode
 */

#include <shaderstack/uniforms.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace shaderstack {

/**
 * @brief How a layer composites onto what is already on the surface
 */
enum class BlendMode {
    Normal,      ///< Source-over alpha blending (default)
    Additive,    ///< src * srcAlpha + dst
    Subtractive, ///< dst * (1 - src)
    Multiply,    ///< dst * src
    None         ///< No blending, layer overwrites the surface
};

/**
 * @brief Get blend mode display name
 */
inline const char* blendModeName(BlendMode mode) {
    switch (mode) {
        case BlendMode::Normal:      return "Normal";
        case BlendMode::Additive:    return "Additive";
        case BlendMode::Subtractive: return "Subtractive";
        case BlendMode::Multiply:    return "Multiply";
        case BlendMode::None:        return "None";
        default:                     return "Unknown";
    }
}

/**
 * @brief Drawing-buffer size in physical pixels
 */
struct FrameSize {
    int width = 0;
    int height = 0;
};

/// Per-frame hook: mutate the layer's own uniforms just before its draw call
using BeforeFrameFn = std::function<void(UniformSet& uniforms, float timeSeconds, FrameSize size)>;

/**
 * @brief Caller contract for one layer
 *
 * `shaderSource` is the WGSL fragment stage. It must define
 * `fn fs_main(input: VertexOutput) -> @location(0) vec4f` and reads its
 * uniforms through `u` (e.g. `u.time`, `u.resolution`, `u.uSpeed`).
 */
struct LayerDescriptor {
    std::string name;                      ///< Label used in diagnostics
    std::string shaderSource;              ///< WGSL fragment source
    UniformSet initialUniforms;            ///< Caller uniforms (must avoid time/resolution)
    BeforeFrameFn onBeforeFrame;           ///< Optional per-frame mutation
    BlendMode blendMode = BlendMode::Normal;
};

using LayerPtr = std::shared_ptr<const LayerDescriptor>;

/// Ordered layers, back to front
using Layers = std::vector<LayerPtr>;

inline LayerPtr makeLayer(LayerDescriptor desc) {
    return std::make_shared<const LayerDescriptor>(std::move(desc));
}

/**
 * @brief Same length and the same descriptor object in every slot
 */
inline bool sameLayers(const Layers& a, const Layers& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) return false;
    }
    return true;
}

} // namespace shaderstack
