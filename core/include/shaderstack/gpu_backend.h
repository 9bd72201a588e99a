#pragma once

/**
 * @file gpu_backend.h
 * @brief Rendering-context capability used by the compositor
 *
 * GpuBackend is the seam between the compositor logic and a real graphics
 * API. WebGpuBackend implements it on wgpu-native; tests use a recording
 * fake. All calls happen on the frame-loop thread.
 *
 * Lifecycle expected by the compositor:
 * 1. createContext() once, then createQuad()
 * 2. resizeDrawingBuffer() and createDrawable() as needed
 * 3. per frame: beginFrame(), draw() per layer, endFrame()
 * 4. destroyDrawable() for every drawable, destroyQuad(), destroyContext()
 */

#include <shaderstack/layer.h>
#include <shaderstack/uniforms.h>

#include <glm/glm.hpp>

#include <cstdint>
#include <string>

namespace shaderstack {

/**
 * @brief GPU selection hint
 */
enum class PowerPreference {
    Default,
    LowPower,
    HighPerformance
};

/**
 * @brief Fixed context-creation policy
 */
struct ContextOptions {
    bool antialias = false;  ///< Multisampling; backends may refuse a context with it set
    bool alpha = true;       ///< Surface keeps an alpha channel for the page behind it
    PowerPreference powerPreference = PowerPreference::HighPerformance;
};

/**
 * @brief RGBA clear color, 0-1
 */
struct ClearColor {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 0.0f;
};

/// Opaque drawable (program + parameter set) handle
using DrawableHandle = uint32_t;

/// Returned by createDrawable() on failure
constexpr DrawableHandle INVALID_DRAWABLE = 0;

/**
 * @brief Everything needed to build one drawable
 */
struct DrawableDesc {
    std::string label;
    std::string fragmentSource;  ///< Caller WGSL, fs_main entry point
    UniformLayout layout;        ///< Uniform buffer shape
    BlendMode blendMode = BlendMode::Normal;
    bool depthTest = false;
    bool depthWrite = false;
};

/**
 * @brief Abstract rendering context
 */
class GpuBackend {
public:
    virtual ~GpuBackend() = default;

    /**
     * @brief Create the rendering context and attach its surface
     * @return False if no context can be produced (reason in lastError())
     */
    virtual bool createContext(const ContextOptions& options) = 0;

    /// @brief Release the context and detach its surface. No-op if none.
    virtual void destroyContext() = 0;

    /**
     * @brief Create the shared full-screen quad
     * @param projection Orthographic camera applied to the quad corners
     */
    virtual bool createQuad(const glm::mat4& projection) = 0;

    /// @brief Release the shared quad. No-op if none.
    virtual void destroyQuad() = 0;

    /// @brief Resize the drawing buffer (physical pixels)
    virtual void resizeDrawingBuffer(int width, int height) = 0;

    /**
     * @brief Build a program + parameter set for one layer
     * @return INVALID_DRAWABLE on failure (reason in lastError())
     */
    virtual DrawableHandle createDrawable(const DrawableDesc& desc) = 0;

    /// @brief Release a drawable. Unknown handles are ignored.
    virtual void destroyDrawable(DrawableHandle handle) = 0;

    /**
     * @brief Start a frame and clear the surface once
     * @return False if nothing can be drawn this frame
     */
    virtual bool beginFrame(const ClearColor& clear) = 0;

    /// @brief Bind @p handle on the shared quad with @p uniforms and issue one draw call
    virtual void draw(DrawableHandle handle, const UniformSet& uniforms) = 0;

    /// @brief Submit and present the frame started by beginFrame()
    virtual void endFrame() = 0;

    /// @brief Description of the last failure
    virtual const std::string& lastError() const = 0;
};

} // namespace shaderstack
