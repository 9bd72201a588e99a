#pragma once

/**
 * @file surface_manager.h
 * @brief Owns the rendering context, shared quad and orthographic camera
 */

#include <shaderstack/config.h>
#include <shaderstack/container.h>
#include <shaderstack/gpu_backend.h>
#include <shaderstack/material_cache.h>

#include <glm/glm.hpp>

#include <string>

namespace shaderstack {

/**
 * @brief Physical drawing surface of one mounted stack
 */
struct SurfaceState {
    bool contextReady = false;
    bool quadReady = false;
    glm::mat4 projection{1.0f};  ///< Orthographic camera over [-1,1] x [-1,1]
    SurfaceSize size;            ///< Current drawing buffer
};

/**
 * @brief Create, resize and dispose the drawing surface
 *
 * One context and one quad per instance, shared by every layer. Resizes
 * are propagated into the MaterialCache's resolution uniforms.
 *
 * @par Example
 * @code
 * MaterialCache materials(backend);
 * SurfaceManager surface(backend, materials, config);
 * if (!surface.initialize(container)) {
 *     // SurfaceUnavailable: surface.lastError()
 * }
 * surface.resize(container.size(), container.devicePixelRatio());
 * surface.dispose();
 * @endcode
 */
class SurfaceManager {
public:
    SurfaceManager(GpuBackend& backend, MaterialCache& materials, const StackConfig& config);
    ~SurfaceManager();

    // Non-copyable
    SurfaceManager(const SurfaceManager&) = delete;
    SurfaceManager& operator=(const SurfaceManager&) = delete;

    /**
     * @brief Create the context, quad and camera, sized to @p container
     * @return False on SurfaceUnavailable; partial resources are released
     */
    bool initialize(const Container& container);

    /**
     * @brief Resize the drawing buffer for a container size
     * @return True if the buffer changed; same size twice is a no-op
     */
    bool resize(const ContainerSize& size, float devicePixelRatio);

    /**
     * @brief Release drawables, quad and context (in that order)
     *
     * Safe to call any number of times.
     */
    void dispose();

    bool isInitialized() const { return m_state.contextReady && m_state.quadReady; }
    const SurfaceState& state() const { return m_state; }

    /// @brief Transparent black if the stack is transparent, opaque black otherwise
    ClearColor clearColor() const;

    /// @brief Number of resizes that reached the backend
    int resizeCount() const { return m_resizeCount; }

    const std::string& lastError() const { return m_error; }

    /// @brief min(devicePixelRatio, cap); non-positive inputs count as 1
    static float effectivePixelRatio(float devicePixelRatio, float cap);

    /// @brief Drawing buffer for a logical size (zero sizes count as 1)
    static SurfaceSize computeSize(const ContainerSize& size, float devicePixelRatio, float cap);

private:
    GpuBackend& m_backend;
    MaterialCache& m_materials;
    StackConfig m_config;
    SurfaceState m_state;
    int m_resizeCount = 0;
    std::string m_error;
};

} // namespace shaderstack
