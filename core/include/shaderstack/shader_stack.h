#pragma once

/**
 * @file shader_stack.h
 * @brief Multi-layer full-screen shader compositor
 *
 * ShaderStack draws an ordered list of layers onto one shared surface every
 * frame. Layer 0 is drawn first (back), the last layer is drawn on top with
 * its own blend mode.
 *
 * @par Example
 * @code
 * GlfwContainer container(window);
 * GlfwFrameHost host;
 * WebGpuBackend backend(window);
 *
 * ShaderStack stack(container, backend, host, config);
 * stack.mount({steam, lightning});
 * while (host.runOnce()) {}
 * stack.unmount();
 * @endcode
 */

#include <shaderstack/config.h>
#include <shaderstack/container.h>
#include <shaderstack/frame_host.h>
#include <shaderstack/frame_scheduler.h>
#include <shaderstack/gpu_backend.h>
#include <shaderstack/layer.h>
#include <shaderstack/material_cache.h>
#include <shaderstack/observers.h>
#include <shaderstack/surface_manager.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace shaderstack {

class ShaderStack {
public:
    ShaderStack(Container& container, GpuBackend& backend, FrameHost& host,
                const StackConfig& config = StackConfig{});
    ~ShaderStack();

    // Non-copyable
    ShaderStack(const ShaderStack&) = delete;
    ShaderStack& operator=(const ShaderStack&) = delete;

    // -------------------------------------------------------------------------
    /// @name Lifecycle
    /// @{

    /**
     * @brief Acquire the surface, build the layers and start the frame loop
     *
     * If already mounted this behaves like setLayers().
     *
     * @return False if the surface is unavailable; the stack stays inert and
     *         draws nothing
     */
    bool mount(const Layers& layers);

    /**
     * @brief Stop the loop and release every GPU resource
     *
     * Cancels a pending frame request. Safe to call any number of times.
     */
    void unmount();

    bool isMounted() const { return m_mounted; }

    /// @brief True once mounting failed for lack of a surface
    bool isInert() const { return !m_mounted && m_error == StackError::SurfaceUnavailable; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Layers
    /// @{

    /**
     * @brief Replace the layer sequence
     *
     * Materials are rebuilt only if the sequence identity changed (length or
     * any slot's descriptor object).
     */
    void setLayers(const Layers& layers);

    const Layers& layers() const { return m_layers; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Playback
    /// @{

    /// @brief Suppress or resume drawing. The loop keeps running while paused.
    void setPaused(bool paused);
    bool paused() const { return m_config.paused; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name State
    /// @{

    /// @brief Most recent non-fatal condition
    StackError lastError() const { return m_error; }
    const std::string& lastErrorMessage() const { return m_errorMessage; }

    const StackConfig& config() const { return m_config; }
    const SurfaceManager& surface() const { return m_surface; }
    const MaterialCache& materials() const { return m_materials; }

    /// @brief Frame loop of the latest mount (null before the first mount)
    const FrameScheduler* scheduler() const { return m_scheduler.get(); }

    /// @brief Draw calls issued since construction
    uint64_t drawCalls() const { return m_drawCalls; }

    /// @}

private:
    void renderFrame(float timeSeconds);
    bool runBeforeFrame(MaterialEntry& entry, float timeSeconds, const FrameSize& size);
    void afterBuild();
    void onVisibilityChanged(bool visible);
    void setError(StackError error, const std::string& message);

    StackConfig m_config;
    Container& m_container;
    GpuBackend& m_backend;
    FrameHost& m_host;

    // Declaration order = reverse release order
    MaterialCache m_materials;
    SurfaceManager m_surface;
    std::unique_ptr<FrameScheduler> m_scheduler;
    std::vector<std::unique_ptr<FrameScheduler>> m_retiredSchedulers;
    std::unique_ptr<ResizeObserver> m_resizeObserver;
    std::unique_ptr<VisibilityObserver> m_visibilityObserver;

    Layers m_layers;
    bool m_mounted = false;
    bool m_inFrame = false;
    bool m_reportedUnavailable = false;
    std::set<const LayerDescriptor*> m_failedCallbacks;
    uint64_t m_drawCalls = 0;

    StackError m_error = StackError::None;
    std::string m_errorMessage;
};

} // namespace shaderstack
