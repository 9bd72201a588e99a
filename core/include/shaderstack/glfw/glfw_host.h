#pragma once

/**
 * @file glfw_host.h
 * @brief Desktop host: a GLFW window as container, a poll loop as frame source
 *
 * GlfwContainer maps the window onto the Container contract:
 * - size: window size in screen coordinates
 * - device pixel ratio: framebuffer pixels per screen coordinate
 * - resize: framebuffer-size and content-scale callbacks
 * - intersection: iconify callback (iconified = off-screen)
 *
 * GlfwFrameHost runs the frame requests queued before each loop iteration,
 * paced to the target interval.
 */

#include <shaderstack/container.h>
#include <shaderstack/frame_host.h>

#include <GLFW/glfw3.h>

#include <cstdint>
#include <map>

namespace shaderstack::glfw {

class GlfwContainer : public Container {
public:
    /// Installs itself as the window's user pointer
    explicit GlfwContainer(GLFWwindow* window);
    ~GlfwContainer() override;

    // Non-copyable
    GlfwContainer(const GlfwContainer&) = delete;
    GlfwContainer& operator=(const GlfwContainer&) = delete;

    ContainerSize size() const override;
    float devicePixelRatio() const override;

    ListenerId addResizeListener(ResizeListener listener) override;
    void removeResizeListener(ListenerId id) override;

    ListenerId addIntersectionListener(IntersectionListener listener) override;
    void removeIntersectionListener(ListenerId id) override;

    /// @brief False while the window is iconified
    bool visible() const override { return m_visible; }

    GLFWwindow* window() const { return m_window; }

private:
    void notifyResize();
    void notifyIntersection(bool visible);

    static void onFramebufferSize(GLFWwindow* window, int width, int height);
    static void onContentScale(GLFWwindow* window, float xscale, float yscale);
    static void onIconify(GLFWwindow* window, int iconified);

    GLFWwindow* m_window;
    bool m_visible = true;
    ListenerId m_nextId = 1;
    std::map<ListenerId, ResizeListener> m_resizeListeners;
    std::map<ListenerId, IntersectionListener> m_intersectionListeners;
};

class GlfwFrameHost : public FrameHost {
public:
    /**
     * @param window Window whose close flag ends the loop
     * @param targetFps Upper bound on loop iterations per second (0 = unpaced)
     */
    explicit GlfwFrameHost(GLFWwindow* window, double targetFps = 60.0);

    FrameRequestId requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameRequestId id) override;
    double now() const override;

    /**
     * @brief Process events, then run the frame requests queued so far
     * @return False once the window should close
     */
    bool runOnce();

    /// @brief Loop iterations that ran at least one frame callback
    uint64_t frameCount() const { return m_frameCount; }

    size_t pendingCount() const { return m_pending.size(); }

private:
    GLFWwindow* m_window;
    double m_interval;
    double m_lastIteration = 0.0;
    FrameRequestId m_nextId = 1;
    std::map<FrameRequestId, FrameCallback> m_pending;
    uint64_t m_frameCount = 0;
};

} // namespace shaderstack::glfw
