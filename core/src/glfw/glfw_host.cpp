// ShaderStack - GLFW Host Implementation

#include <shaderstack/glfw/glfw_host.h>

#include <utility>
#include <vector>

namespace shaderstack::glfw {

// -----------------------------------------------------------------------------
// GlfwContainer
// -----------------------------------------------------------------------------

GlfwContainer::GlfwContainer(GLFWwindow* window)
    : m_window(window)
{
    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, onFramebufferSize);
    glfwSetWindowContentScaleCallback(m_window, onContentScale);
    glfwSetWindowIconifyCallback(m_window, onIconify);
    m_visible = glfwGetWindowAttrib(m_window, GLFW_ICONIFIED) == GLFW_FALSE;
}

GlfwContainer::~GlfwContainer() {
    glfwSetFramebufferSizeCallback(m_window, nullptr);
    glfwSetWindowContentScaleCallback(m_window, nullptr);
    glfwSetWindowIconifyCallback(m_window, nullptr);
    if (glfwGetWindowUserPointer(m_window) == this) {
        glfwSetWindowUserPointer(m_window, nullptr);
    }
}

ContainerSize GlfwContainer::size() const {
    int width = 0, height = 0;
    glfwGetWindowSize(m_window, &width, &height);
    return ContainerSize{static_cast<float>(width), static_cast<float>(height)};
}

float GlfwContainer::devicePixelRatio() const {
    int windowWidth = 0, windowHeight = 0;
    int bufferWidth = 0, bufferHeight = 0;
    glfwGetWindowSize(m_window, &windowWidth, &windowHeight);
    glfwGetFramebufferSize(m_window, &bufferWidth, &bufferHeight);
    if (windowWidth > 0 && bufferWidth > 0) {
        return static_cast<float>(bufferWidth) / static_cast<float>(windowWidth);
    }

    // Iconified windows report 0x0
    float xscale = 1.0f, yscale = 1.0f;
    glfwGetWindowContentScale(m_window, &xscale, &yscale);
    return xscale;
}

ListenerId GlfwContainer::addResizeListener(ResizeListener listener) {
    ListenerId id = m_nextId++;
    m_resizeListeners.emplace(id, std::move(listener));
    return id;
}

void GlfwContainer::removeResizeListener(ListenerId id) {
    m_resizeListeners.erase(id);
}

ListenerId GlfwContainer::addIntersectionListener(IntersectionListener listener) {
    ListenerId id = m_nextId++;
    m_intersectionListeners.emplace(id, std::move(listener));
    return id;
}

void GlfwContainer::removeIntersectionListener(ListenerId id) {
    m_intersectionListeners.erase(id);
}

void GlfwContainer::notifyResize() {
    // Listeners may unregister themselves
    auto listeners = m_resizeListeners;
    for (auto& [id, listener] : listeners) {
        if (listener) listener();
    }
}

void GlfwContainer::notifyIntersection(bool visible) {
    if (visible == m_visible) return;
    m_visible = visible;
    auto listeners = m_intersectionListeners;
    for (auto& [id, listener] : listeners) {
        if (listener) listener(visible);
    }
}

void GlfwContainer::onFramebufferSize(GLFWwindow* window, int /*width*/, int /*height*/) {
    auto* self = static_cast<GlfwContainer*>(glfwGetWindowUserPointer(window));
    if (self) self->notifyResize();
}

void GlfwContainer::onContentScale(GLFWwindow* window, float /*xscale*/, float /*yscale*/) {
    auto* self = static_cast<GlfwContainer*>(glfwGetWindowUserPointer(window));
    if (self) self->notifyResize();
}

void GlfwContainer::onIconify(GLFWwindow* window, int iconified) {
    auto* self = static_cast<GlfwContainer*>(glfwGetWindowUserPointer(window));
    if (self) self->notifyIntersection(iconified == GLFW_FALSE);
}

// -----------------------------------------------------------------------------
// GlfwFrameHost
// -----------------------------------------------------------------------------

GlfwFrameHost::GlfwFrameHost(GLFWwindow* window, double targetFps)
    : m_window(window)
    , m_interval(targetFps > 0.0 ? 1.0 / targetFps : 0.0)
{
}

FrameRequestId GlfwFrameHost::requestFrame(FrameCallback callback) {
    FrameRequestId id = m_nextId++;
    m_pending.emplace(id, std::move(callback));
    return id;
}

void GlfwFrameHost::cancelFrame(FrameRequestId id) {
    m_pending.erase(id);
}

double GlfwFrameHost::now() const {
    return glfwGetTime() * 1000.0;
}

bool GlfwFrameHost::runOnce() {
    if (glfwWindowShouldClose(m_window)) {
        return false;
    }

    double remaining = m_lastIteration + m_interval - glfwGetTime();
    if (remaining > 0.0) {
        glfwWaitEventsTimeout(remaining);
    } else {
        glfwPollEvents();
    }
    m_lastIteration = glfwGetTime();

    // Requests made from inside a callback run next iteration; requests
    // cancelled by an earlier callback in this batch never run
    std::vector<FrameRequestId> due;
    due.reserve(m_pending.size());
    for (const auto& entry : m_pending) {
        due.push_back(entry.first);
    }

    if (!due.empty()) {
        double timestamp = now();
        for (FrameRequestId id : due) {
            auto it = m_pending.find(id);
            if (it == m_pending.end()) {
                continue;
            }
            FrameCallback callback = std::move(it->second);
            m_pending.erase(it);
            if (callback) callback(timestamp);
        }
        ++m_frameCount;
    }

    return !glfwWindowShouldClose(m_window);
}

} // namespace shaderstack::glfw
