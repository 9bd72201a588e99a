// ShaderStack - Compositor Implementation

#include <shaderstack/shader_stack.h>

#include <exception>
#include <iostream>

namespace shaderstack {

namespace {

// Rolls a partially mounted stack back unless dismissed
class MountGuard {
public:
    explicit MountGuard(ShaderStack& stack) : m_stack(stack) {}
    ~MountGuard() {
        if (m_armed) {
            m_stack.unmount();
        }
    }
    void dismiss() { m_armed = false; }

private:
    ShaderStack& m_stack;
    bool m_armed = true;
};

// Marks the span in which layer callbacks may run
class FrameScope {
public:
    explicit FrameScope(bool& flag) : m_flag(flag) { m_flag = true; }
    ~FrameScope() { m_flag = false; }

private:
    bool& m_flag;
};

} // namespace

ShaderStack::ShaderStack(Container& container, GpuBackend& backend, FrameHost& host,
                         const StackConfig& config)
    : m_config(config)
    , m_container(container)
    , m_backend(backend)
    , m_host(host)
    , m_materials(backend)
    , m_surface(backend, m_materials, config)
{
}

ShaderStack::~ShaderStack() {
    unmount();
}

bool ShaderStack::mount(const Layers& layers) {
    if (m_mounted) {
        setLayers(layers);
        return true;
    }

    m_layers = layers;
    MountGuard guard(*this);

    if (!m_surface.initialize(m_container)) {
        setError(StackError::SurfaceUnavailable, m_surface.lastError());
        if (!m_reportedUnavailable) {
            std::cerr << "[ShaderStack] Surface unavailable: " << m_surface.lastError()
                      << " (rendering disabled)\n";
            m_reportedUnavailable = true;
        }
        return false;
    }
    m_mounted = true;

    m_materials.build(m_layers, m_surface.state().size);
    afterBuild();

    // Stopped loops may still be on the call stack (remount from a layer
    // callback); they are released at the next frame boundary
    if (m_scheduler) {
        m_retiredSchedulers.push_back(std::move(m_scheduler));
    }
    if (!m_inFrame) {
        m_retiredSchedulers.clear();
    }
    m_scheduler = std::make_unique<FrameScheduler>(m_host, [this](float t) { renderFrame(t); });
    m_scheduler->setPaused(m_config.paused);
    m_scheduler->setAnimateWhenOffscreen(m_config.animateWhenOffscreen);

    m_resizeObserver = std::make_unique<ResizeObserver>(
        m_container, [this](const ContainerSize& size, float devicePixelRatio) {
            m_surface.resize(size, devicePixelRatio);
        });
    m_resizeObserver->connect();

    if (!m_config.animateWhenOffscreen) {
        m_visibilityObserver = std::make_unique<VisibilityObserver>(
            m_container, [this](bool visible) { onVisibilityChanged(visible); });
        m_visibilityObserver->connect();
    }

    m_scheduler->start();
    guard.dismiss();

    const SurfaceSize& size = m_surface.state().size;
    std::cout << "[ShaderStack] Mounted " << m_layers.size() << " layers at "
              << size.width << "x" << size.height << " (ratio " << size.pixelRatio << ")\n";
    return true;
}

void ShaderStack::unmount() {
    if (m_scheduler) {
        if (m_scheduler->stop()) {
            setError(StackError::DisposedWhileScheduled, "pending frame request cancelled");
        }
    }

    // Observers before the surface so no resize lands on a dead context
    m_visibilityObserver.reset();
    m_resizeObserver.reset();

    m_surface.dispose();
    m_failedCallbacks.clear();
    m_mounted = false;
}

void ShaderStack::setLayers(const Layers& layers) {
    m_layers = layers;
    if (!m_mounted) {
        return;
    }
    if (m_materials.rebuild(m_layers, m_surface.state().size)) {
        afterBuild();
    }
}

void ShaderStack::setPaused(bool paused) {
    m_config.paused = paused;
    if (!m_scheduler) {
        return;
    }
    m_scheduler->setPaused(paused);
    if (!paused) {
        m_scheduler->ensureScheduled();
    }
}

void ShaderStack::onVisibilityChanged(bool visible) {
    if (!m_scheduler) {
        return;
    }
    m_scheduler->setVisible(visible);
    if (visible) {
        m_scheduler->ensureScheduled();
    }
}

void ShaderStack::afterBuild() {
    m_failedCallbacks.clear();
    if (!m_materials.conflicts().empty()) {
        setError(StackError::DescriptorConflict,
                 "layer uniform '" + m_materials.conflicts().front() + "' uses a reserved name");
    }
}

void ShaderStack::setError(StackError error, const std::string& message) {
    m_error = error;
    m_errorMessage = message;
}

bool ShaderStack::runBeforeFrame(MaterialEntry& entry, float timeSeconds, const FrameSize& size) {
    // Held for the duration of the call; the callback may replace the layers
    LayerPtr layer = entry.layer;
    try {
        layer->onBeforeFrame(entry.uniforms, timeSeconds, size);
        return true;
    } catch (const std::exception& e) {
        if (m_failedCallbacks.insert(layer.get()).second) {
            std::cerr << "[ShaderStack] onBeforeFrame failed for '" << layer->name
                      << "': " << e.what() << " (layer skipped)\n";
        }
        return false;
    }
}

void ShaderStack::renderFrame(float timeSeconds) {
    // Only the current scheduler renders, so no retired one is running here
    m_retiredSchedulers.clear();

    if (!m_mounted || !m_surface.isInitialized()) {
        return;
    }
    if (!m_backend.beginFrame(m_surface.clearColor())) {
        return;
    }

    const SurfaceSize& buffer = m_surface.state().size;
    FrameSize frameSize{buffer.width, buffer.height};
    const uint64_t generation = m_materials.generation();
    FrameScope scope(m_inFrame);

    auto& entries = m_materials.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        MaterialEntry& entry = entries[i];
        entry.uniforms.set(TIME_UNIFORM, timeSeconds);

        if (entry.layer && entry.layer->onBeforeFrame) {
            bool ok = runBeforeFrame(entry, timeSeconds, frameSize);
            // The callback replaced the layers or unmounted the stack
            if (!m_mounted || m_materials.generation() != generation) {
                break;
            }
            if (!ok) {
                continue;
            }
        }

        if (entry.hasDrawable()) {
            m_backend.draw(entry.drawable, entry.uniforms);
            ++m_drawCalls;
        }
    }

    if (m_surface.isInitialized()) {
        m_backend.endFrame();
    }
}

} // namespace shaderstack
