// ShaderStack - Surface Manager Implementation

#include <shaderstack/surface_manager.h>

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <cmath>

namespace shaderstack {

SurfaceManager::SurfaceManager(GpuBackend& backend, MaterialCache& materials, const StackConfig& config)
    : m_backend(backend)
    , m_materials(materials)
    , m_config(config)
{
}

SurfaceManager::~SurfaceManager() {
    dispose();
}

float SurfaceManager::effectivePixelRatio(float devicePixelRatio, float cap) {
    float dpr = devicePixelRatio > 0.0f ? devicePixelRatio : 1.0f;
    float limit = cap > 0.0f ? cap : 1.0f;
    return std::min(dpr, limit);
}

SurfaceSize SurfaceManager::computeSize(const ContainerSize& size, float devicePixelRatio, float cap) {
    float ratio = effectivePixelRatio(devicePixelRatio, cap);
    float width = size.width > 0.0f ? size.width : 1.0f;
    float height = size.height > 0.0f ? size.height : 1.0f;

    SurfaceSize result;
    result.pixelRatio = ratio;
    result.width = std::max(1, static_cast<int>(std::floor(width * ratio)));
    result.height = std::max(1, static_cast<int>(std::floor(height * ratio)));
    return result;
}

bool SurfaceManager::initialize(const Container& container) {
    if (isInitialized()) {
        return true;
    }

    m_error.clear();

    ContextOptions options;
    options.antialias = false;
    options.alpha = m_config.transparent;
    options.powerPreference = PowerPreference::HighPerformance;

    if (!m_backend.createContext(options)) {
        m_error = m_backend.lastError().empty() ? "no rendering context available" : m_backend.lastError();
        return false;
    }
    m_state.contextReady = true;

    // Right-handed, zero-to-one depth: the quad at z=0 lands inside the clip volume
    m_state.projection = glm::orthoRH_ZO(-1.0f, 1.0f, -1.0f, 1.0f, 0.0f, 1.0f);

    if (!m_backend.createQuad(m_state.projection)) {
        m_error = m_backend.lastError().empty() ? "failed to create quad geometry" : m_backend.lastError();
        dispose();
        return false;
    }
    m_state.quadReady = true;
    m_state.size = SurfaceSize{0, 0, 0.0f};

    resize(container.size(), container.devicePixelRatio());
    return true;
}

bool SurfaceManager::resize(const ContainerSize& size, float devicePixelRatio) {
    if (!isInitialized()) {
        return false;
    }

    SurfaceSize next = computeSize(size, devicePixelRatio, m_config.capDevicePixelRatio);
    if (next == m_state.size) {
        return false;
    }

    m_backend.resizeDrawingBuffer(next.width, next.height);
    m_state.size = next;
    ++m_resizeCount;

    m_materials.setResolution(next);
    return true;
}

void SurfaceManager::dispose() {
    // Drawables first; they were created against this context
    m_materials.disposeAll();

    if (m_state.quadReady) {
        m_backend.destroyQuad();
        m_state.quadReady = false;
    }

    if (m_state.contextReady) {
        m_backend.destroyContext();
        m_state.contextReady = false;
    }

    m_state.size = SurfaceSize{0, 0, 0.0f};
}

ClearColor SurfaceManager::clearColor() const {
    ClearColor color;
    color.a = m_config.transparent ? 0.0f : 1.0f;
    return color;
}

} // namespace shaderstack
