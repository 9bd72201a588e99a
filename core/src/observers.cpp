// ShaderStack - Resize / Visibility Observers

#include <shaderstack/observers.h>

#include <utility>

namespace shaderstack {

// -----------------------------------------------------------------------------
// ResizeObserver
// -----------------------------------------------------------------------------

ResizeObserver::ResizeObserver(Container& container, Callback callback)
    : m_container(container)
    , m_callback(std::move(callback))
{
}

ResizeObserver::~ResizeObserver() {
    disconnect();
}

void ResizeObserver::connect() {
    if (connected()) return;
    m_id = m_container.addResizeListener([this]() {
        if (m_callback) {
            m_callback(m_container.size(), m_container.devicePixelRatio());
        }
    });
}

void ResizeObserver::disconnect() {
    if (!connected()) return;
    m_container.removeResizeListener(m_id);
    m_id = 0;
}

// -----------------------------------------------------------------------------
// VisibilityObserver
// -----------------------------------------------------------------------------

VisibilityObserver::VisibilityObserver(Container& container, Callback callback)
    : m_container(container)
    , m_callback(std::move(callback))
{
}

VisibilityObserver::~VisibilityObserver() {
    disconnect();
}

void VisibilityObserver::connect() {
    if (connected() || !m_container.supportsIntersection()) return;
    m_id = m_container.addIntersectionListener([this](bool visible) {
        if (m_callback) {
            m_callback(visible);
        }
    });

    // Report the state at connect time; later changes arrive as events
    if (m_callback) {
        m_callback(m_container.visible());
    }
}

void VisibilityObserver::disconnect() {
    if (!connected()) return;
    m_container.removeIntersectionListener(m_id);
    m_id = 0;
}

} // namespace shaderstack
