#pragma once

/**
 * @file observers.h
 * @brief Container resize and viewport-intersection subscriptions
 *
 * Both observers register with the Container on connect() and unregister on
 * disconnect() or destruction. Callbacks run on the frame-loop thread.
 */

#include <shaderstack/container.h>

#include <functional>

namespace shaderstack {

/**
 * @brief Forwards container size changes
 *
 * No throttling beyond whatever batching the host does; the receiver
 * (SurfaceManager::resize) is idempotent.
 */
class ResizeObserver {
public:
    using Callback = std::function<void(const ContainerSize& size, float devicePixelRatio)>;

    ResizeObserver(Container& container, Callback callback);
    ~ResizeObserver();

    // Non-copyable
    ResizeObserver(const ResizeObserver&) = delete;
    ResizeObserver& operator=(const ResizeObserver&) = delete;

    void connect();
    void disconnect();
    bool connected() const { return m_id != 0; }

private:
    Container& m_container;
    Callback m_callback;
    ListenerId m_id = 0;
};

/**
 * @brief Forwards viewport-intersection changes
 *
 * connect() reports the container's current state once, then every change.
 * On a host without intersection support connect() does nothing and the
 * container is treated as always visible.
 */
class VisibilityObserver {
public:
    using Callback = std::function<void(bool visible)>;

    VisibilityObserver(Container& container, Callback callback);
    ~VisibilityObserver();

    // Non-copyable
    VisibilityObserver(const VisibilityObserver&) = delete;
    VisibilityObserver& operator=(const VisibilityObserver&) = delete;

    void connect();
    void disconnect();
    bool connected() const { return m_id != 0; }

private:
    Container& m_container;
    Callback m_callback;
    ListenerId m_id = 0;
};

} // namespace shaderstack
