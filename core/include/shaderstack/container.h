#pragma once

/**
 * @file container.h
 * @brief Host container the stack mounts into
 *
 * The container reports its logical (CSS-pixel) size and device pixel
 * ratio, and notifies listeners when it is resized or when its
 * intersection with the viewport changes. GlfwContainer implements this for
 * a desktop window; tests drive a fake.
 */

#include <cstdint>
#include <functional>

namespace shaderstack {

/**
 * @brief Logical container size
 */
struct ContainerSize {
    float width = 0.0f;
    float height = 0.0f;
};

/// Listener registration id (0 = not registered)
using ListenerId = uint32_t;

class Container {
public:
    using ResizeListener = std::function<void()>;
    using IntersectionListener = std::function<void(bool visible)>;

    virtual ~Container() = default;

    /// @brief Current logical size
    virtual ContainerSize size() const = 0;

    /// @brief Physical pixels per logical pixel
    virtual float devicePixelRatio() const = 0;

    virtual ListenerId addResizeListener(ResizeListener listener) = 0;
    virtual void removeResizeListener(ListenerId id) = 0;

    /// @brief Whether the host can report viewport intersection at all
    virtual bool supportsIntersection() const { return true; }

    /// @brief Current intersection state, reported to new intersection listeners
    virtual bool visible() const { return true; }

    virtual ListenerId addIntersectionListener(IntersectionListener listener) = 0;
    virtual void removeIntersectionListener(ListenerId id) = 0;
};

} // namespace shaderstack
