#pragma once

/**
 * @file frame_host.h
 * @brief Host per-frame scheduling primitive
 *
 * Equivalent of "request next animation frame" / "cancel pending frame".
 * A request fires at most once; the callback receives the host's clock in
 * milliseconds.
 */

#include <cstdint>
#include <functional>

namespace shaderstack {

/// Pending frame request id (0 = none)
using FrameRequestId = uint64_t;

class FrameHost {
public:
    using FrameCallback = std::function<void(double nowMs)>;

    virtual ~FrameHost() = default;

    /// @brief Schedule @p callback for the next frame
    virtual FrameRequestId requestFrame(FrameCallback callback) = 0;

    /// @brief Drop a pending request. Unknown or fired ids are ignored.
    virtual void cancelFrame(FrameRequestId id) = 0;

    /// @brief Monotonic clock in milliseconds
    virtual double now() const = 0;
};

} // namespace shaderstack
