#pragma once

/**
 * @file config.h
 * @brief Stack-level configuration and error taxonomy
 */

namespace shaderstack {

/**
 * @brief Stack configuration supplied by the calling code
 *
 * | Field | Default | Description |
 * |-------|---------|-------------|
 * | paused | false | Suppress drawing (loop keeps polling) |
 * | capDevicePixelRatio | 2 | Upper bound for the pixel ratio used |
 * | transparent | true | Surface has alpha, clears to transparent black |
 * | animateWhenOffscreen | false | Keep drawing while outside the viewport |
 */
struct StackConfig {
    bool paused = false;
    float capDevicePixelRatio = 2.0f;
    bool transparent = true;
    bool animateWhenOffscreen = false;
};

/**
 * @brief Non-fatal conditions reported by the stack
 */
enum class StackError {
    None,
    SurfaceUnavailable,     ///< Rendering context could not be created
    DescriptorConflict,     ///< Layer uniform named time/resolution
    DisposedWhileScheduled  ///< Torn down with a frame request pending
};

inline const char* errorName(StackError error) {
    switch (error) {
        case StackError::None:                   return "None";
        case StackError::SurfaceUnavailable:     return "SurfaceUnavailable";
        case StackError::DescriptorConflict:     return "DescriptorConflict";
        case StackError::DisposedWhileScheduled: return "DisposedWhileScheduled";
        default:                                 return "Unknown";
    }
}

} // namespace shaderstack
