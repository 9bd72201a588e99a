// ShaderStack CLI
// Handles: shaderstack --help, shaderstack --version, demo options

#pragma once

#include <shaderstack/config.h>

#include <cstdint>

namespace shaderstack::cli {

// Version info
constexpr const char* VERSION = "1.0.0";

struct DemoOptions {
    int width = 800;                 // Window size in screen coordinates
    int height = 450;
    float capDevicePixelRatio = 2.0f;
    bool opaque = false;
    bool animateWhenOffscreen = false;
    bool paused = false;
    uint64_t frames = 0;             // Exit after this many frames (0 = until closed)
    float intensity = 1.0f;          // 0-1, fed to the demo layers every frame
};

// Parse demo options
// Returns: 0+ = handled (exit with this code), -1 = options parsed, continue to the demo
int parseArgs(int argc, char** argv, DemoOptions& options);

// Stack configuration for parsed options
StackConfig toStackConfig(const DemoOptions& options);

} // namespace shaderstack::cli
