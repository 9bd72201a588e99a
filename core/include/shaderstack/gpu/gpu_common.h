#pragma once

/**
 * @file gpu_common.h
 * @brief WebGPU helpers shared by the backend
 *
 * - Quad vertex stage every layer program starts with
 * - Safe release helpers for GPU resources
 */

#include <webgpu/webgpu.h>

#include <cstdint>
#include <cstring>
#include <string>

namespace shaderstack::gpu {

// =============================================================================
// String Helpers
// =============================================================================

/**
 * @brief Convert C string to WebGPU string view
 */
inline WGPUStringView toStringView(const char* str) {
    WGPUStringView view;
    view.data = str;
    view.length = std::strlen(str);
    return view;
}

inline WGPUStringView toStringView(const std::string& str) {
    WGPUStringView view;
    view.data = str.c_str();
    view.length = str.size();
    return view;
}

/**
 * @brief Copy a WebGPU string view (null-terminated or sized) into a std::string
 */
inline std::string fromStringView(WGPUStringView view, const char* fallback = "unknown") {
    if (!view.data) {
        return fallback;
    }
    size_t length = view.length == WGPU_STRLEN ? std::strlen(view.data) : view.length;
    return std::string(view.data, length);
}

// =============================================================================
// Shared Vertex Stage
// =============================================================================

/**
 * @brief Vertex stage for the shared quad
 *
 * Reads the quad's vertex buffer (clip-space position at location 0, uv at
 * location 1). uv (0,0) is the bottom-left corner.
 *
 * Layer fragment sources are appended after this and the generated
 * `Uniforms` block:
 * @code
 * @fragment
 * fn fs_main(input: VertexOutput) -> @location(0) vec4f {
 *     return vec4f(input.uv, 0.5 + 0.5 * sin(u.time), 1.0);
 * }
 * @endcode
 */
inline constexpr const char* QUAD_VERTEX_SHADER = R"(
struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
};

@vertex
fn vs_main(@location(0) position: vec2f, @location(1) uv: vec2f) -> VertexOutput {
    var output: VertexOutput;
    output.position = vec4f(position, 0.0, 1.0);
    output.uv = uv;
    return output;
}
)";

/// Floats per quad vertex: position.xy, uv.xy
inline constexpr size_t QUAD_VERTEX_FLOATS = 4;

/// Vertices in the shared quad (triangle strip)
inline constexpr uint32_t QUAD_VERTEX_COUNT = 4;

// =============================================================================
// Resource Cleanup Helpers
// =============================================================================

/**
 * @brief Safe release helpers that check for null, release, and set to nullptr
 *
 * Usage:
 * @code
 * void destroyDrawable(Drawable& d) {
 *     gpu::release(d.bindGroup);
 *     gpu::release(d.uniformBuffer);
 *     gpu::release(d.pipeline);
 * }
 * @endcode
 */

inline void release(WGPURenderPipeline& p) {
    if (p) { wgpuRenderPipelineRelease(p); p = nullptr; }
}

inline void release(WGPUBindGroupLayout& l) {
    if (l) { wgpuBindGroupLayoutRelease(l); l = nullptr; }
}

inline void release(WGPUBindGroup& g) {
    if (g) { wgpuBindGroupRelease(g); g = nullptr; }
}

inline void release(WGPUBuffer& b) {
    if (b) { wgpuBufferRelease(b); b = nullptr; }
}

inline void release(WGPUTexture& t) {
    if (t) { wgpuTextureRelease(t); t = nullptr; }
}

inline void release(WGPUTextureView& v) {
    if (v) { wgpuTextureViewRelease(v); v = nullptr; }
}

inline void release(WGPUShaderModule& m) {
    if (m) { wgpuShaderModuleRelease(m); m = nullptr; }
}

inline void release(WGPUPipelineLayout& l) {
    if (l) { wgpuPipelineLayoutRelease(l); l = nullptr; }
}

inline void release(WGPURenderPassEncoder& e) {
    if (e) { wgpuRenderPassEncoderRelease(e); e = nullptr; }
}

inline void release(WGPUCommandEncoder& e) {
    if (e) { wgpuCommandEncoderRelease(e); e = nullptr; }
}

inline void release(WGPUQueue& q) {
    if (q) { wgpuQueueRelease(q); q = nullptr; }
}

inline void release(WGPUDevice& d) {
    if (d) { wgpuDeviceRelease(d); d = nullptr; }
}

inline void release(WGPUAdapter& a) {
    if (a) { wgpuAdapterRelease(a); a = nullptr; }
}

inline void release(WGPUSurface& s) {
    if (s) { wgpuSurfaceRelease(s); s = nullptr; }
}

inline void release(WGPUInstance& i) {
    if (i) { wgpuInstanceRelease(i); i = nullptr; }
}

} // namespace shaderstack::gpu
