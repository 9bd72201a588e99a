#pragma once

/**
 * @file webgpu_backend.h
 * @brief GpuBackend on wgpu-native, presenting to a GLFW window
 *
 * One WebGPU instance, adapter, device and window surface per context.
 * Every drawable owns a render pipeline, a uniform buffer and a bind group;
 * they all draw the same quad vertex buffer inside one render pass per frame.
 */

#include <shaderstack/gpu_backend.h>

#include <webgpu/webgpu.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct GLFWwindow;

namespace shaderstack::gpu {

class WebGpuBackend : public GpuBackend {
public:
    explicit WebGpuBackend(GLFWwindow* window);
    ~WebGpuBackend() override;

    // Non-copyable
    WebGpuBackend(const WebGpuBackend&) = delete;
    WebGpuBackend& operator=(const WebGpuBackend&) = delete;

    bool createContext(const ContextOptions& options) override;
    void destroyContext() override;

    bool createQuad(const glm::mat4& projection) override;
    void destroyQuad() override;

    void resizeDrawingBuffer(int width, int height) override;

    DrawableHandle createDrawable(const DrawableDesc& desc) override;
    void destroyDrawable(DrawableHandle handle) override;

    bool beginFrame(const ClearColor& clear) override;
    void draw(DrawableHandle handle, const UniformSet& uniforms) override;
    void endFrame() override;

    const std::string& lastError() const override { return m_error; }

    /// @brief Full WGSL module for a layer: vertex stage, uniform block, fragment source
    static std::string composeShader(const UniformLayout& layout, const std::string& fragmentSource);

    bool hasContext() const { return m_device != nullptr; }
    WGPUTextureFormat surfaceFormat() const { return m_config.format; }
    WGPUCompositeAlphaMode alphaMode() const { return m_config.alphaMode; }
    size_t drawableCount() const { return m_drawables.size(); }

private:
    struct Drawable {
        std::string label;
        UniformLayout layout;
        WGPURenderPipeline pipeline = nullptr;
        WGPUBindGroupLayout bindGroupLayout = nullptr;
        WGPUBuffer uniformBuffer = nullptr;
        WGPUBindGroup bindGroup = nullptr;
        std::vector<uint8_t> staging;
    };

    bool requestAdapter(const ContextOptions& options);
    bool requestDevice();
    void configureSurface(const ContextOptions& options);
    void releaseDrawable(Drawable& drawable);
    void abortFrame();
    void releaseFrameTargets();

    static void onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                             WGPUStringView message, void* userdata1, void* userdata2);
    static void onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                              WGPUStringView message, void* userdata1, void* userdata2);

    GLFWwindow* m_window;

    // Context
    WGPUInstance m_instance = nullptr;
    WGPUSurface m_surface = nullptr;
    WGPUAdapter m_adapter = nullptr;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    WGPUSurfaceConfiguration m_config = {};
    bool m_configured = false;

    // Shared quad
    WGPUBuffer m_quadBuffer = nullptr;
    uint64_t m_quadBufferSize = 0;

    // Drawables
    std::map<DrawableHandle, Drawable> m_drawables;
    DrawableHandle m_nextHandle = 1;

    // Current frame
    WGPUTexture m_frameTexture = nullptr;
    WGPUTextureView m_frameView = nullptr;
    WGPUCommandEncoder m_encoder = nullptr;
    WGPURenderPassEncoder m_pass = nullptr;

    // Errors reported by the device callback
    uint64_t m_deviceErrors = 0;
    std::string m_error;
};

} // namespace shaderstack::gpu
