// ShaderStack - Pipeline Builder Utility
// Fluent API for creating layer render pipelines with less boilerplate

#pragma once

#include <shaderstack/layer.h>

#include <webgpu/webgpu.h>

#include <string>
#include <vector>

namespace shaderstack::gpu {

struct UniformBinding {
    uint32_t binding;
    uint64_t size;
    WGPUShaderStage visibility;
};

/**
 * @brief Blend state for a layer blend mode
 * @return False for BlendMode::None (no blend state, layer overwrites)
 */
bool blendStateFor(BlendMode mode, WGPUBlendState& out);

// Pipeline builder with fluent interface
class PipelineBuilder {
public:
    explicit PipelineBuilder(WGPUDevice device);
    ~PipelineBuilder();

    // Shader configuration
    PipelineBuilder& shader(const std::string& wgslSource);
    PipelineBuilder& vertexEntry(const char* entryPoint);
    PipelineBuilder& fragmentEntry(const char* entryPoint);
    PipelineBuilder& label(const std::string& label);

    // Output configuration
    PipelineBuilder& colorTarget(WGPUTextureFormat format, BlendMode blend);

    // Geometry: shared quad vertex buffer (position.xy, uv.xy)
    PipelineBuilder& quadVertices();

    // Binding configuration - fragment stage by default
    PipelineBuilder& uniform(uint32_t binding, uint64_t size);
    PipelineBuilder& uniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility);

    // Build the pipeline (null on failure, see error())
    WGPURenderPipeline build();

    // Access the bind group layout after build(); caller releases it
    WGPUBindGroupLayout bindGroupLayout() const { return m_bindGroupLayout; }

    // Check if build succeeded
    bool valid() const { return m_pipeline != nullptr; }
    const std::string& error() const { return m_error; }

private:
    bool createShaderModule();
    bool createBindGroupLayout();
    bool createPipelineLayout();

    WGPUDevice m_device;
    std::string m_label;
    std::string m_shaderSource;
    std::string m_vertexEntry = "vs_main";
    std::string m_fragmentEntry = "fs_main";
    WGPUTextureFormat m_colorFormat = WGPUTextureFormat_BGRA8Unorm;
    BlendMode m_blend = BlendMode::Normal;
    bool m_quadVertices = false;

    std::vector<UniformBinding> m_bindings;
    std::string m_error;

    // Created resources
    WGPUShaderModule m_shaderModule = nullptr;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUPipelineLayout m_pipelineLayout = nullptr;
    WGPURenderPipeline m_pipeline = nullptr;
};

} // namespace shaderstack::gpu
