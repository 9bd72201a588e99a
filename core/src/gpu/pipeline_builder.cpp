// ShaderStack - Pipeline Builder Implementation

#include <shaderstack/gpu/pipeline_builder.h>
#include <shaderstack/gpu/gpu_common.h>

namespace shaderstack::gpu {

bool blendStateFor(BlendMode mode, WGPUBlendState& out) {
    out = {};
    out.color.operation = WGPUBlendOperation_Add;
    out.alpha.operation = WGPUBlendOperation_Add;
    out.alpha.srcFactor = WGPUBlendFactor_One;
    out.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;

    switch (mode) {
        case BlendMode::Normal:
            // src * alpha + dst * (1 - alpha)
            out.color.srcFactor = WGPUBlendFactor_SrcAlpha;
            out.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
            return true;

        case BlendMode::Additive:
            // src * alpha + dst
            out.color.srcFactor = WGPUBlendFactor_SrcAlpha;
            out.color.dstFactor = WGPUBlendFactor_One;
            out.alpha.srcFactor = WGPUBlendFactor_SrcAlpha;
            out.alpha.dstFactor = WGPUBlendFactor_One;
            return true;

        case BlendMode::Subtractive:
            // dst * (1 - src)
            out.color.srcFactor = WGPUBlendFactor_Zero;
            out.color.dstFactor = WGPUBlendFactor_OneMinusSrc;
            out.alpha.srcFactor = WGPUBlendFactor_Zero;
            out.alpha.dstFactor = WGPUBlendFactor_One;
            return true;

        case BlendMode::Multiply:
            // dst * src
            out.color.srcFactor = WGPUBlendFactor_Zero;
            out.color.dstFactor = WGPUBlendFactor_Src;
            out.alpha.srcFactor = WGPUBlendFactor_Zero;
            out.alpha.dstFactor = WGPUBlendFactor_SrcAlpha;
            return true;

        case BlendMode::None:
        default:
            return false;
    }
}

PipelineBuilder::PipelineBuilder(WGPUDevice device)
    : m_device(device) {}

PipelineBuilder::~PipelineBuilder() {
    // m_bindGroupLayout and m_pipeline are handed to the caller
    release(m_shaderModule);
    release(m_pipelineLayout);
}

PipelineBuilder& PipelineBuilder::shader(const std::string& wgslSource) {
    m_shaderSource = wgslSource;
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexEntry(const char* entryPoint) {
    m_vertexEntry = entryPoint;
    return *this;
}

PipelineBuilder& PipelineBuilder::fragmentEntry(const char* entryPoint) {
    m_fragmentEntry = entryPoint;
    return *this;
}

PipelineBuilder& PipelineBuilder::label(const std::string& label) {
    m_label = label;
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTarget(WGPUTextureFormat format, BlendMode blend) {
    m_colorFormat = format;
    m_blend = blend;
    return *this;
}

PipelineBuilder& PipelineBuilder::quadVertices() {
    m_quadVertices = true;
    return *this;
}

PipelineBuilder& PipelineBuilder::uniform(uint32_t binding, uint64_t size) {
    return uniform(binding, size, WGPUShaderStage_Fragment);
}

PipelineBuilder& PipelineBuilder::uniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility) {
    m_bindings.push_back({binding, size, visibility});
    return *this;
}

bool PipelineBuilder::createShaderModule() {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(m_shaderSource);

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = toStringView(m_label);
    m_shaderModule = wgpuDeviceCreateShaderModule(m_device, &shaderDesc);
    if (!m_shaderModule) {
        m_error = "failed to create shader module";
        return false;
    }
    return true;
}

bool PipelineBuilder::createBindGroupLayout() {
    std::vector<WGPUBindGroupLayoutEntry> entries(m_bindings.size());

    for (size_t i = 0; i < m_bindings.size(); ++i) {
        auto& entry = entries[i];
        const auto& binding = m_bindings[i];

        entry = {};
        entry.binding = binding.binding;
        entry.visibility = binding.visibility;
        entry.buffer.type = WGPUBufferBindingType_Uniform;
        entry.buffer.minBindingSize = binding.size;
    }

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.entryCount = entries.size();
    layoutDesc.entries = entries.data();
    m_bindGroupLayout = wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc);
    if (!m_bindGroupLayout) {
        m_error = "failed to create bind group layout";
        return false;
    }
    return true;
}

bool PipelineBuilder::createPipelineLayout() {
    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &m_bindGroupLayout;
    m_pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);
    if (!m_pipelineLayout) {
        m_error = "failed to create pipeline layout";
        return false;
    }
    return true;
}

WGPURenderPipeline PipelineBuilder::build() {
    if (!createShaderModule() || !createBindGroupLayout() || !createPipelineLayout()) {
        release(m_bindGroupLayout);
        return nullptr;
    }

    WGPUBlendState blendState = {};
    bool useBlend = blendStateFor(m_blend, blendState);

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = m_colorFormat;
    colorTarget.writeMask = WGPUColorWriteMask_All;
    if (useBlend) {
        colorTarget.blend = &blendState;
    }

    WGPUVertexAttribute attributes[2] = {};
    attributes[0].format = WGPUVertexFormat_Float32x2;  // position
    attributes[0].offset = 0;
    attributes[0].shaderLocation = 0;

    attributes[1].format = WGPUVertexFormat_Float32x2;  // uv
    attributes[1].offset = 2 * sizeof(float);
    attributes[1].shaderLocation = 1;

    WGPUVertexBufferLayout vertexLayout = {};
    vertexLayout.arrayStride = QUAD_VERTEX_FLOATS * sizeof(float);
    vertexLayout.stepMode = WGPUVertexStepMode_Vertex;
    vertexLayout.attributeCount = 2;
    vertexLayout.attributes = attributes;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = m_shaderModule;
    fragmentState.entryPoint = toStringView(m_fragmentEntry);
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    // No depthStencil state: layers are never depth tested or written
    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView(m_label);
    pipelineDesc.layout = m_pipelineLayout;
    pipelineDesc.vertex.module = m_shaderModule;
    pipelineDesc.vertex.entryPoint = toStringView(m_vertexEntry);
    if (m_quadVertices) {
        pipelineDesc.vertex.bufferCount = 1;
        pipelineDesc.vertex.buffers = &vertexLayout;
    }
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleStrip;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    // Single sample; WebGpuBackend::createContext refuses antialias
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;
    pipelineDesc.fragment = &fragmentState;

    m_pipeline = wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);
    if (!m_pipeline) {
        m_error = "failed to create render pipeline";
        release(m_bindGroupLayout);
    }
    return m_pipeline;
}

} // namespace shaderstack::gpu
