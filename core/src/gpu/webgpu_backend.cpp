// ShaderStack - WebGPU Backend Implementation

#include <shaderstack/gpu/webgpu_backend.h>
#include <shaderstack/gpu/gpu_common.h>
#include <shaderstack/gpu/pipeline_builder.h>

#include <webgpu/wgpu.h>  // wgpu-native extensions (wgpuDevicePoll)
#include <glfw3webgpu.h>
#include <GLFW/glfw3.h>

#include <glm/glm.hpp>

#include <iostream>

namespace shaderstack::gpu {

namespace {

struct AdapterUserData {
    WGPUAdapter adapter = nullptr;
    std::string message;
    bool done = false;
};

void onAdapterRequestEnded(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                           WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* data = static_cast<AdapterUserData*>(userdata1);
    if (status == WGPURequestAdapterStatus_Success) {
        data->adapter = adapter;
    } else {
        data->message = fromStringView(message, "unknown error");
    }
    data->done = true;
}

struct DeviceUserData {
    WGPUDevice device = nullptr;
    std::string message;
    bool done = false;
};

void onDeviceRequestEnded(WGPURequestDeviceStatus status, WGPUDevice device,
                          WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* data = static_cast<DeviceUserData*>(userdata1);
    if (status == WGPURequestDeviceStatus_Success) {
        data->device = device;
    } else {
        data->message = fromStringView(message, "unknown error");
    }
    data->done = true;
}

WGPUPowerPreference toWgpu(PowerPreference preference) {
    switch (preference) {
        case PowerPreference::LowPower:        return WGPUPowerPreference_LowPower;
        case PowerPreference::HighPerformance: return WGPUPowerPreference_HighPerformance;
        case PowerPreference::Default:
        default:                               return WGPUPowerPreference_Undefined;
    }
}

} // namespace

WebGpuBackend::WebGpuBackend(GLFWwindow* window)
    : m_window(window) {}

WebGpuBackend::~WebGpuBackend() {
    destroyContext();
}

// -----------------------------------------------------------------------------
// Context
// -----------------------------------------------------------------------------

void WebGpuBackend::onDeviceLost(WGPUDevice const* /*device*/, WGPUDeviceLostReason reason,
                                 WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    // Expected when the device is released on teardown
    if (reason == WGPUDeviceLostReason_Destroyed) return;
    auto* self = static_cast<WebGpuBackend*>(userdata1);
    std::string text = fromStringView(message);
    std::cerr << "[WebGpuBackend] Device lost: " << text << "\n";
    if (self) self->m_error = "device lost: " + text;
}

void WebGpuBackend::onDeviceError(WGPUDevice const* /*device*/, WGPUErrorType /*type*/,
                                  WGPUStringView message, void* userdata1, void* /*userdata2*/) {
    auto* self = static_cast<WebGpuBackend*>(userdata1);
    std::string text = fromStringView(message);
    std::cerr << "[WebGpuBackend] WebGPU error: " << text << "\n";
    if (self) {
        self->m_error = text;
        ++self->m_deviceErrors;
    }
}

bool WebGpuBackend::createContext(const ContextOptions& options) {
    if (m_device) {
        return true;
    }
    m_error.clear();

    if (!m_window) {
        m_error = "no window to present to";
        return false;
    }
    // Pipelines are built single-sampled
    if (options.antialias) {
        m_error = "multisampled contexts are not supported";
        return false;
    }

    WGPUInstanceDescriptor instanceDesc = {};
    m_instance = wgpuCreateInstance(&instanceDesc);
    if (!m_instance) {
        m_error = "failed to create WebGPU instance";
        return false;
    }

    m_surface = glfwCreateWindowWGPUSurface(m_instance, m_window);
    if (!m_surface) {
        m_error = "failed to create window surface";
        destroyContext();
        return false;
    }

    if (!requestAdapter(options) || !requestDevice()) {
        destroyContext();
        return false;
    }

    m_queue = wgpuDeviceGetQueue(m_device);
    configureSurface(options);
    return true;
}

bool WebGpuBackend::requestAdapter(const ContextOptions& options) {
    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = m_surface;
    adapterOpts.powerPreference = toWgpu(options.powerPreference);

    AdapterUserData adapterData;
    WGPURequestAdapterCallbackInfo adapterCallback = {};
    adapterCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallback.callback = onAdapterRequestEnded;
    adapterCallback.userdata1 = &adapterData;

    wgpuInstanceRequestAdapter(m_instance, &adapterOpts, adapterCallback);

    // wgpu-native completes the request before returning with AllowSpontaneous
    if (!adapterData.done || !adapterData.adapter) {
        m_error = "no adapter: " + (adapterData.message.empty() ? std::string("request pending") : adapterData.message);
        return false;
    }
    m_adapter = adapterData.adapter;

    WGPUAdapterInfo info = {};
    wgpuAdapterGetInfo(m_adapter, &info);
    std::cout << "[WebGpuBackend] Adapter: " << fromStringView(info.device) << "\n";
    wgpuAdapterInfoFreeMembers(info);
    return true;
}

bool WebGpuBackend::requestDevice() {
    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = toStringView("ShaderStack Device");
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.deviceLostCallbackInfo.userdata1 = this;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onDeviceError;
    deviceDesc.uncapturedErrorCallbackInfo.userdata1 = this;

    DeviceUserData deviceData;
    WGPURequestDeviceCallbackInfo deviceCallback = {};
    deviceCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallback.callback = onDeviceRequestEnded;
    deviceCallback.userdata1 = &deviceData;

    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, deviceCallback);

    if (!deviceData.done || !deviceData.device) {
        m_error = "no device: " + (deviceData.message.empty() ? std::string("request pending") : deviceData.message);
        return false;
    }
    m_device = deviceData.device;
    return true;
}

void WebGpuBackend::configureSurface(const ContextOptions& options) {
    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(m_surface, m_adapter, &capabilities);

    WGPUTextureFormat format = WGPUTextureFormat_BGRA8Unorm;
    if (capabilities.formatCount > 0) {
        format = capabilities.formats[0];
    }

    // Transparent stacks composite over whatever is behind the window
    WGPUCompositeAlphaMode wanted = options.alpha ? WGPUCompositeAlphaMode_Premultiplied
                                                  : WGPUCompositeAlphaMode_Opaque;
    WGPUCompositeAlphaMode alphaMode = WGPUCompositeAlphaMode_Auto;
    for (size_t i = 0; i < capabilities.alphaModeCount; ++i) {
        if (capabilities.alphaModes[i] == wanted) {
            alphaMode = wanted;
            break;
        }
    }

    wgpuSurfaceCapabilitiesFreeMembers(capabilities);

    int width = 0, height = 0;
    glfwGetFramebufferSize(m_window, &width, &height);

    m_config = {};
    m_config.device = m_device;
    m_config.format = format;
    m_config.width = static_cast<uint32_t>(width > 0 ? width : 1);
    m_config.height = static_cast<uint32_t>(height > 0 ? height : 1);
    m_config.presentMode = WGPUPresentMode_Fifo;
    m_config.alphaMode = alphaMode;
    m_config.usage = WGPUTextureUsage_RenderAttachment;
    wgpuSurfaceConfigure(m_surface, &m_config);
    m_configured = true;
}

void WebGpuBackend::destroyContext() {
    abortFrame();

    for (auto& [handle, drawable] : m_drawables) {
        releaseDrawable(drawable);
    }
    m_drawables.clear();
    destroyQuad();

    if (m_configured && m_surface) {
        wgpuSurfaceUnconfigure(m_surface);
    }
    m_configured = false;

    release(m_queue);
    release(m_device);
    release(m_adapter);
    release(m_surface);
    release(m_instance);
}

// -----------------------------------------------------------------------------
// Quad
// -----------------------------------------------------------------------------

bool WebGpuBackend::createQuad(const glm::mat4& projection) {
    if (!m_device) {
        m_error = "no device";
        return false;
    }
    destroyQuad();

    // Triangle strip: bottom-left, bottom-right, top-left, top-right
    const glm::vec2 corners[QUAD_VERTEX_COUNT] = {
        {-1.0f, -1.0f}, {1.0f, -1.0f}, {-1.0f, 1.0f}, {1.0f, 1.0f}
    };

    float vertices[QUAD_VERTEX_COUNT * QUAD_VERTEX_FLOATS];
    for (uint32_t i = 0; i < QUAD_VERTEX_COUNT; ++i) {
        glm::vec4 clip = projection * glm::vec4(corners[i], 0.0f, 1.0f);
        float* v = vertices + i * QUAD_VERTEX_FLOATS;
        v[0] = clip.x / clip.w;
        v[1] = clip.y / clip.w;
        v[2] = corners[i].x * 0.5f + 0.5f;
        v[3] = corners[i].y * 0.5f + 0.5f;
    }

    WGPUBufferDescriptor bufferDesc = {};
    bufferDesc.label = toStringView("ShaderStack Quad");
    bufferDesc.size = sizeof(vertices);
    bufferDesc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
    m_quadBuffer = wgpuDeviceCreateBuffer(m_device, &bufferDesc);
    if (!m_quadBuffer) {
        m_error = "failed to create quad vertex buffer";
        return false;
    }
    m_quadBufferSize = sizeof(vertices);
    wgpuQueueWriteBuffer(m_queue, m_quadBuffer, 0, vertices, sizeof(vertices));
    return true;
}

void WebGpuBackend::destroyQuad() {
    release(m_quadBuffer);
    m_quadBufferSize = 0;
}

void WebGpuBackend::resizeDrawingBuffer(int width, int height) {
    if (!m_configured) return;

    uint32_t w = static_cast<uint32_t>(width > 0 ? width : 1);
    uint32_t h = static_cast<uint32_t>(height > 0 ? height : 1);
    if (w == m_config.width && h == m_config.height) return;

    m_config.width = w;
    m_config.height = h;
    wgpuSurfaceConfigure(m_surface, &m_config);
}

// -----------------------------------------------------------------------------
// Drawables
// -----------------------------------------------------------------------------

std::string WebGpuBackend::composeShader(const UniformLayout& layout, const std::string& fragmentSource) {
    std::string source = QUAD_VERTEX_SHADER;
    source += "\n";
    source += wgslUniformBlock(layout);
    source += "\n";
    source += fragmentSource;
    return source;
}

DrawableHandle WebGpuBackend::createDrawable(const DrawableDesc& desc) {
    if (!m_device) {
        m_error = "no device";
        return INVALID_DRAWABLE;
    }

    uint64_t errorsBefore = m_deviceErrors;

    Drawable drawable;
    drawable.label = desc.label;
    drawable.layout = desc.layout;

    PipelineBuilder builder(m_device);
    builder.label(desc.label)
           .shader(composeShader(desc.layout, desc.fragmentSource))
           .quadVertices()
           .colorTarget(m_config.format, desc.blendMode)
           .uniform(0, desc.layout.size);

    drawable.pipeline = builder.build();
    drawable.bindGroupLayout = builder.bindGroupLayout();
    if (!builder.valid()) {
        m_error = builder.error();
        releaseDrawable(drawable);
        return INVALID_DRAWABLE;
    }

    WGPUBufferDescriptor bufferDesc = {};
    bufferDesc.label = toStringView(desc.label);
    bufferDesc.size = desc.layout.size;
    bufferDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    drawable.uniformBuffer = wgpuDeviceCreateBuffer(m_device, &bufferDesc);

    WGPUBindGroupEntry entry = {};
    entry.binding = 0;
    entry.buffer = drawable.uniformBuffer;
    entry.offset = 0;
    entry.size = desc.layout.size;

    WGPUBindGroupDescriptor bindGroupDesc = {};
    bindGroupDesc.layout = drawable.bindGroupLayout;
    bindGroupDesc.entryCount = 1;
    bindGroupDesc.entries = &entry;
    drawable.bindGroup = wgpuDeviceCreateBindGroup(m_device, &bindGroupDesc);

    // Shader compile errors arrive through the uncaptured-error callback
    if (!drawable.uniformBuffer || !drawable.bindGroup || m_deviceErrors != errorsBefore) {
        if (m_deviceErrors == errorsBefore) {
            m_error = "failed to create uniform resources";
        }
        releaseDrawable(drawable);
        return INVALID_DRAWABLE;
    }

    DrawableHandle handle = m_nextHandle++;
    m_drawables.emplace(handle, std::move(drawable));
    return handle;
}

void WebGpuBackend::releaseDrawable(Drawable& drawable) {
    release(drawable.bindGroup);
    release(drawable.uniformBuffer);
    release(drawable.bindGroupLayout);
    release(drawable.pipeline);
}

void WebGpuBackend::destroyDrawable(DrawableHandle handle) {
    auto it = m_drawables.find(handle);
    if (it == m_drawables.end()) return;
    releaseDrawable(it->second);
    m_drawables.erase(it);
}

// -----------------------------------------------------------------------------
// Frame
// -----------------------------------------------------------------------------

bool WebGpuBackend::beginFrame(const ClearColor& clear) {
    if (!m_configured || !m_quadBuffer) {
        return false;
    }
    abortFrame();

    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(m_surface, &surfaceTexture);
    if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        if (surfaceTexture.texture) {
            wgpuTextureRelease(surfaceTexture.texture);
        }
        // Outdated or lost: reconfigure and try again next frame
        wgpuSurfaceConfigure(m_surface, &m_config);
        return false;
    }
    m_frameTexture = surfaceTexture.texture;

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = m_config.format;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    m_frameView = wgpuTextureCreateView(m_frameTexture, &viewDesc);

    WGPUCommandEncoderDescriptor encoderDesc = {};
    m_encoder = wgpuDeviceCreateCommandEncoder(m_device, &encoderDesc);

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = m_frameView;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {clear.r, clear.g, clear.b, clear.a};

    WGPURenderPassDescriptor renderPassDesc = {};
    renderPassDesc.colorAttachmentCount = 1;
    renderPassDesc.colorAttachments = &colorAttachment;
    m_pass = wgpuCommandEncoderBeginRenderPass(m_encoder, &renderPassDesc);

    wgpuRenderPassEncoderSetVertexBuffer(m_pass, 0, m_quadBuffer, 0, m_quadBufferSize);
    return true;
}

void WebGpuBackend::draw(DrawableHandle handle, const UniformSet& uniforms) {
    if (!m_pass) return;

    auto it = m_drawables.find(handle);
    if (it == m_drawables.end()) return;
    Drawable& drawable = it->second;

    // Each drawable owns its buffer and is drawn once per frame
    packUniforms(uniforms, drawable.layout, drawable.staging);
    wgpuQueueWriteBuffer(m_queue, drawable.uniformBuffer, 0,
                         drawable.staging.data(), drawable.staging.size());

    wgpuRenderPassEncoderSetPipeline(m_pass, drawable.pipeline);
    wgpuRenderPassEncoderSetBindGroup(m_pass, 0, drawable.bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(m_pass, QUAD_VERTEX_COUNT, 1, 0, 0);
}

void WebGpuBackend::endFrame() {
    if (!m_pass) return;

    wgpuRenderPassEncoderEnd(m_pass);
    release(m_pass);

    WGPUCommandBufferDescriptor cmdBufferDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(m_encoder, &cmdBufferDesc);
    wgpuQueueSubmit(m_queue, 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    release(m_encoder);

    // Present before releasing the view; wgpu-native releases the texture after present
    wgpuSurfacePresent(m_surface);
    wgpuDevicePoll(m_device, false, nullptr);

    releaseFrameTargets();
}

void WebGpuBackend::abortFrame() {
    if (m_pass) {
        wgpuRenderPassEncoderEnd(m_pass);
        release(m_pass);
    }
    release(m_encoder);
    releaseFrameTargets();
}

void WebGpuBackend::releaseFrameTargets() {
    release(m_frameView);
    release(m_frameTexture);
}

} // namespace shaderstack::gpu
