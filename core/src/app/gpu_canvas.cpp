// Blobs - GPU Canvas Implementation
// Instanced discs and rectangles rendered into a persistent canvas texture

#include "gpu_canvas.h"
#include <iostream>

namespace blobs::app {

namespace {

constexpr WGPUTextureFormat CANVAS_FORMAT = WGPUTextureFormat_RGBA8Unorm;

// Helper to create WGPUStringView from C string
inline WGPUStringView toStringView(const char* str) {
    WGPUStringView sv;
    sv.data = str;
    sv.length = WGPU_STRLEN;
    return sv;
}

// Shape uniforms (must match shader)
struct ShapeUniforms {
    float resolutionX;
    float resolutionY;
    float _pad[2];
};

struct QuadVertex {
    float x, y;
};

// WGSL shader for shape rendering (SDF disc or solid rect)
const char* SHAPE_SHADER = R"(
struct Uniforms {
    resolution: vec2f,
    _pad: vec2f,
}

struct VertexInput {
    @location(0) localPos: vec2f,
}

struct InstanceInput {
    @location(1) center: vec2f,
    @location(2) halfSize: vec2f,
    @location(3) color: vec4f,
    @location(4) shape: f32,
}

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) localPos: vec2f,
    @location(1) color: vec4f,
    @location(2) shape: f32,
}

@group(0) @binding(0) var<uniform> uniforms: Uniforms;

@vertex
fn vs_main(vert: VertexInput, inst: InstanceInput) -> VertexOutput {
    var output: VertexOutput;

    // Pixel position, origin top-left
    let pixel = inst.center + vert.localPos * inst.halfSize;

    // Pixels to clip space (-1 to 1), Y down
    var clipPos = pixel / uniforms.resolution * 2.0 - 1.0;
    clipPos.y = -clipPos.y;

    output.position = vec4f(clipPos, 0.0, 1.0);
    output.localPos = vert.localPos;
    output.color = inst.color;
    output.shape = inst.shape;
    return output;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    if (input.shape > 0.5) {
        return input.color;
    }

    // SDF disc with a one pixel antialiased edge
    let dist = length(input.localPos);
    let aa = max(fwidth(dist), 0.0001);
    let edge = 1.0 - smoothstep(1.0 - aa, 1.0, dist);
    if (edge <= 0.0) {
        discard;
    }
    return vec4f(input.color.rgb, input.color.a * edge);
}
)";

// Full-screen triangle sampling the canvas
const char* BLIT_SHADER = R"(
struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
};

@group(0) @binding(0) var canvasSampler: sampler;
@group(0) @binding(1) var canvasTexture: texture_2d<f32>;

@vertex
fn vs_main(@builtin(vertex_index) vertexIndex: u32) -> VertexOutput {
    var positions = array<vec2f, 3>(
        vec2f(-1.0, -1.0),
        vec2f(3.0, -1.0),
        vec2f(-1.0, 3.0)
    );
    var output: VertexOutput;
    output.position = vec4f(positions[vertexIndex], 0.0, 1.0);
    output.uv = (positions[vertexIndex] + 1.0) * 0.5;
    output.uv.y = 1.0 - output.uv.y;
    return output;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    return textureSample(canvasTexture, canvasSampler, input.uv);
}
)";

WGPUShaderModule createShaderModule(WGPUDevice device, const char* code, const char* label) {
    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(code);

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = toStringView(label);
    return wgpuDeviceCreateShaderModule(device, &shaderDesc);
}

} // namespace

GpuCanvas::~GpuCanvas() {
    cleanup();
}

bool GpuCanvas::init(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat surfaceFormat,
                     int width, int height) {
    if (m_initialized) return true;

    m_device = device;
    m_queue = queue;
    m_surfaceFormat = surfaceFormat;
    m_width = width;
    m_height = height;

    if (!createQuad() || !createShapePipeline() || !createBlitPipeline()) {
        cleanup();
        return false;
    }
    createCanvasTexture();

    m_initialized = true;
    std::cout << "[GpuCanvas] Initialized " << width << "x" << height << std::endl;
    return true;
}

bool GpuCanvas::createQuad() {
    // Two triangles covering [-1, 1]^2
    QuadVertex vertices[6] = {
        {-1.0f, -1.0f}, { 1.0f, -1.0f}, { 1.0f,  1.0f},
        {-1.0f, -1.0f}, { 1.0f,  1.0f}, {-1.0f,  1.0f},
    };

    WGPUBufferDescriptor vertexDesc = {};
    vertexDesc.size = sizeof(vertices);
    vertexDesc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
    m_quadBuffer = wgpuDeviceCreateBuffer(m_device, &vertexDesc);
    if (!m_quadBuffer) return false;
    wgpuQueueWriteBuffer(m_queue, m_quadBuffer, 0, vertices, sizeof(vertices));

    WGPUBufferDescriptor uniformDesc = {};
    uniformDesc.size = sizeof(ShapeUniforms);
    uniformDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    m_uniformBuffer = wgpuDeviceCreateBuffer(m_device, &uniformDesc);
    return m_uniformBuffer != nullptr;
}

bool GpuCanvas::createShapePipeline() {
    WGPUShaderModule shaderModule = createShaderModule(m_device, SHAPE_SHADER, "Shape Shader");
    if (!shaderModule) {
        std::cerr << "[GpuCanvas] Failed to create shape shader module" << std::endl;
        return false;
    }

    // Bind group layout (just uniforms)
    WGPUBindGroupLayoutEntry layoutEntry = {};
    layoutEntry.binding = 0;
    layoutEntry.visibility = WGPUShaderStage_Vertex;
    layoutEntry.buffer.type = WGPUBufferBindingType_Uniform;
    layoutEntry.buffer.minBindingSize = sizeof(ShapeUniforms);

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.entryCount = 1;
    layoutDesc.entries = &layoutEntry;
    m_shapeBindGroupLayout = wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc);

    WGPUBindGroupEntry bindEntry = {};
    bindEntry.binding = 0;
    bindEntry.buffer = m_uniformBuffer;
    bindEntry.size = sizeof(ShapeUniforms);

    WGPUBindGroupDescriptor bindDesc = {};
    bindDesc.layout = m_shapeBindGroupLayout;
    bindDesc.entryCount = 1;
    bindDesc.entries = &bindEntry;
    m_shapeBindGroup = wgpuDeviceCreateBindGroup(m_device, &bindDesc);

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &m_shapeBindGroupLayout;
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);

    // Buffer 0: per-vertex (localPos)
    WGPUVertexAttribute vertexAttribs[1] = {};
    vertexAttribs[0].format = WGPUVertexFormat_Float32x2;
    vertexAttribs[0].offset = 0;
    vertexAttribs[0].shaderLocation = 0;

    WGPUVertexBufferLayout vertexLayout = {};
    vertexLayout.arrayStride = sizeof(QuadVertex);
    vertexLayout.stepMode = WGPUVertexStepMode_Vertex;
    vertexLayout.attributeCount = 1;
    vertexLayout.attributes = vertexAttribs;

    // Buffer 1: per-instance (center, half size, color, shape)
    WGPUVertexAttribute instanceAttribs[4] = {};
    instanceAttribs[0].format = WGPUVertexFormat_Float32x2;
    instanceAttribs[0].offset = 0;
    instanceAttribs[0].shaderLocation = 1;
    instanceAttribs[1].format = WGPUVertexFormat_Float32x2;
    instanceAttribs[1].offset = 8;
    instanceAttribs[1].shaderLocation = 2;
    instanceAttribs[2].format = WGPUVertexFormat_Float32x4;
    instanceAttribs[2].offset = 16;
    instanceAttribs[2].shaderLocation = 3;
    instanceAttribs[3].format = WGPUVertexFormat_Float32;
    instanceAttribs[3].offset = 32;
    instanceAttribs[3].shaderLocation = 4;

    WGPUVertexBufferLayout instanceLayout = {};
    instanceLayout.arrayStride = sizeof(ShapeInstance);
    instanceLayout.stepMode = WGPUVertexStepMode_Instance;
    instanceLayout.attributeCount = 4;
    instanceLayout.attributes = instanceAttribs;

    WGPUVertexBufferLayout bufferLayouts[2] = {vertexLayout, instanceLayout};

    // Alpha blending
    WGPUBlendState blendState = {};
    blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_One;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blendState.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = CANVAS_FORMAT;
    colorTarget.blend = &blendState;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = shaderModule;
    fragmentState.entryPoint = toStringView("fs_main");
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView("Shape Pipeline");
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = shaderModule;
    pipelineDesc.vertex.entryPoint = toStringView("vs_main");
    pipelineDesc.vertex.bufferCount = 2;
    pipelineDesc.vertex.buffers = bufferLayouts;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;
    pipelineDesc.fragment = &fragmentState;

    m_shapePipeline = wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);

    wgpuPipelineLayoutRelease(pipelineLayout);
    wgpuShaderModuleRelease(shaderModule);

    if (!m_shapePipeline) {
        std::cerr << "[GpuCanvas] Failed to create shape pipeline" << std::endl;
        return false;
    }
    return true;
}

bool GpuCanvas::createBlitPipeline() {
    WGPUShaderModule shaderModule = createShaderModule(m_device, BLIT_SHADER, "Blit Shader");
    if (!shaderModule) {
        std::cerr << "[GpuCanvas] Failed to create blit shader module" << std::endl;
        return false;
    }

    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = WGPUFilterMode_Nearest;
    samplerDesc.minFilter = WGPUFilterMode_Nearest;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 1.0f;
    samplerDesc.maxAnisotropy = 1;
    m_sampler = wgpuDeviceCreateSampler(m_device, &samplerDesc);
    if (!m_sampler) {
        wgpuShaderModuleRelease(shaderModule);
        return false;
    }

    WGPUBindGroupLayoutEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].visibility = WGPUShaderStage_Fragment;
    entries[0].sampler.type = WGPUSamplerBindingType_Filtering;
    entries[1].binding = 1;
    entries[1].visibility = WGPUShaderStage_Fragment;
    entries[1].texture.sampleType = WGPUTextureSampleType_Float;
    entries[1].texture.viewDimension = WGPUTextureViewDimension_2D;
    entries[1].texture.multisampled = false;

    WGPUBindGroupLayoutDescriptor bindGroupLayoutDesc = {};
    bindGroupLayoutDesc.label = toStringView("Blit Bind Group Layout");
    bindGroupLayoutDesc.entryCount = 2;
    bindGroupLayoutDesc.entries = entries;
    m_blitBindGroupLayout = wgpuDeviceCreateBindGroupLayout(m_device, &bindGroupLayoutDesc);
    if (!m_blitBindGroupLayout) {
        wgpuShaderModuleRelease(shaderModule);
        return false;
    }

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.label = toStringView("Blit Pipeline Layout");
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &m_blitBindGroupLayout;
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc);

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = m_surfaceFormat;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = shaderModule;
    fragmentState.entryPoint = toStringView("fs_main");
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView("Blit Pipeline");
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = shaderModule;
    pipelineDesc.vertex.entryPoint = toStringView("vs_main");
    pipelineDesc.vertex.bufferCount = 0;
    pipelineDesc.fragment = &fragmentState;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = 0xFFFFFFFF;

    m_blitPipeline = wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc);

    wgpuPipelineLayoutRelease(pipelineLayout);
    wgpuShaderModuleRelease(shaderModule);

    if (!m_blitPipeline) {
        std::cerr << "[GpuCanvas] Failed to create blit pipeline" << std::endl;
        return false;
    }
    return true;
}

void GpuCanvas::createCanvasTexture() {
    WGPUTextureDescriptor texDesc = {};
    texDesc.label = toStringView("Canvas");
    texDesc.size.width = static_cast<uint32_t>(m_width > 0 ? m_width : 1);
    texDesc.size.height = static_cast<uint32_t>(m_height > 0 ? m_height : 1);
    texDesc.size.depthOrArrayLayers = 1;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = CANVAS_FORMAT;
    texDesc.usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_TextureBinding;
    m_canvasTexture = wgpuDeviceCreateTexture(m_device, &texDesc);

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = CANVAS_FORMAT;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    m_canvasView = wgpuTextureCreateView(m_canvasTexture, &viewDesc);

    // Blit bind group follows the canvas view
    WGPUBindGroupEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].sampler = m_sampler;
    entries[1].binding = 1;
    entries[1].textureView = m_canvasView;

    WGPUBindGroupDescriptor bindGroupDesc = {};
    bindGroupDesc.label = toStringView("Blit Bind Group");
    bindGroupDesc.layout = m_blitBindGroupLayout;
    bindGroupDesc.entryCount = 2;
    bindGroupDesc.entries = entries;
    m_blitBindGroup = wgpuDeviceCreateBindGroup(m_device, &bindGroupDesc);

    m_canvasNeedsClear = true;
}

void GpuCanvas::releaseCanvasTexture() {
    if (m_blitBindGroup) { wgpuBindGroupRelease(m_blitBindGroup); m_blitBindGroup = nullptr; }
    if (m_canvasView) { wgpuTextureViewRelease(m_canvasView); m_canvasView = nullptr; }
    if (m_canvasTexture) {
        wgpuTextureDestroy(m_canvasTexture);
        wgpuTextureRelease(m_canvasTexture);
        m_canvasTexture = nullptr;
    }
}

void GpuCanvas::resize(int width, int height) {
    if (width == m_width && height == m_height) return;
    m_width = width;
    m_height = height;
    if (!m_initialized) return;

    releaseCanvasTexture();
    createCanvasTexture();
}

void GpuCanvas::ensureInstanceCapacity(size_t count) {
    if (count <= m_instanceCapacity) return;

    if (m_instanceBuffer) {
        wgpuBufferRelease(m_instanceBuffer);
    }
    m_instanceCapacity = count + count / 4;

    WGPUBufferDescriptor bufferDesc = {};
    bufferDesc.size = m_instanceCapacity * sizeof(ShapeInstance);
    bufferDesc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
    m_instanceBuffer = wgpuDeviceCreateBuffer(m_device, &bufferDesc);
}

// -----------------------------------------------------------------------------
// DrawSurface
// -----------------------------------------------------------------------------

void GpuCanvas::fillRect(float x, float y, float w, float h, const Color& color) {
    ShapeInstance inst = {};
    inst.posX = x + w * 0.5f;
    inst.posY = y + h * 0.5f;
    inst.halfW = w * 0.5f;
    inst.halfH = h * 0.5f;
    inst.r = color.r; inst.g = color.g; inst.b = color.b; inst.a = color.a;
    inst.shape = 1.0f;
    m_instances.push_back(inst);
}

void GpuCanvas::strokeRect(float x, float y, float w, float h, const Color& color) {
    // One pixel line inside the rectangle's edge
    fillRect(x, y, w, 1.0f, color);
    fillRect(x, y + h - 1.0f, w, 1.0f, color);
    fillRect(x, y, 1.0f, h, color);
    fillRect(x + w - 1.0f, y, 1.0f, h, color);
}

void GpuCanvas::fillCircle(float x, float y, float radius, const Color& color) {
    ShapeInstance inst = {};
    inst.posX = x;
    inst.posY = y;
    inst.halfW = radius;
    inst.halfH = radius;
    inst.r = color.r; inst.g = color.g; inst.b = color.b; inst.a = color.a;
    inst.shape = 0.0f;
    m_instances.push_back(inst);
}

// -----------------------------------------------------------------------------
// Passes
// -----------------------------------------------------------------------------

void GpuCanvas::render() {
    if (!m_initialized) return;
    if (m_instances.empty() && !m_canvasNeedsClear) return;

    if (!m_instances.empty()) {
        ensureInstanceCapacity(m_instances.size());
        wgpuQueueWriteBuffer(m_queue, m_instanceBuffer, 0, m_instances.data(),
                             m_instances.size() * sizeof(ShapeInstance));
    }

    ShapeUniforms uniforms = {};
    uniforms.resolutionX = static_cast<float>(m_width);
    uniforms.resolutionY = static_cast<float>(m_height);
    wgpuQueueWriteBuffer(m_queue, m_uniformBuffer, 0, &uniforms, sizeof(uniforms));

    WGPUCommandEncoderDescriptor encoderDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_device, &encoderDesc);

    // Load keeps the previous frame; a fresh texture starts black
    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = m_canvasView;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = m_canvasNeedsClear ? WGPULoadOp_Clear : WGPULoadOp_Load;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {0.0, 0.0, 0.0, 1.0};

    WGPURenderPassDescriptor renderPassDesc = {};
    renderPassDesc.colorAttachmentCount = 1;
    renderPassDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &renderPassDesc);

    if (!m_instances.empty()) {
        wgpuRenderPassEncoderSetPipeline(pass, m_shapePipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_shapeBindGroup, 0, nullptr);
        wgpuRenderPassEncoderSetVertexBuffer(pass, 0, m_quadBuffer, 0, WGPU_WHOLE_SIZE);
        wgpuRenderPassEncoderSetVertexBuffer(pass, 1, m_instanceBuffer, 0,
                                             m_instances.size() * sizeof(ShapeInstance));
        wgpuRenderPassEncoderDraw(pass, 6, static_cast<uint32_t>(m_instances.size()), 0, 0);
    }

    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    WGPUCommandBufferDescriptor cmdBufferDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdBufferDesc);
    wgpuQueueSubmit(m_queue, 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);

    m_canvasNeedsClear = false;
    m_instances.clear();
}

void GpuCanvas::present(WGPUTextureView target) {
    if (!m_initialized || !target) return;

    WGPUCommandEncoderDescriptor encoderDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_device, &encoderDesc);

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = target;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {0.0, 0.0, 0.0, 1.0};

    WGPURenderPassDescriptor renderPassDesc = {};
    renderPassDesc.colorAttachmentCount = 1;
    renderPassDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &renderPassDesc);
    wgpuRenderPassEncoderSetPipeline(pass, m_blitPipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_blitBindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    WGPUCommandBufferDescriptor cmdBufferDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdBufferDesc);
    wgpuQueueSubmit(m_queue, 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
    wgpuCommandEncoderRelease(encoder);
}

void GpuCanvas::cleanup() {
    releaseCanvasTexture();

    if (m_shapePipeline) { wgpuRenderPipelineRelease(m_shapePipeline); m_shapePipeline = nullptr; }
    if (m_shapeBindGroup) { wgpuBindGroupRelease(m_shapeBindGroup); m_shapeBindGroup = nullptr; }
    if (m_shapeBindGroupLayout) { wgpuBindGroupLayoutRelease(m_shapeBindGroupLayout); m_shapeBindGroupLayout = nullptr; }
    if (m_uniformBuffer) { wgpuBufferRelease(m_uniformBuffer); m_uniformBuffer = nullptr; }
    if (m_quadBuffer) { wgpuBufferRelease(m_quadBuffer); m_quadBuffer = nullptr; }
    if (m_instanceBuffer) { wgpuBufferRelease(m_instanceBuffer); m_instanceBuffer = nullptr; }

    if (m_blitPipeline) { wgpuRenderPipelineRelease(m_blitPipeline); m_blitPipeline = nullptr; }
    if (m_blitBindGroupLayout) { wgpuBindGroupLayoutRelease(m_blitBindGroupLayout); m_blitBindGroupLayout = nullptr; }
    if (m_sampler) { wgpuSamplerRelease(m_sampler); m_sampler = nullptr; }

    m_instances.clear();
    m_instanceCapacity = 0;
    m_initialized = false;
}

} // namespace blobs::app
