#pragma once

// Blobs - GPU Canvas
// WebGPU implementation of DrawSurface with a persistent canvas texture

#include <blobs/draw_surface.h>
#include <webgpu/webgpu.h>
#include <cstddef>
#include <vector>

namespace blobs::app {

/**
 * @brief Instanced 2D shape renderer drawing into a persistent texture
 *
 * DrawSurface calls are collected as shape instances during a frame and
 * rendered in call order by one instanced draw. The canvas texture is loaded,
 * not cleared, between frames, so anything the simulation does not repaint
 * stays visible (trails when clearCanvas is off). present() then blits the
 * canvas to the window surface.
 */
class GpuCanvas : public DrawSurface {
public:
    GpuCanvas() = default;
    ~GpuCanvas();

    GpuCanvas(const GpuCanvas&) = delete;
    GpuCanvas& operator=(const GpuCanvas&) = delete;

    /// @brief Create pipelines and the canvas texture
    bool init(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat surfaceFormat,
              int width, int height);

    /// @brief Recreate the canvas texture; its contents are cleared to black
    void resize(int width, int height);

    /// @brief Forget shapes collected since the last render
    void beginFrame() { m_instances.clear(); }

    void fillRect(float x, float y, float w, float h, const Color& color) override;
    void strokeRect(float x, float y, float w, float h, const Color& color) override;
    void fillCircle(float x, float y, float radius, const Color& color) override;

    /// @brief Draw the collected shapes into the canvas texture
    void render();

    /// @brief Blit the canvas into a window surface view
    void present(WGPUTextureView target);

    int width() const { return m_width; }
    int height() const { return m_height; }
    size_t shapeCount() const { return m_instances.size(); }

    void cleanup();

private:
    // Instance layout (must match shader)
    struct ShapeInstance {
        float posX, posY;       // Center in pixels
        float halfW, halfH;     // Half extents in pixels
        float r, g, b, a;
        float shape;            // 0 = disc, 1 = rect
        float _pad[3];
    };

    bool createQuad();
    bool createShapePipeline();
    bool createBlitPipeline();
    void createCanvasTexture();
    void releaseCanvasTexture();
    void ensureInstanceCapacity(size_t count);

    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    WGPUTextureFormat m_surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    int m_width = 0;
    int m_height = 0;

    // Shape pass
    WGPURenderPipeline m_shapePipeline = nullptr;
    WGPUBindGroupLayout m_shapeBindGroupLayout = nullptr;
    WGPUBindGroup m_shapeBindGroup = nullptr;
    WGPUBuffer m_uniformBuffer = nullptr;
    WGPUBuffer m_quadBuffer = nullptr;
    WGPUBuffer m_instanceBuffer = nullptr;
    size_t m_instanceCapacity = 0;
    std::vector<ShapeInstance> m_instances;

    // Canvas
    WGPUTexture m_canvasTexture = nullptr;
    WGPUTextureView m_canvasView = nullptr;
    bool m_canvasNeedsClear = true;

    // Blit pass
    WGPURenderPipeline m_blitPipeline = nullptr;
    WGPUBindGroupLayout m_blitBindGroupLayout = nullptr;
    WGPUBindGroup m_blitBindGroup = nullptr;
    WGPUSampler m_sampler = nullptr;

    bool m_initialized = false;
};

} // namespace blobs::app
