#pragma once

#include <memory>

#include "../surface_manager.hpp"
#include "gl_device.hpp"

namespace kestrel
{

// OpenGL surfaces: the window framebuffer as primary plus a same-sized
// offscreen framebuffer. The context is exclusive to the render thread and
// only current inside a GpuContextGuard.
class GlSurfaceManager final : public SurfaceManager
{
   public:
    GlSurfaceManager(std::unique_ptr<GlDevice> device, bool vsync);
    ~GlSurfaceManager() override;

    GlSurfaceManager(const GlSurfaceManager&)            = delete;
    GlSurfaceManager& operator=(const GlSurfaceManager&) = delete;

    GraphicsBackend backend() const override { return GraphicsBackend::OpenGL; }

    RenderSurfacePair& create(NativeWindow& window, PhysicalSize size) override;
    bool               resize(PhysicalSize size) override;
    SurfaceFrame       acquire_current() override;
    void               flush() override;
    void               present(const BoundingBox& dirty_region) override;

    PhysicalSize size() const override { return pair_.size(); }

    RenderSurfacePair&       surfaces() override { return pair_; }
    const RenderSurfacePair& surfaces() const override { return pair_; }

    GpuContext& context() override { return context_; }

    GlDevice& device() { return *device_; }

   private:
    // Builds a complete pair or throws with nothing left allocated.
    RenderSurfacePair build_pair(PhysicalSize size);
    void              destroy_pair(RenderSurfacePair& pair);

    std::unique_ptr<GlDevice> device_;
    bool                      vsync_ = true;
    GpuContext                context_;
    RenderSurfacePair         pair_;
};

}   // namespace kestrel
