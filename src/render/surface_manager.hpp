#pragma once

#include <kestrel/geometry.hpp>
#include <kestrel/surface.hpp>

#include "gpu_context.hpp"

namespace kestrel
{

class NativeWindow;

// Owns the GPU device/context of one window and its render surface pair.
// One implementation per graphics backend; all of them are used from the
// render thread only.
class SurfaceManager
{
   public:
    virtual ~SurfaceManager() = default;

    virtual GraphicsBackend backend() const = 0;

    // Bind render targets to `window` at `size`. Throws SurfaceCreationError
    // if the backend refuses. The returned pair stays owned by the manager.
    virtual RenderSurfacePair& create(NativeWindow& window, PhysicalSize size) = 0;

    // Returns false without touching anything for a zero-sized or unchanged
    // size. Otherwise reallocates and returns true. Throws
    // SurfaceCreationError if the new surfaces cannot be bound.
    virtual bool resize(PhysicalSize size) = 0;

    // Surfaces for the next frame. May block for a bounded time waiting on
    // the presentation engine. Empty when there is nothing to draw into.
    virtual SurfaceFrame acquire_current() = 0;

    // Submit recorded GPU work.
    virtual void flush() = 0;

    // Display the frame. A degenerate region is a no-op. Throws PresentError.
    virtual void present(const BoundingBox& dirty_region) = 0;

    virtual PhysicalSize size() const = 0;

    virtual RenderSurfacePair&       surfaces() = 0;
    virtual const RenderSurfacePair& surfaces() const = 0;

    bool has_surfaces() const { return surfaces().valid(); }

    [[nodiscard]] GpuContextGuard bind_context() { return context().bind(); }

    virtual GpuContext& context() = 0;
};

}   // namespace kestrel
