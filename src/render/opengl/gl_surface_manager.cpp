#include "gl_surface_manager.hpp"

#include <algorithm>
#include <kestrel/errors.hpp>
#include <kestrel/logger.hpp>
#include <string>
#include <utility>

namespace kestrel
{

namespace
{

PhysicalSize at_least_one(PhysicalSize size)
{
    return {std::max(size.width, 1u), std::max(size.height, 1u)};
}

}   // namespace

GlSurfaceManager::GlSurfaceManager(std::unique_ptr<GlDevice> device, bool vsync)
    : device_(std::move(device)),
      vsync_(vsync),
      context_([this] { device_->make_current(); }, [this] { device_->make_not_current(); })
{
}

GlSurfaceManager::~GlSurfaceManager()
{
    if (!pair_.valid())
    {
        return;
    }
    if (!context_.affinity().is_owner())
    {
        KESTREL_LOG_WARN("gl", "Surface manager destroyed off the render thread; leaving GL objects to the context");
        return;
    }
    try
    {
        auto guard = bind_context();
        destroy_pair(pair_);
    }
    catch (const std::exception& e)
    {
        KESTREL_LOG_ERROR("gl", "Failed to release surfaces: {}", e.what());
    }
}

RenderSurfacePair GlSurfaceManager::build_pair(PhysicalSize size)
{
    const PhysicalSize target = at_least_one(size);

    RenderSurfacePair pair;
    pair.primary.id     = device_->create_window_target(target);
    pair.primary.size   = target;
    pair.primary.origin = SurfaceOrigin::BottomLeft;
    if (!pair.primary)
    {
        throw SurfaceCreationError("OpenGL: could not wrap the window framebuffer ("
                                   + std::to_string(target.width) + "x"
                                   + std::to_string(target.height) + ")");
    }

    pair.dirty.id     = device_->create_offscreen_target(target);
    pair.dirty.size   = target;
    pair.dirty.origin = SurfaceOrigin::TopLeft;
    if (!pair.dirty)
    {
        device_->destroy_target(pair.primary.id);
        throw SurfaceCreationError("OpenGL: could not create offscreen framebuffer ("
                                   + std::to_string(target.width) + "x"
                                   + std::to_string(target.height) + ")");
    }
    return pair;
}

void GlSurfaceManager::destroy_pair(RenderSurfacePair& pair)
{
    if (pair.dirty)
        device_->destroy_target(pair.dirty.id);
    if (pair.primary)
        device_->destroy_target(pair.primary.id);
    pair = {};
}

RenderSurfacePair& GlSurfaceManager::create(NativeWindow& window, PhysicalSize size)
{
    context_.affinity().check("GlSurfaceManager");

    device_->attach(window, vsync_);

    auto              guard = bind_context();
    RenderSurfacePair fresh = build_pair(size);
    if (pair_.valid())
    {
        destroy_pair(pair_);
    }
    pair_ = fresh;

    KESTREL_LOG_INFO("gl", "Surfaces created at {}x{}", pair_.size().width, pair_.size().height);
    return pair_;
}

bool GlSurfaceManager::resize(PhysicalSize size)
{
    if (size.is_empty() || size == pair_.size())
    {
        return false;
    }

    auto guard = bind_context();

    // The old pair stays in place until the new one is complete.
    RenderSurfacePair fresh = build_pair(size);
    destroy_pair(pair_);
    pair_ = fresh;
    device_->resize_window_target(size);

    KESTREL_LOG_DEBUG("gl", "Surfaces resized to {}x{}", size.width, size.height);
    return true;
}

SurfaceFrame GlSurfaceManager::acquire_current()
{
    context_.affinity().check("GlSurfaceManager");
    if (!pair_.valid())
    {
        return {};
    }
    return {&pair_.dirty, &pair_.primary};
}

void GlSurfaceManager::flush()
{
    auto guard = bind_context();
    device_->flush();
}

void GlSurfaceManager::present(const BoundingBox& dirty_region)
{
    if (dirty_region.is_degenerate())
    {
        return;
    }

    auto guard = bind_context();
    if (!device_->swap_buffers())
    {
        throw PresentError("OpenGL: buffer swap failed");
    }
}

}   // namespace kestrel
