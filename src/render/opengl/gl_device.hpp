#pragma once

#include <cstdint>
#include <kestrel/geometry.hpp>

namespace kestrel
{

class NativeWindow;

// The OpenGL calls the surface manager needs, behind a seam so the surface
// bookkeeping runs without a GL driver. Every call except attach() expects
// the context to be current.
class GlDevice
{
   public:
    virtual ~GlDevice() = default;

    // Create the context for `window`. Throws SurfaceCreationError.
    virtual void attach(NativeWindow& window, bool vsync) = 0;

    virtual void make_current() = 0;
    virtual void make_not_current() = 0;

    // Wrap the window's default framebuffer. Returns 0 on failure.
    virtual uint64_t create_window_target(PhysicalSize size) = 0;

    // Offscreen framebuffer with a colour attachment. Returns 0 on failure.
    virtual uint64_t create_offscreen_target(PhysicalSize size) = 0;

    virtual void destroy_target(uint64_t id) = 0;

    // Viewport and drawable size for the window framebuffer.
    virtual void resize_window_target(PhysicalSize size) = 0;

    virtual void flush() = 0;

    // Returns false if the swap failed.
    virtual bool swap_buffers() = 0;
};

}   // namespace kestrel
