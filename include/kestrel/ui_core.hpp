#pragma once

#include <kestrel/event.hpp>
#include <kestrel/geometry.hpp>
#include <kestrel/surface.hpp>

namespace kestrel
{

// The retained UI toolkit core as seen from the platform layer.
//
// Layout, styling and the scene graph live behind this interface. The run
// loop and the event translator only call into it; it never calls back into
// the platform layer.
class UiCore
{
   public:
    virtual ~UiCore() = default;

    // Queue an event for the next process_events() pass.
    virtual void send_event(Event event) = 0;

    // Emit a canonical window event with the window root as origin.
    virtual void emit_window_event(const WindowEvent& event) = 0;

    // True while events are waiting in the core's own queue.
    virtual bool has_pending_events() const = 0;

    virtual void process_events() = 0;

    // Touches GPU-resident state (images, fonts); the caller holds the GPU
    // context for the duration of the call.
    virtual void process_style_updates() = 0;

    virtual void process_animations() = 0;
    virtual void process_visual_updates() = 0;

    // Returns and clears the core's "something changed visually" flag.
    virtual bool take_redraw_request() = 0;

    // Draw into the acquired surfaces; returns the region that changed.
    virtual BoundingBox draw(const SurfaceFrame& frame) = 0;

    virtual WindowSize window_size() const = 0;
    virtual void       set_window_size(WindowSize logical) = 0;

    // Bounds of the root entity in physical pixels.
    virtual void set_physical_window_size(PhysicalSize physical) = 0;

    virtual double user_scale_factor() const = 0;

    // Combined OS * user factor used for layout and text.
    virtual void   set_scale_factor(double factor) = 0;
    virtual double scale_factor() const = 0;

    // Non-owning; the surface manager keeps ownership of the pair.
    virtual RenderSurfacePair* surface_pair(Entity window) = 0;
    virtual void               set_surface_pair(Entity window, RenderSurfacePair* pair) = 0;

    virtual Modifiers modifiers() const = 0;
    virtual void      set_modifiers(Modifiers modifiers) = 0;

    virtual void needs_refresh() = 0;

    virtual void set_current(Entity entity) = 0;
};

}   // namespace kestrel
