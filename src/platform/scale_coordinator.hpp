#pragma once

#include <kestrel/geometry.hpp>
#include <kestrel/window_description.hpp>

#include "platform_event.hpp"

namespace kestrel
{

struct ScaleState
{
    double       os_scale_factor   = 1.0;
    double       user_scale_factor = 1.0;
    WindowSize   logical_size;
    PhysicalSize physical_size;

    double scale_factor() const { return os_scale_factor * user_scale_factor; }

    bool operator==(const ScaleState&) const = default;
};

// physical = round(logical * os_scale * user_scale), per axis.
PhysicalSize compute_physical_size(WindowSize logical, double os_scale, double user_scale);

struct ScaleUpdate
{
    ScaleState state;
    bool       needs_resize = false;

    // A zero-sized window (minimized) still applies the new state but must not
    // touch the GPU surfaces.
    bool needs_surface_update() const { return needs_resize && !state.physical_size.is_empty(); }
};

// Single authority for the relationship between OS DPI scale, the user scale
// factor, and logical/physical window size.
class ScaleCoordinator
{
   public:
    ScaleCoordinator(ScalePolicy policy, double os_scale_factor, double user_scale_factor,
                     WindowSize logical_size);

    // Called once per tick with the UI core's view of the window. Reports a
    // resize iff the logical size or user scale differs from the last
    // applied state; the new state becomes the applied one.
    ScaleUpdate update(WindowSize logical_size, double user_scale_factor);

    // The native window was resized (by the user, or because the OS scale
    // changed). The native logical size already includes the user scale
    // factor; the UI logical size is recovered from it.
    ScaleState on_native_resize(const NativeWindowInfo& info, double user_scale_factor);

    // Native logical size to request for the applied state.
    void native_request_size(double& width, double& height) const;

    // OS part of the scale, used to convert native cursor positions.
    double window_scale_factor() const { return applied_.os_scale_factor; }

    bool uses_system_scaling() const { return policy_.uses_system_scaling(); }

    const ScaleState& applied() const { return applied_; }

   private:
    ScaleState apply(WindowSize logical_size, double os_scale, double user_scale);

    ScalePolicy policy_;
    ScaleState  applied_;
};

}   // namespace kestrel
