#include "scale_coordinator.hpp"

#include <cmath>
#include <kestrel/logger.hpp>

namespace kestrel
{

namespace
{

uint32_t scale_axis(uint32_t logical, double factor)
{
    double scaled = std::round(static_cast<double>(logical) * factor);
    return scaled <= 0.0 ? 0u : static_cast<uint32_t>(scaled);
}

uint32_t unscale_axis(double native_logical, double user_scale)
{
    if (user_scale <= 0.0)
        return 0;
    double value = std::round(native_logical / user_scale);
    return value <= 0.0 ? 0u : static_cast<uint32_t>(value);
}

}   // namespace

PhysicalSize compute_physical_size(WindowSize logical, double os_scale, double user_scale)
{
    const double factor = os_scale * user_scale;
    return {scale_axis(logical.width, factor), scale_axis(logical.height, factor)};
}

ScaleCoordinator::ScaleCoordinator(ScalePolicy policy, double os_scale_factor,
                                   double user_scale_factor, WindowSize logical_size)
    : policy_(policy)
{
    double os = policy_.fixed_factor.value_or(os_scale_factor);
    apply(logical_size, os, user_scale_factor);
}

ScaleState ScaleCoordinator::apply(WindowSize logical_size, double os_scale, double user_scale)
{
    applied_.os_scale_factor   = os_scale;
    applied_.user_scale_factor = user_scale;
    applied_.logical_size      = logical_size;
    applied_.physical_size     = compute_physical_size(logical_size, os_scale, user_scale);
    return applied_;
}

ScaleUpdate ScaleCoordinator::update(WindowSize logical_size, double user_scale_factor)
{
    ScaleUpdate result;
    if (logical_size == applied_.logical_size && user_scale_factor == applied_.user_scale_factor)
    {
        result.state = applied_;
        return result;
    }

    result.state        = apply(logical_size, applied_.os_scale_factor, user_scale_factor);
    result.needs_resize = true;

    KESTREL_LOG_DEBUG("scale",
                      "Logical {}x{} at scale {} -> physical {}x{}",
                      logical_size.width,
                      logical_size.height,
                      result.state.scale_factor(),
                      result.state.physical_size.width,
                      result.state.physical_size.height);
    return result;
}

ScaleState ScaleCoordinator::on_native_resize(const NativeWindowInfo& info,
                                              double user_scale_factor)
{
    WindowSize logical{unscale_axis(info.logical_width, user_scale_factor),
                       unscale_axis(info.logical_height, user_scale_factor)};

    double os = applied_.os_scale_factor;
    if (policy_.uses_system_scaling() && info.scale > 0.0)
    {
        if (info.scale != os)
        {
            KESTREL_LOG_INFO("scale", "OS scale factor changed: {} -> {}", os, info.scale);
        }
        os = info.scale;
    }

    return apply(logical, os, user_scale_factor);
}

void ScaleCoordinator::native_request_size(double& width, double& height) const
{
    width  = static_cast<double>(applied_.logical_size.width) * applied_.user_scale_factor;
    height = static_cast<double>(applied_.logical_size.height) * applied_.user_scale_factor;
}

}   // namespace kestrel
