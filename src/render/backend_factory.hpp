#pragma once

#include <chrono>
#include <kestrel/surface.hpp>
#include <memory>

#include "surface_manager.hpp"

namespace kestrel
{

// True when `backend` was compiled into this build.
bool backend_available(GraphicsBackend backend);

// Surface manager for `backend` with its platform device. Throws
// ConfigurationError when the backend is not compiled in, and
// DeviceAcquisitionError when no GPU can drive it.
std::unique_ptr<SurfaceManager> make_surface_manager(GraphicsBackend           backend,
                                                     bool                      vsync,
                                                     std::chrono::milliseconds frame_timeout);

}   // namespace kestrel
