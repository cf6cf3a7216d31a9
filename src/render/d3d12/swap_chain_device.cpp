#include "swap_chain_device.hpp"

#include <algorithm>
#include <kestrel/errors.hpp>
#include <kestrel/logger.hpp>

namespace kestrel
{

PresentArgs choose_present_args(bool vsync, bool tearing_supported)
{
    PresentArgs args;
    if (!vsync)
    {
        args.sync_interval = 0;
        args.allow_tearing = tearing_supported;
    }
    return args;
}

DirtyRect to_dirty_rect(const BoundingBox& region)
{
    return {static_cast<int32_t>(std::max(region.left(), 0.0f)),
            static_cast<int32_t>(std::max(region.top(), 0.0f)),
            static_cast<int32_t>(std::max(region.right(), 0.0f)),
            static_cast<int32_t>(std::max(region.bottom(), 0.0f))};
}

size_t select_adapter(const std::vector<AdapterInfo>&   adapters,
                      const std::function<bool(size_t)>& try_create_device)
{
    for (size_t i = 0; i < adapters.size(); ++i)
    {
        if (adapters[i].software)
        {
            KESTREL_LOG_DEBUG("d3d12", "Skipping software adapter '{}'", adapters[i].description);
            continue;
        }
        if (try_create_device(i))
        {
            KESTREL_LOG_INFO("d3d12", "Using adapter '{}'", adapters[i].description);
            return i;
        }
        KESTREL_LOG_WARN("d3d12", "Adapter '{}' rejected device creation", adapters[i].description);
    }
    throw DeviceAcquisitionError("Direct3D12: no hardware adapter accepted device creation ("
                                 + std::to_string(adapters.size()) + " enumerated)");
}

}   // namespace kestrel
