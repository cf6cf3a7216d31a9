#pragma once

#include <cstdint>
#include <functional>
#include <kestrel/geometry.hpp>
#include <string>
#include <vector>

#include "../frame_gate.hpp"

namespace kestrel
{

// Present call parameters derived from the vsync setting.
struct PresentArgs
{
    uint32_t sync_interval = 1;
    bool     allow_tearing = false;

    bool operator==(const PresentArgs&) const = default;
};

// vsync: interval 1. Otherwise interval 0, tearing when the display
// stack supports it (variable refresh rate monitors).
PresentArgs choose_present_args(bool vsync, bool tearing_supported);

struct DirtyRect
{
    int32_t left   = 0;
    int32_t top    = 0;
    int32_t right  = 0;
    int32_t bottom = 0;

    bool operator==(const DirtyRect&) const = default;
};

// Clamp a dirty region to non-negative integer pixel coordinates.
DirtyRect to_dirty_rect(const BoundingBox& region);

struct AdapterInfo
{
    std::string description;
    bool        software = false;
};

// Index of the first non-software adapter (in preference order) for which
// `try_create_device` succeeds. Throws DeviceAcquisitionError if none does.
size_t select_adapter(const std::vector<AdapterInfo>&   adapters,
                      const std::function<bool(size_t)>& try_create_device);

// Swap chain and GPU context operations of the Direct3D12 backend. The DXGI
// implementation lives in dxgi_swap_chain_device; tests record the calls.
class SwapChainDevice
{
   public:
    static constexpr uint32_t BUFFER_COUNT = 2;

    virtual ~SwapChainDevice() = default;

    // Create the swap chain for `native_handle` with buffers of
    // `buffer_size`. Throws SurfaceCreationError.
    virtual void create_swap_chain(void* native_handle, PhysicalSize buffer_size) = 0;

    virtual uint32_t current_buffer_index() const = 0;

    // Wrap swap-chain buffer `index` as a render target of `size`.
    // Returns 0 on failure.
    virtual uint64_t wrap_buffer(uint32_t index, PhysicalSize size) = 0;

    // Drop every render target created by wrap_buffer().
    virtual void release_buffer_surfaces() = 0;

    // Free cached GPU resources and reset the rendering context. Both must
    // happen after release_buffer_surfaces() and before resize_buffers().
    virtual void free_gpu_resources() = 0;
    virtual void reset_context() = 0;

    // Throws SurfaceCreationError.
    virtual void resize_buffers(PhysicalSize buffer_size) = 0;

    virtual FrameGate& frame_gate() = 0;

    virtual void flush() = 0;

    // Throws PresentError.
    virtual void present(const DirtyRect& rect) = 0;
};

}   // namespace kestrel
