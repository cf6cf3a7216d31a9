#include "d3d12_surface_manager.hpp"

#include <kestrel/errors.hpp>
#include <kestrel/logger.hpp>
#include <string>
#include <utility>

#include "../../platform/native_window.hpp"

namespace kestrel
{

D3D12SurfaceManager::D3D12SurfaceManager(std::unique_ptr<SwapChainDevice> device,
                                         std::chrono::milliseconds        frame_timeout)
    : device_(std::move(device)), frame_timeout_(frame_timeout)
{
}

D3D12SurfaceManager::~D3D12SurfaceManager()
{
    if (pair_.valid() || buffers_[0])
    {
        release_surfaces();
    }
}

PhysicalSize D3D12SurfaceManager::storage_size_for(PhysicalSize inner) const
{
    std::optional<PhysicalSize> monitor;
    if (window_)
    {
        monitor = window_->current_monitor_size();
    }
    return max_extent(monitor.value_or(inner), inner);
}

void D3D12SurfaceManager::create_surfaces()
{
    release_surfaces();

    for (uint32_t i = 0; i < SwapChainDevice::BUFFER_COUNT; ++i)
    {
        uint64_t id = device_->wrap_buffer(i, inner_size_);
        if (id == 0)
        {
            release_surfaces();
            throw SurfaceCreationError("Direct3D12: could not wrap swap-chain buffer "
                                       + std::to_string(i));
        }
        buffers_[i] = Surface{id, inner_size_, SurfaceOrigin::TopLeft};
    }
    select_pair();
}

void D3D12SurfaceManager::release_surfaces()
{
    device_->release_buffer_surfaces();
    buffers_.fill(Surface{});
    pair_ = {};
}

void D3D12SurfaceManager::select_pair()
{
    uint32_t index = device_->current_buffer_index() % SwapChainDevice::BUFFER_COUNT;
    pair_.primary  = buffers_[index];
    pair_.dirty    = buffers_[(index + 1) % SwapChainDevice::BUFFER_COUNT];
}

RenderSurfacePair& D3D12SurfaceManager::create(NativeWindow& window, PhysicalSize size)
{
    context_.affinity().check("D3D12SurfaceManager");

    window_      = &window;
    inner_size_  = size;
    buffer_size_ = storage_size_for(size);

    device_->create_swap_chain(window.native_handle(), buffer_size_);
    create_surfaces();

    KESTREL_LOG_INFO("d3d12",
                     "Swap chain created: window {}x{}, buffers {}x{}",
                     inner_size_.width,
                     inner_size_.height,
                     buffer_size_.width,
                     buffer_size_.height);
    return pair_;
}

bool D3D12SurfaceManager::resize(PhysicalSize size)
{
    if (size.is_empty() || size == inner_size_)
    {
        return false;
    }

    auto guard  = bind_context();
    inner_size_ = size;

    try
    {
        if (exceeds(inner_size_, buffer_size_))
        {
            PhysicalSize storage = storage_size_for(inner_size_);

            // No reference into the old buffers may survive into ResizeBuffers.
            release_surfaces();
            device_->free_gpu_resources();
            device_->reset_context();
            device_->resize_buffers(storage);
            buffer_size_ = storage;

            KESTREL_LOG_DEBUG("d3d12", "Buffers resized to {}x{}", buffer_size_.width, buffer_size_.height);
        }

        create_surfaces();
    }
    catch (const SurfaceCreationError&)
    {
        // Surfaces are gone; forget the size so the next resize rebuilds them.
        inner_size_ = {};
        throw;
    }
    return true;
}

SurfaceFrame D3D12SurfaceManager::acquire_current()
{
    context_.affinity().check("D3D12SurfaceManager");
    if (!buffers_[0])
    {
        return {};
    }

    select_pair();
    return {&pair_.dirty, &pair_.primary};
}

void D3D12SurfaceManager::flush()
{
    auto guard = bind_context();
    device_->flush();
}

void D3D12SurfaceManager::present(const BoundingBox& dirty_region)
{
    if (dirty_region.is_degenerate())
    {
        return;
    }
    if (window_ && window_->is_minimized())
    {
        return;
    }

    // Only a frame that reaches Present may consume a latency slot.
    if (!device_->frame_gate().wait(frame_timeout_))
    {
        KESTREL_LOG_WARN("d3d12", "Frame latency wait timed out after {} ms", frame_timeout_.count());
    }

    auto guard = bind_context();
    device_->present(to_dirty_rect(dirty_region));
}

}   // namespace kestrel
