#pragma once

#include <array>
#include <chrono>
#include <memory>

#include "../surface_manager.hpp"
#include "swap_chain_device.hpp"

namespace kestrel
{

// Direct3D12 surfaces over a two-buffer flip swap chain.
//
// Buffers are allocated at monitor size so that most window growth needs no
// buffer reallocation. When the window outgrows them, every surface is
// released and the GPU context reset before the buffers are resized, and
// the surfaces are rebuilt from the new buffers afterwards.
class D3D12SurfaceManager final : public SurfaceManager
{
   public:
    D3D12SurfaceManager(std::unique_ptr<SwapChainDevice> device,
                        std::chrono::milliseconds        frame_timeout);
    ~D3D12SurfaceManager() override;

    D3D12SurfaceManager(const D3D12SurfaceManager&)            = delete;
    D3D12SurfaceManager& operator=(const D3D12SurfaceManager&) = delete;

    GraphicsBackend backend() const override { return GraphicsBackend::Direct3D12; }

    RenderSurfacePair& create(NativeWindow& window, PhysicalSize size) override;
    bool               resize(PhysicalSize size) override;
    SurfaceFrame       acquire_current() override;
    void               flush() override;
    void               present(const BoundingBox& dirty_region) override;

    PhysicalSize size() const override { return inner_size_; }
    PhysicalSize buffer_size() const { return buffer_size_; }

    RenderSurfacePair&       surfaces() override { return pair_; }
    const RenderSurfacePair& surfaces() const override { return pair_; }

    GpuContext& context() override { return context_; }

    SwapChainDevice& device() { return *device_; }

   private:
    // Buffer storage for `inner`: the monitor size, or `inner` where that is
    // larger or the monitor is unknown.
    PhysicalSize storage_size_for(PhysicalSize inner) const;

    void create_surfaces();
    void release_surfaces();
    void select_pair();

    std::unique_ptr<SwapChainDevice> device_;
    std::chrono::milliseconds        frame_timeout_;
    GpuContext                       context_;
    NativeWindow*                    window_ = nullptr;

    PhysicalSize inner_size_;
    PhysicalSize buffer_size_;

    std::array<Surface, SwapChainDevice::BUFFER_COUNT> buffers_{};
    RenderSurfacePair                                  pair_;
};

}   // namespace kestrel
