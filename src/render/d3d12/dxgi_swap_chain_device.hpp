#pragma once

#if defined(KESTREL_HAS_D3D12) && defined(_WIN32)

    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <array>
    #include <d3d12.h>
    #include <dxgi1_6.h>
    #include <memory>
    #include <windows.h>
    #include <wrl.h>

    #include "swap_chain_device.hpp"

namespace kestrel
{

// SwapChainDevice over DXGI and a Direct3D12 device on the first hardware
// adapter (high-performance first) that accepts feature level 11_0.
class DxgiSwapChainDevice final : public SwapChainDevice
{
   public:
    // Throws DeviceAcquisitionError when no adapter can be used.
    explicit DxgiSwapChainDevice(bool vsync);
    ~DxgiSwapChainDevice() override;

    DxgiSwapChainDevice(const DxgiSwapChainDevice&)            = delete;
    DxgiSwapChainDevice& operator=(const DxgiSwapChainDevice&) = delete;

    void     create_swap_chain(void* native_handle, PhysicalSize buffer_size) override;
    uint32_t current_buffer_index() const override;
    uint64_t wrap_buffer(uint32_t index, PhysicalSize size) override;
    void     release_buffer_surfaces() override;
    void     free_gpu_resources() override;
    void     reset_context() override;
    void     resize_buffers(PhysicalSize buffer_size) override;

    FrameGate& frame_gate() override;

    void flush() override;
    void present(const DirtyRect& rect) override;

    ID3D12Device*       device() const { return device_.Get(); }
    ID3D12CommandQueue* queue() const { return queue_.Get(); }

   private:
    void acquire_device();
    void wait_for_gpu();

    template <typename T>
    using ComPtr = Microsoft::WRL::ComPtr<T>;

    ComPtr<IDXGIFactory6>             factory_;
    ComPtr<IDXGIAdapter1>             adapter_;
    ComPtr<ID3D12Device>              device_;
    ComPtr<ID3D12CommandQueue>        queue_;
    ComPtr<ID3D12CommandAllocator>    allocator_;
    ComPtr<ID3D12GraphicsCommandList> command_list_;
    ComPtr<ID3D12Fence>               fence_;
    HANDLE                            fence_event_ = nullptr;
    UINT64                            fence_value_ = 0;

    ComPtr<IDXGISwapChain3>                              swap_chain_;
    ComPtr<ID3D12DescriptorHeap>                         rtv_heap_;
    UINT                                                 rtv_stride_ = 0;
    std::array<ComPtr<ID3D12Resource>, BUFFER_COUNT>     buffers_;
    uint64_t                                             next_surface_id_ = 1;
    UINT                                                 swap_chain_flags_ = 0;
    PresentArgs                                          present_args_;
    std::unique_ptr<FrameGate>                           gate_;
};

}   // namespace kestrel

#endif
