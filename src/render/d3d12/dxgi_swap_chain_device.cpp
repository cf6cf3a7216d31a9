#if defined(KESTREL_HAS_D3D12) && defined(_WIN32)

    #include "dxgi_swap_chain_device.hpp"

    #include <kestrel/errors.hpp>
    #include <kestrel/logger.hpp>
    #include <string>
    #include <vector>

namespace kestrel
{

namespace
{

constexpr DXGI_FORMAT BUFFER_FORMAT = DXGI_FORMAT_R8G8B8A8_UNORM;
constexpr DWORD       STARTUP_WAIT_MS = 1000;

std::string narrow(const wchar_t* text)
{
    int length = WideCharToMultiByte(CP_UTF8, 0, text, -1, nullptr, 0, nullptr, nullptr);
    if (length <= 1)
        return {};
    std::string out(static_cast<size_t>(length - 1), '\0');
    WideCharToMultiByte(CP_UTF8, 0, text, -1, out.data(), length, nullptr, nullptr);
    return out;
}

std::string hresult_string(HRESULT hr)
{
    return std::to_string(static_cast<unsigned long>(hr));
}

// Frame gate over the swap chain's frame-latency waitable object. DXGI
// signals it; signal() has nothing to do.
class WaitableFrameGate final : public FrameGate
{
   public:
    explicit WaitableFrameGate(HANDLE handle) : handle_(handle) {}
    ~WaitableFrameGate() override
    {
        if (handle_)
            CloseHandle(handle_);
    }

    bool wait(std::chrono::milliseconds timeout) override
    {
        return WaitForSingleObjectEx(handle_, static_cast<DWORD>(timeout.count()), TRUE)
               == WAIT_OBJECT_0;
    }

    void signal() override {}

   private:
    HANDLE handle_ = nullptr;
};

}   // namespace

DxgiSwapChainDevice::DxgiSwapChainDevice(bool vsync)
{
    acquire_device();

    BOOL allow_tearing = FALSE;
    if (FAILED(factory_->CheckFeatureSupport(
            DXGI_FEATURE_PRESENT_ALLOW_TEARING, &allow_tearing, sizeof(allow_tearing))))
    {
        allow_tearing = FALSE;
    }
    present_args_ = choose_present_args(vsync, allow_tearing == TRUE);

    KESTREL_LOG_DEBUG("d3d12",
                      "Present args: sync interval {}, tearing {}",
                      present_args_.sync_interval,
                      present_args_.allow_tearing);
}

DxgiSwapChainDevice::~DxgiSwapChainDevice()
{
    if (queue_ && fence_)
    {
        wait_for_gpu();
    }
    if (fence_event_)
    {
        CloseHandle(fence_event_);
    }
}

void DxgiSwapChainDevice::acquire_device()
{
    if (FAILED(CreateDXGIFactory2(0, IID_PPV_ARGS(&factory_))))
    {
        throw DeviceAcquisitionError("Direct3D12: DXGI factory 6 is not available");
    }

    std::vector<ComPtr<IDXGIAdapter1>> adapters;
    std::vector<AdapterInfo>           infos;
    for (UINT i = 0;; ++i)
    {
        ComPtr<IDXGIAdapter1> adapter;
        if (factory_->EnumAdapterByGpuPreference(
                i, DXGI_GPU_PREFERENCE_HIGH_PERFORMANCE, IID_PPV_ARGS(&adapter))
            == DXGI_ERROR_NOT_FOUND)
        {
            break;
        }

        DXGI_ADAPTER_DESC1 desc{};
        adapter->GetDesc1(&desc);

        AdapterInfo info;
        info.description = narrow(desc.Description);
        info.software    = (desc.Flags & DXGI_ADAPTER_FLAG_SOFTWARE) != 0;
        infos.push_back(std::move(info));
        adapters.push_back(adapter);
    }

    size_t chosen = select_adapter(infos,
                                   [&](size_t i)
                                   {
                                       return SUCCEEDED(D3D12CreateDevice(adapters[i].Get(),
                                                                          D3D_FEATURE_LEVEL_11_0,
                                                                          IID_PPV_ARGS(&device_)));
                                   });
    adapter_ = adapters[chosen];

    D3D12_COMMAND_QUEUE_DESC queue_desc{};
    queue_desc.Type = D3D12_COMMAND_LIST_TYPE_DIRECT;
    if (FAILED(device_->CreateCommandQueue(&queue_desc, IID_PPV_ARGS(&queue_))))
    {
        throw DeviceAcquisitionError("Direct3D12: could not create command queue");
    }

    if (FAILED(device_->CreateCommandAllocator(D3D12_COMMAND_LIST_TYPE_DIRECT,
                                               IID_PPV_ARGS(&allocator_)))
        || FAILED(device_->CreateCommandList(0,
                                             D3D12_COMMAND_LIST_TYPE_DIRECT,
                                             allocator_.Get(),
                                             nullptr,
                                             IID_PPV_ARGS(&command_list_)))
        || FAILED(command_list_->Close()))
    {
        throw DeviceAcquisitionError("Direct3D12: could not create command list");
    }

    if (FAILED(device_->CreateFence(0, D3D12_FENCE_FLAG_NONE, IID_PPV_ARGS(&fence_))))
    {
        throw DeviceAcquisitionError("Direct3D12: could not create fence");
    }
    fence_event_ = CreateEvent(nullptr, FALSE, FALSE, nullptr);
}

void DxgiSwapChainDevice::create_swap_chain(void* native_handle, PhysicalSize buffer_size)
{
    auto hwnd = static_cast<HWND>(native_handle);
    if (!hwnd)
    {
        throw SurfaceCreationError("Direct3D12: window has no HWND");
    }

    swap_chain_flags_ = DXGI_SWAP_CHAIN_FLAG_FRAME_LATENCY_WAITABLE_OBJECT;
    if (present_args_.allow_tearing)
    {
        swap_chain_flags_ |= DXGI_SWAP_CHAIN_FLAG_ALLOW_TEARING;
    }

    DXGI_SWAP_CHAIN_DESC1 desc{};
    desc.Width       = buffer_size.width;
    desc.Height      = buffer_size.height;
    desc.Format      = BUFFER_FORMAT;
    desc.Stereo      = FALSE;
    desc.SampleDesc  = {1, 0};
    desc.BufferUsage = DXGI_USAGE_RENDER_TARGET_OUTPUT;
    desc.BufferCount = BUFFER_COUNT;
    desc.Scaling     = DXGI_SCALING_NONE;
    desc.SwapEffect  = DXGI_SWAP_EFFECT_FLIP_SEQUENTIAL;
    desc.AlphaMode   = DXGI_ALPHA_MODE_UNSPECIFIED;
    desc.Flags       = swap_chain_flags_;

    ComPtr<IDXGISwapChain1> swap_chain1;
    HRESULT hr = factory_->CreateSwapChainForHwnd(
        queue_.Get(), hwnd, &desc, nullptr, nullptr, &swap_chain1);
    if (FAILED(hr) || FAILED(swap_chain1.As(&swap_chain_)))
    {
        throw SurfaceCreationError("Direct3D12: CreateSwapChainForHwnd failed (hr "
                                   + hresult_string(hr) + ")");
    }

    D3D12_DESCRIPTOR_HEAP_DESC heap_desc{};
    heap_desc.NumDescriptors = BUFFER_COUNT;
    heap_desc.Type           = D3D12_DESCRIPTOR_HEAP_TYPE_RTV;
    if (FAILED(device_->CreateDescriptorHeap(&heap_desc, IID_PPV_ARGS(&rtv_heap_))))
    {
        throw SurfaceCreationError("Direct3D12: could not create RTV heap");
    }
    rtv_stride_ = device_->GetDescriptorHandleIncrementSize(D3D12_DESCRIPTOR_HEAP_TYPE_RTV);

    if (HANDLE waitable = swap_chain_->GetFrameLatencyWaitableObject())
    {
        gate_ = std::make_unique<WaitableFrameGate>(waitable);
    }
    else
    {
        KESTREL_LOG_WARN("d3d12", "No frame latency waitable object; counting presents instead");
        gate_ = std::make_unique<CountingFrameGate>(BUFFER_COUNT);
    }
    gate_->wait(std::chrono::milliseconds(STARTUP_WAIT_MS));

    UINT flags = present_args_.allow_tearing ? DXGI_PRESENT_ALLOW_TEARING : 0;
    if (FAILED(swap_chain_->Present(present_args_.sync_interval, flags)))
    {
        KESTREL_LOG_WARN("d3d12", "Initial present failed");
    }
    gate_->signal();
}

uint32_t DxgiSwapChainDevice::current_buffer_index() const
{
    return swap_chain_ ? swap_chain_->GetCurrentBackBufferIndex() : 0;
}

uint64_t DxgiSwapChainDevice::wrap_buffer(uint32_t index, PhysicalSize size)
{
    if (!swap_chain_ || index >= BUFFER_COUNT)
    {
        return 0;
    }
    if (FAILED(swap_chain_->GetBuffer(index, IID_PPV_ARGS(&buffers_[index]))))
    {
        KESTREL_LOG_ERROR("d3d12", "GetBuffer({}) failed", index);
        return 0;
    }

    D3D12_CPU_DESCRIPTOR_HANDLE handle = rtv_heap_->GetCPUDescriptorHandleForHeapStart();
    handle.ptr += static_cast<SIZE_T>(index) * rtv_stride_;
    device_->CreateRenderTargetView(buffers_[index].Get(), nullptr, handle);

    KESTREL_LOG_TRACE("d3d12", "Wrapped buffer {} as {}x{} target", index, size.width, size.height);
    return next_surface_id_++;
}

void DxgiSwapChainDevice::release_buffer_surfaces()
{
    for (auto& buffer : buffers_)
    {
        buffer.Reset();
    }
}

void DxgiSwapChainDevice::free_gpu_resources()
{
    wait_for_gpu();
}

void DxgiSwapChainDevice::reset_context()
{
    if (FAILED(allocator_->Reset())
        || FAILED(command_list_->Reset(allocator_.Get(), nullptr))
        || FAILED(command_list_->Close()))
    {
        throw SurfaceCreationError("Direct3D12: could not reset the command list");
    }
}

void DxgiSwapChainDevice::resize_buffers(PhysicalSize buffer_size)
{
    HRESULT hr = swap_chain_->ResizeBuffers(
        BUFFER_COUNT, buffer_size.width, buffer_size.height, BUFFER_FORMAT, swap_chain_flags_);
    if (FAILED(hr))
    {
        throw SurfaceCreationError("Direct3D12: ResizeBuffers failed (hr " + hresult_string(hr)
                                   + ")");
    }
}

FrameGate& DxgiSwapChainDevice::frame_gate()
{
    if (!gate_)
    {
        throw std::logic_error("Direct3D12: frame gate requested before the swap chain exists");
    }
    return *gate_;
}

void DxgiSwapChainDevice::flush()
{
    if (FAILED(queue_->Signal(fence_.Get(), ++fence_value_)))
    {
        KESTREL_LOG_ERROR("d3d12", "Fence signal failed on flush");
    }
}

void DxgiSwapChainDevice::present(const DirtyRect& rect)
{
    RECT dirty{rect.left, rect.top, rect.right, rect.bottom};

    DXGI_PRESENT_PARAMETERS params{};
    params.DirtyRectsCount = 1;
    params.pDirtyRects     = &dirty;

    UINT    flags = present_args_.allow_tearing ? DXGI_PRESENT_ALLOW_TEARING : 0;
    HRESULT hr    = swap_chain_->Present1(present_args_.sync_interval, flags, &params);
    if (FAILED(hr))
    {
        bool device_lost = hr == DXGI_ERROR_DEVICE_REMOVED || hr == DXGI_ERROR_DEVICE_RESET;
        throw PresentError("Direct3D12: Present1 failed (hr " + hresult_string(hr) + ")",
                           device_lost);
    }
    if (gate_)
    {
        gate_->signal();
    }
}

void DxgiSwapChainDevice::wait_for_gpu()
{
    const UINT64 value = ++fence_value_;
    if (FAILED(queue_->Signal(fence_.Get(), value)))
    {
        KESTREL_LOG_ERROR("d3d12", "Fence signal failed while waiting for the GPU");
        return;
    }
    if (fence_->GetCompletedValue() < value)
    {
        fence_->SetEventOnCompletion(value, fence_event_);
        WaitForSingleObject(fence_event_, INFINITE);
    }
}

}   // namespace kestrel

#endif
