#pragma once

#if defined(KESTREL_HAS_VULKAN) && defined(KESTREL_USE_GLFW)

    #include <chrono>
    #include <cstdint>
    #include <optional>
    #include <vector>
    #include <vulkan/vulkan.h>

    #include "../surface_manager.hpp"
    #include "swapchain_images.hpp"

namespace kestrel
{

namespace vk
{

struct QueueFamilyIndices
{
    std::optional<uint32_t> graphics;
    std::optional<uint32_t> present;

    bool is_complete() const { return graphics.has_value() && present.has_value(); }
};

struct SwapchainSupportDetails
{
    VkSurfaceCapabilitiesKHR        capabilities{};
    std::vector<VkSurfaceFormatKHR> formats;
    std::vector<VkPresentModeKHR>   present_modes;
};

QueueFamilyIndices      find_queue_families(VkPhysicalDevice device, VkSurfaceKHR surface);
SwapchainSupportDetails query_swapchain_support(VkPhysicalDevice device, VkSurfaceKHR surface);
VkSurfaceFormatKHR      choose_surface_format(const std::vector<VkSurfaceFormatKHR>& formats);
VkPresentModeKHR        choose_present_mode(const std::vector<VkPresentModeKHR>& modes, bool vsync);
VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& capabilities, uint32_t width,
                         uint32_t height);

}   // namespace vk

// Minimal Vulkan backend: instance, device and swap chain for one window.
// The surface pair is the acquired swap-chain image and the previously
// acquired one; there is no offscreen compositing surface of its own.
// An image whose present is skipped stays held for the next frame.
class VkSurfaceManager final : public SurfaceManager
{
   public:
    VkSurfaceManager(bool vsync, std::chrono::milliseconds frame_timeout);
    ~VkSurfaceManager() override;

    VkSurfaceManager(const VkSurfaceManager&)            = delete;
    VkSurfaceManager& operator=(const VkSurfaceManager&) = delete;

    GraphicsBackend backend() const override { return GraphicsBackend::Vulkan; }

    RenderSurfacePair& create(NativeWindow& window, PhysicalSize size) override;
    bool               resize(PhysicalSize size) override;
    SurfaceFrame       acquire_current() override;
    void               flush() override;
    void               present(const BoundingBox& dirty_region) override;

    PhysicalSize size() const override { return size_; }

    RenderSurfacePair&       surfaces() override { return pair_; }
    const RenderSurfacePair& surfaces() const override { return pair_; }

    GpuContext& context() override { return context_; }

   private:
    void create_instance();
    void pick_device();
    void create_device();

    // Builds a swap chain for `size`, retiring `old_swapchain`. Throws
    // SurfaceCreationError without touching the current swap chain.
    VkSwapchainKHR build_swapchain(PhysicalSize size, VkSwapchainKHR old_swapchain,
                                   VkExtent2D& extent, std::vector<VkImage>& images);

    // Replaces the swap chain at `size`, also when the size is unchanged.
    void recreate_swapchain(PhysicalSize size);
    bool try_recreate();

    void rebuild_pair();
    void destroy();

    bool                      vsync_ = true;
    std::chrono::milliseconds frame_timeout_;
    GpuContext                context_;

    VkInstance               instance_        = VK_NULL_HANDLE;
    VkSurfaceKHR             surface_         = VK_NULL_HANDLE;
    VkPhysicalDevice         physical_device_ = VK_NULL_HANDLE;
    VkDevice                 device_          = VK_NULL_HANDLE;
    VkQueue                  graphics_queue_  = VK_NULL_HANDLE;
    VkQueue                  present_queue_   = VK_NULL_HANDLE;
    vk::QueueFamilyIndices   families_;
    VkSwapchainKHR           swapchain_       = VK_NULL_HANDLE;
    VkExtent2D               extent_{0, 0};
    std::vector<VkImage>     images_;
    VkFence                  acquire_fence_   = VK_NULL_HANDLE;

    SwapchainImages images_state_;
    uint64_t        generation_ = 0;

    PhysicalSize      size_;
    RenderSurfacePair pair_;
};

}   // namespace kestrel

#endif
