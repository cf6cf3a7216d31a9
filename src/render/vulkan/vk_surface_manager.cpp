#if defined(KESTREL_HAS_VULKAN) && defined(KESTREL_USE_GLFW)

    #include "vk_surface_manager.hpp"

    #define GLFW_INCLUDE_NONE
    #define GLFW_INCLUDE_VULKAN
    #include <GLFW/glfw3.h>
    #include <algorithm>
    #include <kestrel/errors.hpp>
    #include <kestrel/logger.hpp>
    #include <set>
    #include <string>

    #include "../../platform/native_window.hpp"

namespace kestrel
{

namespace vk
{

QueueFamilyIndices find_queue_families(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    QueueFamilyIndices indices;

    uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &count, families.data());

    for (uint32_t i = 0; i < count; ++i)
    {
        if (!indices.graphics && (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT))
        {
            indices.graphics = i;
        }

        VkBool32 present_support = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(device, i, surface, &present_support);
        if (!indices.present && present_support)
        {
            indices.present = i;
        }
    }
    return indices;
}

SwapchainSupportDetails query_swapchain_support(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    SwapchainSupportDetails details;
    vkGetPhysicalDeviceSurfaceCapabilitiesKHR(device, surface, &details.capabilities);

    uint32_t format_count = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(device, surface, &format_count, nullptr);
    if (format_count > 0)
    {
        details.formats.resize(format_count);
        vkGetPhysicalDeviceSurfaceFormatsKHR(
            device, surface, &format_count, details.formats.data());
    }

    uint32_t mode_count = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(device, surface, &mode_count, nullptr);
    if (mode_count > 0)
    {
        details.present_modes.resize(mode_count);
        vkGetPhysicalDeviceSurfacePresentModesKHR(
            device, surface, &mode_count, details.present_modes.data());
    }
    return details;
}

VkSurfaceFormatKHR choose_surface_format(const std::vector<VkSurfaceFormatKHR>& formats)
{
    for (const auto& f : formats)
    {
        if (f.format == VK_FORMAT_B8G8R8A8_UNORM
            && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR)
        {
            return f;
        }
    }
    return formats[0];
}

VkPresentModeKHR choose_present_mode(const std::vector<VkPresentModeKHR>& modes, bool vsync)
{
    // FIFO is the only mode every implementation supports.
    if (vsync)
    {
        return VK_PRESENT_MODE_FIFO_KHR;
    }
    for (auto preferred : {VK_PRESENT_MODE_MAILBOX_KHR, VK_PRESENT_MODE_IMMEDIATE_KHR})
    {
        if (std::find(modes.begin(), modes.end(), preferred) != modes.end())
        {
            return preferred;
        }
    }
    return VK_PRESENT_MODE_FIFO_KHR;
}

VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& capabilities, uint32_t width,
                         uint32_t height)
{
    if (capabilities.currentExtent.width != UINT32_MAX)
    {
        return capabilities.currentExtent;
    }
    VkExtent2D extent = {width, height};
    extent.width      = std::clamp(
        extent.width, capabilities.minImageExtent.width, capabilities.maxImageExtent.width);
    extent.height = std::clamp(
        extent.height, capabilities.minImageExtent.height, capabilities.maxImageExtent.height);
    return extent;
}

}   // namespace vk

namespace
{

int rate_device(VkPhysicalDevice device, VkSurfaceKHR surface)
{
    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(device, &props);

    if (!vk::find_queue_families(device, surface).is_complete())
        return -1;

    uint32_t ext_count = 0;
    vkEnumerateDeviceExtensionProperties(device, nullptr, &ext_count, nullptr);
    std::vector<VkExtensionProperties> exts(ext_count);
    vkEnumerateDeviceExtensionProperties(device, nullptr, &ext_count, exts.data());
    bool has_swapchain = std::any_of(exts.begin(),
                                     exts.end(),
                                     [](const VkExtensionProperties& e)
                                     {
                                         return std::string(e.extensionName)
                                                == VK_KHR_SWAPCHAIN_EXTENSION_NAME;
                                     });
    if (!has_swapchain)
        return -1;

    int score = 0;
    if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU)
        score += 1000;
    else if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU)
        score += 100;

    score += static_cast<int>(props.limits.maxImageDimension2D / 1024);
    return score;
}

uint64_t surface_id(uint64_t generation, uint32_t image)
{
    return (generation << 8) | (static_cast<uint64_t>(image) + 1);
}

}   // namespace

VkSurfaceManager::VkSurfaceManager(bool vsync, std::chrono::milliseconds frame_timeout)
    : vsync_(vsync), frame_timeout_(frame_timeout)
{
}

VkSurfaceManager::~VkSurfaceManager()
{
    destroy();
}

void VkSurfaceManager::create_instance()
{
    VkApplicationInfo app_info{};
    app_info.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app_info.pApplicationName   = "Kestrel";
    app_info.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    app_info.pEngineName        = "Kestrel";
    app_info.engineVersion      = VK_MAKE_VERSION(0, 1, 0);
    app_info.apiVersion         = VK_API_VERSION_1_2;

    uint32_t     glfw_ext_count = 0;
    const char** glfw_exts      = glfwGetRequiredInstanceExtensions(&glfw_ext_count);
    if (!glfw_exts)
    {
        throw DeviceAcquisitionError("Vulkan: GLFW reports no surface support");
    }

    VkInstanceCreateInfo create_info{};
    create_info.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    create_info.pApplicationInfo        = &app_info;
    create_info.enabledExtensionCount   = glfw_ext_count;
    create_info.ppEnabledExtensionNames = glfw_exts;

    if (vkCreateInstance(&create_info, nullptr, &instance_) != VK_SUCCESS)
    {
        throw DeviceAcquisitionError("Vulkan: failed to create instance");
    }
}

void VkSurfaceManager::pick_device()
{
    uint32_t count = 0;
    vkEnumeratePhysicalDevices(instance_, &count, nullptr);
    std::vector<VkPhysicalDevice> devices(count);
    vkEnumeratePhysicalDevices(instance_, &count, devices.data());

    int best_score = -1;
    for (auto dev : devices)
    {
        int score = rate_device(dev, surface_);
        if (score > best_score)
        {
            best_score       = score;
            physical_device_ = dev;
        }
    }

    if (physical_device_ == VK_NULL_HANDLE)
    {
        throw DeviceAcquisitionError("Vulkan: no GPU can present to this window ("
                                     + std::to_string(count) + " enumerated)");
    }

    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(physical_device_, &props);
    KESTREL_LOG_INFO("vulkan", "Using GPU: {}", props.deviceName);
}

void VkSurfaceManager::create_device()
{
    families_ = vk::find_queue_families(physical_device_, surface_);

    std::set<uint32_t> unique_families{families_.graphics.value(), families_.present.value()};

    float                                priority = 1.0f;
    std::vector<VkDeviceQueueCreateInfo> queue_infos;
    for (uint32_t family : unique_families)
    {
        VkDeviceQueueCreateInfo qi{};
        qi.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        qi.queueFamilyIndex = family;
        qi.queueCount       = 1;
        qi.pQueuePriorities = &priority;
        queue_infos.push_back(qi);
    }

    const char*              extensions[] = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};
    VkPhysicalDeviceFeatures features{};

    VkDeviceCreateInfo create_info{};
    create_info.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    create_info.queueCreateInfoCount    = static_cast<uint32_t>(queue_infos.size());
    create_info.pQueueCreateInfos       = queue_infos.data();
    create_info.pEnabledFeatures        = &features;
    create_info.enabledExtensionCount   = 1;
    create_info.ppEnabledExtensionNames = extensions;

    if (vkCreateDevice(physical_device_, &create_info, nullptr, &device_) != VK_SUCCESS)
    {
        throw DeviceAcquisitionError("Vulkan: failed to create logical device");
    }

    vkGetDeviceQueue(device_, families_.graphics.value(), 0, &graphics_queue_);
    vkGetDeviceQueue(device_, families_.present.value(), 0, &present_queue_);

    VkFenceCreateInfo fence_info{};
    fence_info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    if (vkCreateFence(device_, &fence_info, nullptr, &acquire_fence_) != VK_SUCCESS)
    {
        throw DeviceAcquisitionError("Vulkan: failed to create acquire fence");
    }
}

VkSwapchainKHR VkSurfaceManager::build_swapchain(PhysicalSize size, VkSwapchainKHR old_swapchain,
                                                 VkExtent2D& extent, std::vector<VkImage>& images)
{
    auto support = vk::query_swapchain_support(physical_device_, surface_);
    if (support.formats.empty())
    {
        throw SurfaceCreationError("Vulkan: surface reports no formats");
    }

    auto format = vk::choose_surface_format(support.formats);
    auto mode   = vk::choose_present_mode(support.present_modes, vsync_);
    extent      = vk::choose_extent(support.capabilities, size.width, size.height);

    uint32_t image_count = support.capabilities.minImageCount + 1;
    if (support.capabilities.maxImageCount > 0 && image_count > support.capabilities.maxImageCount)
    {
        image_count = support.capabilities.maxImageCount;
    }

    VkSwapchainCreateInfoKHR create_info{};
    create_info.sType            = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    create_info.surface          = surface_;
    create_info.minImageCount    = image_count;
    create_info.imageFormat      = format.format;
    create_info.imageColorSpace  = format.colorSpace;
    create_info.imageExtent      = extent;
    create_info.imageArrayLayers = 1;
    create_info.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    create_info.preTransform   = support.capabilities.currentTransform;
    create_info.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    create_info.presentMode    = mode;
    create_info.clipped        = VK_TRUE;
    create_info.oldSwapchain   = old_swapchain;

    uint32_t family_indices[] = {families_.graphics.value(), families_.present.value()};
    if (family_indices[0] != family_indices[1])
    {
        create_info.imageSharingMode      = VK_SHARING_MODE_CONCURRENT;
        create_info.queueFamilyIndexCount = 2;
        create_info.pQueueFamilyIndices   = family_indices;
    }
    else
    {
        create_info.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }

    VkSwapchainKHR swapchain = VK_NULL_HANDLE;
    VkResult       result    = vkCreateSwapchainKHR(device_, &create_info, nullptr, &swapchain);
    if (result != VK_SUCCESS)
    {
        throw SurfaceCreationError("Vulkan: vkCreateSwapchainKHR failed ("
                                   + std::to_string(static_cast<int>(result)) + ")");
    }

    vkGetSwapchainImagesKHR(device_, swapchain, &image_count, nullptr);
    images.resize(image_count);
    vkGetSwapchainImagesKHR(device_, swapchain, &image_count, images.data());
    return swapchain;
}

void VkSurfaceManager::rebuild_pair()
{
    pair_ = {};
    if (images_.empty())
    {
        return;
    }

    const auto count   = static_cast<uint32_t>(images_.size());
    uint32_t   current = images_state_.current().value_or(0);
    uint32_t   other   = images_state_.previous().value_or((current + 1) % count);

    PhysicalSize image_size{extent_.width, extent_.height};
    pair_.primary = Surface{surface_id(generation_, current), image_size, SurfaceOrigin::TopLeft};
    pair_.dirty   = Surface{surface_id(generation_, other), image_size, SurfaceOrigin::TopLeft};
}

RenderSurfacePair& VkSurfaceManager::create(NativeWindow& window, PhysicalSize size)
{
    context_.affinity().check("VkSurfaceManager");

    create_instance();

    auto* glfw_window = static_cast<GLFWwindow*>(window.native_handle());
    if (glfwCreateWindowSurface(instance_, glfw_window, nullptr, &surface_) != VK_SUCCESS)
    {
        throw SurfaceCreationError("Vulkan: glfwCreateWindowSurface failed");
    }

    pick_device();
    create_device();

    swapchain_ = build_swapchain(size, VK_NULL_HANDLE, extent_, images_);
    size_      = size;
    ++generation_;
    rebuild_pair();

    KESTREL_LOG_INFO("vulkan",
                     "Swap chain created: {} images at {}x{}",
                     images_.size(),
                     extent_.width,
                     extent_.height);
    return pair_;
}

void VkSurfaceManager::recreate_swapchain(PhysicalSize size)
{
    auto guard = bind_context();
    vkDeviceWaitIdle(device_);

    VkExtent2D           extent{};
    std::vector<VkImage> images;
    VkSwapchainKHR       fresh = build_swapchain(size, swapchain_, extent, images);

    // Retiring the old swap chain also returns any image still held from it.
    vkDestroySwapchainKHR(device_, swapchain_, nullptr);
    swapchain_ = fresh;
    extent_    = extent;
    images_    = std::move(images);
    size_      = size;
    images_state_.reset();
    ++generation_;
    rebuild_pair();

    KESTREL_LOG_DEBUG("vulkan", "Swap chain rebuilt at {}x{}", extent_.width, extent_.height);
}

bool VkSurfaceManager::try_recreate()
{
    try
    {
        recreate_swapchain(size_);
        return true;
    }
    catch (const SurfaceCreationError& e)
    {
        // Stays out of date; the next frame or resize tries again.
        KESTREL_LOG_WARN("vulkan", "Swap chain rebuild failed: {}", e.what());
        return false;
    }
}

bool VkSurfaceManager::resize(PhysicalSize size)
{
    if (size.is_empty() || size == size_)
    {
        return false;
    }

    recreate_swapchain(size);
    return true;
}

SurfaceFrame VkSurfaceManager::acquire_current()
{
    context_.affinity().check("VkSurfaceManager");
    if (swapchain_ == VK_NULL_HANDLE || size_.is_empty())
    {
        return {};
    }

    if (images_state_.out_of_date() && !try_recreate())
    {
        return {};
    }

    // A frame whose present was skipped still owns its image; draw into it again.
    if (images_state_.holding())
    {
        rebuild_pair();
        return {&pair_.dirty, &pair_.primary};
    }

    const auto timeout_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(frame_timeout_).count());

    uint32_t index  = 0;
    VkResult result = vkAcquireNextImageKHR(
        device_, swapchain_, timeout_ns, VK_NULL_HANDLE, acquire_fence_, &index);

    if (result == VK_ERROR_OUT_OF_DATE_KHR)
    {
        KESTREL_LOG_DEBUG("vulkan", "Swap chain out of date on acquire; rebuilding");
        images_state_.mark_out_of_date();
        if (!try_recreate())
        {
            return {};
        }
        result = vkAcquireNextImageKHR(
            device_, swapchain_, timeout_ns, VK_NULL_HANDLE, acquire_fence_, &index);
    }

    if (result == VK_TIMEOUT || result == VK_NOT_READY)
    {
        KESTREL_LOG_WARN("vulkan", "Image acquire timed out after {} ms", frame_timeout_.count());
        return {};
    }
    if (result == VK_ERROR_OUT_OF_DATE_KHR)
    {
        images_state_.mark_out_of_date();
        return {};
    }
    if (result != VK_SUCCESS && result != VK_SUBOPTIMAL_KHR)
    {
        throw PresentError("Vulkan: vkAcquireNextImageKHR failed ("
                               + std::to_string(static_cast<int>(result)) + ")",
                           result == VK_ERROR_DEVICE_LOST);
    }

    if (vkWaitForFences(device_, 1, &acquire_fence_, VK_TRUE, timeout_ns) != VK_SUCCESS)
    {
        KESTREL_LOG_WARN("vulkan", "Acquire fence wait timed out");
    }
    vkResetFences(device_, 1, &acquire_fence_);

    if (result == VK_SUBOPTIMAL_KHR)
    {
        images_state_.mark_out_of_date();
    }
    images_state_.acquired(index);
    rebuild_pair();
    return {&pair_.dirty, &pair_.primary};
}

void VkSurfaceManager::flush()
{
    auto guard = bind_context();
    if (graphics_queue_ != VK_NULL_HANDLE)
    {
        vkQueueWaitIdle(graphics_queue_);
    }
}

void VkSurfaceManager::present(const BoundingBox& dirty_region)
{
    if (dirty_region.is_degenerate() || !images_state_.holding())
    {
        return;
    }

    auto guard = bind_context();

    uint32_t         index = *images_state_.take_for_present();
    VkPresentInfoKHR present_info{};
    present_info.sType          = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    present_info.swapchainCount = 1;
    present_info.pSwapchains    = &swapchain_;
    present_info.pImageIndices  = &index;

    VkResult result = vkQueuePresentKHR(present_queue_, &present_info);
    if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR)
    {
        KESTREL_LOG_DEBUG("vulkan", "Present reported a stale swap chain");
        images_state_.mark_out_of_date();
        return;
    }
    if (result != VK_SUCCESS)
    {
        throw PresentError("Vulkan: vkQueuePresentKHR failed ("
                               + std::to_string(static_cast<int>(result)) + ")",
                           result == VK_ERROR_DEVICE_LOST);
    }
}

void VkSurfaceManager::destroy()
{
    if (device_ != VK_NULL_HANDLE)
    {
        vkDeviceWaitIdle(device_);
        if (swapchain_ != VK_NULL_HANDLE)
            vkDestroySwapchainKHR(device_, swapchain_, nullptr);
        if (acquire_fence_ != VK_NULL_HANDLE)
            vkDestroyFence(device_, acquire_fence_, nullptr);
        vkDestroyDevice(device_, nullptr);
    }
    if (surface_ != VK_NULL_HANDLE)
        vkDestroySurfaceKHR(instance_, surface_, nullptr);
    if (instance_ != VK_NULL_HANDLE)
        vkDestroyInstance(instance_, nullptr);

    swapchain_     = VK_NULL_HANDLE;
    acquire_fence_ = VK_NULL_HANDLE;
    device_        = VK_NULL_HANDLE;
    surface_       = VK_NULL_HANDLE;
    instance_      = VK_NULL_HANDLE;
    images_.clear();
    images_state_.reset();
    pair_ = {};
}

}   // namespace kestrel

#endif
