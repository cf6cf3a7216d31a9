#include "backend_factory.hpp"

#include <kestrel/errors.hpp>
#include <kestrel/logger.hpp>
#include <string>

#ifdef KESTREL_HAS_OPENGL
    #include "opengl/gl_surface_manager.hpp"
    #include "opengl/glfw_gl_device.hpp"
#endif

#if defined(KESTREL_HAS_D3D12) && defined(_WIN32)
    #include "d3d12/d3d12_surface_manager.hpp"
    #include "d3d12/dxgi_swap_chain_device.hpp"
#endif

#if defined(KESTREL_HAS_VULKAN) && defined(KESTREL_USE_GLFW)
    #include "vulkan/vk_surface_manager.hpp"
#endif

namespace kestrel
{

bool backend_available(GraphicsBackend backend)
{
    switch (backend)
    {
        case GraphicsBackend::OpenGL:
#ifdef KESTREL_HAS_OPENGL
            return true;
#else
            return false;
#endif
        case GraphicsBackend::Direct3D12:
#if defined(KESTREL_HAS_D3D12) && defined(_WIN32)
            return true;
#else
            return false;
#endif
        case GraphicsBackend::Vulkan:
#if defined(KESTREL_HAS_VULKAN) && defined(KESTREL_USE_GLFW)
            return true;
#else
            return false;
#endif
    }
    return false;
}

std::unique_ptr<SurfaceManager> make_surface_manager(GraphicsBackend           backend,
                                                     bool                      vsync,
                                                     std::chrono::milliseconds frame_timeout)
{
    if (!backend_available(backend))
    {
        throw ConfigurationError("Graphics backend '" + std::string(backend_name(backend))
                                 + "' is not compiled into this build");
    }

    KESTREL_LOG_INFO("backend", "Creating {} surface manager (vsync {})", backend_name(backend), vsync);

    switch (backend)
    {
#ifdef KESTREL_HAS_OPENGL
        case GraphicsBackend::OpenGL:
            return std::make_unique<GlSurfaceManager>(std::make_unique<GlfwGlDevice>(), vsync);
#endif
#if defined(KESTREL_HAS_D3D12) && defined(_WIN32)
        case GraphicsBackend::Direct3D12:
            return std::make_unique<D3D12SurfaceManager>(
                std::make_unique<DxgiSwapChainDevice>(vsync), frame_timeout);
#endif
#if defined(KESTREL_HAS_VULKAN) && defined(KESTREL_USE_GLFW)
        case GraphicsBackend::Vulkan:
            return std::make_unique<VkSurfaceManager>(vsync, frame_timeout);
#endif
        default:
            break;
    }

    (void)vsync;
    (void)frame_timeout;
    throw ConfigurationError("Graphics backend '" + std::string(backend_name(backend))
                             + "' is not compiled into this build");
}

}   // namespace kestrel
