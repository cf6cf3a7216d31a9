#include <cctype>
#include <cstdlib>
#include <kestrel/logger.hpp>
#include <kestrel/surface.hpp>
#include <kestrel/window_description.hpp>
#include <string>

namespace kestrel
{

std::string_view backend_name(GraphicsBackend backend)
{
    switch (backend)
    {
        case GraphicsBackend::OpenGL:
            return "opengl";
        case GraphicsBackend::Direct3D12:
            return "d3d12";
        case GraphicsBackend::Vulkan:
            return "vulkan";
    }
    return "unknown";
}

std::optional<GraphicsBackend> parse_backend_name(std::string_view name)
{
    std::string lower;
    for (char c : name)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "opengl" || lower == "gl")
        return GraphicsBackend::OpenGL;
    if (lower == "d3d12" || lower == "direct3d12" || lower == "dx12")
        return GraphicsBackend::Direct3D12;
    if (lower == "vulkan" || lower == "vk")
        return GraphicsBackend::Vulkan;
    return std::nullopt;
}

void AppConfig::apply_environment()
{
    if (const char* env = std::getenv("KESTREL_BACKEND"); env && env[0] != '\0')
    {
        if (auto parsed = parse_backend_name(env))
        {
            backend = *parsed;
            KESTREL_LOG_INFO("app", "Backend from KESTREL_BACKEND: {}", backend_name(backend));
        }
        else
        {
            KESTREL_LOG_WARN("app", "Ignoring unknown KESTREL_BACKEND value '{}'", env);
        }
    }

    if (const char* env = std::getenv("KESTREL_LOG_LEVEL"); env && env[0] != '\0')
    {
        if (auto level = Logger::level_from_string(env))
        {
            log_level = *level;
        }
        else
        {
            KESTREL_LOG_WARN("app", "Ignoring unknown KESTREL_LOG_LEVEL value '{}'", env);
        }
    }
}

}   // namespace kestrel
