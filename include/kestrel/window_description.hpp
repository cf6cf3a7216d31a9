#pragma once

#include <chrono>
#include <cstddef>
#include <kestrel/event.hpp>
#include <kestrel/geometry.hpp>
#include <kestrel/logger.hpp>
#include <kestrel/surface.hpp>
#include <optional>
#include <string>

namespace kestrel
{

// How the OS part of the scale factor is chosen.
struct ScalePolicy
{
    // Empty: follow the DPI the OS reports, including changes at runtime
    // (window dragged to another monitor). Set: pin the window scale factor.
    std::optional<double> fixed_factor;

    static ScalePolicy system() { return {}; }
    static ScalePolicy fixed(double factor) { return {factor}; }

    bool uses_system_scaling() const { return !fixed_factor.has_value(); }
};

// Opaque handle of a host window a child window is embedded into
// (HWND, X11 Window, NSView*).
struct ParentWindow
{
    void* handle = nullptr;
};

struct WindowDescription
{
    std::string title      = "Kestrel";
    WindowSize  inner_size = {800, 600};

    // Applied on top of the OS DPI scaling; 1.0 leaves it untouched.
    double user_scale_factor = 1.0;

    ScalePolicy scale_policy = ScalePolicy::system();

    bool resizable = true;
    bool vsync     = true;
};

// Key combination that closes the window, in addition to the native
// close button. Matches only when the modifiers are exactly `modifiers`.
struct QuitAccelerator
{
    bool      enabled = false;
    Code      code    = Code::KeyQ;
    Modifiers modifiers{Modifiers::SUPER};

    static QuitAccelerator platform_default()
    {
        QuitAccelerator accel;
#ifdef __APPLE__
        accel.enabled = true;
#endif
        return accel;
    }
};

struct AppConfig
{
#ifdef _WIN32
    GraphicsBackend backend = GraphicsBackend::Direct3D12;
#else
    GraphicsBackend backend = GraphicsBackend::OpenGL;
#endif

    LogLevel    log_level = LogLevel::Info;
    std::string log_file;   // empty: console only

    QuitAccelerator quit_accelerator = QuitAccelerator::platform_default();

    // Upper bound on the wait for the next swap-chain buffer.
    std::chrono::milliseconds frame_timeout{1000};

    size_t event_channel_capacity = 4096;

    // Apply KESTREL_BACKEND and KESTREL_LOG_LEVEL from the environment.
    // Unknown values are logged and ignored.
    void apply_environment();
};

std::optional<GraphicsBackend> parse_backend_name(std::string_view name);

}   // namespace kestrel
