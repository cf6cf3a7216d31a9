#pragma once

#include <cstdint>
#include <functional>
#include <kestrel/geometry.hpp>
#include <kestrel/window_description.hpp>
#include <memory>
#include <optional>

#include "platform_event.hpp"

namespace kestrel
{

using WindowId = uint32_t;

inline constexpr WindowId INVALID_WINDOW_ID = 0;

// One native OS window. Owned by WindowLifecycle; everything else holds a
// plain reference for lookups only.
class NativeWindow
{
   public:
    virtual ~NativeWindow() = default;

    virtual WindowId id() const = 0;

    // Raw handle for graphics API surface creation (GLFWwindow*, HWND).
    virtual void* native_handle() const = 0;

    virtual NativeWindowInfo info() const = 0;

    // Resize request in native logical units (user scale already applied).
    virtual void request_resize(double logical_width, double logical_height) = 0;

    virtual bool is_minimized() const = 0;

    // Pixel size of the monitor the window is on, when known.
    virtual std::optional<PhysicalSize> current_monitor_size() const = 0;
};

using PlatformEventSink = std::function<void(const PlatformEvent&)>;

// Pulls events out of the native event loop.
class PlatformEventSource
{
   public:
    virtual ~PlatformEventSource() = default;

    // Dispatch everything currently pending without blocking.
    virtual void poll(const PlatformEventSink& sink) = 0;

    // Block until at least one event arrives, then dispatch.
    virtual void wait(const PlatformEventSink& sink) = 0;
};

// A created window together with the event source that feeds it.
struct NativeWindowBundle
{
    std::unique_ptr<NativeWindow>        window;
    std::unique_ptr<PlatformEventSource> events;
};

// Creates native windows. The GLFW implementation lives in
// platform/glfw; tests supply their own.
class WindowFactory
{
   public:
    virtual ~WindowFactory() = default;

    virtual NativeWindowBundle create(WindowId id, const WindowDescription& desc,
                                      GraphicsBackend backend) = 0;

    // Same as create(), embedded as a child of `parent`.
    virtual NativeWindowBundle create_child(WindowId id, const WindowDescription& desc,
                                            GraphicsBackend backend, ParentWindow parent) = 0;
};

}   // namespace kestrel
