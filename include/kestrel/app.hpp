#pragma once

#include <chrono>
#include <functional>
#include <kestrel/event_channel.hpp>
#include <kestrel/fwd.hpp>
#include <kestrel/geometry.hpp>
#include <kestrel/surface.hpp>
#include <kestrel/window_description.hpp>
#include <memory>
#include <string>

namespace kestrel
{

// Builds the UI core rendered into a window. `proxy` injects events into
// that window from any thread.
using UiBuilder = std::function<std::unique_ptr<UiCore>(EventProxy proxy)>;

// Runs after every tick with the window root as the current entity.
using IdleCallback = std::function<void(UiCore&)>;

// Produces the surface manager for a window. Defaults to
// make_surface_manager().
using SurfaceManagerFactory = std::function<std::unique_ptr<SurfaceManager>(
    GraphicsBackend backend, bool vsync, std::chrono::milliseconds frame_timeout)>;

class WindowLifecycle;
class WindowSession;

// Handle of a window embedded in a host window. The host owns the thread:
// the window is created on the thread that calls open_parented(), and the
// host drives it by calling step() from that same thread, typically from
// its own event loop or idle timer. Only proxy() may be used elsewhere.
class ParentedWindow
{
   public:
    ParentedWindow();
    ~ParentedWindow();

    ParentedWindow(ParentedWindow&&) noexcept;
    ParentedWindow& operator=(ParentedWindow&&) noexcept;

    ParentedWindow(const ParentedWindow&)            = delete;
    ParentedWindow& operator=(const ParentedWindow&) = delete;

    // Injects events into the window's UI from any thread.
    EventProxy proxy() const { return EventProxy(channel_); }

    // Poll native events and run one tick. Returns false once the window
    // has closed. Throws PresentError like Application::run().
    bool step();

    // Tear down the UI and surfaces and destroy the child window.
    void close();

    bool is_open() const;

   private:
    friend class Application;

    std::shared_ptr<WindowFactory>   factory_;
    std::shared_ptr<EventChannel>    channel_;
    std::unique_ptr<WindowLifecycle> windows_;
    std::unique_ptr<WindowSession>   session_;
    WindowId                         id_ = 0;
};

// Application front end: describes a window, opens it and runs it.
//
// Usage:
//   kestrel::Application app(build_ui);
//   app.title("Hello").inner_size({640, 480}).user_scale_factor(1.25);
//   app.run();
class Application
{
   public:
    explicit Application(UiBuilder build_ui, AppConfig config = {});
    ~Application();

    Application(const Application&)            = delete;
    Application& operator=(const Application&) = delete;

    Application& title(std::string title);
    Application& inner_size(WindowSize size);
    Application& user_scale_factor(double factor);
    Application& scale_policy(ScalePolicy policy);
    Application& backend(GraphicsBackend backend);
    Application& vsync(bool enabled);
    Application& resizable(bool enabled);
    Application& quit_accelerator(QuitAccelerator accel);
    Application& on_idle(IdleCallback callback);

    // Replace the native windowing backend (GLFW by default).
    Application& window_factory(std::shared_ptr<WindowFactory> factory);

    // Replace the surface manager construction (make_surface_manager() by
    // default).
    Application& surface_factory(SurfaceManagerFactory factory);

    const WindowDescription& description() const { return description_; }
    const AppConfig&         config() const { return config_; }

    // Open the window and block until it closes. Throws ConfigurationError
    // before any window exists when the backend is not compiled in, and
    // DeviceAcquisitionError or SurfaceCreationError when it cannot start.
    void run();

    // Open a child window inside `parent` on the calling thread. Throws like
    // run() when the window or its surfaces cannot be created.
    ParentedWindow open_parented(ParentWindow parent);

    // Console sink plus the optional file sink from `config`.
    static void init_logging(const AppConfig& config);

   private:
    void prepare();

    UiBuilder                      build_ui_;
    AppConfig                      config_;
    WindowDescription              description_;
    IdleCallback                   on_idle_;
    std::shared_ptr<WindowFactory> window_factory_;
    SurfaceManagerFactory          surface_factory_;
    bool                           backend_overridden_ = false;
};

}   // namespace kestrel
