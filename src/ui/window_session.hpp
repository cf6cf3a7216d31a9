#pragma once

#include <chrono>
#include <functional>
#include <kestrel/app.hpp>
#include <kestrel/event_channel.hpp>
#include <kestrel/ui_core.hpp>
#include <kestrel/window_description.hpp>
#include <memory>

#include "../platform/window_lifecycle.hpp"
#include "../render/surface_manager.hpp"
#include "frame_pacer.hpp"
#include "run_loop.hpp"

namespace kestrel
{

// Everything one open window needs to run: UI core, surfaces and driver.
// Created after the native window exists and torn down before it goes away.
//
// Usage:
//   WindowSession session(windows, id, settings);
//   session.open();
//   while (session.step()) {}
//   session.shutdown();
class WindowSession
{
   public:
    struct Settings
    {
        WindowDescription             description;
        AppConfig                     config;
        UiBuilder                     build_ui;
        SurfaceManagerFactory         make_surfaces;
        IdleCallback                  on_idle;
        std::shared_ptr<EventChannel> channel;
    };

    WindowSession(WindowLifecycle& windows, WindowId id, Settings settings);
    ~WindowSession();

    WindowSession(const WindowSession&)            = delete;
    WindowSession& operator=(const WindowSession&) = delete;

    // Build surfaces and the UI core, then start the driver. Throws
    // DeviceAcquisitionError or SurfaceCreationError.
    void open();

    // Poll native events and pump the driver once. Returns false once the
    // window should close; the close is then queued on the lifecycle.
    bool step();

    // Release the UI core and surfaces. Safe to call more than once.
    void shutdown();

    bool is_open() const { return driver_ != nullptr; }

    RunLoopDriver*  driver() { return driver_.get(); }
    UiCore*         ui() { return ui_.get(); }
    SurfaceManager* surfaces() { return surfaces_.get(); }
    FramePacer&     pacer() { return pacer_; }

    const std::shared_ptr<EventChannel>& channel() const { return settings_.channel; }

   private:
    WindowLifecycle&                windows_;
    WindowId                        id_;
    Settings                        settings_;
    FramePacer                      pacer_;
    std::unique_ptr<SurfaceManager> surfaces_;
    std::unique_ptr<UiCore>         ui_;
    std::unique_ptr<RunLoopDriver>  driver_;
};

}   // namespace kestrel
