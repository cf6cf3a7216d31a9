#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <kestrel/event_channel.hpp>
#include <kestrel/ui_core.hpp>
#include <kestrel/window_description.hpp>
#include <memory>

#include "../platform/event_translator.hpp"
#include "../platform/native_window.hpp"
#include "../platform/scale_coordinator.hpp"
#include "../render/gpu_context.hpp"
#include "../render/surface_manager.hpp"

namespace kestrel
{

// Drives one window: per-tick update/render of the UI core, plus routing of
// native events into the translator and the scale coordinator.
//
// All methods must be called from the thread that constructed the driver
// (the window's render thread).
class RunLoopDriver
{
   public:
    using IdleCallback = std::function<void(UiCore&)>;

    RunLoopDriver(UiCore&                       ui,
                  SurfaceManager&               surfaces,
                  NativeWindow&                 window,
                  ScaleCoordinator              scale,
                  std::shared_ptr<EventChannel> channel,
                  QuitAccelerator               quit_accelerator = QuitAccelerator::platform_default(),
                  IdleCallback                  on_idle          = {});

    RunLoopDriver(const RunLoopDriver&)            = delete;
    RunLoopDriver& operator=(const RunLoopDriver&) = delete;

    // Create the window's surfaces and hand the pair and the initial scale
    // state to the UI core. Throws SurfaceCreationError.
    void start();

    // One full update/render cycle.
    void tick();

    // Tick, then keep ticking while injected or UI-core events are pending.
    // Returns the number of ticks run.
    size_t pump();

    // Entry point for native events.
    void handle_event(const PlatformEvent& event);

    bool should_terminate() const { return translator_.should_terminate(); }

    void request_redraw() { redraw_pending_ = true; }
    bool redraw_pending() const { return redraw_pending_; }

    uint64_t tick_count() const { return tick_count_; }

    const ScaleCoordinator& scale() const { return scale_; }
    const EventTranslator&  translator() const { return translator_; }

    ThreadAffinity&       affinity() { return affinity_; }
    const ThreadAffinity& affinity() const { return affinity_; }

   private:
    void drain_channel();
    void update_scale();
    void apply_state(const ScaleState& state);
    void resize_surfaces(PhysicalSize size);
    void render();

    UiCore&                       ui_;
    SurfaceManager&               surfaces_;
    NativeWindow&                 window_;
    ScaleCoordinator              scale_;
    std::shared_ptr<EventChannel> channel_;
    EventTranslator               translator_;
    IdleCallback                  on_idle_;
    ThreadAffinity                affinity_;

    bool     redraw_pending_ = true;
    uint64_t tick_count_     = 0;
};

}   // namespace kestrel
