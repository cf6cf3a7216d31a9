#include "run_loop.hpp"

#include <kestrel/errors.hpp>
#include <kestrel/logger.hpp>

namespace kestrel
{

RunLoopDriver::RunLoopDriver(UiCore&                       ui,
                             SurfaceManager&               surfaces,
                             NativeWindow&                 window,
                             ScaleCoordinator              scale,
                             std::shared_ptr<EventChannel> channel,
                             QuitAccelerator               quit_accelerator,
                             IdleCallback                  on_idle)
    : ui_(ui),
      surfaces_(surfaces),
      window_(window),
      scale_(std::move(scale)),
      channel_(channel ? std::move(channel) : std::make_shared<EventChannel>()),
      translator_(quit_accelerator),
      on_idle_(std::move(on_idle))
{
}

void RunLoopDriver::start()
{
    affinity_.check("RunLoopDriver::start");

    const ScaleState& state = scale_.applied();
    RenderSurfacePair& pair = surfaces_.create(window_, state.physical_size);

    ui_.set_window_size(state.logical_size);
    ui_.set_scale_factor(state.scale_factor());
    ui_.set_physical_window_size(state.physical_size);
    ui_.set_surface_pair(Entity::root(), &pair);

    redraw_pending_ = true;

    KESTREL_LOG_INFO("runloop",
                     "Window {} started at {}x{} (scale {})",
                     window_.id(),
                     state.physical_size.width,
                     state.physical_size.height,
                     state.scale_factor());
}

void RunLoopDriver::tick()
{
    affinity_.check("RunLoopDriver::tick");
    ++tick_count_;

    // 1. Events injected from other threads.
    drain_channel();

    // 2.
    ui_.process_events();

    // 3. Scale and size.
    update_scale();

    // 4. Style updates may upload images and fonts.
    {
        GpuContextGuard guard = surfaces_.bind_context();
        ui_.process_style_updates();
    }

    // 5.
    ui_.process_animations();
    ui_.process_visual_updates();

    if (ui_.take_redraw_request())
    {
        redraw_pending_ = true;
    }

    // 6.
    if (redraw_pending_)
    {
        render();
    }

    // 7.
    if (on_idle_)
    {
        ui_.set_current(Entity::root());
        on_idle_(ui_);
    }
}

size_t RunLoopDriver::pump()
{
    size_t ticks = 0;
    do
    {
        tick();
        ++ticks;
    } while (!channel_->empty() || ui_.has_pending_events());

    if (ticks > 1)
    {
        KESTREL_LOG_TRACE("runloop", "Pumped {} ticks", ticks);
    }
    return ticks;
}

void RunLoopDriver::handle_event(const PlatformEvent& event)
{
    affinity_.check("RunLoopDriver::handle_event");

    switch (event.type)
    {
        case PlatformEvent::Type::Resized:
        {
            ScaleState state = scale_.on_native_resize(event.window_info, ui_.user_scale_factor());
            KESTREL_LOG_DEBUG("runloop",
                              "Native resize to {}x{} logical",
                              state.logical_size.width,
                              state.logical_size.height);
            ui_.set_window_size(state.logical_size);
            apply_state(state);
            return;
        }

        case PlatformEvent::Type::Minimized:
            KESTREL_LOG_DEBUG("runloop", "Window {} minimized", window_.id());
            return;

        default:
            break;
    }

    if (!translator_.translate(event, ui_, scale_.window_scale_factor()))
    {
        KESTREL_LOG_TRACE("runloop", "Unhandled native event {}", static_cast<int>(event.type));
    }
}

void RunLoopDriver::drain_channel()
{
    size_t drained = channel_->drain([this](Event&& event) { ui_.send_event(std::move(event)); });
    if (drained > 0)
    {
        KESTREL_LOG_TRACE("runloop", "Drained {} injected events", drained);
    }
}

void RunLoopDriver::update_scale()
{
    ScaleUpdate update = scale_.update(ui_.window_size(), ui_.user_scale_factor());
    if (!update.needs_resize)
    {
        return;
    }

    double width  = 0.0;
    double height = 0.0;
    scale_.native_request_size(width, height);
    window_.request_resize(width, height);

    apply_state(update.state);
}

void RunLoopDriver::apply_state(const ScaleState& state)
{
    ui_.set_scale_factor(state.scale_factor());
    ui_.set_physical_window_size(state.physical_size);

    if (!state.physical_size.is_empty())
    {
        resize_surfaces(state.physical_size);
    }
    redraw_pending_ = true;
}

void RunLoopDriver::resize_surfaces(PhysicalSize size)
{
    try
    {
        surfaces_.resize(size);
    }
    catch (const SurfaceCreationError& e)
    {
        // The next resize trigger tries again.
        KESTREL_LOG_ERROR("runloop",
                          "Surface resize to {}x{} failed: {}",
                          size.width,
                          size.height,
                          e.what());
    }
}

void RunLoopDriver::render()
{
    if (scale_.applied().physical_size.is_empty() || !surfaces_.has_surfaces())
    {
        return;
    }

    GpuContextGuard guard = surfaces_.bind_context();

    SurfaceFrame frame = surfaces_.acquire_current();
    if (!frame)
    {
        return;
    }

    BoundingBox dirty = ui_.draw(frame);
    surfaces_.flush();
    surfaces_.present(dirty);

    redraw_pending_ = false;
}

}   // namespace kestrel
