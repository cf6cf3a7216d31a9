#include "window_session.hpp"

#include <kestrel/errors.hpp>
#include <kestrel/logger.hpp>
#include <string>

#include "../render/backend_factory.hpp"

namespace kestrel
{

WindowSession::WindowSession(WindowLifecycle& windows, WindowId id, Settings settings)
    : windows_(windows),
      id_(id),
      settings_(std::move(settings)),
      pacer_(60.0f, settings_.description.vsync ? FramePacer::Mode::VSync : FramePacer::Mode::TargetFPS)
{
    if (!settings_.channel)
    {
        settings_.channel = std::make_shared<EventChannel>(settings_.config.event_channel_capacity);
    }
    if (!settings_.make_surfaces)
    {
        settings_.make_surfaces = make_surface_manager;
    }
}

WindowSession::~WindowSession()
{
    shutdown();
}

void WindowSession::open()
{
    NativeWindow* window = windows_.find(id_);
    if (!window)
    {
        throw SurfaceCreationError("Window " + std::to_string(id_) + " is not open");
    }
    if (!settings_.build_ui)
    {
        throw ConfigurationError("No UI builder for window " + std::to_string(id_));
    }

    const WindowDescription& desc = settings_.description;
    NativeWindowInfo         info = window->info();

    ScaleCoordinator scale(desc.scale_policy, info.scale, desc.user_scale_factor, desc.inner_size);

    surfaces_ = settings_.make_surfaces(settings_.config.backend,
                                        desc.vsync,
                                        settings_.config.frame_timeout);
    if (!surfaces_)
    {
        throw DeviceAcquisitionError("No surface manager for backend "
                                     + std::string(backend_name(settings_.config.backend)));
    }

    ui_ = settings_.build_ui(EventProxy(settings_.channel));
    if (!ui_)
    {
        throw ConfigurationError("UI builder returned no UI core");
    }
    ui_->set_window_size(desc.inner_size);
    windows_.bind(id_, Entity::root());

    driver_ = std::make_unique<RunLoopDriver>(*ui_,
                                              *surfaces_,
                                              *window,
                                              scale,
                                              settings_.channel,
                                              settings_.config.quit_accelerator,
                                              settings_.on_idle);
    driver_->start();
    pacer_.reset();
}

bool WindowSession::step()
{
    if (!driver_)
    {
        return false;
    }

    pacer_.begin_frame();

    if (PlatformEventSource* events = windows_.events(id_))
    {
        // Once close intent is seen, the rest of this batch is dropped; the
        // tick below still delivers the close request to the UI.
        events->poll(
            [this](const PlatformEvent& event)
            {
                if (!driver_->should_terminate())
                {
                    driver_->handle_event(event);
                }
            });
    }
    driver_->pump();

    pacer_.end_frame();

    if (driver_->should_terminate())
    {
        windows_.on_will_close(id_);
        return false;
    }
    return true;
}

void WindowSession::shutdown()
{
    if (!driver_ && !ui_ && !surfaces_)
    {
        return;
    }

    driver_.reset();

    if (ui_)
    {
        if (surfaces_ && surfaces_->context().affinity().is_owner())
        {
            // The UI core may still hold GPU images and fonts.
            GpuContextGuard guard = surfaces_->bind_context();
            ui_->set_surface_pair(Entity::root(), nullptr);
            ui_.reset();
        }
        else
        {
            KESTREL_LOG_WARN("app", "Window {} torn down without its GPU context", id_);
            ui_.reset();
        }
    }
    surfaces_.reset();

    KESTREL_LOG_DEBUG("app", "Window {} session shut down", id_);
}

}   // namespace kestrel
