#include <kestrel/app.hpp>
#include <kestrel/errors.hpp>
#include <kestrel/logger.hpp>
#include <kestrel/ui_core.hpp>
#include <utility>

#include "../platform/window_lifecycle.hpp"
#include "../render/backend_factory.hpp"
#include "window_session.hpp"

#ifdef KESTREL_USE_GLFW
    #include "../platform/glfw/glfw_window.hpp"
#endif

namespace kestrel
{

namespace
{

std::shared_ptr<WindowFactory> default_window_factory()
{
#ifdef KESTREL_USE_GLFW
    return std::make_shared<GlfwWindowFactory>();
#else
    throw ConfigurationError("No native windowing backend is compiled into this build");
#endif
}

}   // namespace

// ─── ParentedWindow ─────────────────────────────────────────────────────────

ParentedWindow::ParentedWindow() = default;

ParentedWindow::~ParentedWindow()
{
    close();
}

ParentedWindow::ParentedWindow(ParentedWindow&&) noexcept = default;

ParentedWindow& ParentedWindow::operator=(ParentedWindow&& other) noexcept
{
    if (this != &other)
    {
        close();
        factory_ = std::move(other.factory_);
        channel_ = std::move(other.channel_);
        windows_ = std::move(other.windows_);
        session_ = std::move(other.session_);
        id_      = other.id_;
    }
    return *this;
}

bool ParentedWindow::step()
{
    if (!session_)
    {
        return false;
    }
    if (session_->step())
    {
        return true;
    }
    close();
    return false;
}

void ParentedWindow::close()
{
    if (session_)
    {
        session_->shutdown();
        session_.reset();
    }
    if (windows_)
    {
        windows_->close(id_);
        windows_.reset();
        KESTREL_LOG_INFO("app", "Parented window {} closed", id_);
    }
}

bool ParentedWindow::is_open() const
{
    return session_ && session_->is_open();
}

// ─── Application ────────────────────────────────────────────────────────────

Application::Application(UiBuilder build_ui, AppConfig config)
    : build_ui_(std::move(build_ui)), config_(std::move(config))
{
}

Application::~Application() = default;

Application& Application::title(std::string title)
{
    description_.title = std::move(title);
    return *this;
}

Application& Application::inner_size(WindowSize size)
{
    description_.inner_size = size;
    return *this;
}

Application& Application::user_scale_factor(double factor)
{
    description_.user_scale_factor = factor;
    return *this;
}

Application& Application::scale_policy(ScalePolicy policy)
{
    description_.scale_policy = policy;
    return *this;
}

Application& Application::backend(GraphicsBackend backend)
{
    config_.backend     = backend;
    backend_overridden_ = true;
    return *this;
}

Application& Application::vsync(bool enabled)
{
    description_.vsync = enabled;
    return *this;
}

Application& Application::resizable(bool enabled)
{
    description_.resizable = enabled;
    return *this;
}

Application& Application::quit_accelerator(QuitAccelerator accel)
{
    config_.quit_accelerator = accel;
    return *this;
}

Application& Application::on_idle(IdleCallback callback)
{
    on_idle_ = std::move(callback);
    return *this;
}

Application& Application::window_factory(std::shared_ptr<WindowFactory> factory)
{
    window_factory_ = std::move(factory);
    return *this;
}

Application& Application::surface_factory(SurfaceManagerFactory factory)
{
    surface_factory_ = std::move(factory);
    return *this;
}

void Application::init_logging(const AppConfig& config)
{
    auto& logger = Logger::instance();
    logger.clear_sinks();
    logger.set_level(config.log_level);
    logger.add_sink(sinks::console_sink());

    if (!config.log_file.empty())
    {
        try
        {
            logger.add_sink(sinks::file_sink(config.log_file));
            KESTREL_LOG_INFO("app", "Log file: {}", config.log_file);
        }
        catch (const std::exception& e)
        {
            KESTREL_LOG_WARN("app", "Failed to create log file: {}", e.what());
        }
    }
}

void Application::prepare()
{
    init_logging(config_);

    // The environment overrides defaults, not explicit builder choices.
    GraphicsBackend chosen = config_.backend;
    config_.apply_environment();
    if (backend_overridden_)
    {
        config_.backend = chosen;
    }
    Logger::instance().set_level(config_.log_level);

    if (!surface_factory_ && !backend_available(config_.backend))
    {
        throw ConfigurationError("Graphics backend '" + std::string(backend_name(config_.backend))
                                 + "' is not compiled into this build");
    }
    if (!window_factory_)
    {
        window_factory_ = default_window_factory();
    }

    KESTREL_LOG_INFO("app",
                     "Opening \"{}\" ({}x{}, user scale {}, backend {})",
                     description_.title,
                     description_.inner_size.width,
                     description_.inner_size.height,
                     description_.user_scale_factor,
                     backend_name(config_.backend));
}

void Application::run()
{
    prepare();

    WindowSession::Settings settings{description_,
                                     config_,
                                     build_ui_,
                                     surface_factory_,
                                     on_idle_,
                                     std::make_shared<EventChannel>(config_.event_channel_capacity)};

    WindowLifecycle windows(*window_factory_, config_.backend);
    WindowId        id = windows.open(description_);

    {
        WindowSession session(windows, id, std::move(settings));
        session.open();
        while (session.step())
        {
        }
        session.shutdown();
    }

    windows.process_pending_closes();
    KESTREL_LOG_INFO("app", "Window {} closed", id);
}

ParentedWindow Application::open_parented(ParentWindow parent)
{
    prepare();

    ParentedWindow handle;
    handle.factory_ = window_factory_;
    handle.channel_ = std::make_shared<EventChannel>(config_.event_channel_capacity);
    handle.windows_ = std::make_unique<WindowLifecycle>(*handle.factory_, config_.backend);
    handle.id_      = handle.windows_->open_parented(description_, parent);

    WindowSession::Settings settings{
        description_, config_, build_ui_, surface_factory_, on_idle_, handle.channel_};
    handle.session_ = std::make_unique<WindowSession>(*handle.windows_, handle.id_, std::move(settings));
    handle.session_->open();

    return handle;
}

}   // namespace kestrel
