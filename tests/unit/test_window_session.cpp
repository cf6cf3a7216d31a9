#include <gtest/gtest.h>

#include <chrono>
#include <kestrel/kestrel.hpp>
#include <kestrel/errors.hpp>
#include <memory>
#include <stdexcept>
#include <thread>

#include "fake_devices.hpp"
#include "fake_platform.hpp"
#include "fake_ui_core.hpp"
#include "ui/window_session.hpp"

using namespace kestrel;
using namespace kestrel::test;

namespace
{

struct Ping
{
    int value = 0;
};

// FakeUiCore that reports its own destruction.
class TrackedUiCore : public FakeUiCore
{
   public:
    ~TrackedUiCore() override
    {
        if (on_destroy)
            on_destroy();
    }

    std::function<void()> on_destroy;
};

}   // namespace

class WindowSessionTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        factory_.os_scale = 2.0;
        id_               = windows_.open(WindowDescription{});
    }

    WindowSession::Settings settings()
    {
        WindowSession::Settings s;
        s.description.inner_size = {400, 300};
        s.build_ui               = [this](EventProxy proxy)
        {
            proxy_  = proxy;
            auto ui = std::make_unique<TrackedUiCore>();
            ui_     = ui.get();
            return ui;
        };
        s.make_surfaces = [this](GraphicsBackend, bool, std::chrono::milliseconds)
        {
            auto manager = std::make_unique<FakeSurfaceManager>();
            surfaces_    = manager.get();
            return manager;
        };
        return s;
    }

    FakeWindowFactory   factory_;
    WindowLifecycle     windows_{factory_, GraphicsBackend::OpenGL};
    WindowId            id_       = INVALID_WINDOW_ID;
    TrackedUiCore*      ui_       = nullptr;
    FakeSurfaceManager* surfaces_ = nullptr;
    EventProxy          proxy_;
};

TEST_F(WindowSessionTest, OpenStartsDriverAtWindowScale)
{
    WindowSession session(windows_, id_, settings());
    session.open();

    ASSERT_TRUE(session.is_open());
    ASSERT_NE(ui_, nullptr);
    ASSERT_NE(surfaces_, nullptr);
    EXPECT_EQ(surfaces_->log.front(), "create 800x600");
    EXPECT_EQ(ui_->logical_size, (WindowSize{400, 300}));
    EXPECT_DOUBLE_EQ(ui_->scale, 2.0);
    ASSERT_TRUE(windows_.entity_for(id_).has_value());
    EXPECT_EQ(*windows_.entity_for(id_), Entity::root());
}

TEST_F(WindowSessionTest, UiProxyFeedsSessionChannel)
{
    WindowSession session(windows_, id_, settings());
    session.open();

    EXPECT_TRUE(proxy_.send(Event(Ping{5})));
    EXPECT_TRUE(session.step());

    ASSERT_EQ(ui_->processed.size(), 1u);
    EXPECT_EQ(ui_->processed[0].get<Ping>()->value, 5);
}

TEST_F(WindowSessionTest, OpenWithoutWindowThrows)
{
    WindowSession session(windows_, 999, settings());
    EXPECT_THROW(session.open(), SurfaceCreationError);
    EXPECT_FALSE(session.is_open());
}

TEST_F(WindowSessionTest, MissingBuilderIsConfigurationError)
{
    auto s     = settings();
    s.build_ui = {};
    WindowSession session(windows_, id_, std::move(s));
    EXPECT_THROW(session.open(), ConfigurationError);
}

TEST_F(WindowSessionTest, NullUiIsConfigurationError)
{
    auto s     = settings();
    s.build_ui = [](EventProxy) { return std::unique_ptr<UiCore>(); };
    WindowSession session(windows_, id_, std::move(s));
    EXPECT_THROW(session.open(), ConfigurationError);
}

TEST_F(WindowSessionTest, NoSurfaceManagerIsDeviceAcquisitionError)
{
    auto s          = settings();
    s.make_surfaces = [](GraphicsBackend, bool, std::chrono::milliseconds)
    { return std::unique_ptr<SurfaceManager>(); };
    WindowSession session(windows_, id_, std::move(s));
    EXPECT_THROW(session.open(), DeviceAcquisitionError);
}

TEST_F(WindowSessionTest, StepRoutesNativeEvents)
{
    WindowSession session(windows_, id_, settings());
    session.open();

    factory_.last_events->push(PlatformEvent::cursor_moved(3.0, 4.0));
    EXPECT_TRUE(session.step());

    ASSERT_EQ(ui_->emitted.size(), 1u);
    EXPECT_FLOAT_EQ(ui_->emitted[0].x, 6.0f);
    EXPECT_EQ(factory_.last_events->polls, 1);
}

TEST_F(WindowSessionTest, CloseRequestEndsSessionAndQueuesClose)
{
    WindowSession session(windows_, id_, settings());
    session.open();

    factory_.last_events->push(PlatformEvent::of(PlatformEvent::Type::WillClose));
    EXPECT_FALSE(session.step());
    EXPECT_TRUE(windows_.is_close_pending(id_));
    EXPECT_TRUE(windows_.is_open(id_));

    std::vector<WindowEventType> expected{WindowEventType::WindowClose};
    EXPECT_EQ(ui_->processed_window_events(), expected);
}

TEST_F(WindowSessionTest, EventsAfterCloseRequestAreNotDispatched)
{
    WindowSession session(windows_, id_, settings());
    session.open();

    factory_.last_events->push(PlatformEvent::cursor_moved(1.0, 1.0));
    factory_.last_events->push(PlatformEvent::of(PlatformEvent::Type::WillClose));
    factory_.last_events->push(PlatformEvent::cursor_moved(2.0, 2.0));
    EXPECT_FALSE(session.step());

    // Only the move queued before the close reaches the UI.
    ASSERT_EQ(ui_->emitted.size(), 1u);
    EXPECT_FLOAT_EQ(ui_->emitted[0].x, 2.0f);

    std::vector<WindowEventType> expected{WindowEventType::WindowClose};
    EXPECT_EQ(ui_->processed_window_events(), expected);
}

TEST_F(WindowSessionTest, ShutdownDestroysUiWithContextBound)
{
    WindowSession session(windows_, id_, settings());
    session.open();

    bool bound_at_destroy = false;
    ui_->on_destroy       = [&] { bound_at_destroy = surfaces_->context().is_bound(); };

    session.shutdown();

    EXPECT_TRUE(bound_at_destroy);
    EXPECT_FALSE(session.is_open());
    EXPECT_EQ(session.ui(), nullptr);
    EXPECT_EQ(session.surfaces(), nullptr);
    EXPECT_FALSE(session.step());

    EXPECT_NO_THROW(session.shutdown());
}

// ─── Application ────────────────────────────────────────────────────────────

class ApplicationTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        factory_ = std::make_shared<FakeWindowFactory>();
        factory_->initial_events.push_back(PlatformEvent::of(PlatformEvent::Type::WillClose));
    }

    UiBuilder builder()
    {
        return [this](EventProxy)
        {
            ++builds_;
            return std::make_unique<FakeUiCore>();
        };
    }

    SurfaceManagerFactory surfaces()
    {
        return [this](GraphicsBackend backend, bool vsync, std::chrono::milliseconds)
        {
            requested_backend_ = backend;
            requested_vsync_   = vsync;
            return std::make_unique<FakeSurfaceManager>();
        };
    }

    std::shared_ptr<FakeWindowFactory> factory_;
    int                                builds_ = 0;
    GraphicsBackend                    requested_backend_{};
    bool                               requested_vsync_ = false;
};

TEST_F(ApplicationTest, BuilderSetsDescription)
{
    Application app(builder());
    app.title("Hello").inner_size({640, 480}).user_scale_factor(1.25).resizable(false).vsync(false);

    EXPECT_EQ(app.description().title, "Hello");
    EXPECT_EQ(app.description().inner_size, (WindowSize{640, 480}));
    EXPECT_DOUBLE_EQ(app.description().user_scale_factor, 1.25);
    EXPECT_FALSE(app.description().resizable);
    EXPECT_FALSE(app.description().vsync);
}

TEST_F(ApplicationTest, RunOpensWindowAndReturnsOnClose)
{
    Application app(builder());
    app.title("Run")
        .backend(GraphicsBackend::Vulkan)
        .vsync(true)
        .window_factory(factory_)
        .surface_factory(surfaces());

    app.run();

    EXPECT_EQ(builds_, 1);
    EXPECT_EQ(factory_->created.size(), 1u);
    EXPECT_EQ(factory_->backends[0], GraphicsBackend::Vulkan);
    EXPECT_EQ(requested_backend_, GraphicsBackend::Vulkan);
    EXPECT_TRUE(requested_vsync_);
}

TEST_F(ApplicationTest, WindowCreationFailurePropagates)
{
    factory_->fail_next = true;
    Application app(builder());
    app.window_factory(factory_).surface_factory(surfaces());

    EXPECT_THROW(app.run(), SurfaceCreationError);
    EXPECT_EQ(builds_, 0);
}

#ifndef _WIN32
TEST_F(ApplicationTest, UnavailableBackendFailsBeforeAnyWindow)
{
    Application app(builder());
    app.backend(GraphicsBackend::Direct3D12).window_factory(factory_);

    EXPECT_THROW(app.run(), ConfigurationError);
    EXPECT_TRUE(factory_->created.empty());
}
#endif

TEST_F(ApplicationTest, ParentedWindowIsCreatedOnCallingThread)
{
    factory_->initial_events.clear();

    Application app(builder());
    app.window_factory(factory_).surface_factory(surfaces());

    int            host   = 0;
    ParentedWindow handle = app.open_parented(ParentWindow{&host});

    EXPECT_TRUE(handle.is_open());
    EXPECT_TRUE(static_cast<bool>(handle.proxy()));
    EXPECT_EQ(builds_, 1);
    ASSERT_EQ(factory_->parents.size(), 1u);
    EXPECT_EQ(factory_->parents[0], &host);

    handle.close();
    EXPECT_FALSE(handle.is_open());
    EXPECT_FALSE(handle.step());
}

TEST_F(ApplicationTest, HostDrivesParentedWindowBySteps)
{
    factory_->initial_events.clear();

    FakeUiCore* ui = nullptr;
    Application app(
        [&](EventProxy)
        {
            auto core = std::make_unique<FakeUiCore>();
            ui        = core.get();
            return core;
        });
    app.window_factory(factory_).surface_factory(surfaces());

    int            host   = 0;
    ParentedWindow handle = app.open_parented(ParentWindow{&host});
    ASSERT_NE(ui, nullptr);

    // Nothing runs until the host steps the window.
    EXPECT_TRUE(handle.proxy().send(Event(Ping{9})));
    EXPECT_TRUE(ui->processed.empty());

    EXPECT_TRUE(handle.step());
    ASSERT_EQ(ui->processed.size(), 1u);
    EXPECT_EQ(ui->processed[0].get<Ping>()->value, 9);

    factory_->last_events->push(PlatformEvent::of(PlatformEvent::Type::WillClose));
    EXPECT_FALSE(handle.step());
    EXPECT_FALSE(handle.is_open());
}

TEST_F(ApplicationTest, ProxySendsFromOtherThreadsAreDrainedOnHostStep)
{
    factory_->initial_events.clear();

    FakeUiCore* ui = nullptr;
    Application app(
        [&](EventProxy)
        {
            auto core = std::make_unique<FakeUiCore>();
            ui        = core.get();
            return core;
        });
    app.window_factory(factory_).surface_factory(surfaces());

    int            host   = 0;
    ParentedWindow handle = app.open_parented(ParentWindow{&host});
    EventProxy     proxy  = handle.proxy();

    std::thread producer([proxy]() { proxy.send(Event(Ping{3})); });
    producer.join();

    EXPECT_TRUE(handle.step());
    ASSERT_NE(ui, nullptr);
    ASSERT_EQ(ui->processed.size(), 1u);
    EXPECT_EQ(ui->processed[0].get<Ping>()->value, 3);
}

TEST_F(ApplicationTest, ParentedWindowStepOffHostThreadThrows)
{
    factory_->initial_events.clear();

    Application app(builder());
    app.window_factory(factory_).surface_factory(surfaces());

    int            host   = 0;
    ParentedWindow handle = app.open_parented(ParentWindow{&host});

    bool threw = false;
    std::thread other(
        [&]
        {
            try
            {
                handle.step();
            }
            catch (const std::logic_error&)
            {
                threw = true;
            }
        });
    other.join();

    EXPECT_TRUE(threw);
    EXPECT_TRUE(handle.is_open());
}

TEST_F(ApplicationTest, ParentedWindowFailureThrowsToHost)
{
    factory_->fail_next = true;

    Application app(builder());
    app.window_factory(factory_).surface_factory(surfaces());

    EXPECT_THROW(app.open_parented(ParentWindow{nullptr}), SurfaceCreationError);
    EXPECT_EQ(builds_, 0);
}
