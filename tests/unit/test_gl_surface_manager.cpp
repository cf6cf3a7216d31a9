#include <gtest/gtest.h>

#include <kestrel/errors.hpp>
#include <memory>

#include "fake_devices.hpp"
#include "fake_platform.hpp"
#include "render/opengl/gl_surface_manager.hpp"

using namespace kestrel;
using namespace kestrel::test;

class GlSurfaceManagerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        auto device = std::make_unique<FakeGlDevice>();
        gl_         = device.get();
        manager_    = std::make_unique<GlSurfaceManager>(std::move(device), true);
    }

    FakeNativeWindow                  window_;
    FakeGlDevice*                     gl_ = nullptr;
    std::unique_ptr<GlSurfaceManager> manager_;
};

TEST_F(GlSurfaceManagerTest, CreateBuildsMatchingPair)
{
    RenderSurfacePair& pair = manager_->create(window_, {640, 480});

    EXPECT_TRUE(gl_->attached);
    EXPECT_TRUE(gl_->vsync);
    EXPECT_TRUE(pair.valid());
    EXPECT_EQ(pair.primary.size, (PhysicalSize{640, 480}));
    EXPECT_EQ(pair.dirty.size, pair.primary.size);
    EXPECT_EQ(pair.primary.origin, SurfaceOrigin::BottomLeft);
    EXPECT_EQ(pair.dirty.origin, SurfaceOrigin::TopLeft);
    EXPECT_EQ(gl_->live.size(), 2u);
    EXPECT_EQ(gl_->calls_without_context, 0);
    EXPECT_FALSE(gl_->current);
}

TEST_F(GlSurfaceManagerTest, CreateFailureThrowsAndLeavesNothing)
{
    gl_->fail_offscreen_target = true;
    EXPECT_THROW(manager_->create(window_, {640, 480}), SurfaceCreationError);
    EXPECT_TRUE(gl_->live.empty());
    EXPECT_FALSE(manager_->has_surfaces());
    EXPECT_FALSE(gl_->current);
}

TEST_F(GlSurfaceManagerTest, ResizeToZeroIsNoOp)
{
    manager_->create(window_, {640, 480});
    auto before = manager_->surfaces().primary.id;
    gl_->log.clear();

    EXPECT_FALSE(manager_->resize({0, 480}));
    EXPECT_FALSE(manager_->resize({640, 0}));
    EXPECT_TRUE(gl_->log.empty());
    EXPECT_EQ(manager_->surfaces().primary.id, before);
}

TEST_F(GlSurfaceManagerTest, ResizeToSameSizeIsNoOp)
{
    manager_->create(window_, {640, 480});
    gl_->log.clear();

    EXPECT_FALSE(manager_->resize({640, 480}));
    EXPECT_TRUE(gl_->log.empty());
}

TEST_F(GlSurfaceManagerTest, ResizeReplacesPair)
{
    manager_->create(window_, {640, 480});
    auto old_primary = manager_->surfaces().primary.id;

    EXPECT_TRUE(manager_->resize({800, 600}));
    EXPECT_EQ(manager_->size(), (PhysicalSize{800, 600}));
    EXPECT_EQ(manager_->surfaces().dirty.size, (PhysicalSize{800, 600}));
    EXPECT_NE(manager_->surfaces().primary.id, old_primary);
    EXPECT_EQ(gl_->live.size(), 2u);
    EXPECT_EQ(gl_->calls_without_context, 0);
    EXPECT_FALSE(gl_->current);
}

TEST_F(GlSurfaceManagerTest, FailedResizeKeepsOldPair)
{
    manager_->create(window_, {640, 480});
    RenderSurfacePair before = manager_->surfaces();

    gl_->fail_offscreen_target = true;
    EXPECT_THROW(manager_->resize({800, 600}), SurfaceCreationError);

    EXPECT_EQ(manager_->surfaces().primary.id, before.primary.id);
    EXPECT_EQ(manager_->surfaces().dirty.id, before.dirty.id);
    EXPECT_EQ(manager_->size(), (PhysicalSize{640, 480}));
    EXPECT_EQ(gl_->live.size(), 2u);
    EXPECT_FALSE(gl_->current);
}

TEST_F(GlSurfaceManagerTest, AcquireDrawsIntoDirtySurface)
{
    manager_->create(window_, {640, 480});
    SurfaceFrame frame = manager_->acquire_current();
    ASSERT_TRUE(static_cast<bool>(frame));
    EXPECT_EQ(frame.drawable, &manager_->surfaces().dirty);
    EXPECT_EQ(frame.present_target, &manager_->surfaces().primary);
}

TEST_F(GlSurfaceManagerTest, AcquireWithoutSurfacesIsEmpty)
{
    EXPECT_FALSE(static_cast<bool>(manager_->acquire_current()));
}

TEST_F(GlSurfaceManagerTest, PresentSwapsBuffers)
{
    manager_->create(window_, {640, 480});
    manager_->present({0.0f, 0.0f, 10.0f, 10.0f});
    EXPECT_EQ(gl_->swaps, 1);
    EXPECT_EQ(gl_->calls_without_context, 0);
}

TEST_F(GlSurfaceManagerTest, DegenerateRegionIsNotPresented)
{
    manager_->create(window_, {640, 480});
    manager_->present({0.0f, 0.0f, 0.0f, 10.0f});
    manager_->present({5.0f, 5.0f, 10.0f, -1.0f});
    EXPECT_EQ(gl_->swaps, 0);
}

TEST_F(GlSurfaceManagerTest, FailedSwapThrowsPresentError)
{
    manager_->create(window_, {640, 480});
    gl_->swap_ok = false;
    try
    {
        manager_->present({0.0f, 0.0f, 10.0f, 10.0f});
        FAIL() << "expected PresentError";
    }
    catch (const PresentError& e)
    {
        EXPECT_FALSE(e.device_lost());
    }
    EXPECT_FALSE(gl_->current);
}

TEST_F(GlSurfaceManagerTest, ContextReleasedAfterEachOperation)
{
    manager_->create(window_, {640, 480});
    manager_->flush();
    manager_->resize({320, 240});
    EXPECT_FALSE(manager_->context().is_bound());
    EXPECT_FALSE(gl_->current);
}

TEST_F(GlSurfaceManagerTest, NestedBindKeepsContextCurrent)
{
    manager_->create(window_, {640, 480});
    int before = gl_->make_current_calls;
    {
        auto guard = manager_->bind_context();
        manager_->flush();
        manager_->present({0.0f, 0.0f, 1.0f, 1.0f});
        EXPECT_TRUE(gl_->current);
    }
    EXPECT_EQ(gl_->make_current_calls, before + 1);
    EXPECT_FALSE(gl_->current);
}

TEST_F(GlSurfaceManagerTest, ZeroSizedCreateIsClampedToOnePixel)
{
    RenderSurfacePair& pair = manager_->create(window_, {0, 0});
    EXPECT_TRUE(pair.valid());
    EXPECT_EQ(pair.size(), (PhysicalSize{1, 1}));
}

TEST_F(GlSurfaceManagerTest, RepeatedResizeDoesNotLeakTargets)
{
    manager_->create(window_, {640, 480});
    for (uint32_t w = 100; w < 110; ++w)
        manager_->resize({w, 100});
    EXPECT_EQ(gl_->live.size(), 2u);
}
