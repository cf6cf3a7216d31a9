#include <gtest/gtest.h>

#include "platform/scale_coordinator.hpp"

using namespace kestrel;

// ─── compute_physical_size ──────────────────────────────────────────────────

TEST(PhysicalSize, RoundsEachAxis)
{
    PhysicalSize p = compute_physical_size({101, 33}, 1.5, 1.0);
    EXPECT_EQ(p.width, 152u);   // 151.5 rounds up
    EXPECT_EQ(p.height, 50u);   // 49.5 rounds up
}

TEST(PhysicalSize, CombinesOsAndUserScale)
{
    PhysicalSize p = compute_physical_size({800, 600}, 2.0, 1.25);
    EXPECT_EQ(p, (PhysicalSize{2000, 1500}));
}

TEST(PhysicalSize, ZeroLogicalGivesZeroPhysical)
{
    PhysicalSize p = compute_physical_size({0, 600}, 2.0, 1.0);
    EXPECT_EQ(p.width, 0u);
    EXPECT_TRUE(p.is_empty());
}

// ─── ScaleCoordinator::update ───────────────────────────────────────────────

TEST(ScaleCoordinator, InitialStateIsApplied)
{
    ScaleCoordinator sc(ScalePolicy::system(), 2.0, 1.0, {640, 480});
    EXPECT_EQ(sc.applied().physical_size, (PhysicalSize{1280, 960}));
    EXPECT_DOUBLE_EQ(sc.applied().scale_factor(), 2.0);
    EXPECT_DOUBLE_EQ(sc.window_scale_factor(), 2.0);
}

TEST(ScaleCoordinator, UnchangedInputsNeedNoResize)
{
    ScaleCoordinator sc(ScalePolicy::system(), 1.0, 1.0, {640, 480});
    ScaleUpdate      u = sc.update({640, 480}, 1.0);
    EXPECT_FALSE(u.needs_resize);
    EXPECT_EQ(u.state, sc.applied());
}

TEST(ScaleCoordinator, IdempotentAfterResize)
{
    ScaleCoordinator sc(ScalePolicy::system(), 1.5, 1.0, {640, 480});

    ScaleUpdate first = sc.update({700, 500}, 1.0);
    EXPECT_TRUE(first.needs_resize);

    ScaleUpdate second = sc.update({700, 500}, 1.0);
    EXPECT_FALSE(second.needs_resize);
    EXPECT_EQ(second.state.physical_size, first.state.physical_size);
}

TEST(ScaleCoordinator, LogicalSizeChangeNeedsResize)
{
    ScaleCoordinator sc(ScalePolicy::system(), 1.0, 1.0, {640, 480});
    ScaleUpdate      u = sc.update({800, 480}, 1.0);
    EXPECT_TRUE(u.needs_resize);
    EXPECT_TRUE(u.needs_surface_update());
    EXPECT_EQ(u.state.physical_size, (PhysicalSize{800, 480}));
}

TEST(ScaleCoordinator, UserScaleChangeNeedsResize)
{
    ScaleCoordinator sc(ScalePolicy::system(), 2.0, 1.0, {400, 300});
    ScaleUpdate      u = sc.update({400, 300}, 1.5);
    EXPECT_TRUE(u.needs_resize);
    EXPECT_EQ(u.state.physical_size, (PhysicalSize{1200, 900}));
    EXPECT_DOUBLE_EQ(u.state.scale_factor(), 3.0);
}

TEST(ScaleCoordinator, ZeroSizeAppliesStateButSkipsSurfaces)
{
    ScaleCoordinator sc(ScalePolicy::system(), 1.0, 1.0, {640, 480});
    ScaleUpdate      u = sc.update({0, 0}, 1.0);
    EXPECT_TRUE(u.needs_resize);
    EXPECT_FALSE(u.needs_surface_update());
    EXPECT_TRUE(sc.applied().physical_size.is_empty());
}

TEST(ScaleCoordinator, FixedPolicyOverridesOsScale)
{
    ScaleCoordinator sc(ScalePolicy::fixed(1.0), 2.0, 1.0, {640, 480});
    EXPECT_FALSE(sc.uses_system_scaling());
    EXPECT_EQ(sc.applied().physical_size, (PhysicalSize{640, 480}));
}

// ─── Native resize ──────────────────────────────────────────────────────────

TEST(ScaleCoordinator, NativeResizeRemovesUserScale)
{
    ScaleCoordinator sc(ScalePolicy::system(), 1.0, 2.0, {400, 300});

    NativeWindowInfo info;
    info.logical_width  = 1000.0;
    info.logical_height = 700.0;
    info.scale          = 1.0;

    ScaleState s = sc.on_native_resize(info, 2.0);
    EXPECT_EQ(s.logical_size, (WindowSize{500, 350}));
    EXPECT_EQ(s.physical_size, (PhysicalSize{1000, 700}));

    // The UI core now reports the new size; nothing further to do.
    EXPECT_FALSE(sc.update({500, 350}, 2.0).needs_resize);
}

TEST(ScaleCoordinator, SystemPolicyFollowsOsScaleChange)
{
    ScaleCoordinator sc(ScalePolicy::system(), 1.0, 1.0, {400, 300});

    NativeWindowInfo info;
    info.logical_width  = 400.0;
    info.logical_height = 300.0;
    info.scale          = 2.0;

    ScaleState s = sc.on_native_resize(info, 1.0);
    EXPECT_DOUBLE_EQ(s.os_scale_factor, 2.0);
    EXPECT_EQ(s.physical_size, (PhysicalSize{800, 600}));
    EXPECT_DOUBLE_EQ(sc.window_scale_factor(), 2.0);
}

TEST(ScaleCoordinator, FixedPolicyIgnoresOsScaleChange)
{
    ScaleCoordinator sc(ScalePolicy::fixed(1.0), 1.0, 1.0, {400, 300});

    NativeWindowInfo info;
    info.logical_width  = 400.0;
    info.logical_height = 300.0;
    info.scale          = 2.0;

    ScaleState s = sc.on_native_resize(info, 1.0);
    EXPECT_DOUBLE_EQ(s.os_scale_factor, 1.0);
    EXPECT_EQ(s.physical_size, (PhysicalSize{400, 300}));
}

TEST(ScaleCoordinator, NativeRequestIncludesUserScale)
{
    ScaleCoordinator sc(ScalePolicy::system(), 2.0, 1.5, {400, 300});
    double           w = 0.0, h = 0.0;
    sc.native_request_size(w, h);
    EXPECT_DOUBLE_EQ(w, 600.0);
    EXPECT_DOUBLE_EQ(h, 450.0);
}
