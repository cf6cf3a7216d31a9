#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "ui/frame_pacer.hpp"

using namespace kestrel;
using namespace std::chrono_literals;

TEST(FramePacer, DefaultTargetIsSixtyFps)
{
    FramePacer pacer;
    EXPECT_FLOAT_EQ(pacer.target_fps(), 60.0f);
    EXPECT_EQ(pacer.mode(), FramePacer::Mode::TargetFPS);
}

TEST(FramePacer, NonPositiveTargetIsIgnored)
{
    FramePacer pacer(30.0f);
    pacer.set_target_fps(0.0f);
    pacer.set_target_fps(-5.0f);
    EXPECT_FLOAT_EQ(pacer.target_fps(), 30.0f);
}

TEST(FramePacer, RemainingFillsFrameBudget)
{
    FramePacer pacer(100.0f);
    EXPECT_EQ(pacer.remaining(std::chrono::microseconds(4000)), std::chrono::microseconds(6000));
    EXPECT_EQ(pacer.remaining(std::chrono::microseconds(10000)), std::chrono::microseconds(0));
    EXPECT_EQ(pacer.remaining(std::chrono::microseconds(25000)), std::chrono::microseconds(0));
}

TEST(FramePacer, VSyncModeNeverWaits)
{
    FramePacer pacer(100.0f, FramePacer::Mode::VSync);
    EXPECT_EQ(pacer.remaining(std::chrono::microseconds(0)), std::chrono::microseconds(0));
}

TEST(FramePacer, FirstFrameHasZeroDt)
{
    FramePacer pacer;
    pacer.begin_frame();
    EXPECT_FLOAT_EQ(pacer.dt(), 0.0f);
    EXPECT_EQ(pacer.frame_number(), 0u);
}

TEST(FramePacer, DtMeasuresBetweenFrames)
{
    FramePacer pacer(1000.0f, FramePacer::Mode::VSync);
    pacer.begin_frame();
    std::this_thread::sleep_for(20ms);
    pacer.begin_frame();

    EXPECT_GE(pacer.dt(), 0.015f);
    EXPECT_LE(pacer.dt(), 0.25f);
    EXPECT_EQ(pacer.frame_number(), 1u);
}

TEST(FramePacer, EndFrameSleepsToTarget)
{
    FramePacer pacer(50.0f);
    auto       start = std::chrono::steady_clock::now();
    pacer.begin_frame();
    pacer.end_frame();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 15ms);
}

TEST(FramePacer, ResetRestartsNumbering)
{
    FramePacer pacer(1000.0f, FramePacer::Mode::VSync);
    pacer.begin_frame();
    pacer.begin_frame();
    pacer.begin_frame();
    EXPECT_EQ(pacer.frame_number(), 2u);

    pacer.reset();
    pacer.begin_frame();
    EXPECT_EQ(pacer.frame_number(), 0u);
    EXPECT_FLOAT_EQ(pacer.dt(), 0.0f);
}
