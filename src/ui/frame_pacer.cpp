#include "frame_pacer.hpp"

#include <kestrel/logger.hpp>
#include <thread>

namespace kestrel
{

FramePacer::FramePacer(float target_fps, Mode mode) : mode_(mode)
{
    set_target_fps(target_fps);
    reset();
}

void FramePacer::set_target_fps(float fps)
{
    if (fps > 0.0f)
    {
        target_fps_ = fps;
    }
}

void FramePacer::begin_frame()
{
    frame_start_ = Clock::now();

    if (first_frame_)
    {
        first_frame_      = false;
        last_frame_start_ = frame_start_;
        dt_               = 0.0f;
        frame_number_     = 0;
        return;
    }

    std::chrono::duration<float> elapsed = frame_start_ - last_frame_start_;
    last_frame_start_                    = frame_start_;

    // Clamp dt to avoid spiral of death
    dt_ = elapsed.count() > 0.25f ? 0.25f : elapsed.count();
    ++frame_number_;
}

std::chrono::microseconds FramePacer::remaining(std::chrono::microseconds frame_duration) const
{
    if (mode_ != Mode::TargetFPS || target_fps_ <= 0.0f)
    {
        return std::chrono::microseconds{0};
    }
    auto target = std::chrono::microseconds(static_cast<int64_t>(1'000'000.0 / target_fps_));
    return frame_duration < target ? target - frame_duration : std::chrono::microseconds{0};
}

void FramePacer::end_frame()
{
    auto frame_duration =
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - frame_start_);
    auto wait = remaining(frame_duration);
    if (wait.count() > 0)
    {
        std::this_thread::sleep_for(wait);
    }
    else if (mode_ == Mode::TargetFPS)
    {
        KESTREL_LOG_TRACE("runloop",
                          "Frame {} over budget: {} us",
                          frame_number_,
                          frame_duration.count());
    }
}

void FramePacer::reset()
{
    first_frame_  = true;
    dt_           = 0.0f;
    frame_number_ = 0;
}

}   // namespace kestrel
