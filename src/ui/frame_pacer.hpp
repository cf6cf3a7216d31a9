#pragma once

#include <chrono>
#include <cstdint>

namespace kestrel
{

// Paces the native event loop between ticks.
class FramePacer
{
   public:
    enum class Mode
    {
        TargetFPS,   // Sleep to hit the target rate
        VSync,       // Present blocks; no extra waiting
    };

    explicit FramePacer(float target_fps = 60.0f, Mode mode = Mode::TargetFPS);

    void  set_target_fps(float fps);
    float target_fps() const { return target_fps_; }

    void set_mode(Mode mode) { mode_ = mode; }
    Mode mode() const { return mode_; }

    // Call at the start and end of each loop iteration.
    void begin_frame();
    void end_frame();

    void reset();

    // Seconds since the previous begin_frame(), clamped to 0.25.
    float    dt() const { return dt_; }
    uint64_t frame_number() const { return frame_number_; }

    // Time end_frame() has to wait to reach the target rate after a frame
    // that took `frame_duration`.
    std::chrono::microseconds remaining(std::chrono::microseconds frame_duration) const;

   private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    float target_fps_ = 60.0f;
    Mode  mode_       = Mode::TargetFPS;

    TimePoint frame_start_;
    TimePoint last_frame_start_;
    bool      first_frame_  = true;
    float     dt_           = 0.0f;
    uint64_t  frame_number_ = 0;
};

}   // namespace kestrel
