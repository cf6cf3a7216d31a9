#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace kestrel
{

// Limits the number of frames in flight. The render thread waits before
// presenting a frame; the presentation engine signals when a buffer frees up.
class FrameGate
{
   public:
    virtual ~FrameGate() = default;

    // Returns false if no buffer became available within `timeout`.
    virtual bool wait(std::chrono::milliseconds timeout) = 0;

    virtual void signal() = 0;
};

// Counting implementation used where the backend has no native waitable
// (and by tests).
class CountingFrameGate : public FrameGate
{
   public:
    explicit CountingFrameGate(uint32_t max_in_flight);

    bool wait(std::chrono::milliseconds timeout) override;
    void signal() override;

    uint32_t in_flight() const;
    uint32_t max_in_flight() const { return max_in_flight_; }

   private:
    const uint32_t          max_in_flight_;
    uint32_t                in_flight_ = 0;
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
};

}   // namespace kestrel
