#include "frame_gate.hpp"

namespace kestrel
{

CountingFrameGate::CountingFrameGate(uint32_t max_in_flight)
    : max_in_flight_(max_in_flight == 0 ? 1 : max_in_flight)
{
}

bool CountingFrameGate::wait(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return in_flight_ < max_in_flight_; }))
    {
        return false;
    }
    ++in_flight_;
    return true;
}

void CountingFrameGate::signal()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0)
        {
            --in_flight_;
        }
    }
    cv_.notify_one();
}

uint32_t CountingFrameGate::in_flight() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

}   // namespace kestrel
