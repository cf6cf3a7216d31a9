#pragma once

#include <cstddef>
#include <deque>
#include <kestrel/event.hpp>
#include <memory>
#include <mutex>
#include <utility>

namespace kestrel
{

// Bounded MPSC (multiple-producer single-consumer) queue for injecting
// events into a window's UI from other threads. Any thread may push; only the
// render thread that owns the run loop drains it, at the start of a tick.
class EventChannel
{
   public:
    static constexpr size_t DEFAULT_CAPACITY = 4096;

    explicit EventChannel(size_t capacity = DEFAULT_CAPACITY) : capacity_(capacity) {}

    EventChannel(const EventChannel&)            = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // Producer side. Returns false if the channel is full.
    bool push(Event event)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_)
        {
            return false;
        }
        queue_.push_back(std::move(event));
        return true;
    }

    // Consumer side. Returns false if the channel is empty.
    bool pop(Event& out)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty())
        {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    // Consumer side: hand every event queued at call time to `sink`, in FIFO
    // order. Events pushed while draining are left for the next drain.
    template <typename Sink>
    size_t drain(Sink&& sink)
    {
        std::deque<Event> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            batch.swap(queue_);
        }
        for (auto& event : batch)
        {
            sink(std::move(event));
        }
        return batch.size();
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

   private:
    const size_t       capacity_;
    mutable std::mutex mutex_;
    std::deque<Event>  queue_;
};

// Cheap, copyable producer handle handed to host threads.
class EventProxy
{
   public:
    EventProxy() = default;
    explicit EventProxy(std::shared_ptr<EventChannel> channel) : channel_(std::move(channel)) {}

    // Returns false if the channel is gone or full.
    bool send(Event event) const { return channel_ && channel_->push(std::move(event)); }

    explicit operator bool() const { return channel_ != nullptr; }

   private:
    std::shared_ptr<EventChannel> channel_;
};

}   // namespace kestrel
