#pragma once

#include <functional>
#include <string_view>
#include <thread>

namespace kestrel
{

// Records the thread that owns an object and rejects use from any other.
class ThreadAffinity
{
   public:
    ThreadAffinity() : owner_(std::this_thread::get_id()) {}

    // Hand ownership to the calling thread (render thread start-up).
    void rebind() { owner_ = std::this_thread::get_id(); }

    bool is_owner() const { return owner_ == std::this_thread::get_id(); }

    // Throws std::logic_error naming `what` when called off the owner thread.
    void check(std::string_view what) const;

   private:
    std::thread::id owner_;
};

class GpuContextGuard;

// A GPU context that must be current on the render thread while GPU state
// is touched. Binding is reentrant: nested guards only count depth, and the
// context is released when the outermost guard goes away.
class GpuContext
{
   public:
    using Hook = std::function<void()>;

    GpuContext() = default;
    GpuContext(Hook make_current, Hook release);

    GpuContext(const GpuContext&)            = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    [[nodiscard]] GpuContextGuard bind();

    bool is_bound() const { return depth_ > 0; }
    int  depth() const { return depth_; }

    ThreadAffinity&       affinity() { return affinity_; }
    const ThreadAffinity& affinity() const { return affinity_; }

   private:
    friend class GpuContextGuard;

    void enter();
    void leave() noexcept;

    Hook           make_current_;
    Hook           release_;
    int            depth_ = 0;
    ThreadAffinity affinity_;
};

// Scoped critical section over a GpuContext. Releases on every exit path,
// including exceptions thrown by the guarded work.
class GpuContextGuard
{
   public:
    GpuContextGuard() = default;
    explicit GpuContextGuard(GpuContext& context);
    ~GpuContextGuard();

    GpuContextGuard(const GpuContextGuard&)            = delete;
    GpuContextGuard& operator=(const GpuContextGuard&) = delete;

    GpuContextGuard(GpuContextGuard&& other) noexcept;
    GpuContextGuard& operator=(GpuContextGuard&& other) noexcept;

    // Leave early; the destructor then does nothing.
    void release() noexcept;

    explicit operator bool() const { return context_ != nullptr; }

   private:
    GpuContext* context_ = nullptr;
};

}   // namespace kestrel
