#include "gpu_context.hpp"

#include <kestrel/logger.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace kestrel
{

void ThreadAffinity::check(std::string_view what) const
{
    if (!is_owner())
    {
        throw std::logic_error(std::string(what) + " used from a thread that does not own it");
    }
}

GpuContext::GpuContext(Hook make_current, Hook release)
    : make_current_(std::move(make_current)), release_(std::move(release))
{
}

GpuContextGuard GpuContext::bind()
{
    return GpuContextGuard(*this);
}

void GpuContext::enter()
{
    affinity_.check("GPU context");
    if (depth_ == 0 && make_current_)
    {
        make_current_();
    }
    ++depth_;
}

void GpuContext::leave() noexcept
{
    if (depth_ == 0)
    {
        return;
    }
    if (--depth_ == 0 && release_)
    {
        try
        {
            release_();
        }
        catch (const std::exception& e)
        {
            KESTREL_LOG_ERROR("render", "Failed to release GPU context: {}", e.what());
        }
    }
}

GpuContextGuard::GpuContextGuard(GpuContext& context) : context_(&context)
{
    context_->enter();
}

GpuContextGuard::~GpuContextGuard()
{
    release();
}

GpuContextGuard::GpuContextGuard(GpuContextGuard&& other) noexcept
    : context_(std::exchange(other.context_, nullptr))
{
}

GpuContextGuard& GpuContextGuard::operator=(GpuContextGuard&& other) noexcept
{
    if (this != &other)
    {
        release();
        context_ = std::exchange(other.context_, nullptr);
    }
    return *this;
}

void GpuContextGuard::release() noexcept
{
    if (context_)
    {
        context_->leave();
        context_ = nullptr;
    }
}

}   // namespace kestrel
