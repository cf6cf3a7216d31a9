#include "swapchain_images.hpp"

namespace kestrel
{

void SwapchainImages::acquired(uint32_t index)
{
    if (current_ != index)
    {
        previous_ = current_;
    }
    current_ = index;
    held_    = index;
}

std::optional<uint32_t> SwapchainImages::take_for_present()
{
    std::optional<uint32_t> index = held_;
    held_.reset();
    return index;
}

void SwapchainImages::reset()
{
    held_.reset();
    current_.reset();
    previous_.reset();
    out_of_date_ = false;
}

}   // namespace kestrel
