#pragma once

#include <cstdint>
#include <optional>

namespace kestrel
{

// Bookkeeping for the swap-chain images a window holds between acquire and
// present. At most one image is held at a time: a frame whose present is
// skipped keeps its image, and the next frame draws into it again instead
// of acquiring another one.
class SwapchainImages
{
   public:
    bool holding() const { return held_.has_value(); }

    // Image acquired from the presentation engine and now held.
    void acquired(uint32_t index);

    // Hands the held image over for presentation.
    std::optional<uint32_t> take_for_present();

    std::optional<uint32_t> current() const { return current_; }
    std::optional<uint32_t> previous() const { return previous_; }

    // The swap chain no longer matches the surface and must be rebuilt,
    // even at an unchanged size.
    void mark_out_of_date() { out_of_date_ = true; }
    bool out_of_date() const { return out_of_date_; }

    // The swap chain was rebuilt; every image index is stale.
    void reset();

   private:
    std::optional<uint32_t> held_;
    std::optional<uint32_t> current_;
    std::optional<uint32_t> previous_;
    bool                    out_of_date_ = false;
};

}   // namespace kestrel
