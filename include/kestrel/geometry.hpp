#pragma once

#include <algorithm>
#include <cstdint>

namespace kestrel
{

// Window size in logical (DPI independent) units, before any scaling.
struct WindowSize
{
    uint32_t width  = 0;
    uint32_t height = 0;

    bool operator==(const WindowSize&) const = default;
};

// Size in device pixels.
struct PhysicalSize
{
    uint32_t width  = 0;
    uint32_t height = 0;

    bool is_empty() const { return width == 0 || height == 0; }

    bool operator==(const PhysicalSize&) const = default;
};

// True when `inner` does not fit inside `outer` along either axis.
inline bool exceeds(const PhysicalSize& inner, const PhysicalSize& outer)
{
    return inner.width > outer.width || inner.height > outer.height;
}

inline PhysicalSize max_extent(const PhysicalSize& a, const PhysicalSize& b)
{
    return {std::max(a.width, b.width), std::max(a.height, b.height)};
}

// Axis-aligned rectangle in physical pixels, used for dirty regions.
struct BoundingBox
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    float left() const { return x; }
    float top() const { return y; }
    float right() const { return x + w; }
    float bottom() const { return y + h; }

    // An empty or inverted region never needs presenting.
    bool is_degenerate() const { return w <= 0.0f || h <= 0.0f; }

    static BoundingBox from_size(const PhysicalSize& size)
    {
        return {0.0f, 0.0f, static_cast<float>(size.width), static_cast<float>(size.height)};
    }
};

}   // namespace kestrel
