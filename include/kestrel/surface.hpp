#pragma once

#include <cstdint>
#include <kestrel/geometry.hpp>
#include <string_view>

namespace kestrel
{

enum class GraphicsBackend
{
    OpenGL,
    Direct3D12,
    Vulkan,
};

std::string_view backend_name(GraphicsBackend backend);

enum class SurfaceOrigin : uint8_t
{
    TopLeft,
    BottomLeft,
};

// A renderable 2D target. The GPU objects behind `id` are owned by the
// backend that produced it; the UI core only draws through the handle.
struct Surface
{
    uint64_t      id     = 0;
    PhysicalSize  size;
    SurfaceOrigin origin = SurfaceOrigin::TopLeft;

    explicit operator bool() const { return id != 0; }
};

// Primary drawable plus a same-sized secondary surface used for
// dirty-region compositing.
struct RenderSurfacePair
{
    Surface primary;
    Surface dirty;

    bool valid() const { return primary.id != 0 && dirty.id != 0; }
    PhysicalSize size() const { return primary.size; }
};

// What the UI core draws into for one frame. The core renders the changed
// region into `drawable` and composites it onto `present_target`, which is
// what the backend displays on present().
struct SurfaceFrame
{
    Surface* drawable       = nullptr;
    Surface* present_target = nullptr;

    explicit operator bool() const { return drawable != nullptr; }
};

}   // namespace kestrel
