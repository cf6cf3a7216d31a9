#pragma once

#include <kestrel/event.hpp>
#include <kestrel/geometry.hpp>
#include <cstdint>
#include <string>
#include <utility>

namespace kestrel
{

// Raw events as the native windowing backend reports them, before
// translation into canonical WindowEvents.

enum class NativeMouseButton : uint8_t
{
    Left,
    Right,
    Middle,
    Back,
    Forward,
    Other,
};

enum class ScrollUnit : uint8_t
{
    Lines,
    Pixels,
};

enum class KeyState : uint8_t
{
    Down,
    Up,
};

// Native window metrics. `logical_*` is in the backend's logical units and
// already includes the user scale factor, because the backend only knows
// about its own DPI scaling.
struct NativeWindowInfo
{
    double       logical_width  = 0.0;
    double       logical_height = 0.0;
    double       scale          = 1.0;   // OS-reported DPI scale
    PhysicalSize physical;
};

struct PlatformEvent
{
    enum class Type : uint8_t
    {
        CursorMoved,
        ButtonPressed,
        ButtonReleased,
        WheelScrolled,
        CursorEntered,
        CursorLeft,
        Keyboard,
        Focused,
        Unfocused,
        Resized,
        Minimized,
        WillClose,
    };

    Type type = Type::CursorMoved;

    // CursorMoved: position in native logical units.
    // WheelScrolled: delta in `scroll_unit`.
    double x = 0.0;
    double y = 0.0;

    NativeMouseButton button       = NativeMouseButton::Left;
    uint16_t          button_other = 0;

    ScrollUnit scroll_unit = ScrollUnit::Lines;

    // Keyboard
    Code        code      = Code::Unidentified;
    KeyState    key_state = KeyState::Down;
    std::string text;   // UTF-8 text produced by the key press, if any
    Modifiers   modifiers;

    // Resized
    NativeWindowInfo window_info;

    static PlatformEvent cursor_moved(double x, double y)
    {
        PlatformEvent e;
        e.type = Type::CursorMoved;
        e.x    = x;
        e.y    = y;
        return e;
    }

    static PlatformEvent mouse_button(Type pressed_or_released, NativeMouseButton b, uint16_t other = 0)
    {
        PlatformEvent e;
        e.type         = pressed_or_released;
        e.button       = b;
        e.button_other = other;
        return e;
    }

    static PlatformEvent wheel(ScrollUnit unit, double dx, double dy)
    {
        PlatformEvent e;
        e.type        = Type::WheelScrolled;
        e.scroll_unit = unit;
        e.x           = dx;
        e.y           = dy;
        return e;
    }

    static PlatformEvent key(KeyState state, Code code, std::string text = {}, Modifiers mods = {})
    {
        PlatformEvent e;
        e.type      = Type::Keyboard;
        e.key_state = state;
        e.code      = code;
        e.text      = std::move(text);
        e.modifiers = mods;
        return e;
    }

    static PlatformEvent resized(const NativeWindowInfo& info)
    {
        PlatformEvent e;
        e.type        = Type::Resized;
        e.window_info = info;
        return e;
    }

    static PlatformEvent of(Type type)
    {
        PlatformEvent e;
        e.type = type;
        return e;
    }
};

}   // namespace kestrel
