#pragma once

#include <any>
#include <cstdint>
#include <string>
#include <utility>

namespace kestrel
{

// Identifier of a node in the UI core's tree. Entity 0 is the window root.
struct Entity
{
    uint32_t id = 0;

    static constexpr Entity root() { return Entity{0}; }

    bool operator==(const Entity&) const = default;
};

// ─── Modifiers ──────────────────────────────────────────────────────────────

class Modifiers
{
   public:
    static constexpr uint8_t SHIFT = 0x01;
    static constexpr uint8_t CTRL  = 0x02;
    static constexpr uint8_t ALT   = 0x04;
    static constexpr uint8_t SUPER = 0x08;

    constexpr Modifiers() = default;
    constexpr explicit Modifiers(uint8_t bits) : bits_(bits) {}

    constexpr bool contains(uint8_t flag) const { return (bits_ & flag) == flag; }
    constexpr bool empty() const { return bits_ == 0; }
    constexpr uint8_t bits() const { return bits_; }

    constexpr void set(uint8_t flag, bool on)
    {
        bits_ = on ? static_cast<uint8_t>(bits_ | flag) : static_cast<uint8_t>(bits_ & ~flag);
    }

    constexpr bool operator==(const Modifiers&) const = default;

   private:
    uint8_t bits_ = 0;
};

// ─── Keys and buttons ───────────────────────────────────────────────────────

// Physical key location, independent of keyboard layout.
enum class Code : uint16_t
{
    Unidentified = 0,

    KeyA, KeyB, KeyC, KeyD, KeyE, KeyF, KeyG, KeyH, KeyI, KeyJ, KeyK, KeyL, KeyM,
    KeyN, KeyO, KeyP, KeyQ, KeyR, KeyS, KeyT, KeyU, KeyV, KeyW, KeyX, KeyY, KeyZ,

    Digit0, Digit1, Digit2, Digit3, Digit4, Digit5, Digit6, Digit7, Digit8, Digit9,

    Space,
    Enter,
    Escape,
    Tab,
    Backspace,
    Delete,
    Insert,
    Home,
    End,
    PageUp,
    PageDown,
    ArrowLeft,
    ArrowRight,
    ArrowUp,
    ArrowDown,

    ShiftLeft,
    ShiftRight,
    ControlLeft,
    ControlRight,
    AltLeft,
    AltRight,
    MetaLeft,
    MetaRight,

    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
};

enum class MouseButtonKind : uint8_t
{
    Left,
    Right,
    Middle,
    Other,
};

struct MouseButton
{
    MouseButtonKind kind  = MouseButtonKind::Left;
    uint16_t        other = 0;   // only meaningful for MouseButtonKind::Other

    static constexpr MouseButton left() { return {MouseButtonKind::Left, 0}; }
    static constexpr MouseButton right() { return {MouseButtonKind::Right, 0}; }
    static constexpr MouseButton middle() { return {MouseButtonKind::Middle, 0}; }
    static constexpr MouseButton other_button(uint16_t id) { return {MouseButtonKind::Other, id}; }

    bool operator==(const MouseButton&) const = default;
};

// ─── Canonical window events ────────────────────────────────────────────────

enum class WindowEventType : uint8_t
{
    MouseMove,
    MouseDown,
    MouseUp,
    MouseScroll,
    MouseEnter,
    MouseLeave,
    CharInput,
    KeyDown,
    KeyUp,
    WindowClose,
};

// Events the platform layer emits into the UI core. Only the fields that
// belong to `type` are meaningful.
struct WindowEvent
{
    WindowEventType type = WindowEventType::MouseMove;

    // MouseMove: cursor position in physical pixels. MouseScroll: line deltas.
    float x = 0.0f;
    float y = 0.0f;

    MouseButton button;

    // KeyDown / KeyUp
    Code        code = Code::Unidentified;
    std::string key;   // logical key text (UTF-8), empty for non-character keys

    // CharInput
    char32_t character = 0;

    static WindowEvent mouse_move(float x, float y)
    {
        WindowEvent e;
        e.type = WindowEventType::MouseMove;
        e.x    = x;
        e.y    = y;
        return e;
    }

    static WindowEvent mouse_down(MouseButton b)
    {
        WindowEvent e;
        e.type   = WindowEventType::MouseDown;
        e.button = b;
        return e;
    }

    static WindowEvent mouse_up(MouseButton b)
    {
        WindowEvent e;
        e.type   = WindowEventType::MouseUp;
        e.button = b;
        return e;
    }

    static WindowEvent mouse_scroll(float lines_x, float lines_y)
    {
        WindowEvent e;
        e.type = WindowEventType::MouseScroll;
        e.x    = lines_x;
        e.y    = lines_y;
        return e;
    }

    static WindowEvent char_input(char32_t c)
    {
        WindowEvent e;
        e.type      = WindowEventType::CharInput;
        e.character = c;
        return e;
    }

    static WindowEvent key_down(Code code, std::string key)
    {
        WindowEvent e;
        e.type = WindowEventType::KeyDown;
        e.code = code;
        e.key  = std::move(key);
        return e;
    }

    static WindowEvent key_up(Code code, std::string key)
    {
        WindowEvent e;
        e.type = WindowEventType::KeyUp;
        e.code = code;
        e.key  = std::move(key);
        return e;
    }

    static WindowEvent of(WindowEventType type)
    {
        WindowEvent e;
        e.type = type;
        return e;
    }
};

// Message routed through the UI core's event queue. Carries either a
// canonical window event or an application-defined payload.
struct Event
{
    Entity   target = Entity::root();
    std::any payload;

    Event() = default;

    template <typename T>
    explicit Event(T value, Entity to = Entity::root()) : target(to), payload(std::move(value))
    {
    }

    template <typename T>
    const T* get() const
    {
        return std::any_cast<T>(&payload);
    }
};

}   // namespace kestrel
