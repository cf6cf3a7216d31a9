#include "event_translator.hpp"

#include <kestrel/logger.hpp>

#include "utf8.hpp"

namespace kestrel
{

namespace
{

// Modifier flag carried by a modifier key, 0 for every other key.
uint8_t modifier_flag(Code code)
{
    switch (code)
    {
        case Code::ShiftLeft:
        case Code::ShiftRight:
            return Modifiers::SHIFT;
        case Code::ControlLeft:
        case Code::ControlRight:
            return Modifiers::CTRL;
        case Code::AltLeft:
        case Code::AltRight:
            return Modifiers::ALT;
        case Code::MetaLeft:
        case Code::MetaRight:
            return Modifiers::SUPER;
        default:
            return 0;
    }
}

}   // namespace

EventTranslator::EventTranslator(QuitAccelerator quit_accelerator)
    : quit_accelerator_(quit_accelerator)
{
}

MouseButton EventTranslator::map_mouse_button(NativeMouseButton button, uint16_t other)
{
    switch (button)
    {
        case NativeMouseButton::Left:
            return MouseButton::left();
        case NativeMouseButton::Right:
            return MouseButton::right();
        case NativeMouseButton::Middle:
            return MouseButton::middle();
        case NativeMouseButton::Back:
            return MouseButton::other_button(4);
        case NativeMouseButton::Forward:
            return MouseButton::other_button(5);
        case NativeMouseButton::Other:
            return MouseButton::other_button(other);
    }
    return MouseButton::left();
}

float EventTranslator::normalize_pixel_delta(double delta)
{
    if (delta < 0.0)
        return -1.0f;
    if (delta > 1.0)
        return 1.0f;
    return 0.0f;
}

bool EventTranslator::is_quit_accelerator(const PlatformEvent& event) const
{
    return quit_accelerator_.enabled && event.key_state == KeyState::Down
           && event.code == quit_accelerator_.code
           && event.modifiers == quit_accelerator_.modifiers;
}

void EventTranslator::request_close(UiCore& ui)
{
    if (should_terminate_)
    {
        return;
    }
    should_terminate_ = true;
    KESTREL_LOG_INFO("input", "Close requested");
    ui.send_event(Event(WindowEvent::of(WindowEventType::WindowClose)));
}

bool EventTranslator::translate(const PlatformEvent& event, UiCore& ui, double window_scale_factor)
{
    using Type = PlatformEvent::Type;

    switch (event.type)
    {
        case Type::CursorMoved:
        {
            auto x = static_cast<float>(event.x * window_scale_factor);
            auto y = static_cast<float>(event.y * window_scale_factor);
            ui.emit_window_event(WindowEvent::mouse_move(x, y));
            return true;
        }

        case Type::ButtonPressed:
            ui.emit_window_event(
                WindowEvent::mouse_down(map_mouse_button(event.button, event.button_other)));
            return true;

        case Type::ButtonReleased:
            ui.emit_window_event(
                WindowEvent::mouse_up(map_mouse_button(event.button, event.button_other)));
            return true;

        case Type::WheelScrolled:
        {
            float lines_x = static_cast<float>(event.x);
            float lines_y = static_cast<float>(event.y);
            if (event.scroll_unit == ScrollUnit::Pixels)
            {
                lines_x = normalize_pixel_delta(event.x);
                lines_y = normalize_pixel_delta(event.y);
            }
            ui.emit_window_event(WindowEvent::mouse_scroll(lines_x, lines_y));
            return true;
        }

        case Type::CursorEntered:
            ui.emit_window_event(WindowEvent::of(WindowEventType::MouseEnter));
            return true;

        case Type::CursorLeft:
            ui.emit_window_event(WindowEvent::of(WindowEventType::MouseLeave));
            return true;

        case Type::Keyboard:
            if (is_quit_accelerator(event))
            {
                request_close(ui);
            }
            translate_keyboard(event, ui);
            return true;

        case Type::Focused:
            ui.needs_refresh();
            return true;

        case Type::WillClose:
            request_close(ui);
            return true;

        case Type::Unfocused:
        case Type::Resized:
        case Type::Minimized:
            return false;
    }
    return false;
}

void EventTranslator::translate_keyboard(const PlatformEvent& event, UiCore& ui)
{
    const bool pressed = event.key_state == KeyState::Down;

    if (uint8_t flag = modifier_flag(event.code); flag != 0)
    {
        modifiers_.set(flag, pressed);
        ui.set_modifiers(modifiers_);
    }

    if (pressed)
    {
        for (char32_t c : utf8::decode(event.text))
        {
            ui.emit_window_event(WindowEvent::char_input(c));
        }
        ui.emit_window_event(WindowEvent::key_down(event.code, event.text));
    }
    else
    {
        ui.emit_window_event(WindowEvent::key_up(event.code, event.text));
    }
}

}   // namespace kestrel
