#include <gtest/gtest.h>

#include "fake_ui_core.hpp"
#include "platform/event_translator.hpp"

using namespace kestrel;
using kestrel::test::FakeUiCore;

namespace
{

QuitAccelerator super_q()
{
    QuitAccelerator accel;
    accel.enabled   = true;
    accel.code      = Code::KeyQ;
    accel.modifiers = Modifiers(Modifiers::SUPER);
    return accel;
}

QuitAccelerator disabled()
{
    QuitAccelerator accel;
    accel.enabled = false;
    return accel;
}

}   // namespace

// ─── Pointer ────────────────────────────────────────────────────────────────

TEST(EventTranslator, CursorPositionScaledToPhysical)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    EXPECT_TRUE(t.translate(PlatformEvent::cursor_moved(10.0, 20.5), ui, 2.0));
    ASSERT_EQ(ui.emitted.size(), 1u);
    EXPECT_EQ(ui.emitted[0].type, WindowEventType::MouseMove);
    EXPECT_FLOAT_EQ(ui.emitted[0].x, 20.0f);
    EXPECT_FLOAT_EQ(ui.emitted[0].y, 41.0f);
}

TEST(EventTranslator, ButtonMapping)
{
    EXPECT_EQ(EventTranslator::map_mouse_button(NativeMouseButton::Left, 0), MouseButton::left());
    EXPECT_EQ(EventTranslator::map_mouse_button(NativeMouseButton::Right, 0), MouseButton::right());
    EXPECT_EQ(EventTranslator::map_mouse_button(NativeMouseButton::Middle, 0), MouseButton::middle());
    EXPECT_EQ(EventTranslator::map_mouse_button(NativeMouseButton::Back, 0),
              MouseButton::other_button(4));
    EXPECT_EQ(EventTranslator::map_mouse_button(NativeMouseButton::Forward, 0),
              MouseButton::other_button(5));
    EXPECT_EQ(EventTranslator::map_mouse_button(NativeMouseButton::Other, 9),
              MouseButton::other_button(9));
}

TEST(EventTranslator, ButtonPressAndRelease)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    t.translate(PlatformEvent::mouse_button(PlatformEvent::Type::ButtonPressed, NativeMouseButton::Back),
                ui,
                1.0);
    t.translate(PlatformEvent::mouse_button(PlatformEvent::Type::ButtonReleased, NativeMouseButton::Left),
                ui,
                1.0);

    ASSERT_EQ(ui.emitted.size(), 2u);
    EXPECT_EQ(ui.emitted[0].type, WindowEventType::MouseDown);
    EXPECT_EQ(ui.emitted[0].button, MouseButton::other_button(4));
    EXPECT_EQ(ui.emitted[1].type, WindowEventType::MouseUp);
    EXPECT_EQ(ui.emitted[1].button, MouseButton::left());
}

TEST(EventTranslator, EnterAndLeave)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    t.translate(PlatformEvent::of(PlatformEvent::Type::CursorEntered), ui, 1.0);
    t.translate(PlatformEvent::of(PlatformEvent::Type::CursorLeft), ui, 1.0);

    ASSERT_EQ(ui.emitted.size(), 2u);
    EXPECT_EQ(ui.emitted[0].type, WindowEventType::MouseEnter);
    EXPECT_EQ(ui.emitted[1].type, WindowEventType::MouseLeave);
}

// ─── Scroll ─────────────────────────────────────────────────────────────────

TEST(EventTranslator, PixelDeltaNormalization)
{
    EXPECT_FLOAT_EQ(EventTranslator::normalize_pixel_delta(-0.1), -1.0f);
    EXPECT_FLOAT_EQ(EventTranslator::normalize_pixel_delta(-40.0), -1.0f);
    EXPECT_FLOAT_EQ(EventTranslator::normalize_pixel_delta(0.0), 0.0f);
    EXPECT_FLOAT_EQ(EventTranslator::normalize_pixel_delta(0.5), 0.0f);
    EXPECT_FLOAT_EQ(EventTranslator::normalize_pixel_delta(1.0), 0.0f);
    EXPECT_FLOAT_EQ(EventTranslator::normalize_pixel_delta(1.01), 1.0f);
    EXPECT_FLOAT_EQ(EventTranslator::normalize_pixel_delta(120.0), 1.0f);
}

TEST(EventTranslator, PixelScrollCollapsesPerAxis)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    t.translate(PlatformEvent::wheel(ScrollUnit::Pixels, -3.0, 0.5), ui, 2.0);
    ASSERT_EQ(ui.emitted.size(), 1u);
    EXPECT_EQ(ui.emitted[0].type, WindowEventType::MouseScroll);
    EXPECT_FLOAT_EQ(ui.emitted[0].x, -1.0f);
    EXPECT_FLOAT_EQ(ui.emitted[0].y, 0.0f);
}

TEST(EventTranslator, LineScrollPassesThrough)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    t.translate(PlatformEvent::wheel(ScrollUnit::Lines, 0.25, -2.5), ui, 2.0);
    ASSERT_EQ(ui.emitted.size(), 1u);
    EXPECT_FLOAT_EQ(ui.emitted[0].x, 0.25f);
    EXPECT_FLOAT_EQ(ui.emitted[0].y, -2.5f);
}

// ─── Keyboard ───────────────────────────────────────────────────────────────

TEST(EventTranslator, CharactersPrecedeKeyDown)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    // "é" followed by "a": two code points, three bytes.
    t.translate(PlatformEvent::key(KeyState::Down, Code::KeyA, "\xC3\xA9" "a"), ui, 1.0);

    ASSERT_EQ(ui.emitted.size(), 3u);
    EXPECT_EQ(ui.emitted[0].type, WindowEventType::CharInput);
    EXPECT_EQ(ui.emitted[0].character, U'\u00E9');
    EXPECT_EQ(ui.emitted[1].type, WindowEventType::CharInput);
    EXPECT_EQ(ui.emitted[1].character, U'a');
    EXPECT_EQ(ui.emitted[2].type, WindowEventType::KeyDown);
    EXPECT_EQ(ui.emitted[2].code, Code::KeyA);
}

TEST(EventTranslator, KeyDownWithoutTextEmitsOnlyKeyDown)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    t.translate(PlatformEvent::key(KeyState::Down, Code::ArrowLeft), ui, 1.0);
    ASSERT_EQ(ui.emitted.size(), 1u);
    EXPECT_EQ(ui.emitted[0].type, WindowEventType::KeyDown);
}

TEST(EventTranslator, KeyUpNeverEmitsCharacters)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    t.translate(PlatformEvent::key(KeyState::Up, Code::KeyA, "a"), ui, 1.0);
    ASSERT_EQ(ui.emitted.size(), 1u);
    EXPECT_EQ(ui.emitted[0].type, WindowEventType::KeyUp);
    EXPECT_EQ(ui.emitted[0].code, Code::KeyA);
}

TEST(EventTranslator, ModifierKeysUpdateModifiers)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    t.translate(PlatformEvent::key(KeyState::Down, Code::ShiftLeft), ui, 1.0);
    t.translate(PlatformEvent::key(KeyState::Down, Code::ControlRight), ui, 1.0);
    EXPECT_TRUE(t.modifiers().contains(Modifiers::SHIFT));
    EXPECT_TRUE(t.modifiers().contains(Modifiers::CTRL));
    EXPECT_EQ(ui.mods, t.modifiers());

    t.translate(PlatformEvent::key(KeyState::Up, Code::ShiftLeft), ui, 1.0);
    EXPECT_FALSE(t.modifiers().contains(Modifiers::SHIFT));
    EXPECT_TRUE(t.modifiers().contains(Modifiers::CTRL));
    EXPECT_EQ(ui.mods, t.modifiers());
}

TEST(EventTranslator, NonModifierKeysLeaveModifiersAlone)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    // Native modifier bits on an ordinary key do not change the state.
    t.translate(PlatformEvent::key(KeyState::Down, Code::KeyB, "b", Modifiers(Modifiers::ALT)),
                ui,
                1.0);
    EXPECT_TRUE(t.modifiers().empty());
}

// ─── Close intent ───────────────────────────────────────────────────────────

TEST(EventTranslator, WillCloseRequestsTermination)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    EXPECT_FALSE(t.should_terminate());
    EXPECT_TRUE(t.translate(PlatformEvent::of(PlatformEvent::Type::WillClose), ui, 1.0));
    EXPECT_TRUE(t.should_terminate());

    auto sent = ui.sent_window_events();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0], WindowEventType::WindowClose);
}

TEST(EventTranslator, CloseIsSentOnce)
{
    FakeUiCore      ui;
    EventTranslator t(super_q());

    t.translate(PlatformEvent::of(PlatformEvent::Type::WillClose), ui, 1.0);
    t.translate(PlatformEvent::of(PlatformEvent::Type::WillClose), ui, 1.0);
    t.translate(PlatformEvent::key(KeyState::Down, Code::KeyQ, "q", Modifiers(Modifiers::SUPER)),
                ui,
                1.0);

    EXPECT_EQ(ui.sent_window_events().size(), 1u);
}

TEST(EventTranslator, QuitAcceleratorRequestsClose)
{
    FakeUiCore      ui;
    EventTranslator t(super_q());

    t.translate(PlatformEvent::key(KeyState::Down, Code::KeyQ, "q", Modifiers(Modifiers::SUPER)),
                ui,
                1.0);
    EXPECT_TRUE(t.should_terminate());
    EXPECT_EQ(ui.sent_window_events().size(), 1u);
}

TEST(EventTranslator, QuitAcceleratorNeedsExactModifiers)
{
    FakeUiCore      ui;
    EventTranslator t(super_q());

    Modifiers super_shift(Modifiers::SUPER | Modifiers::SHIFT);
    t.translate(PlatformEvent::key(KeyState::Down, Code::KeyQ, "Q", super_shift), ui, 1.0);
    t.translate(PlatformEvent::key(KeyState::Down, Code::KeyQ, "q"), ui, 1.0);
    t.translate(PlatformEvent::key(KeyState::Up, Code::KeyQ, "", Modifiers(Modifiers::SUPER)),
                ui,
                1.0);

    EXPECT_FALSE(t.should_terminate());
    EXPECT_TRUE(ui.sent_window_events().empty());
}

TEST(EventTranslator, DisabledAcceleratorIsIgnored)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    t.translate(PlatformEvent::key(KeyState::Down, Code::KeyQ, "q", Modifiers(Modifiers::SUPER)),
                ui,
                1.0);
    EXPECT_FALSE(t.should_terminate());
}

// ─── Window notifications ───────────────────────────────────────────────────

TEST(EventTranslator, FocusRequestsRefresh)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    EXPECT_TRUE(t.translate(PlatformEvent::of(PlatformEvent::Type::Focused), ui, 1.0));
    EXPECT_EQ(ui.refreshes, 1);
}

TEST(EventTranslator, SizeNotificationsAreLeftToTheRunLoop)
{
    FakeUiCore      ui;
    EventTranslator t(disabled());

    EXPECT_FALSE(t.translate(PlatformEvent::resized({}), ui, 1.0));
    EXPECT_FALSE(t.translate(PlatformEvent::of(PlatformEvent::Type::Minimized), ui, 1.0));
    EXPECT_FALSE(t.translate(PlatformEvent::of(PlatformEvent::Type::Unfocused), ui, 1.0));
    EXPECT_TRUE(ui.emitted.empty());
}
