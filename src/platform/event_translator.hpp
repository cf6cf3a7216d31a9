#pragma once

#include <kestrel/event.hpp>
#include <kestrel/ui_core.hpp>
#include <kestrel/window_description.hpp>

#include "platform_event.hpp"

namespace kestrel
{

// Maps native input and window notifications onto canonical WindowEvents.
//
// Owns the keyboard modifier state and the should-terminate flag. Resize and
// minimize notifications are not handled here; the run loop routes those to
// the ScaleCoordinator.
class EventTranslator
{
   public:
    explicit EventTranslator(QuitAccelerator quit_accelerator = QuitAccelerator::platform_default());

    // Translate one native event into zero or more UI core calls.
    // `window_scale_factor` is the OS part of the scale and converts native
    // logical cursor positions into physical pixels.
    // Returns false when the event type is not handled by the translator.
    bool translate(const PlatformEvent& event, UiCore& ui, double window_scale_factor);

    bool      should_terminate() const { return should_terminate_; }
    Modifiers modifiers() const { return modifiers_; }

    static MouseButton map_mouse_button(NativeMouseButton button, uint16_t other);

    // Pixel deltas collapse to a unit step: < 0 -> -1, > 1 -> +1, else 0.
    static float normalize_pixel_delta(double delta);

   private:
    bool is_quit_accelerator(const PlatformEvent& event) const;
    void request_close(UiCore& ui);
    void translate_keyboard(const PlatformEvent& event, UiCore& ui);

    QuitAccelerator quit_accelerator_;
    Modifiers       modifiers_;
    bool            should_terminate_ = false;
};

}   // namespace kestrel
