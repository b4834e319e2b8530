#pragma once
#include <optional>
#include <string>
#include <vector>
#include "common/Result.hpp"

namespace interfaces {

    enum class MouseButton {
        Left,
        Right,
        Middle
    };

    // Concrete keys an OS binding can press. Logical names ("cmd") are
    // resolved to these by core::KeyMap before they reach the injector.
    enum class KeyCode {
        Character, // printable ASCII, see KeyStroke::character
        Ctrl,
        Shift,
        Alt,
        Meta,      // Command on macOS, Super/Windows key elsewhere
        Enter,
        Tab,
        Escape,
        Space,
        Up,
        Down,
        Left,
        Right,
        Backspace,
        Delete,
        Home,
        End,
        PageUp,
        PageDown,
        F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12
    };

    struct KeyStroke {
        KeyCode code = KeyCode::Character;
        char character = '\0'; // only meaningful for KeyCode::Character (lowercase)

        bool operator==(const KeyStroke& other) const {
            return code == other.code && character == other.character;
        }
    };

    const char* to_string(MouseButton button) noexcept;
    std::string to_string(const KeyStroke& key);

    /**
     * Capability interface for the host-OS input binding.
     *
     * One implementation per OS (XTest, uinput, SendInput, Quartz), selected at
     * startup by the platform factory. Tests substitute a recording fake.
     * Implementations serialize their own calls; callers may use one instance
     * from several session threads.
     */
    class IInputInjector {
    public:
        virtual ~IInputInjector() = default;

        // Move the pointer by a relative offset in pixels (sub-pixel deltas accumulate)
        virtual common::EmptyResult move_relative(float dx, float dy) = 0;

        // pressed == nullopt: press then release, in that order
        // pressed == true:    press only (button held)
        // pressed == false:   release only
        virtual common::EmptyResult click(MouseButton button, std::optional<bool> pressed) = 0;

        // Type a UTF-8 string
        virtual common::EmptyResult type_text(const std::string& text) = 0;

        // Press every key in order, then release them in reverse order
        virtual common::EmptyResult press_combination(const std::vector<KeyStroke>& keys) = 0;

        // Scroll ticks; positive dy scrolls up, positive dx scrolls right
        virtual common::EmptyResult scroll(int dx, int dy) = 0;

        virtual const char* name() const noexcept = 0;
    };

}
