#include "LinuxXTestInjector.hpp"
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

// X11 Headers - only included in the .cpp file
#include <X11/Xlib.h>
#include <X11/XKBlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace platform {
namespace linux_os {

    using interfaces::KeyCode;

    LinuxXTestInjector::LinuxXTestInjector()
        : display_(nullptr), initialized_(false) {

        // Open connection to X display
        display_ = XOpenDisplay(nullptr);
        if (!display_) {
            std::cerr << "[LinuxXTestInjector] Failed to open X display. "
                      << "Are you running in an X11 session?" << std::endl;
            return;
        }

        // Check if XTest extension is available
        int event_base, error_base, major, minor;
        if (!XTestQueryExtension(display_, &event_base, &error_base, &major, &minor)) {
            std::cerr << "[LinuxXTestInjector] XTest extension not available!" << std::endl;
            XCloseDisplay(display_);
            display_ = nullptr;
            return;
        }

        initialized_ = true;
        std::cout << "[LinuxXTestInjector] Initialized, XTest v" << major << "." << minor << std::endl;
    }

    LinuxXTestInjector::~LinuxXTestInjector() {
        if (display_) {
            XCloseDisplay(display_);
            display_ = nullptr;
        }
    }

    common::EmptyResult LinuxXTestInjector::not_ready() const {
        return common::EmptyResult::err(common::ErrorCode::NotInitialized, "XTest injector not initialized");
    }

    common::EmptyResult LinuxXTestInjector::move_relative(float dx, float dy) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_ || !display_) return not_ready();

        // Keep the fractional part so slow finger motion still moves the pointer
        residual_x_ += dx;
        residual_y_ += dy;
        int step_x = static_cast<int>(std::trunc(residual_x_));
        int step_y = static_cast<int>(std::trunc(residual_y_));
        residual_x_ -= static_cast<float>(step_x);
        residual_y_ -= static_cast<float>(step_y);

        if (step_x == 0 && step_y == 0) return common::EmptyResult::success();

        Bool result = XTestFakeRelativeMotionEvent(display_, step_x, step_y, CurrentTime);
        XFlush(display_);

        if (!result) {
            return common::EmptyResult::err(common::ErrorCode::SystemError, "XTestFakeRelativeMotionEvent failed");
        }
        return common::EmptyResult::success();
    }

    common::EmptyResult LinuxXTestInjector::click(interfaces::MouseButton button, std::optional<bool> pressed) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_ || !display_) return not_ready();

        // X11 Button codes: 1=Left, 2=Middle, 3=Right
        unsigned int x_button;
        switch (button) {
            case interfaces::MouseButton::Right:
                x_button = Button3;
                break;
            case interfaces::MouseButton::Middle:
                x_button = Button2;
                break;
            case interfaces::MouseButton::Left:
            default:
                x_button = Button1;
                break;
        }

        Bool ok = True;
        if (!pressed.has_value() || *pressed) {
            ok = ok && XTestFakeButtonEvent(display_, x_button, True, CurrentTime);
        }
        if (!pressed.has_value() || !*pressed) {
            ok = ok && XTestFakeButtonEvent(display_, x_button, False, CurrentTime);
        }
        XFlush(display_);

        if (!ok) {
            return common::EmptyResult::err(common::ErrorCode::SystemError, "XTestFakeButtonEvent failed");
        }
        return common::EmptyResult::success();
    }

    common::EmptyResult LinuxXTestInjector::scroll(int dx, int dy) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_ || !display_) return not_ready();

        // Wheel buttons: 4=up, 5=down, 6=left, 7=right. One click per tick.
        auto ticks = [this](unsigned int button, int count) {
            for (int i = 0; i < count; ++i) {
                XTestFakeButtonEvent(display_, button, True, CurrentTime);
                XTestFakeButtonEvent(display_, button, False, CurrentTime);
            }
        };
        if (dy > 0) ticks(4, dy);
        if (dy < 0) ticks(5, -dy);
        if (dx < 0) ticks(6, -dx);
        if (dx > 0) ticks(7, dx);
        XFlush(display_);
        return common::EmptyResult::success();
    }

    unsigned long LinuxXTestInjector::keysym_for(const interfaces::KeyStroke& key) const {
        switch (key.code) {
            case KeyCode::Character: return static_cast<unsigned long>(static_cast<unsigned char>(key.character));
            case KeyCode::Ctrl:      return XK_Control_L;
            case KeyCode::Shift:     return XK_Shift_L;
            case KeyCode::Alt:       return XK_Alt_L;
            case KeyCode::Meta:      return XK_Super_L;
            case KeyCode::Enter:     return XK_Return;
            case KeyCode::Tab:       return XK_Tab;
            case KeyCode::Escape:    return XK_Escape;
            case KeyCode::Space:     return XK_space;
            case KeyCode::Up:        return XK_Up;
            case KeyCode::Down:      return XK_Down;
            case KeyCode::Left:      return XK_Left;
            case KeyCode::Right:     return XK_Right;
            case KeyCode::Backspace: return XK_BackSpace;
            case KeyCode::Delete:    return XK_Delete;
            case KeyCode::Home:      return XK_Home;
            case KeyCode::End:       return XK_End;
            case KeyCode::PageUp:    return XK_Page_Up;
            case KeyCode::PageDown:  return XK_Page_Down;
            default: break;
        }
        // F1..F12 are contiguous in both enums
        return XK_F1 + (static_cast<int>(key.code) - static_cast<int>(KeyCode::F1));
    }

    bool LinuxXTestInjector::send_key(unsigned long keysym, bool is_down) {
        ::KeyCode code = XKeysymToKeycode(display_, static_cast<KeySym>(keysym));
        if (code == 0) return false;
        return XTestFakeKeyEvent(display_, code, is_down ? True : False, CurrentTime) != 0;
    }

    common::EmptyResult LinuxXTestInjector::press_combination(const std::vector<interfaces::KeyStroke>& keys) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_ || !display_) return not_ready();

        std::vector<unsigned long> syms;
        for (const auto& key : keys) {
            unsigned long sym = keysym_for(key);
            if (XKeysymToKeycode(display_, static_cast<KeySym>(sym)) == 0) {
                return common::EmptyResult::err(common::ErrorCode::TranslationError,
                                                "key not on this keyboard: " + interfaces::to_string(key));
            }
            syms.push_back(sym);
        }

        for (auto sym : syms) {
            send_key(sym, true);
            XFlush(display_);
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        for (auto it = syms.rbegin(); it != syms.rend(); ++it) {
            send_key(*it, false);
        }
        XFlush(display_);
        return common::EmptyResult::success();
    }

    common::EmptyResult LinuxXTestInjector::type_text(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_ || !display_) return not_ready();

        size_t skipped = 0;
        for (char ch : text) {
            unsigned char c = static_cast<unsigned char>(ch);
            unsigned long sym;
            if (c == '\n') sym = XK_Return;
            else if (c == '\t') sym = XK_Tab;
            else if (c >= 0x20 && c < 0x7F) sym = c; // Latin-1 keysyms equal ASCII
            else { ++skipped; continue; }

            ::KeyCode code = XKeysymToKeycode(display_, static_cast<KeySym>(sym));
            if (code == 0) { ++skipped; continue; }

            // Shift when the keysym sits on the shifted level of its key
            bool needs_shift = XkbKeycodeToKeysym(display_, code, 0, 0) != static_cast<KeySym>(sym) &&
                               XkbKeycodeToKeysym(display_, code, 0, 1) == static_cast<KeySym>(sym);

            if (needs_shift) send_key(XK_Shift_L, true);
            XTestFakeKeyEvent(display_, code, True, CurrentTime);
            XTestFakeKeyEvent(display_, code, False, CurrentTime);
            if (needs_shift) send_key(XK_Shift_L, false);
        }
        XFlush(display_);

        if (skipped > 0) {
            return common::EmptyResult::err(common::ErrorCode::TranslationError,
                                            std::to_string(skipped) + " character(s) could not be typed");
        }
        return common::EmptyResult::success();
    }

} // namespace linux_os
} // namespace platform
