#include "LinuxUInputInjector.hpp"
#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>
#include <thread>

// Linux kernel headers for uinput
#include <linux/uinput.h>
#include <linux/input.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>

namespace platform {
namespace linux_os {

    using interfaces::KeyCode;

    namespace {

        struct CharKey {
            int code;
            bool shifted;
        };

        // US layout. Returns code 0 when the character has no key.
        CharKey key_for_char(char c) {
            static const int letters[26] = {
                KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I, KEY_J, KEY_K, KEY_L, KEY_M,
                KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R, KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z
            };
            static const int digits[10] = {
                KEY_0, KEY_1, KEY_2, KEY_3, KEY_4, KEY_5, KEY_6, KEY_7, KEY_8, KEY_9
            };

            if (c >= 'a' && c <= 'z') return {letters[c - 'a'], false};
            if (c >= 'A' && c <= 'Z') return {letters[c - 'A'], true};
            if (c >= '0' && c <= '9') return {digits[c - '0'], false};

            switch (c) {
                case ' ':  return {KEY_SPACE, false};
                case '\n': return {KEY_ENTER, false};
                case '\t': return {KEY_TAB, false};
                case '-':  return {KEY_MINUS, false};
                case '_':  return {KEY_MINUS, true};
                case '=':  return {KEY_EQUAL, false};
                case '+':  return {KEY_EQUAL, true};
                case '[':  return {KEY_LEFTBRACE, false};
                case '{':  return {KEY_LEFTBRACE, true};
                case ']':  return {KEY_RIGHTBRACE, false};
                case '}':  return {KEY_RIGHTBRACE, true};
                case '\\': return {KEY_BACKSLASH, false};
                case '|':  return {KEY_BACKSLASH, true};
                case ';':  return {KEY_SEMICOLON, false};
                case ':':  return {KEY_SEMICOLON, true};
                case '\'': return {KEY_APOSTROPHE, false};
                case '"':  return {KEY_APOSTROPHE, true};
                case '`':  return {KEY_GRAVE, false};
                case '~':  return {KEY_GRAVE, true};
                case ',':  return {KEY_COMMA, false};
                case '<':  return {KEY_COMMA, true};
                case '.':  return {KEY_DOT, false};
                case '>':  return {KEY_DOT, true};
                case '/':  return {KEY_SLASH, false};
                case '?':  return {KEY_SLASH, true};
                case '!':  return {KEY_1, true};
                case '@':  return {KEY_2, true};
                case '#':  return {KEY_3, true};
                case '$':  return {KEY_4, true};
                case '%':  return {KEY_5, true};
                case '^':  return {KEY_6, true};
                case '&':  return {KEY_7, true};
                case '*':  return {KEY_8, true};
                case '(':  return {KEY_9, true};
                case ')':  return {KEY_0, true};
                default:   return {0, false};
            }
        }

        int code_for(const interfaces::KeyStroke& key) {
            switch (key.code) {
                case KeyCode::Character: return key_for_char(key.character).code;
                case KeyCode::Ctrl:      return KEY_LEFTCTRL;
                case KeyCode::Shift:     return KEY_LEFTSHIFT;
                case KeyCode::Alt:       return KEY_LEFTALT;
                case KeyCode::Meta:      return KEY_LEFTMETA;
                case KeyCode::Enter:     return KEY_ENTER;
                case KeyCode::Tab:       return KEY_TAB;
                case KeyCode::Escape:    return KEY_ESC;
                case KeyCode::Space:     return KEY_SPACE;
                case KeyCode::Up:        return KEY_UP;
                case KeyCode::Down:      return KEY_DOWN;
                case KeyCode::Left:      return KEY_LEFT;
                case KeyCode::Right:     return KEY_RIGHT;
                case KeyCode::Backspace: return KEY_BACKSPACE;
                case KeyCode::Delete:    return KEY_DELETE;
                case KeyCode::Home:      return KEY_HOME;
                case KeyCode::End:       return KEY_END;
                case KeyCode::PageUp:    return KEY_PAGEUP;
                case KeyCode::PageDown:  return KEY_PAGEDOWN;
                case KeyCode::F1:  return KEY_F1;
                case KeyCode::F2:  return KEY_F2;
                case KeyCode::F3:  return KEY_F3;
                case KeyCode::F4:  return KEY_F4;
                case KeyCode::F5:  return KEY_F5;
                case KeyCode::F6:  return KEY_F6;
                case KeyCode::F7:  return KEY_F7;
                case KeyCode::F8:  return KEY_F8;
                case KeyCode::F9:  return KEY_F9;
                case KeyCode::F10: return KEY_F10;
                case KeyCode::F11: return KEY_F11;
                case KeyCode::F12: return KEY_F12;
            }
            return 0;
        }

    } // namespace

    LinuxUInputInjector::LinuxUInputInjector()
        : uinput_fd_(-1), initialized_(false) {

        if (!setup_device()) {
            std::cerr << "[LinuxUInputInjector] Failed to initialize: " << error_message_ << std::endl;
            return;
        }

        initialized_ = true;
        std::cout << "[LinuxUInputInjector] Initialized. Virtual pointer + keyboard created." << std::endl;
    }

    LinuxUInputInjector::~LinuxUInputInjector() {
        if (uinput_fd_ >= 0) {
            // Destroy the virtual device
            ioctl(uinput_fd_, UI_DEV_DESTROY);
            close(uinput_fd_);
            uinput_fd_ = -1;
        }
    }

    bool LinuxUInputInjector::setup_device() {
        uinput_fd_ = open("/dev/uinput", O_WRONLY | O_NONBLOCK);
        if (uinput_fd_ < 0) {
            error_message_ = "Cannot open /dev/uinput. Run as root or add user to 'input' group.";
            return false;
        }

        auto fail = [this](const char* what) {
            error_message_ = what;
            close(uinput_fd_);
            uinput_fd_ = -1;
            return false;
        };

        if (ioctl(uinput_fd_, UI_SET_EVBIT, EV_KEY) < 0) return fail("ioctl UI_SET_EVBIT EV_KEY failed");
        if (ioctl(uinput_fd_, UI_SET_EVBIT, EV_REL) < 0) return fail("ioctl UI_SET_EVBIT EV_REL failed");

        // Buttons
        ioctl(uinput_fd_, UI_SET_KEYBIT, BTN_LEFT);
        ioctl(uinput_fd_, UI_SET_KEYBIT, BTN_RIGHT);
        ioctl(uinput_fd_, UI_SET_KEYBIT, BTN_MIDDLE);

        // Every keyboard key code up to the F-keys block
        for (int code = KEY_ESC; code <= KEY_F12; ++code) {
            ioctl(uinput_fd_, UI_SET_KEYBIT, code);
        }
        const int extra_keys[] = {KEY_HOME, KEY_END, KEY_PAGEUP, KEY_PAGEDOWN, KEY_UP, KEY_DOWN,
                                  KEY_LEFT, KEY_RIGHT, KEY_DELETE, KEY_LEFTMETA};
        for (int code : extra_keys) {
            ioctl(uinput_fd_, UI_SET_KEYBIT, code);
        }

        // Relative axes
        ioctl(uinput_fd_, UI_SET_RELBIT, REL_X);
        ioctl(uinput_fd_, UI_SET_RELBIT, REL_Y);
        ioctl(uinput_fd_, UI_SET_RELBIT, REL_WHEEL);
        ioctl(uinput_fd_, UI_SET_RELBIT, REL_HWHEEL);

        struct uinput_setup usetup;
        memset(&usetup, 0, sizeof(usetup));
        usetup.id.bustype = BUS_USB;
        usetup.id.vendor = 0x1234;  // Fake vendor ID
        usetup.id.product = 0x5679; // Fake product ID
        strcpy(usetup.name, "RemoteMouse Virtual Input");

        if (ioctl(uinput_fd_, UI_DEV_SETUP, &usetup) < 0) {
            // Fallback for older kernels without UI_DEV_SETUP
            struct uinput_user_dev uud;
            memset(&uud, 0, sizeof(uud));
            strcpy(uud.name, "RemoteMouse Virtual Input");
            uud.id.bustype = BUS_USB;
            uud.id.vendor = 0x1234;
            uud.id.product = 0x5679;
            uud.id.version = 1;

            if (write(uinput_fd_, &uud, sizeof(uud)) < 0) {
                return fail("Failed to write uinput_user_dev");
            }
        }

        if (ioctl(uinput_fd_, UI_DEV_CREATE) < 0) return fail("ioctl UI_DEV_CREATE failed");

        // Give the system a moment to register the new device
        usleep(100000); // 100ms

        return true;
    }

    bool LinuxUInputInjector::emit(int type, int code, int value) {
        struct input_event ev;
        memset(&ev, 0, sizeof(ev));
        ev.type = type;
        ev.code = code;
        ev.value = value;
        return write(uinput_fd_, &ev, sizeof(ev)) == static_cast<ssize_t>(sizeof(ev));
    }

    bool LinuxUInputInjector::syn() {
        return emit(EV_SYN, SYN_REPORT, 0);
    }

    bool LinuxUInputInjector::tap_key(int code, bool shifted) {
        bool ok = true;
        if (shifted) ok = emit(EV_KEY, KEY_LEFTSHIFT, 1) && syn() && ok;
        ok = emit(EV_KEY, code, 1) && syn() && ok;
        ok = emit(EV_KEY, code, 0) && syn() && ok;
        if (shifted) ok = emit(EV_KEY, KEY_LEFTSHIFT, 0) && syn() && ok;
        return ok;
    }

    common::EmptyResult LinuxUInputInjector::not_ready() const {
        return common::EmptyResult::err(common::ErrorCode::NotInitialized,
                                        "uinput injector not initialized: " + error_message_);
    }

    common::EmptyResult LinuxUInputInjector::move_relative(float dx, float dy) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) return not_ready();

        residual_x_ += dx;
        residual_y_ += dy;
        int step_x = static_cast<int>(std::trunc(residual_x_));
        int step_y = static_cast<int>(std::trunc(residual_y_));
        residual_x_ -= static_cast<float>(step_x);
        residual_y_ -= static_cast<float>(step_y);

        bool ok = true;
        if (step_x != 0) ok = emit(EV_REL, REL_X, step_x) && ok;
        if (step_y != 0) ok = emit(EV_REL, REL_Y, step_y) && ok;
        if (step_x != 0 || step_y != 0) ok = syn() && ok;

        if (!ok) return common::EmptyResult::err(common::ErrorCode::SystemError, "uinput write failed");
        return common::EmptyResult::success();
    }

    common::EmptyResult LinuxUInputInjector::click(interfaces::MouseButton button, std::optional<bool> pressed) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) return not_ready();

        int btn_code;
        switch (button) {
            case interfaces::MouseButton::Right:
                btn_code = BTN_RIGHT;
                break;
            case interfaces::MouseButton::Middle:
                btn_code = BTN_MIDDLE;
                break;
            case interfaces::MouseButton::Left:
            default:
                btn_code = BTN_LEFT;
                break;
        }

        bool ok = true;
        if (!pressed.has_value() || *pressed) ok = emit(EV_KEY, btn_code, 1) && syn() && ok;
        if (!pressed.has_value() || !*pressed) ok = emit(EV_KEY, btn_code, 0) && syn() && ok;

        if (!ok) return common::EmptyResult::err(common::ErrorCode::SystemError, "uinput write failed");
        return common::EmptyResult::success();
    }

    common::EmptyResult LinuxUInputInjector::scroll(int dx, int dy) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) return not_ready();

        bool ok = true;
        if (dy != 0) ok = emit(EV_REL, REL_WHEEL, dy) && ok;   // positive = up
        if (dx != 0) ok = emit(EV_REL, REL_HWHEEL, dx) && ok;  // positive = right
        ok = syn() && ok;

        if (!ok) return common::EmptyResult::err(common::ErrorCode::SystemError, "uinput write failed");
        return common::EmptyResult::success();
    }

    common::EmptyResult LinuxUInputInjector::press_combination(const std::vector<interfaces::KeyStroke>& keys) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) return not_ready();

        std::vector<int> codes;
        for (const auto& key : keys) {
            int code = code_for(key);
            if (code == 0) {
                return common::EmptyResult::err(common::ErrorCode::TranslationError,
                                                "key has no uinput code: " + interfaces::to_string(key));
            }
            codes.push_back(code);
        }

        bool ok = true;
        for (int code : codes) {
            ok = emit(EV_KEY, code, 1) && syn() && ok;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        for (auto it = codes.rbegin(); it != codes.rend(); ++it) {
            ok = emit(EV_KEY, *it, 0) && syn() && ok;
        }

        if (!ok) return common::EmptyResult::err(common::ErrorCode::SystemError, "uinput write failed");
        return common::EmptyResult::success();
    }

    common::EmptyResult LinuxUInputInjector::type_text(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!initialized_) return not_ready();

        size_t skipped = 0;
        bool ok = true;
        for (char c : text) {
            CharKey key = key_for_char(c);
            if (key.code == 0) { ++skipped; continue; }
            ok = tap_key(key.code, key.shifted) && ok;
        }

        if (!ok) return common::EmptyResult::err(common::ErrorCode::SystemError, "uinput write failed");
        if (skipped > 0) {
            return common::EmptyResult::err(common::ErrorCode::TranslationError,
                                            std::to_string(skipped) + " character(s) could not be typed");
        }
        return common::EmptyResult::success();
    }

} // namespace linux_os
} // namespace platform
