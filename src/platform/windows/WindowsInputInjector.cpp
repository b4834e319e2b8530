#include "WindowsInputInjector.hpp"
#include <chrono>
#include <cmath>
#include <thread>

namespace platform {
namespace windows_os {

    using interfaces::KeyCode;

    namespace {

        WORD virtual_key_for(const interfaces::KeyStroke& key) {
            switch (key.code) {
                case KeyCode::Character: {
                    SHORT vk = VkKeyScanA(key.character);
                    return vk == -1 ? 0 : static_cast<WORD>(LOBYTE(vk));
                }
                case KeyCode::Ctrl:      return VK_CONTROL;
                case KeyCode::Shift:     return VK_SHIFT;
                case KeyCode::Alt:       return VK_MENU;
                case KeyCode::Meta:      return VK_LWIN;
                case KeyCode::Enter:     return VK_RETURN;
                case KeyCode::Tab:       return VK_TAB;
                case KeyCode::Escape:    return VK_ESCAPE;
                case KeyCode::Space:     return VK_SPACE;
                case KeyCode::Up:        return VK_UP;
                case KeyCode::Down:      return VK_DOWN;
                case KeyCode::Left:      return VK_LEFT;
                case KeyCode::Right:     return VK_RIGHT;
                case KeyCode::Backspace: return VK_BACK;
                case KeyCode::Delete:    return VK_DELETE;
                case KeyCode::Home:      return VK_HOME;
                case KeyCode::End:       return VK_END;
                case KeyCode::PageUp:    return VK_PRIOR;
                case KeyCode::PageDown:  return VK_NEXT;
                default: break;
            }
            return static_cast<WORD>(VK_F1 + (static_cast<int>(key.code) - static_cast<int>(KeyCode::F1)));
        }

        INPUT key_input(WORD vk, bool is_down) {
            INPUT input = {};
            input.type = INPUT_KEYBOARD;
            input.ki.wVk = vk;
            input.ki.dwFlags = is_down ? 0 : KEYEVENTF_KEYUP;
            return input;
        }

        INPUT unicode_input(wchar_t unit, bool is_down) {
            INPUT input = {};
            input.type = INPUT_KEYBOARD;
            input.ki.wScan = unit;
            input.ki.dwFlags = KEYEVENTF_UNICODE | (is_down ? 0 : KEYEVENTF_KEYUP);
            return input;
        }

    } // namespace

    common::EmptyResult WindowsInputInjector::send(std::vector<INPUT>& inputs) {
        if (inputs.empty()) return common::EmptyResult::success();
        UINT sent = SendInput(static_cast<UINT>(inputs.size()), inputs.data(), sizeof(INPUT));
        if (sent != inputs.size()) {
            return common::EmptyResult::err(common::ErrorCode::SystemError,
                                            "SendInput blocked (error " + std::to_string(GetLastError()) + ")");
        }
        return common::EmptyResult::success();
    }

    common::EmptyResult WindowsInputInjector::move_relative(float dx, float dy) {
        std::lock_guard<std::mutex> lock(mutex_);

        residual_x_ += dx;
        residual_y_ += dy;
        LONG step_x = static_cast<LONG>(std::trunc(residual_x_));
        LONG step_y = static_cast<LONG>(std::trunc(residual_y_));
        residual_x_ -= static_cast<float>(step_x);
        residual_y_ -= static_cast<float>(step_y);
        if (step_x == 0 && step_y == 0) return common::EmptyResult::success();

        std::vector<INPUT> inputs(1);
        inputs[0].type = INPUT_MOUSE;
        inputs[0].mi.dx = step_x;
        inputs[0].mi.dy = step_y;
        inputs[0].mi.dwFlags = MOUSEEVENTF_MOVE; // relative, subject to pointer acceleration
        return send(inputs);
    }

    common::EmptyResult WindowsInputInjector::click(interfaces::MouseButton button, std::optional<bool> pressed) {
        std::lock_guard<std::mutex> lock(mutex_);

        DWORD down_flag = MOUSEEVENTF_LEFTDOWN;
        DWORD up_flag = MOUSEEVENTF_LEFTUP;
        switch (button) {
            case interfaces::MouseButton::Left:
                break;
            case interfaces::MouseButton::Right:
                down_flag = MOUSEEVENTF_RIGHTDOWN;
                up_flag = MOUSEEVENTF_RIGHTUP;
                break;
            case interfaces::MouseButton::Middle:
                down_flag = MOUSEEVENTF_MIDDLEDOWN;
                up_flag = MOUSEEVENTF_MIDDLEUP;
                break;
        }

        std::vector<INPUT> inputs;
        if (!pressed.has_value() || *pressed) {
            INPUT input = {};
            input.type = INPUT_MOUSE;
            input.mi.dwFlags = down_flag;
            inputs.push_back(input);
        }
        if (!pressed.has_value() || !*pressed) {
            INPUT input = {};
            input.type = INPUT_MOUSE;
            input.mi.dwFlags = up_flag;
            inputs.push_back(input);
        }
        return send(inputs);
    }

    common::EmptyResult WindowsInputInjector::scroll(int dx, int dy) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<INPUT> inputs;
        if (dy != 0) {
            INPUT input = {};
            input.type = INPUT_MOUSE;
            input.mi.dwFlags = MOUSEEVENTF_WHEEL;
            input.mi.mouseData = static_cast<DWORD>(dy * WHEEL_DELTA); // positive = up
            inputs.push_back(input);
        }
        if (dx != 0) {
            INPUT input = {};
            input.type = INPUT_MOUSE;
            input.mi.dwFlags = MOUSEEVENTF_HWHEEL;
            input.mi.mouseData = static_cast<DWORD>(dx * WHEEL_DELTA); // positive = right
            inputs.push_back(input);
        }
        return send(inputs);
    }

    common::EmptyResult WindowsInputInjector::press_combination(const std::vector<interfaces::KeyStroke>& keys) {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<WORD> codes;
        for (const auto& key : keys) {
            WORD vk = virtual_key_for(key);
            if (vk == 0) {
                return common::EmptyResult::err(common::ErrorCode::TranslationError,
                                                "key has no virtual key: " + interfaces::to_string(key));
            }
            codes.push_back(vk);
        }

        for (WORD vk : codes) {
            std::vector<INPUT> down{key_input(vk, true)};
            auto res = send(down);
            if (res.is_err()) return res;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        std::vector<INPUT> ups;
        for (auto it = codes.rbegin(); it != codes.rend(); ++it) {
            ups.push_back(key_input(*it, false));
        }
        return send(ups);
    }

    common::EmptyResult WindowsInputInjector::type_text(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);

        int length = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
        if (length <= 0) {
            return common::EmptyResult::err(common::ErrorCode::TranslationError, "text is not valid UTF-8");
        }
        std::wstring wide(static_cast<size_t>(length), L'\0');
        MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), &wide[0], length);

        std::vector<INPUT> inputs;
        inputs.reserve(wide.size() * 2);
        for (wchar_t unit : wide) {
            if (unit == L'\n') {
                inputs.push_back(key_input(VK_RETURN, true));
                inputs.push_back(key_input(VK_RETURN, false));
                continue;
            }
            inputs.push_back(unicode_input(unit, true));
            inputs.push_back(unicode_input(unit, false));
        }
        return send(inputs);
    }

}
}
