#include "core/KeyMap.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace interfaces {

    const char* to_string(MouseButton button) noexcept {
        switch (button) {
            case MouseButton::Left:   return "left";
            case MouseButton::Right:  return "right";
            case MouseButton::Middle: return "middle";
        }
        return "left";
    }

    std::string to_string(const KeyStroke& key) {
        switch (key.code) {
            case KeyCode::Character: return std::string(1, key.character);
            case KeyCode::Ctrl:      return "ctrl";
            case KeyCode::Shift:     return "shift";
            case KeyCode::Alt:       return "alt";
            case KeyCode::Meta:      return "meta";
            case KeyCode::Enter:     return "enter";
            case KeyCode::Tab:       return "tab";
            case KeyCode::Escape:    return "esc";
            case KeyCode::Space:     return "space";
            case KeyCode::Up:        return "up";
            case KeyCode::Down:      return "down";
            case KeyCode::Left:      return "left";
            case KeyCode::Right:     return "right";
            case KeyCode::Backspace: return "backspace";
            case KeyCode::Delete:    return "delete";
            case KeyCode::Home:      return "home";
            case KeyCode::End:       return "end";
            case KeyCode::PageUp:    return "pageup";
            case KeyCode::PageDown:  return "pagedown";
            default: break;
        }
        int f = static_cast<int>(key.code) - static_cast<int>(KeyCode::F1) + 1;
        return "f" + std::to_string(f);
    }

}

namespace core {

    using interfaces::KeyCode;
    using interfaces::KeyStroke;

    namespace {

        std::string lowercase(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        // OS independent names. cmd and ctrl are resolved in resolve().
        const std::unordered_map<std::string, KeyCode>& named_keys() {
            static const std::unordered_map<std::string, KeyCode> table = {
                {"shift", KeyCode::Shift},
                {"alt", KeyCode::Alt},
                {"option", KeyCode::Alt},
                {"win", KeyCode::Meta},
                {"super", KeyCode::Meta},
                {"meta", KeyCode::Meta},
                {"enter", KeyCode::Enter},
                {"return", KeyCode::Enter},
                {"tab", KeyCode::Tab},
                {"esc", KeyCode::Escape},
                {"escape", KeyCode::Escape},
                {"space", KeyCode::Space},
                {"up", KeyCode::Up},
                {"down", KeyCode::Down},
                {"left", KeyCode::Left},
                {"right", KeyCode::Right},
                {"backspace", KeyCode::Backspace},
                {"delete", KeyCode::Delete},
                {"del", KeyCode::Delete},
                {"home", KeyCode::Home},
                {"end", KeyCode::End},
                {"pageup", KeyCode::PageUp},
                {"pagedown", KeyCode::PageDown},
                {"f1", KeyCode::F1}, {"f2", KeyCode::F2}, {"f3", KeyCode::F3},
                {"f4", KeyCode::F4}, {"f5", KeyCode::F5}, {"f6", KeyCode::F6},
                {"f7", KeyCode::F7}, {"f8", KeyCode::F8}, {"f9", KeyCode::F9},
                {"f10", KeyCode::F10}, {"f11", KeyCode::F11}, {"f12", KeyCode::F12},
            };
            return table;
        }

    } // namespace

    common::Result<KeyStroke> KeyMap::resolve(const std::string& name) const {
        // Single printable character, including ' '
        if (name.size() == 1 && std::isprint(static_cast<unsigned char>(name[0]))) {
            if (name[0] == ' ') return KeyStroke{KeyCode::Space, '\0'};
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
            return KeyStroke{KeyCode::Character, c};
        }

        std::string key = lowercase(name);
        bool mac = os_ == interfaces::HostOs::MacOS;

        if (key == "cmd" || key == "command") {
            return KeyStroke{mac ? KeyCode::Meta : KeyCode::Ctrl, '\0'};
        }
        if (key == "ctrl" || key == "control") {
            return KeyStroke{mac ? KeyCode::Meta : KeyCode::Ctrl, '\0'};
        }

        const auto& table = named_keys();
        auto it = table.find(key);
        if (it != table.end()) {
            return KeyStroke{it->second, '\0'};
        }

        return common::Result<KeyStroke>::err(common::ErrorCode::TranslationError, "unknown key: " + name);
    }

    common::Result<std::vector<KeyStroke>> KeyMap::resolve_all(const std::vector<std::string>& names) const {
        std::vector<KeyStroke> keys;
        keys.reserve(names.size());
        for (const auto& name : names) {
            auto key = resolve(name);
            if (key.is_err()) return common::Result<std::vector<KeyStroke>>::err(key.error());
            keys.push_back(key.unwrap());
        }
        return keys;
    }

    common::Result<interfaces::MouseButton> parse_mouse_button(const std::string& name) {
        std::string button = lowercase(name);
        if (button == "left") return interfaces::MouseButton::Left;
        if (button == "right") return interfaces::MouseButton::Right;
        if (button == "middle") return interfaces::MouseButton::Middle;
        return common::Result<interfaces::MouseButton>::err(common::ErrorCode::TranslationError,
                                                            "unknown button: " + name);
    }

} // namespace core
