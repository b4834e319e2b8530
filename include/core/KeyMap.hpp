#pragma once
#include <string>
#include <vector>
#include "common/Result.hpp"
#include "interfaces/IInputInjector.hpp"
#include "interfaces/IPlatformFactory.hpp"

namespace core {

// ============================================================================
// KeyMap - logical key names to concrete keys for one host OS
// ============================================================================
// Names are case-insensitive. "cmd" is the platform primary modifier (Command
// on macOS, Control elsewhere); "ctrl" also lands on Command on macOS.
// "win"/"super"/"meta" are the Super/Windows key. A single printable
// character is a character key. Anything else is a TranslationError.
// ============================================================================

class KeyMap {
public:
    explicit KeyMap(interfaces::HostOs os) : os_(os) {}

    common::Result<interfaces::KeyStroke> resolve(const std::string& name) const;

    // Resolve every name; the first unknown one fails the whole list
    common::Result<std::vector<interfaces::KeyStroke>> resolve_all(const std::vector<std::string>& names) const;

    interfaces::HostOs host_os() const noexcept { return os_; }

private:
    interfaces::HostOs os_;
};

// "left" | "right" | "middle" (case-insensitive)
common::Result<interfaces::MouseButton> parse_mouse_button(const std::string& name);

} // namespace core
