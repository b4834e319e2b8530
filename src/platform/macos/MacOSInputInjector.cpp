#include "MacOSInputInjector.hpp"
#include <ApplicationServices/ApplicationServices.h>
#include <Carbon/Carbon.h>
#include <chrono>
#include <thread>

namespace platform {
namespace macos {

using interfaces::KeyCode;

namespace {

constexpr CGKeyCode kNoKey = 0xFFFF;

CGKeyCode key_code_for_character(char c) {
    switch (c) {
        case 'a': return kVK_ANSI_A; case 'b': return kVK_ANSI_B; case 'c': return kVK_ANSI_C;
        case 'd': return kVK_ANSI_D; case 'e': return kVK_ANSI_E; case 'f': return kVK_ANSI_F;
        case 'g': return kVK_ANSI_G; case 'h': return kVK_ANSI_H; case 'i': return kVK_ANSI_I;
        case 'j': return kVK_ANSI_J; case 'k': return kVK_ANSI_K; case 'l': return kVK_ANSI_L;
        case 'm': return kVK_ANSI_M; case 'n': return kVK_ANSI_N; case 'o': return kVK_ANSI_O;
        case 'p': return kVK_ANSI_P; case 'q': return kVK_ANSI_Q; case 'r': return kVK_ANSI_R;
        case 's': return kVK_ANSI_S; case 't': return kVK_ANSI_T; case 'u': return kVK_ANSI_U;
        case 'v': return kVK_ANSI_V; case 'w': return kVK_ANSI_W; case 'x': return kVK_ANSI_X;
        case 'y': return kVK_ANSI_Y; case 'z': return kVK_ANSI_Z;
        case '0': return kVK_ANSI_0; case '1': return kVK_ANSI_1; case '2': return kVK_ANSI_2;
        case '3': return kVK_ANSI_3; case '4': return kVK_ANSI_4; case '5': return kVK_ANSI_5;
        case '6': return kVK_ANSI_6; case '7': return kVK_ANSI_7; case '8': return kVK_ANSI_8;
        case '9': return kVK_ANSI_9;
        case '-': return kVK_ANSI_Minus;     case '=': return kVK_ANSI_Equal;
        case '[': return kVK_ANSI_LeftBracket; case ']': return kVK_ANSI_RightBracket;
        case ';': return kVK_ANSI_Semicolon; case '\'': return kVK_ANSI_Quote;
        case ',': return kVK_ANSI_Comma;     case '.': return kVK_ANSI_Period;
        case '/': return kVK_ANSI_Slash;     case '\\': return kVK_ANSI_Backslash;
        case '`': return kVK_ANSI_Grave;
        default: return kNoKey;
    }
}

CGKeyCode key_code_for(const interfaces::KeyStroke& key) {
    static const CGKeyCode function_keys[] = {
        kVK_F1, kVK_F2, kVK_F3, kVK_F4, kVK_F5, kVK_F6,
        kVK_F7, kVK_F8, kVK_F9, kVK_F10, kVK_F11, kVK_F12
    };

    switch (key.code) {
        case KeyCode::Character: return key_code_for_character(key.character);
        case KeyCode::Ctrl:      return kVK_Control;
        case KeyCode::Shift:     return kVK_Shift;
        case KeyCode::Alt:       return kVK_Option;
        case KeyCode::Meta:      return kVK_Command;
        case KeyCode::Enter:     return kVK_Return;
        case KeyCode::Tab:       return kVK_Tab;
        case KeyCode::Escape:    return kVK_Escape;
        case KeyCode::Space:     return kVK_Space;
        case KeyCode::Up:        return kVK_UpArrow;
        case KeyCode::Down:      return kVK_DownArrow;
        case KeyCode::Left:      return kVK_LeftArrow;
        case KeyCode::Right:     return kVK_RightArrow;
        case KeyCode::Backspace: return kVK_Delete;
        case KeyCode::Delete:    return kVK_ForwardDelete;
        case KeyCode::Home:      return kVK_Home;
        case KeyCode::End:       return kVK_End;
        case KeyCode::PageUp:    return kVK_PageUp;
        case KeyCode::PageDown:  return kVK_PageDown;
        default: break;
    }
    int index = static_cast<int>(key.code) - static_cast<int>(KeyCode::F1);
    if (index >= 0 && index < 12) return function_keys[index];
    return kNoKey;
}

// Modifier flags that must be set on the events of a combination so
// applications see e.g. Command+C rather than a bare C.
CGEventFlags flag_for(KeyCode code) {
    switch (code) {
        case KeyCode::Ctrl:  return kCGEventFlagMaskControl;
        case KeyCode::Shift: return kCGEventFlagMaskShift;
        case KeyCode::Alt:   return kCGEventFlagMaskAlternate;
        case KeyCode::Meta:  return kCGEventFlagMaskCommand;
        default:             return 0;
    }
}

common::EmptyResult post(CGEventRef event, const char* what) {
    if (!event) {
        return common::EmptyResult::err(common::ErrorCode::SystemError,
                                        std::string("CGEvent creation failed: ") + what);
    }
    CGEventPost(kCGHIDEventTap, event);
    CFRelease(event);
    return common::EmptyResult::success();
}

CGPoint current_location() {
    CGEventRef probe = CGEventCreate(nullptr);
    CGPoint location = CGPointMake(0, 0);
    if (probe) {
        location = CGEventGetLocation(probe);
        CFRelease(probe);
    }
    return location;
}

} // namespace

bool MacOSInputInjector::has_accessibility_permission() {
    return AXIsProcessTrusted();
}

common::EmptyResult MacOSInputInjector::move_relative(float dx, float dy) {
    std::lock_guard<std::mutex> lock(mutex_);

    CGPoint target = current_location();
    target.x += dx;
    target.y += dy;

    // Keep the cursor on the main display bounds
    CGRect bounds = CGDisplayBounds(CGMainDisplayID());
    if (target.x < bounds.origin.x) target.x = bounds.origin.x;
    if (target.y < bounds.origin.y) target.y = bounds.origin.y;
    if (target.x > bounds.origin.x + bounds.size.width - 1) target.x = bounds.origin.x + bounds.size.width - 1;
    if (target.y > bounds.origin.y + bounds.size.height - 1) target.y = bounds.origin.y + bounds.size.height - 1;

    CGEventRef event = CGEventCreateMouseEvent(nullptr, kCGEventMouseMoved, target, kCGMouseButtonLeft);
    if (event) {
        CGEventSetIntegerValueField(event, kCGMouseEventDeltaX, static_cast<int64_t>(dx));
        CGEventSetIntegerValueField(event, kCGMouseEventDeltaY, static_cast<int64_t>(dy));
    }
    return post(event, "mouse move");
}

common::EmptyResult MacOSInputInjector::click(interfaces::MouseButton button, std::optional<bool> pressed) {
    std::lock_guard<std::mutex> lock(mutex_);

    CGEventType down_type = kCGEventLeftMouseDown;
    CGEventType up_type = kCGEventLeftMouseUp;
    CGMouseButton cg_button = kCGMouseButtonLeft;
    switch (button) {
        case interfaces::MouseButton::Left:
            break;
        case interfaces::MouseButton::Right:
            down_type = kCGEventRightMouseDown;
            up_type = kCGEventRightMouseUp;
            cg_button = kCGMouseButtonRight;
            break;
        case interfaces::MouseButton::Middle:
            down_type = kCGEventOtherMouseDown;
            up_type = kCGEventOtherMouseUp;
            cg_button = kCGMouseButtonCenter;
            break;
    }

    CGPoint location = current_location();
    if (!pressed.has_value() || *pressed) {
        auto res = post(CGEventCreateMouseEvent(nullptr, down_type, location, cg_button), "mouse down");
        if (res.is_err()) return res;
    }
    if (!pressed.has_value() || !*pressed) {
        auto res = post(CGEventCreateMouseEvent(nullptr, up_type, location, cg_button), "mouse up");
        if (res.is_err()) return res;
    }
    return common::EmptyResult::success();
}

common::EmptyResult MacOSInputInjector::scroll(int dx, int dy) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Wheel 1 is vertical (positive = up), wheel 2 horizontal (positive = left)
    return post(CGEventCreateScrollWheelEvent(nullptr, kCGScrollEventUnitLine, 2,
                                              static_cast<int32_t>(dy), static_cast<int32_t>(-dx)),
                "scroll");
}

common::EmptyResult MacOSInputInjector::press_combination(const std::vector<interfaces::KeyStroke>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CGKeyCode> codes;
    CGEventFlags flags = 0;
    for (const auto& key : keys) {
        CGKeyCode code = key_code_for(key);
        if (code == kNoKey) {
            return common::EmptyResult::err(common::ErrorCode::TranslationError,
                                            "key has no key code: " + interfaces::to_string(key));
        }
        codes.push_back(code);
        flags |= flag_for(key.code);
    }

    for (CGKeyCode code : codes) {
        CGEventRef event = CGEventCreateKeyboardEvent(nullptr, code, true);
        if (event) CGEventSetFlags(event, flags);
        auto res = post(event, "key down");
        if (res.is_err()) return res;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    for (auto it = codes.rbegin(); it != codes.rend(); ++it) {
        CGEventRef event = CGEventCreateKeyboardEvent(nullptr, *it, false);
        if (event) CGEventSetFlags(event, flags);
        auto res = post(event, "key up");
        if (res.is_err()) return res;
    }
    return common::EmptyResult::success();
}

common::EmptyResult MacOSInputInjector::type_text(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);

    CFStringRef string = CFStringCreateWithBytes(nullptr, reinterpret_cast<const UInt8*>(text.data()),
                                                 static_cast<CFIndex>(text.size()), kCFStringEncodingUTF8, false);
    if (!string) {
        return common::EmptyResult::err(common::ErrorCode::TranslationError, "text is not valid UTF-8");
    }

    CFIndex length = CFStringGetLength(string);
    for (CFIndex i = 0; i < length; ++i) {
        UniChar unit = CFStringGetCharacterAtIndex(string, i);
        for (bool is_down : {true, false}) {
            CGEventRef event = CGEventCreateKeyboardEvent(nullptr, 0, is_down);
            if (event) CGEventKeyboardSetUnicodeString(event, 1, &unit);
            auto res = post(event, "text");
            if (res.is_err()) {
                CFRelease(string);
                return res;
            }
        }
    }
    CFRelease(string);
    return common::EmptyResult::success();
}

} // namespace macos
} // namespace platform
