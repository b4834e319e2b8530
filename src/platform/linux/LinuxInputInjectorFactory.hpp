#pragma once
#include "interfaces/IInputInjector.hpp"
#include <memory>
#include <string>

namespace platform {
namespace linux_os {

    enum class DisplayServer {
        X11,
        Wayland,
        Unknown
    };

    /**
     * Picks the Linux input backend for the current session.
     *
     * - X11: XTest first, uinput as fallback
     * - Wayland: uinput only (XTest events never reach Wayland clients)
     * - Unknown (headless, ssh): XTest, then uinput
     */
    class LinuxInputInjectorFactory {
    public:
        // nullptr if no backend can be opened
        static std::shared_ptr<interfaces::IInputInjector> create();

        static std::shared_ptr<interfaces::IInputInjector> create_xtest();
        static std::shared_ptr<interfaces::IInputInjector> create_uinput();

        static DisplayServer detect_display_server();
    };

    const char* to_string(DisplayServer server) noexcept;

} // namespace linux_os
} // namespace platform
