#include "LinuxInputInjectorFactory.hpp"
#include "LinuxXTestInjector.hpp"
#include "LinuxUInputInjector.hpp"
#include <cstdlib>
#include <iostream>
#include <vector>

namespace platform {
namespace linux_os {

    const char* to_string(DisplayServer server) noexcept {
        switch (server) {
            case DisplayServer::X11:     return "x11";
            case DisplayServer::Wayland: return "wayland";
            case DisplayServer::Unknown: return "unknown";
        }
        return "unknown";
    }

    DisplayServer LinuxInputInjectorFactory::detect_display_server() {
        const char* wayland_display = std::getenv("WAYLAND_DISPLAY");
        if (wayland_display && wayland_display[0] != '\0') {
            return DisplayServer::Wayland;
        }

        // XDG_SESSION_TYPE (systemd-logind sessions)
        const char* session_type = std::getenv("XDG_SESSION_TYPE");
        if (session_type) {
            std::string type(session_type);
            if (type == "wayland") return DisplayServer::Wayland;
            if (type == "x11") return DisplayServer::X11;
        }

        const char* display = std::getenv("DISPLAY");
        if (display && display[0] != '\0') {
            return DisplayServer::X11;
        }

        return DisplayServer::Unknown;
    }

    std::shared_ptr<interfaces::IInputInjector> LinuxInputInjectorFactory::create_xtest() {
        auto xtest = std::make_shared<LinuxXTestInjector>();
        if (xtest->is_available()) {
            return xtest;
        }
        return nullptr;
    }

    std::shared_ptr<interfaces::IInputInjector> LinuxInputInjectorFactory::create_uinput() {
        auto uinput = std::make_shared<LinuxUInputInjector>();
        if (uinput->is_available()) {
            return uinput;
        }
        return nullptr;
    }

    std::shared_ptr<interfaces::IInputInjector> LinuxInputInjectorFactory::create() {
        using Creator = std::shared_ptr<interfaces::IInputInjector> (*)();

        DisplayServer server = detect_display_server();
        std::cout << "[LinuxInputInjectorFactory] Detected display server: " << to_string(server) << std::endl;

        std::vector<Creator> order;
        if (server == DisplayServer::Wayland) {
            order = {&create_uinput};
        } else {
            order = {&create_xtest, &create_uinput};
        }

        for (auto creator : order) {
            auto injector = creator();
            if (injector) {
                std::cout << "[LinuxInputInjectorFactory] Using " << injector->name() << " injector" << std::endl;
                return injector;
            }
        }

        std::cerr << "[LinuxInputInjectorFactory] ERROR: No input injection method available!" << std::endl;
        std::cerr << "[LinuxInputInjectorFactory] Remote input is DISABLED." << std::endl;
        std::cerr << "  - For X11: install libxtst and run inside the X11 session" << std::endl;
        std::cerr << "  - For Wayland: sudo usermod -aG input $USER (then re-login)" << std::endl;
        return nullptr;
    }

} // namespace linux_os
} // namespace platform
