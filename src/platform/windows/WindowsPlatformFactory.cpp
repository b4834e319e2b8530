#ifdef REMOTEMOUSE_PLATFORM_WINDOWS

#include "core/NetworkDefs.hpp"
#include "WindowsPlatformFactory.hpp"
#include "WindowsInputInjector.hpp"
#include <iostream>

namespace platform {
namespace windows_os {

std::shared_ptr<interfaces::IInputInjector> WindowsPlatformFactory::create_input_injector() {
    return std::make_shared<WindowsInputInjector>();
}

void WindowsPlatformFactory::initialize() {
    if (initialized_) return;

    // Relative motion must match what the user sees on high-DPI displays
    SetProcessDPIAware();
    init_network();

    initialized_ = true;
    std::cout << "[WindowsPlatform] Ready" << std::endl;
}

void WindowsPlatformFactory::shutdown() {
    if (!initialized_) return;
    cleanup_network();
    initialized_ = false;
}

} // namespace windows_os
} // namespace platform

#endif // REMOTEMOUSE_PLATFORM_WINDOWS
