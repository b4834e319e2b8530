#ifdef REMOTEMOUSE_PLATFORM_LINUX

#include "LinuxPlatformFactory.hpp"
#include "LinuxInputInjectorFactory.hpp"
#include <iostream>

namespace platform {
namespace linux_os {

std::shared_ptr<interfaces::IInputInjector> LinuxPlatformFactory::create_input_injector() {
    return LinuxInputInjectorFactory::create();
}

void LinuxPlatformFactory::initialize() {
    if (initialized_) return;
    std::cout << "[LinuxPlatform] Display server: "
              << to_string(LinuxInputInjectorFactory::detect_display_server()) << std::endl;
    initialized_ = true;
}

void LinuxPlatformFactory::shutdown() {
    if (!initialized_) return;
    std::cout << "[LinuxPlatform] Shutting down" << std::endl;
    initialized_ = false;
}

} // namespace linux_os
} // namespace platform

#endif // REMOTEMOUSE_PLATFORM_LINUX
