#ifdef REMOTEMOUSE_PLATFORM_MACOS

#include "MacOSPlatformFactory.hpp"
#include "MacOSInputInjector.hpp"
#include <iostream>

namespace platform {
namespace macos {

std::shared_ptr<interfaces::IInputInjector> MacOSPlatformFactory::create_input_injector() {
    return std::make_shared<MacOSInputInjector>();
}

void MacOSPlatformFactory::initialize() {
    if (initialized_) return;
    if (!MacOSInputInjector::has_accessibility_permission()) {
        std::cerr << "[MacOSPlatform] Accessibility permission missing; input events will be ignored" << std::endl;
    }
    initialized_ = true;
}

void MacOSPlatformFactory::shutdown() {
    initialized_ = false;
}

} // namespace macos
} // namespace platform

#endif // REMOTEMOUSE_PLATFORM_MACOS
