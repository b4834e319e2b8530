#pragma once
#include "interfaces/IPlatformFactory.hpp"

#ifdef REMOTEMOUSE_PLATFORM_MACOS

namespace platform {
namespace macos {

/**
 * macOS Platform Factory
 *
 * Creates the Quartz input binding
 */
class MacOSPlatformFactory final : public interfaces::IPlatformFactory {
public:
    MacOSPlatformFactory() = default;
    ~MacOSPlatformFactory() override = default;

    std::shared_ptr<interfaces::IInputInjector> create_input_injector() override;

    interfaces::HostOs host_os() const noexcept override { return interfaces::HostOs::MacOS; }

    const char* platform_name() const noexcept override { return "macOS"; }
    bool is_current_platform() const noexcept override { return REMOTEMOUSE_IS_MACOS; }

    // Lifecycle
    void initialize() override;
    void shutdown() override;

private:
    bool initialized_ = false;
};

} // namespace macos
} // namespace platform

#endif // REMOTEMOUSE_PLATFORM_MACOS
