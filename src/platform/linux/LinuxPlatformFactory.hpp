#pragma once
#include "interfaces/IPlatformFactory.hpp"

#ifdef REMOTEMOUSE_PLATFORM_LINUX

namespace platform {
namespace linux_os {

// ============================================================================
// LinuxPlatformFactory - Factory for Linux platform components
// ============================================================================

class LinuxPlatformFactory final : public interfaces::IPlatformFactory {
public:
    LinuxPlatformFactory() = default;
    ~LinuxPlatformFactory() override = default;

    std::shared_ptr<interfaces::IInputInjector> create_input_injector() override;

    interfaces::HostOs host_os() const noexcept override { return interfaces::HostOs::Linux; }

    const char* platform_name() const noexcept override { return "Linux"; }

    bool is_current_platform() const noexcept override {
        return REMOTEMOUSE_IS_LINUX;
    }

    void initialize() override;
    void shutdown() override;

private:
    bool initialized_ = false;
};

} // namespace linux_os
} // namespace platform

#endif // REMOTEMOUSE_PLATFORM_LINUX
