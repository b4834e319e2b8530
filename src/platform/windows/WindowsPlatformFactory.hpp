#pragma once
#include "interfaces/IPlatformFactory.hpp"

#ifdef REMOTEMOUSE_PLATFORM_WINDOWS

namespace platform {
namespace windows_os {

// ============================================================================
// WindowsPlatformFactory - Factory for Windows platform components
// ============================================================================

class WindowsPlatformFactory final : public interfaces::IPlatformFactory {
public:
    WindowsPlatformFactory() = default;
    ~WindowsPlatformFactory() override = default;

    std::shared_ptr<interfaces::IInputInjector> create_input_injector() override;

    interfaces::HostOs host_os() const noexcept override { return interfaces::HostOs::Windows; }

    const char* platform_name() const noexcept override { return "Windows"; }

    bool is_current_platform() const noexcept override {
        return REMOTEMOUSE_IS_WINDOWS;
    }

    void initialize() override;
    void shutdown() override;

private:
    bool initialized_ = false;
};

} // namespace windows_os
} // namespace platform

#endif // REMOTEMOUSE_PLATFORM_WINDOWS
