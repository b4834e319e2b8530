#pragma once
#include <memory>
#include <string>
#include "interfaces/IInputInjector.hpp"

namespace interfaces {

// Operating system family the host runs on. Drives logical key resolution
// ("cmd" is Command on macOS and Control elsewhere).
enum class HostOs {
    Linux,
    Windows,
    MacOS
};

inline const char* to_string(HostOs os) noexcept {
    switch (os) {
        case HostOs::Linux:   return "Linux";
        case HostOs::Windows: return "Windows";
        case HostOs::MacOS:   return "macOS";
    }
    return "Linux";
}

// ============================================================================
// IPlatformFactory - Abstract Factory for platform-specific components
// ============================================================================
// Each platform (Windows, Linux, macOS) provides its own implementation.
// The host picks the one for the running OS at startup through
// core::PlatformRegistry; nothing downstream inspects the platform again.
//
// Usage:
//   auto platform = PlatformRegistry::instance().current_platform();
//   auto injector = platform.unwrap()->create_input_injector();
// ============================================================================

class IPlatformFactory {
public:
    virtual ~IPlatformFactory() = default;

    // Create input injector for mouse/keyboard simulation
    // May return nullptr if no injection backend is usable
    virtual std::shared_ptr<IInputInjector> create_input_injector() = 0;

    virtual HostOs host_os() const noexcept = 0;

    // Platform name for logging/debugging (e.g., "Windows", "Linux")
    virtual const char* platform_name() const noexcept = 0;

    // Check if this platform is currently the running platform
    virtual bool is_current_platform() const noexcept = 0;

    // Initialize platform-specific resources (called once before first use)
    virtual void initialize() {}

    // Cleanup platform-specific resources
    virtual void shutdown() {}
};

// ============================================================================
// Helper: Platform Detection Macros
// ============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define REMOTEMOUSE_IS_WINDOWS 1
    #define REMOTEMOUSE_IS_LINUX 0
    #define REMOTEMOUSE_IS_MACOS 0
#elif defined(__linux__)
    #define REMOTEMOUSE_IS_WINDOWS 0
    #define REMOTEMOUSE_IS_LINUX 1
    #define REMOTEMOUSE_IS_MACOS 0
#elif defined(__APPLE__)
    #define REMOTEMOUSE_IS_WINDOWS 0
    #define REMOTEMOUSE_IS_LINUX 0
    #define REMOTEMOUSE_IS_MACOS 1
#else
    #define REMOTEMOUSE_IS_WINDOWS 0
    #define REMOTEMOUSE_IS_LINUX 0
    #define REMOTEMOUSE_IS_MACOS 0
#endif

} // namespace interfaces
