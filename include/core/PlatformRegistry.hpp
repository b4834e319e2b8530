#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "common/Result.hpp"
#include "interfaces/IPlatformFactory.hpp"

namespace core {

// The OS pieces the host needs, resolved once at startup
struct HostBinding {
    interfaces::HostOs host_os = interfaces::HostOs::Linux;
    std::string platform_name;
    std::shared_ptr<interfaces::IInputInjector> injector; // null: no usable backend
};

// ============================================================================
// PlatformRegistry - Singleton registry for platform factories
// ============================================================================
// main() registers the factories compiled in for this build; the first one
// reporting is_current_platform() is initialized and used for the process
// lifetime.
//
// Usage:
//   PlatformRegistry::instance().register_factory(
//       std::make_unique<LinuxPlatformFactory>());
//   auto binding = PlatformRegistry::instance().host_binding();
// ============================================================================

class PlatformRegistry {
public:
    static PlatformRegistry& instance();

    PlatformRegistry(const PlatformRegistry&) = delete;
    PlatformRegistry& operator=(const PlatformRegistry&) = delete;

    void register_factory(std::unique_ptr<interfaces::IPlatformFactory> factory);

    // Factory for the running OS, initialized on first access.
    // NotInitialized when none of the registered factories matches.
    common::Result<interfaces::IPlatformFactory*> current_platform();

    // current_platform() plus its input injector
    common::Result<HostBinding> host_binding();

    // Shut down the initialized platform. Idempotent.
    void shutdown();

private:
    PlatformRegistry() = default;
    ~PlatformRegistry();

    std::mutex mutex_;
    std::vector<std::unique_ptr<interfaces::IPlatformFactory>> factories_;
    interfaces::IPlatformFactory* current_ = nullptr;
};

} // namespace core
