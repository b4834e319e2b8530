#include "core/PlatformRegistry.hpp"

namespace core {

PlatformRegistry& PlatformRegistry::instance() {
    static PlatformRegistry registry;
    return registry;
}

PlatformRegistry::~PlatformRegistry() {
    shutdown();
}

void PlatformRegistry::register_factory(std::unique_ptr<interfaces::IPlatformFactory> factory) {
    if (!factory) return;

    std::lock_guard<std::mutex> lock(mutex_);
    factories_.push_back(std::move(factory));
}

common::Result<interfaces::IPlatformFactory*> PlatformRegistry::current_platform() {
    using R = common::Result<interfaces::IPlatformFactory*>;
    std::lock_guard<std::mutex> lock(mutex_);

    if (current_) return R::ok(current_);

    for (auto& factory : factories_) {
        if (factory->is_current_platform()) {
            factory->initialize();
            current_ = factory.get();
            return R::ok(current_);
        }
    }
    return R::err(common::ErrorCode::NotInitialized,
                  "no platform support compiled in for this OS (" +
                      std::to_string(factories_.size()) + " registered)",
                  "PlatformRegistry::current_platform");
}

common::Result<HostBinding> PlatformRegistry::host_binding() {
    auto platform = current_platform();
    if (platform.is_err()) {
        return common::Result<HostBinding>::err(platform.error());
    }

    auto* factory = platform.unwrap();
    HostBinding binding;
    binding.host_os = factory->host_os();
    binding.platform_name = factory->platform_name();
    binding.injector = factory->create_input_injector();
    return common::Result<HostBinding>::ok(binding);
}

void PlatformRegistry::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_) return;

    current_->shutdown();
    current_ = nullptr;
}

} // namespace core
