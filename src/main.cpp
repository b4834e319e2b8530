/**
 * RemoteMouse Host
 *
 * Accepts remote-control clients over WebSocket and injects their pointer
 * and keyboard input into this machine.
 *
 *   ┌──────────────────┐   UDP 9876    ┌──────────────────────┐
 *   │DiscoveryResponder│◄──────────────│  client broadcasts   │
 *   └──────────────────┘               └──────────────────────┘
 *   ┌──────────────────┐   WS 8765
 *   │  ControlServer   │◄────────────── client sessions
 *   └────────┬─────────┘
 *            ▼
 *   ┌──────────────────┐     ┌─────────────────┐     ┌────────────────┐
 *   │  SessionManager  │────►│ InputTranslator │────►│ IInputInjector │
 *   │ (PIN, capacity)  │     │ (command dispatch)    │ (per platform) │
 *   └──────────────────┘     └─────────────────┘     └────────────────┘
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "common/Logger.hpp"
#include "core/ControlServer.hpp"
#include "core/DiscoveryResponder.hpp"
#include "core/HostConfig.hpp"
#include "core/InputTranslator.hpp"
#include "core/NetworkDefs.hpp"
#include "core/PlatformRegistry.hpp"
#include "core/SessionManager.hpp"

#ifdef REMOTEMOUSE_PLATFORM_LINUX
#include "platform/linux/LinuxPlatformFactory.hpp"
#endif
#ifdef REMOTEMOUSE_PLATFORM_WINDOWS
#include "platform/windows/WindowsPlatformFactory.hpp"
#endif
#ifdef REMOTEMOUSE_PLATFORM_MACOS
#include "platform/macos/MacOSPlatformFactory.hpp"
#endif

namespace {

std::atomic<bool> g_stop_requested{false};

void on_signal(int) {
    g_stop_requested = true;
}

void register_platforms() {
    auto& registry = core::PlatformRegistry::instance();
#ifdef REMOTEMOUSE_PLATFORM_LINUX
    registry.register_factory(std::make_unique<platform::linux_os::LinuxPlatformFactory>());
#endif
#ifdef REMOTEMOUSE_PLATFORM_WINDOWS
    registry.register_factory(std::make_unique<platform::windows_os::WindowsPlatformFactory>());
#endif
#ifdef REMOTEMOUSE_PLATFORM_MACOS
    registry.register_factory(std::make_unique<platform::macos::MacOSPlatformFactory>());
#endif
    (void)registry;
}

int run_host(const core::HostConfig& config) {
    auto logger = std::make_shared<common::ConsoleLogger>(config.log_level);

    register_platforms();
    auto binding = core::PlatformRegistry::instance().host_binding();

    interfaces::HostOs host_os = interfaces::HostOs::Linux;
    std::shared_ptr<interfaces::IInputInjector> injector;
    if (binding.is_ok()) {
        host_os = binding.unwrap().host_os;
        injector = binding.unwrap().injector;
        logger->info("[Host] Platform: " + binding.unwrap().platform_name);
    } else {
        logger->error("[Host] " + binding.error().message);
    }
    if (injector) {
        logger->info(std::string("[Host] Input backend: ") + injector->name());
    } else {
        logger->warn("[Host] No input backend available, sessions will receive errors for input");
    }

    auto translator = std::make_shared<core::InputTranslator>(injector, host_os, config.pointer_scale, logger);

    core::SessionSettings settings;
    settings.server_name = config.server_name;
    settings.pin = config.pin;
    settings.max_sessions = config.max_connections;
    settings.capabilities = config.capabilities;
    auto sessions = std::make_shared<core::SessionManager>(settings, translator, logger);

    core::ControlServerConfig server_config;
    server_config.bind_address = config.bind_address;
    server_config.port = config.control_port;
    server_config.auth_timeout = config.auth_timeout;
    core::ControlServer server(server_config, sessions, logger);

    auto started = server.start();
    if (started.is_err()) {
        logger->error("[Host] " + started.error().message);
        core::PlatformRegistry::instance().shutdown();
        return 1;
    }

    core::HostRecord advertisement;
    advertisement.name = config.server_name;
    advertisement.address = core::detect_local_ip();
    advertisement.advertised_ip = advertisement.address;
    advertisement.port = server.port();
    advertisement.version = config.version;
    advertisement.pin_required = !config.pin.empty();
    advertisement.capabilities = config.capabilities;

    std::unique_ptr<core::DiscoveryResponder> responder;
    if (config.discovery_enabled) {
        responder = std::make_unique<core::DiscoveryResponder>(config.discovery_port, advertisement, logger);
        auto responding = responder->start();
        if (responding.is_err()) {
            // Manual entry still works without discovery
            logger->warn("[Host] Discovery disabled: " + responding.error().message);
            responder.reset();
        }
    }

    logger->info("[Host] '" + config.server_name + "' ready at " + advertisement.address + ":" +
                 std::to_string(server.port()) + (config.pin.empty() ? " (no PIN)" : " (PIN required)"));

    while (!g_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    logger->info("[Host] Shutting down...");
    if (responder) responder->stop();
    server.stop();
    core::PlatformRegistry::instance().shutdown();
    logger->info("[Host] Stopped");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "remotemouse_host";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto parsed = core::HostConfig::from_args(args);
    if (parsed.is_err()) {
        std::cerr << "Error: " << parsed.error().message << "\n\n";
        std::cerr << core::HostConfig::usage(program);
        return 2;
    }
    const core::HostConfig& config = parsed.unwrap();
    if (config.show_help) {
        std::cout << core::HostConfig::usage(program);
        return 0;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    init_network();
    int code = 1;
    try {
        code = run_host(config);
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        code = 1;
    }
    cleanup_network();
    return code;
}
