#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/Protocol.hpp"

namespace core {

/**
 * @brief Host process configuration.
 *
 * Defaults, then an optional JSON file (--config), then command line flags.
 * Every source is validated; bad values are InvalidArgument errors.
 */
struct HostConfig {
    std::string server_name = "RemoteMouse Pro";
    std::string pin = "123456";                 // empty: no PIN required
    uint16_t control_port = protocol::DEFAULT_CONTROL_PORT;
    uint16_t discovery_port = protocol::DEFAULT_DISCOVERY_PORT;
    std::string bind_address = "0.0.0.0";
    size_t max_connections = 10;
    std::chrono::milliseconds auth_timeout{5000};
    double pointer_scale = 1.5;
    std::string version = protocol::PROTOCOL_VERSION;
    std::vector<std::string> capabilities{"mouse", "keyboard", "hotkeys", "scroll"};
    bool discovery_enabled = true;
    common::LogLevel log_level = common::LogLevel::Info;
    bool show_help = false;

    // Overlay the keys present in a JSON object onto this config
    common::EmptyResult apply_json(const std::string& text);

    common::EmptyResult validate() const;

    // argv without the program name
    static common::Result<HostConfig> from_args(const std::vector<std::string>& args);

    static std::string usage(const std::string& program);
};

} // namespace core
