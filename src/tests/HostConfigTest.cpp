// ============================================================================
// Host configuration tests
// ============================================================================
// Defaults, JSON config file overlay, command line flags and validation.
//
// Run with: ./HostConfigTest
// ============================================================================

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "core/HostConfig.hpp"
#include "testing/TestReport.hpp"

using core::HostConfig;
using testing::log_test;

namespace {

bool invalid_args(const std::vector<std::string>& args) {
    auto result = HostConfig::from_args(args);
    return result.is_err() && result.error().code == common::ErrorCode::InvalidArgument;
}

void test_defaults() {
    testing::section("Defaults");

    auto result = HostConfig::from_args({});
    log_test("no arguments is valid", result.is_ok());
    if (result.is_err()) return;

    const HostConfig& c = result.unwrap();
    log_test("server name", c.server_name == "RemoteMouse Pro");
    log_test("pin", c.pin == "123456");
    log_test("ports", c.control_port == 8765 && c.discovery_port == 9876);
    log_test("bind address", c.bind_address == "0.0.0.0");
    log_test("max connections", c.max_connections == 10);
    log_test("auth timeout", c.auth_timeout == std::chrono::milliseconds(5000));
    log_test("pointer scale", c.pointer_scale == 1.5);
    log_test("protocol version", c.version == "2.0");
    log_test("capabilities",
             c.capabilities == std::vector<std::string>({"mouse", "keyboard", "hotkeys", "scroll"}));
    log_test("discovery on", c.discovery_enabled);
    log_test("log level info", c.log_level == common::LogLevel::Info);
}

void test_flags() {
    testing::section("Flags");

    auto result = HostConfig::from_args({"--name", "Den", "--pin", "", "--port", "9000",
                                         "--discovery-port", "9001", "--bind", "127.0.0.1",
                                         "--max-connections", "2", "--auth-timeout", "750",
                                         "--pointer-scale", "2.25", "--no-discovery",
                                         "--log-level", "DEBUG"});
    log_test("all flags accepted", result.is_ok(), result.is_err() ? result.error().message : "");
    if (result.is_err()) return;

    const HostConfig& c = result.unwrap();
    log_test("name and empty pin", c.server_name == "Den" && c.pin.empty());
    log_test("ports", c.control_port == 9000 && c.discovery_port == 9001);
    log_test("bind", c.bind_address == "127.0.0.1");
    log_test("max connections", c.max_connections == 2);
    log_test("auth timeout in ms", c.auth_timeout == std::chrono::milliseconds(750));
    log_test("pointer scale", c.pointer_scale == 2.25);
    log_test("discovery off", !c.discovery_enabled);
    log_test("log level is case-insensitive", c.log_level == common::LogLevel::Debug);

    auto help = HostConfig::from_args({"-h"});
    log_test("help flag", help.is_ok() && help.unwrap().show_help);
}

void test_invalid_flags() {
    testing::section("Invalid flags");

    log_test("unknown option", invalid_args({"--frobnicate", "1"}));
    log_test("missing value", invalid_args({"--port"}));
    log_test("port out of range", invalid_args({"--port", "70000"}));
    log_test("port not a number", invalid_args({"--port", "http"}));
    log_test("zero connections", invalid_args({"--max-connections", "0"}));
    log_test("negative timeout", invalid_args({"--auth-timeout", "-5"}));
    log_test("zero pointer scale", invalid_args({"--pointer-scale", "0"}));
    log_test("pointer scale not a number", invalid_args({"--pointer-scale", "fast"}));
    log_test("same control and discovery port", invalid_args({"--port", "9876"}));
    log_test("bad bind address", invalid_args({"--bind", "not-an-ip"}));
    log_test("bad log level", invalid_args({"--log-level", "chatty"}));
    log_test("empty name", invalid_args({"--name", ""}));
}

void test_json_config() {
    testing::section("JSON config");

    HostConfig c;
    auto applied = c.apply_json(R"({"server_name":"Lab","pin":"42","control_port":7000,
                                    "max_connections":3,"auth_timeout_ms":1200,
                                    "pointer_scale":1.0,"discovery_enabled":false,
                                    "capabilities":["mouse"],"log_level":"warn"})");
    log_test("config object applied", applied.is_ok(), applied.is_err() ? applied.error().message : "");
    log_test("values taken from config",
             c.server_name == "Lab" && c.pin == "42" && c.control_port == 7000 && c.max_connections == 3 &&
             c.auth_timeout == std::chrono::milliseconds(1200) && c.pointer_scale == 1.0 &&
             !c.discovery_enabled && c.capabilities == std::vector<std::string>({"mouse"}) &&
             c.log_level == common::LogLevel::Warn);

    HostConfig unknown;
    log_test("unknown key rejected", unknown.apply_json(R"({"colour":"blue"})").is_err());
    HostConfig wrong_type;
    log_test("wrong type rejected", wrong_type.apply_json(R"({"control_port":"8765"})").is_err());
    HostConfig not_object;
    log_test("non-object rejected", not_object.apply_json("[]").is_err());

    const std::string path = "host_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"server_name":"From File","control_port":7100})";
    }
    auto layered = HostConfig::from_args({"--port", "7200", "--config", path});
    log_test("flags override the config file wherever they appear",
             layered.is_ok() && layered.unwrap().server_name == "From File" &&
             layered.unwrap().control_port == 7200);
    std::remove(path.c_str());

    log_test("missing config file", invalid_args({"--config", "does/not/exist.json"}));
}

} // namespace

int main() {
    std::cout << "Host Config Test Suite" << std::endl;
    std::cout << "======================" << std::endl;

    test_defaults();
    test_flags();
    test_invalid_flags();
    test_json_config();

    return testing::print_summary("HOST CONFIG");
}
