#include "core/HostConfig.hpp"
#include "core/NetworkDefs.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace core {

using nlohmann::json;

namespace {

    common::EmptyResult invalid(const std::string& msg) {
        return common::EmptyResult::err(common::ErrorCode::InvalidArgument, msg);
    }

    common::EmptyResult parse_port(const std::string& text, const std::string& flag, uint16_t& out) {
        if (text.empty() || text.size() > 5 || text.find_first_not_of("0123456789") != std::string::npos) {
            return invalid(flag + ": not a port number: " + text);
        }
        int value = std::stoi(text);
        if (value <= 0 || value > 65535) return invalid(flag + ": port out of range: " + text);
        out = static_cast<uint16_t>(value);
        return common::EmptyResult::success();
    }

    common::EmptyResult parse_count(const std::string& text, const std::string& flag, long long& out) {
        if (text.empty() || text.size() > 9 || text.find_first_not_of("0123456789") != std::string::npos) {
            return invalid(flag + ": not a positive integer: " + text);
        }
        out = std::stoll(text);
        return common::EmptyResult::success();
    }

    common::EmptyResult parse_double(const std::string& text, const std::string& flag, double& out) {
        std::istringstream ss(text);
        double value = 0;
        ss >> value;
        if (ss.fail() || !ss.eof()) return invalid(flag + ": not a number: " + text);
        out = value;
        return common::EmptyResult::success();
    }

    std::string read_file(const std::string& path, bool& ok) {
        std::ifstream in(path);
        ok = in.good();
        if (!ok) return "";
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

} // namespace

common::EmptyResult HostConfig::apply_json(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return invalid("config: not a JSON object");
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        if (key == "server_name" || key == "pin" || key == "bind_address" || key == "log_level") {
            if (!value.is_string()) return invalid("config: " + key + " must be a string");
            std::string s = value.get<std::string>();
            if (key == "server_name") server_name = s;
            else if (key == "pin") pin = s;
            else if (key == "bind_address") bind_address = s;
            else if (!common::parse_log_level(s, log_level)) return invalid("config: unknown log level " + s);
        } else if (key == "control_port" || key == "discovery_port") {
            if (!value.is_number_integer()) return invalid("config: " + key + " must be an integer");
            auto port = value.get<int64_t>();
            if (port <= 0 || port > 65535) return invalid("config: " + key + " out of range");
            (key == "control_port" ? control_port : discovery_port) = static_cast<uint16_t>(port);
        } else if (key == "max_connections") {
            if (!value.is_number_integer() || value.get<int64_t>() < 1) {
                return invalid("config: max_connections must be a positive integer");
            }
            max_connections = static_cast<size_t>(value.get<int64_t>());
        } else if (key == "auth_timeout_ms") {
            if (!value.is_number_integer() || value.get<int64_t>() < 1) {
                return invalid("config: auth_timeout_ms must be a positive integer");
            }
            auth_timeout = std::chrono::milliseconds(value.get<int64_t>());
        } else if (key == "pointer_scale") {
            if (!value.is_number()) return invalid("config: pointer_scale must be a number");
            pointer_scale = value.get<double>();
        } else if (key == "discovery_enabled") {
            if (!value.is_boolean()) return invalid("config: discovery_enabled must be a boolean");
            discovery_enabled = value.get<bool>();
        } else if (key == "capabilities") {
            if (!value.is_array()) return invalid("config: capabilities must be an array");
            std::vector<std::string> caps;
            for (const auto& c : value) {
                if (!c.is_string()) return invalid("config: capabilities must contain strings");
                caps.push_back(c.get<std::string>());
            }
            capabilities = caps;
        } else {
            return invalid("config: unknown key " + key);
        }
    }
    return validate();
}

common::EmptyResult HostConfig::validate() const {
    if (server_name.empty()) return invalid("server name must not be empty");
    if (max_connections < 1) return invalid("max connections must be at least 1");
    if (auth_timeout.count() <= 0) return invalid("auth timeout must be positive");
    if (!(pointer_scale > 0.0) || pointer_scale > 100.0) return invalid("pointer scale must be in (0, 100]");
    if (control_port == discovery_port) return invalid("control and discovery ports must differ");

    in_addr probe;
    if (inet_pton(AF_INET, bind_address.c_str(), &probe) != 1) {
        return invalid("invalid bind address: " + bind_address);
    }
    return common::EmptyResult::success();
}

common::Result<HostConfig> HostConfig::from_args(const std::vector<std::string>& args) {
    using ConfigResult = common::Result<HostConfig>;
    HostConfig config;

    // A config file is applied first so flags override it wherever they appear
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] != "--config") continue;
        if (i + 1 >= args.size()) return ConfigResult::err(common::ErrorCode::InvalidArgument, "--config needs a path");
        bool ok = false;
        std::string text = read_file(args[i + 1], ok);
        if (!ok) {
            return ConfigResult::err(common::ErrorCode::InvalidArgument, "cannot read config file " + args[i + 1]);
        }
        auto applied = config.apply_json(text);
        if (applied.is_err()) return ConfigResult::err(applied.error());
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];

        if (flag == "--help" || flag == "-h") { config.show_help = true; continue; }
        if (flag == "--no-discovery") { config.discovery_enabled = false; continue; }

        if (i + 1 >= args.size()) {
            return ConfigResult::err(common::ErrorCode::InvalidArgument, "unknown option or missing value: " + flag);
        }
        const std::string& value = args[++i];
        common::EmptyResult rc = common::EmptyResult::success();

        if (flag == "--config") {
            continue;
        } else if (flag == "--name") {
            config.server_name = value;
        } else if (flag == "--pin") {
            config.pin = value;
        } else if (flag == "--port") {
            rc = parse_port(value, flag, config.control_port);
        } else if (flag == "--discovery-port") {
            rc = parse_port(value, flag, config.discovery_port);
        } else if (flag == "--bind") {
            config.bind_address = value;
        } else if (flag == "--max-connections") {
            long long n = 0;
            rc = parse_count(value, flag, n);
            if (rc.is_ok()) config.max_connections = static_cast<size_t>(n);
        } else if (flag == "--auth-timeout") {
            long long ms = 0;
            rc = parse_count(value, flag, ms);
            if (rc.is_ok()) config.auth_timeout = std::chrono::milliseconds(ms);
        } else if (flag == "--pointer-scale") {
            rc = parse_double(value, flag, config.pointer_scale);
        } else if (flag == "--log-level") {
            if (!common::parse_log_level(value, config.log_level)) {
                rc = invalid("--log-level: unknown level " + value);
            }
        } else {
            rc = invalid("unknown option: " + flag);
        }

        if (rc.is_err()) return ConfigResult::err(rc.error());
    }

    auto valid = config.validate();
    if (valid.is_err()) return ConfigResult::err(valid.error());
    return config;
}

std::string HostConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --config PATH            JSON file with any of the settings below\n"
        << "  --name NAME              advertised server name (default \"RemoteMouse Pro\")\n"
        << "  --pin PIN                pairing PIN, empty disables it (default 123456)\n"
        << "  --port N                 control port (default 8765)\n"
        << "  --discovery-port N       UDP discovery port (default 9876)\n"
        << "  --bind ADDR              listen address (default 0.0.0.0)\n"
        << "  --max-connections N      session cap (default 10)\n"
        << "  --auth-timeout MS        time allowed for Hello (default 5000)\n"
        << "  --pointer-scale X        relative motion multiplier (default 1.5)\n"
        << "  --no-discovery           do not answer discovery broadcasts\n"
        << "  --log-level LEVEL        debug|info|warn|error (default info)\n";
    return out.str();
}

} // namespace core
