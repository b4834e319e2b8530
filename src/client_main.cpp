/**
 * RemoteMouse Client (console)
 *
 * Line-oriented front end over client::RemoteControlClient: discover hosts,
 * connect with a PIN and send pointer/keyboard input. Connection state
 * changes are printed as they happen.
 */

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "client/EventLoop.hpp"
#include "client/FileSettingsStore.hpp"
#include "client/RemoteControlClient.hpp"
#include "client/WebSocketChannel.hpp"
#include "common/Logger.hpp"
#include "core/NetworkDefs.hpp"

namespace {

struct ClientArgs {
    std::string store_path = "remotemouse_client.json";
    std::string broadcast_address = "255.255.255.255";
    uint16_t discovery_port = core::protocol::DEFAULT_DISCOVERY_PORT;
    common::LogLevel log_level = common::LogLevel::Warn;
    std::string connect_to;
    std::string pin;
    bool show_help = false;
};

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --store <file>          Saved hosts file (default remotemouse_client.json)\n"
        << "  --discovery-port <n>    UDP discovery port (default 9876)\n"
        << "  --broadcast <addr>      Discovery broadcast address (default 255.255.255.255)\n"
        << "  --log-level <level>     debug, info, warn or error (default warn)\n"
        << "  --connect <host[:port]> Connect on startup\n"
        << "  --pin <pin>             PIN for --connect\n"
        << "  --help                  Show this help\n";
    return out.str();
}

common::Result<ClientArgs> parse_args(const std::vector<std::string>& args) {
    using R = common::Result<ClientArgs>;
    ClientArgs parsed;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (flag == "--help" || flag == "-h") {
            parsed.show_help = true;
            continue;
        }
        if (i + 1 >= args.size()) {
            return R::err(common::ErrorCode::InvalidArgument, "missing value for " + flag);
        }
        const std::string& value = args[++i];
        if (flag == "--store") {
            parsed.store_path = value;
        } else if (flag == "--broadcast") {
            parsed.broadcast_address = value;
        } else if (flag == "--discovery-port") {
            std::istringstream in(value);
            unsigned long port = 0;
            if (!(in >> port) || !in.eof() || port == 0 || port > 65535) {
                return R::err(common::ErrorCode::InvalidArgument, "invalid port: " + value);
            }
            parsed.discovery_port = static_cast<uint16_t>(port);
        } else if (flag == "--log-level") {
            if (!common::parse_log_level(value, parsed.log_level)) {
                return R::err(common::ErrorCode::InvalidArgument, "invalid log level: " + value);
            }
        } else if (flag == "--connect") {
            parsed.connect_to = value;
        } else if (flag == "--pin") {
            parsed.pin = value;
        } else {
            return R::err(common::ErrorCode::InvalidArgument, "unknown option: " + flag);
        }
    }
    return R::ok(parsed);
}

void print_help() {
    std::cout << "Commands:\n"
              << "  hosts                      List discovered and saved hosts\n"
              << "  scan [stop]                Start or stop LAN discovery\n"
              << "  add <host[:port]> [name]   Save a host by address\n"
              << "  forget <address>           Remove a saved host\n"
              << "  connect <#|host[:port]> [pin]\n"
              << "  disconnect | retry | status\n"
              << "  move <dx> <dy>             Relative pointer move\n"
              << "  click [left|right|middle] [down|up]\n"
              << "  key <text>                 Type text\n"
              << "  hotkey <k1+k2+...>         e.g. hotkey cmd+c\n"
              << "  scroll <dx> <dy>\n"
              << "  ping | help | quit\n";
}

void print_hosts(const std::vector<core::HostRecord>& hosts) {
    if (hosts.empty()) {
        std::cout << "No hosts known. Try 'scan' or 'add <host>'.\n";
        return;
    }
    for (size_t i = 0; i < hosts.size(); ++i) {
        const auto& h = hosts[i];
        std::cout << "  [" << i << "] " << h.name << "  " << h.address << ":" << h.port
                  << (h.pin_required ? "  (PIN)" : "") << "\n";
    }
}

void print_status(const client::ConnectionStatus& status) {
    std::cout << "[Status] " << client::to_string(status.state);
    if (status.host) std::cout << " " << status.host->name << " (" << status.host->address << ")";
    if (status.state == client::ConnectionState::Reconnecting) {
        std::cout << " attempt " << status.retry_count << " in " << status.next_retry_delay.count() << "ms";
    }
    if (!status.last_error.empty()) std::cout << " - " << status.last_error;
    std::cout << std::endl;
}

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(text);
    while (std::getline(in, part, separator)) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

// Index into the discovered list, or an endpoint typed by hand
common::Result<core::HostRecord> resolve_host(client::RemoteControlClient& client, const std::string& target) {
    auto hosts = client.discovered_hosts();
    std::istringstream in(target);
    size_t index = 0;
    if ((in >> index) && in.eof()) {
        if (index >= hosts.size()) {
            return common::Result<core::HostRecord>::err(common::ErrorCode::InvalidArgument,
                                                         "no host #" + target);
        }
        return common::Result<core::HostRecord>::ok(hosts[index]);
    }
    for (const auto& h : hosts) {
        if (h.address == target) return common::Result<core::HostRecord>::ok(h);
    }
    return core::parse_host_endpoint(target);
}

// Returns false on quit
bool handle_command(client::RemoteControlClient& client, const std::string& line) {
    std::istringstream in(line);
    std::string command;
    if (!(in >> command)) return true;

    if (command == "quit" || command == "exit") return false;

    if (command == "help") {
        print_help();
    } else if (command == "hosts" || command == "list") {
        print_hosts(client.discovered_hosts());
    } else if (command == "scan") {
        std::string arg;
        in >> arg;
        if (arg == "stop") {
            client.stop_discovery();
            std::cout << "Discovery stopped\n";
        } else {
            client.start_discovery();
            std::cout << "Discovering hosts...\n";
        }
    } else if (command == "add") {
        std::string endpoint;
        std::string name;
        in >> endpoint;
        std::getline(in >> std::ws, name);
        auto added = client.add_manual_host(endpoint, name);
        if (added.is_err()) {
            std::cout << "Error: " << added.error().message << "\n";
        } else {
            std::cout << "Saved " << added.unwrap().address << ":" << added.unwrap().port << "\n";
        }
    } else if (command == "forget") {
        std::string address;
        in >> address;
        std::cout << (client.forget_host(address) ? "Forgotten\n" : "Unknown host\n");
    } else if (command == "connect") {
        std::string target;
        std::string pin;
        in >> target >> pin;
        auto host = resolve_host(client, target);
        if (host.is_err()) {
            std::cout << "Error: " << host.error().message << "\n";
        } else {
            client.connect(host.unwrap(), pin);
        }
    } else if (command == "disconnect") {
        client.disconnect();
    } else if (command == "retry") {
        client.retry();
    } else if (command == "status") {
        print_status(client.connection_status());
    } else if (command == "move") {
        double dx = 0;
        double dy = 0;
        if (in >> dx >> dy) client.send_move(dx, dy);
        else std::cout << "Usage: move <dx> <dy>\n";
    } else if (command == "click") {
        std::string button = "left";
        std::string phase;
        in >> button >> phase;
        std::optional<bool> down;
        if (phase == "down") down = true;
        if (phase == "up") down = false;
        client.send_click(button, down);
    } else if (command == "key") {
        std::string text;
        std::getline(in >> std::ws, text);
        if (!text.empty()) client.send_key(text);
    } else if (command == "hotkey") {
        std::string combo;
        in >> combo;
        client.send_hotkey(split(combo, '+'));
    } else if (command == "scroll") {
        int dx = 0;
        int dy = 0;
        if (in >> dx >> dy) client.send_scroll(dx, dy);
        else std::cout << "Usage: scroll <dx> <dy>\n";
    } else if (command == "ping") {
        client.send_ping();
    } else {
        std::cout << "Unknown command '" << command << "' (try 'help')\n";
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "remotemouse_client";
    std::vector<std::string> raw(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto parsed = parse_args(raw);
    if (parsed.is_err()) {
        std::cerr << "Error: " << parsed.error().message << "\n\n" << usage(program);
        return 2;
    }
    const ClientArgs& args = parsed.unwrap();
    if (args.show_help) {
        std::cout << usage(program);
        return 0;
    }

    init_network();
    auto logger = std::make_shared<common::ConsoleLogger>(args.log_level, std::cerr);

    auto store = std::make_shared<client::FileSettingsStore>(args.store_path);
    auto loaded = store->load();
    if (loaded.is_err()) {
        logger->warn("[Client] Ignoring settings file: " + loaded.error().message);
    }

    client::ClientOptions options;
    options.discovery.broadcast_address = args.broadcast_address;
    options.discovery.port = args.discovery_port;

    int code = 0;
    client::EventLoop loop(logger);
    try {
        auto connect_timeout = options.reconnect.connect_timeout;
        auto channels = [logger, connect_timeout]() -> std::unique_ptr<interfaces::IClientChannel> {
            return std::make_unique<client::WebSocketChannel>(logger, connect_timeout);
        };
        client::RemoteControlClient client(loop, channels, store, logger, options);
        client.subscribe_status([](const client::ConnectionStatus& status) { print_status(status); });
        client.subscribe_hosts([](const std::vector<core::HostRecord>& hosts) {
            std::cout << "[Discovery] " << hosts.size() << " host(s) found" << std::endl;
        });

        if (!args.connect_to.empty()) {
            auto host = resolve_host(client, args.connect_to);
            if (host.is_err()) {
                std::cerr << "Error: " << host.error().message << "\n";
            } else {
                client.connect(host.unwrap(), args.pin);
            }
        }

        print_help();
        std::string line;
        while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
            if (!handle_command(client, line)) break;
        }

        client.stop_discovery();
        client.disconnect();
        loop.stop();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << "\n";
        code = 1;
    }
    loop.stop();
    cleanup_network();
    return code;
}
