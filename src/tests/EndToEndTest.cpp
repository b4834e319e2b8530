// ============================================================================
// Loopback end-to-end tests
// ============================================================================
// A real ControlServer on 127.0.0.1 (free port) with a recording injector,
// driven by the real client stack: EventLoop, WebSocketChannel and
// ConnectionStateMachine.
//
// Run with: ./EndToEndTest
// ============================================================================

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "client/ConnectionStateMachine.hpp"
#include "client/EventLoop.hpp"
#include "client/WebSocketChannel.hpp"
#include "core/ControlServer.hpp"
#include "core/NetworkDefs.hpp"
#include "core/SessionManager.hpp"
#include "core/network/TcpSocket.hpp"
#include "core/network/WebSocket.hpp"
#include "testing/RecordingInputInjector.hpp"
#include "testing/TestReport.hpp"

using namespace std::chrono_literals;
using namespace core::protocol;
using client::ConnectionState;
using testing::log_test;
using testing::wait_until;

namespace {

struct Host {
    std::shared_ptr<testing::RecordingInputInjector> injector = std::make_shared<testing::RecordingInputInjector>();
    std::shared_ptr<core::SessionManager> sessions;
    std::unique_ptr<core::ControlServer> server;

    explicit Host(size_t max_sessions = 10, std::chrono::milliseconds auth_timeout = 5000ms) {
        core::SessionSettings settings;
        settings.server_name = "Loopback";
        settings.pin = "123456";
        settings.max_sessions = max_sessions;
        settings.capabilities = {"mouse", "keyboard", "hotkeys", "scroll"};

        auto translator = std::make_shared<core::InputTranslator>(injector, interfaces::HostOs::Linux, 1.0,
                                                                  common::make_null_logger());
        sessions = std::make_shared<core::SessionManager>(settings, translator, common::make_null_logger());

        core::ControlServerConfig config;
        config.bind_address = "127.0.0.1";
        config.port = 0;
        config.auth_timeout = auth_timeout;
        server = std::make_unique<core::ControlServer>(config, sessions, common::make_null_logger());
    }

    bool start() { return server->start().is_ok(); }

    core::HostRecord record() const {
        core::HostRecord h;
        h.name = "Loopback";
        h.address = "127.0.0.1";
        h.port = server->port();
        return h;
    }
};

// Client side: its own event loop and a state machine that records everything it publishes
struct Client {
    client::EventLoop loop;
    std::shared_ptr<client::ConnectionStateMachine> machine;

    std::mutex mutex;
    std::vector<ConnectionState> states;
    std::vector<ControlMessage> received;

    explicit Client(client::ReconnectPolicy policy = client::ReconnectPolicy()) {
        machine = client::ConnectionStateMachine::create(
            loop,
            []() -> std::unique_ptr<interfaces::IClientChannel> {
                return std::make_unique<client::WebSocketChannel>(common::make_null_logger(), 2000ms);
            },
            common::make_null_logger(),
            policy);
        machine->subscribe([this](const client::ConnectionStatus& s) {
            std::lock_guard<std::mutex> lock(mutex);
            if (states.empty() || states.back() != s.state) states.push_back(s.state);
        });
        machine->set_message_observer([this](const ControlMessage& m) {
            std::lock_guard<std::mutex> lock(mutex);
            received.push_back(m);
        });
    }

    ~Client() {
        machine->reset();
        loop.stop();
        machine.reset();
    }

    ConnectionState state() const { return machine->status().state; }

    bool wait_for(ConnectionState state, std::chrono::milliseconds timeout = 3000ms) {
        return wait_until([&]() { return machine->status().state == state; }, timeout);
    }

    bool saw_sequence(const std::vector<ConnectionState>& expected) {
        std::lock_guard<std::mutex> lock(mutex);
        size_t next = 0;
        for (auto s : states) {
            if (next < expected.size() && s == expected[next]) ++next;
        }
        return next == expected.size();
    }

    bool received_pong() {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& m : received) {
            if (std::holds_alternative<Pong>(m)) return true;
        }
        return false;
    }
};

// Long retry delay so a failure stays observable as Reconnecting(1)
client::ReconnectPolicy slow_retry() {
    client::ReconnectPolicy policy;
    policy.base_delay = 30s;
    policy.max_delay = 30s;
    return policy;
}

void test_session() {
    testing::section("Authenticated session");

    Host host;
    if (!host.start()) {
        log_test("server starts on a free port", false);
        return;
    }
    log_test("server starts on a free port", host.server->port() != 0);

    Client c;
    c.machine->connect(host.record(), "123456");
    bool active = c.wait_for(ConnectionState::Active);
    log_test("client becomes active", active, client::to_string(c.state()));
    if (!active) return;

    auto status = c.machine->status();
    log_test("host name and capabilities from ok",
             status.host && status.host->name == "Loopback" && status.host->capabilities.size() == 4);
    log_test("state sequence", c.saw_sequence({ConnectionState::Connecting, ConnectionState::Authenticating,
                                               ConnectionState::Active}));
    log_test("host sees one authenticated session", host.sessions->session_count() == 1);

    c.machine->send(Click{"left", true});
    c.machine->send(Move{4.0, -2.0});
    c.machine->send(Click{"left", false});
    c.machine->send(Hotkey{{"cmd", "v"}});
    c.machine->send(Scroll{0, 2});
    c.machine->send(Key{"typed"});

    std::vector<std::string> expected = {"click left down", "move 4 -2", "click left up",
                                         "hotkey ctrl+v", "scroll 0 2", "type typed"};
    bool delivered = wait_until([&]() { return host.injector->calls().size() >= expected.size(); });
    log_test("input arrives at the injector in order", delivered && host.injector->calls() == expected);

    c.machine->send(Ping{});
    log_test("ping is answered", wait_until([&]() { return c.received_pong(); }));

    c.machine->send(Hotkey{{"ctrl", "warp"}});
    bool reported = wait_until([&]() { return c.machine->status().last_error == "unknown key: warp"; });
    log_test("translation error comes back and the session stays", reported && c.state() == ConnectionState::Active);

    c.machine->disconnect();
    log_test("disconnect returns to idle", c.wait_for(ConnectionState::Idle));
    log_test("host drops the session", wait_until([&]() { return host.sessions->session_count() == 0; }));

    host.server->stop();
}

void test_wrong_pin() {
    testing::section("Wrong PIN");

    Host host;
    if (!host.start()) {
        log_test("server starts", false);
        return;
    }

    Client c(slow_retry());
    c.machine->connect(host.record(), "000000");
    bool reconnecting = c.wait_for(ConnectionState::Reconnecting);
    auto status = c.machine->status();
    log_test("client goes Disconnected then Reconnecting(1)",
             reconnecting && status.retry_count == 1 &&
             c.saw_sequence({ConnectionState::Authenticating, ConnectionState::Disconnected,
                             ConnectionState::Reconnecting}));
    log_test("invalid pin is the recorded error", status.last_error == "invalid pin", status.last_error);
    log_test("host closed the session", wait_until([&]() { return host.sessions->session_count() == 0; }));
    log_test("no input was injected", host.injector->calls().empty());

    host.server->stop();
}

void test_capacity() {
    testing::section("Capacity");

    Host host(1);
    if (!host.start()) {
        log_test("server starts", false);
        return;
    }

    Client first;
    first.machine->connect(host.record(), "123456");
    log_test("first client active", first.wait_for(ConnectionState::Active));

    Client second(slow_retry());
    second.machine->connect(host.record(), "123456");
    bool refused = second.wait_for(ConnectionState::Reconnecting);
    log_test("second client is refused", refused && second.machine->status().last_error == "server full",
             second.machine->status().last_error);
    log_test("first client unaffected", first.state() == ConnectionState::Active &&
                                            host.sessions->session_count() == 1);

    host.server->stop();
}

void test_auth_timeout() {
    testing::section("Authentication timeout");

    Host host(10, 300ms);
    if (!host.start()) {
        log_test("server starts", false);
        return;
    }

    std::mutex mutex;
    std::vector<std::string> messages;
    std::string closed_reason;
    bool closed = false;

    client::WebSocketChannel channel(common::make_null_logger(), 2000ms);
    interfaces::ChannelHandlers handlers;
    handlers.on_message = [&](const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(text);
    };
    handlers.on_closed = [&](const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
        closed_reason = reason;
    };
    channel.open("127.0.0.1", host.server->port(), handlers);

    bool ended = wait_until([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    });
    log_test("silent client is disconnected", ended);
    {
        std::lock_guard<std::mutex> lock(mutex);
        bool told = !messages.empty();
        if (told) {
            auto decoded = decode(messages.back());
            told = decoded.is_ok() && decoded.unwrap() == ControlMessage(Error{"authentication timeout"});
        }
        log_test("timeout is reported before closing", told);
    }
    channel.close();
    log_test("host removed the session", wait_until([&]() { return host.sessions->session_count() == 0; }));

    host.server->stop();
}

// Peers that start a message or the upgrade request and then go quiet
void test_stalled_peers() {
    testing::section("Stalled peers");

    Host host(1, 300ms);
    if (!host.start()) {
        log_test("server starts", false);
        return;
    }

    auto connected = core::network::TcpSocket::connect("127.0.0.1", host.server->port(), 2000ms,
                                                      common::CancellationToken());
    if (connected.is_err()) {
        log_test("raw client connects", false, connected.error().message);
        return;
    }
    auto stalled = connected.take();
    bool upgraded = core::network::client_handshake(*stalled, "127.0.0.1", host.server->port()).is_ok();
    log_test("raw client upgrades", upgraded);

    // First byte of a text frame header, nothing after it
    const uint8_t partial = 0x81;
    bool sent = core::network::send_all(*stalled, &partial, 1).is_ok();
    bool registered = wait_until([&]() { return host.sessions->session_count() == 1; });
    log_test("partial frame holds the only slot at first", sent && registered);

    bool expired = wait_until([&]() { return host.sessions->session_count() == 0; }, 2000ms);
    log_test("partial frame is expired by the authentication timeout", expired,
             "session_count=" + std::to_string(host.sessions->session_count()));

    auto reply = core::network::read_message(*stalled, std::chrono::steady_clock::now() + 2000ms);
    bool told = false;
    if (reply.is_ok() && reply.unwrap().opcode == core::network::WsOpcode::TEXT) {
        auto decoded = decode(reply.unwrap().payload);
        told = decoded.is_ok() && decoded.unwrap() == ControlMessage(Error{"authentication timeout"});
    }
    log_test("stalled peer is told why", told);
    stalled->close_socket();

    Client c;
    c.machine->connect(host.record(), "123456");
    log_test("freed slot accepts a real client", c.wait_for(ConnectionState::Active));
    c.machine->disconnect();
    c.wait_for(ConnectionState::Idle);

    auto half = core::network::TcpSocket::connect("127.0.0.1", host.server->port(), 2000ms,
                                                 common::CancellationToken());
    if (half.is_err()) {
        log_test("second raw client connects", false, half.error().message);
        return;
    }
    auto half_socket = half.take();
    const std::string fragment = "GET / HTTP/1.1\r\n";
    bool fragment_sent = core::network::send_all(*half_socket, reinterpret_cast<const uint8_t*>(fragment.data()),
                                                  fragment.size()).is_ok();

    // The host closes a half-sent upgrade once the authentication timeout passes
    auto closed = core::network::read_message(*half_socket, std::chrono::steady_clock::now() + 2000ms);
    bool dropped = closed.is_err() && closed.error().code == common::ErrorCode::TransportError;
    log_test("half-sent upgrade request is dropped", fragment_sent && dropped,
             closed.is_err() ? closed.error().message : "got a message");
    half_socket->close_socket();

    host.server->stop();
}

void test_host_restart() {
    testing::section("Host loss");

    Host host;
    if (!host.start()) {
        log_test("server starts", false);
        return;
    }

    Client c(slow_retry());
    c.machine->connect(host.record(), "123456");
    log_test("client active", c.wait_for(ConnectionState::Active));

    host.server->stop();
    bool reconnecting = c.wait_for(ConnectionState::Reconnecting);
    log_test("host shutdown puts the client in Reconnecting(1)",
             reconnecting && c.machine->status().retry_count == 1);

    Client nobody(slow_retry());
    core::HostRecord closed_port = host.record();
    nobody.machine->connect(closed_port, "123456");
    log_test("refused connection also schedules a retry", nobody.wait_for(ConnectionState::Reconnecting));
}

} // namespace

int main() {
    std::cout << "End-to-End Test Suite" << std::endl;
    std::cout << "=====================" << std::endl;

    init_network();

    test_session();
    test_wrong_pin();
    test_capacity();
    test_auth_timeout();
    test_stalled_peers();
    test_host_restart();

    cleanup_network();
    return testing::print_summary("END TO END");
}
