#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/NetworkDefs.hpp"
#include "core/SessionManager.hpp"

namespace core {

struct ControlServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = protocol::DEFAULT_CONTROL_PORT; // 0 picks a free port
    std::chrono::milliseconds auth_timeout{5000};
};

// ============================================================================
// ControlServer - WebSocket listener feeding the SessionManager
// ============================================================================
// One accept thread plus one reader thread per connection. A reader does the
// upgrade handshake, registers the session, then hands every text message to
// SessionManager in arrival order. WebSocket pings are answered here.
// ============================================================================

class ControlServer {
public:
    ControlServer(ControlServerConfig config,
                  std::shared_ptr<SessionManager> sessions,
                  std::shared_ptr<common::ILogger> logger);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Bind, listen and start the accept thread
    common::EmptyResult start();

    // Stop accepting, close every connection and join all threads. Idempotent.
    void stop();

    bool is_running() const { return running_; }

    // Port actually bound (differs from config when config.port == 0)
    uint16_t port() const { return bound_port_; }

private:
    class Connection;

    struct Worker {
        std::thread thread;
        std::shared_ptr<Connection> connection;
        std::atomic<bool> done{false};
    };

    void accept_loop();
    void serve(Worker& worker);
    void reap_finished_workers();

    ControlServerConfig config_;
    std::shared_ptr<SessionManager> sessions_;
    std::shared_ptr<common::ILogger> logger_;

    socket_t listen_fd_ = INVALID_SOCKET;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    std::mutex workers_mutex_;
    std::list<std::unique_ptr<Worker>> workers_;
};

} // namespace core
