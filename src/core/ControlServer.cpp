#include "core/ControlServer.hpp"
#include "core/network/TcpSocket.hpp"
#include "core/network/WebSocket.hpp"
#include <algorithm>
#include <cstring>
#include <optional>
#include <stdexcept>

namespace core {

// ============================================================================
// Connection - IConnection over one accepted WebSocket
// ============================================================================

class ControlServer::Connection : public interfaces::IConnection {
public:
    Connection(std::unique_ptr<network::TcpSocket> socket, std::shared_ptr<common::ILogger> logger)
        : socket_(std::move(socket)), remote_(socket_->remote_address()), logger_(std::move(logger)) {}

    common::EmptyResult send_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (closed_) {
            return common::EmptyResult::err(common::ErrorCode::TransportError, "connection closed");
        }
        return network::send_frame(*socket_, network::WsOpcode::TEXT, text, false);
    }

    common::EmptyResult send_control(network::WsOpcode opcode, const std::string& payload) {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (closed_) {
            return common::EmptyResult::err(common::ErrorCode::TransportError, "connection closed");
        }
        return network::send_frame(*socket_, opcode, payload, false);
    }

    // Sends a close frame once, then shuts the socket down so the reader
    // thread wakes up. The descriptor itself is released with the object.
    void close() override {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (closed_) return;
        closed_ = true;
        auto sent = network::send_frame(*socket_, network::WsOpcode::CLOSE, "", false);
        if (sent.is_err()) {
            logger_->debug("[ControlServer] Close frame to " + remote_ + " not sent: " + sent.error().message);
        }
        socket_->shutdown_both();
    }

    std::string remote_address() const override { return remote_; }

    network::TcpSocket& socket() { return *socket_; }

private:
    std::unique_ptr<network::TcpSocket> socket_;
    std::string remote_;
    std::shared_ptr<common::ILogger> logger_;
    std::mutex send_mutex_;
    bool closed_ = false;
};

// ============================================================================
// Lifecycle
// ============================================================================

ControlServer::ControlServer(ControlServerConfig config,
                             std::shared_ptr<SessionManager> sessions,
                             std::shared_ptr<common::ILogger> logger)
    : config_(std::move(config)),
      sessions_(std::move(sessions)),
      logger_(logger ? std::move(logger) : common::make_null_logger()) {}

ControlServer::~ControlServer() {
    stop();
}

common::EmptyResult ControlServer::start() {
    if (running_) return common::EmptyResult::success();

    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (!IS_VALID_SOCKET(listen_fd_)) {
        return common::EmptyResult::err(common::ErrorCode::SystemError, "socket() failed");
    }

    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&opt, sizeof(opt));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
        CLOSE_SOCKET(listen_fd_);
        listen_fd_ = INVALID_SOCKET;
        return common::EmptyResult::err(common::ErrorCode::InvalidArgument,
                                        "invalid bind address: " + config_.bind_address);
    }

    if (bind(listen_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        int err = last_socket_error();
        CLOSE_SOCKET(listen_fd_);
        listen_fd_ = INVALID_SOCKET;
        return common::EmptyResult::err(common::ErrorCode::TransportError,
                                        "bind " + config_.bind_address + ":" + std::to_string(config_.port) +
                                        " failed: " + std::strerror(err));
    }

    if (listen(listen_fd_, 16) < 0) {
        CLOSE_SOCKET(listen_fd_);
        listen_fd_ = INVALID_SOCKET;
        return common::EmptyResult::err(common::ErrorCode::TransportError, "listen() failed");
    }

    sockaddr_in bound;
    socklen_t len = sizeof(bound);
    if (getsockname(listen_fd_, (struct sockaddr*)&bound, &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    running_ = true;
    accept_thread_ = std::thread(&ControlServer::accept_loop, this);
    logger_->info("[ControlServer] Listening on " + config_.bind_address + ":" + std::to_string(bound_port_));
    return common::EmptyResult::success();
}

void ControlServer::stop() {
    bool was_running = running_.exchange(false);
    if (was_running && accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (IS_VALID_SOCKET(listen_fd_)) {
        CLOSE_SOCKET(listen_fd_);
        listen_fd_ = INVALID_SOCKET;
    }

    std::list<std::unique_ptr<Worker>> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker->connection) worker->connection->close();
    }
    for (auto& worker : workers) {
        if (worker->thread.joinable()) worker->thread.join();
    }

    if (was_running) {
        logger_->info("[ControlServer] Stopped");
    }
}

// ============================================================================
// Accept loop
// ============================================================================

void ControlServer::accept_loop() {
    while (running_) {
        reap_finished_workers();

        pollfd_t pfd;
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll_sockets(&pfd, 1, 200);
        if (ready <= 0) continue;

        struct sockaddr_in peer;
        socklen_t len = sizeof(peer);
        socket_t fd = accept(listen_fd_, (struct sockaddr*)&peer, &len);
        if (!IS_VALID_SOCKET(fd)) continue;

        auto socket = std::make_unique<network::TcpSocket>(fd, address_to_string(peer));
        socket->set_no_delay(true);

        auto worker = std::make_unique<Worker>();
        worker->connection = std::make_shared<Connection>(std::move(socket), logger_);
        Worker* raw = worker.get();

        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (!running_) {
            worker->connection->close();
            break;
        }
        workers_.push_back(std::move(worker));
        raw->thread = std::thread([this, raw]() { serve(*raw); });
    }
}

void ControlServer::reap_finished_workers() {
    std::list<std::unique_ptr<Worker>> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if ((*it)->done) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        if (worker->thread.joinable()) worker->thread.join();
    }
}

// ============================================================================
// Per-connection reader
// ============================================================================

void ControlServer::serve(Worker& worker) {
    auto connection = worker.connection;
    auto& socket = connection->socket();
    const std::string peer = connection->remote_address();
    const auto deadline = std::chrono::steady_clock::now() + config_.auth_timeout;

    std::optional<SessionId> session_id;

    try {
        // The upgrade request counts against the authentication timeout
        auto timeout_ms = static_cast<int>(config_.auth_timeout.count());
        if (socket.wait_readable(timeout_ms) != network::SocketError::Ok) {
            logger_->warn("[ControlServer] " + peer + " sent no upgrade request");
            connection->close();
            worker.done = true;
            return;
        }

        auto handshake = network::server_handshake(socket, deadline);
        if (handshake.is_err()) {
            logger_->warn("[ControlServer] Handshake with " + peer + " failed: " + handshake.error().message);
            connection->close();
            worker.done = true;
            return;
        }

        auto accepted = sessions_->accept(connection);
        if (accepted.is_err()) {
            worker.done = true;
            return;
        }
        session_id = accepted.unwrap();

        while (running_) {
            int wait_ms = 500;
            network::Deadline read_deadline;
            if (!sessions_->is_authenticated(*session_id)) {
                read_deadline = deadline;
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    sessions_->expire_unauthenticated(*session_id);
                    break;
                }
                wait_ms = static_cast<int>(std::min<int64_t>(remaining.count(), wait_ms));
            }

            auto ready = socket.wait_readable(wait_ms);
            if (ready == network::SocketError::WouldBlock) continue;
            if (ready != network::SocketError::Ok) break;

            // A partial frame from an unauthenticated peer still counts against the timeout
            auto message = network::read_message(socket, read_deadline);
            if (message.is_err()) {
                if (message.error().code == common::ErrorCode::Timeout) {
                    sessions_->expire_unauthenticated(*session_id);
                    break;
                }
                if (message.error().code == common::ErrorCode::ProtocolError) {
                    logger_->warn("[ControlServer] " + peer + ": " + message.error().message);
                    auto sent = connection->send_text(protocol::encode_error(message.error().message));
                    if (sent.is_err()) {
                        logger_->debug("[ControlServer] Could not report frame error to " + peer);
                    }
                }
                break;
            }

            const auto& frame = message.unwrap();
            if (frame.opcode == network::WsOpcode::TEXT) {
                if (sessions_->on_message(*session_id, frame.payload) == Disposition::Close) break;
            } else if (frame.opcode == network::WsOpcode::PING) {
                auto sent = connection->send_control(network::WsOpcode::PONG, frame.payload);
                if (sent.is_err()) break;
            } else if (frame.opcode == network::WsOpcode::CLOSE) {
                break;
            } else if (frame.opcode == network::WsOpcode::BINARY) {
                auto sent = connection->send_text(protocol::encode_error("binary messages are not supported"));
                if (sent.is_err()) break;
            }
        }
    } catch (const std::exception& e) {
        logger_->error("[ControlServer] Connection " + peer + " failed: " + e.what());
    }

    if (session_id) {
        sessions_->on_disconnect(*session_id);
    }
    connection->close();
    worker.done = true;
}

} // namespace core
