#include "client/WebSocketChannel.hpp"
#include "core/network/TcpSocket.hpp"
#include "core/network/WebSocket.hpp"

namespace client {

using core::network::TcpSocket;
using core::network::WsOpcode;

WebSocketChannel::WebSocketChannel(std::shared_ptr<common::ILogger> logger,
                                   std::chrono::milliseconds connect_timeout)
    : logger_(logger ? std::move(logger) : common::make_null_logger()),
      connect_timeout_(connect_timeout) {
}

WebSocketChannel::~WebSocketChannel() {
    close();
}

void WebSocketChannel::open(const std::string& host, uint16_t port, interfaces::ChannelHandlers handlers) {
    if (opened_.exchange(true)) {
        logger_->warn("[Channel] open() called twice; ignoring");
        return;
    }
    io_thread_ = std::thread(&WebSocketChannel::run, this, host, port, std::move(handlers),
                             cancel_.get_token());
}

common::EmptyResult WebSocketChannel::send_text(const std::string& text) {
    return send_frame_locked(static_cast<uint8_t>(WsOpcode::TEXT), text);
}

common::EmptyResult WebSocketChannel::send_frame_locked(uint8_t opcode, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!socket_) {
        return common::EmptyResult::err(common::ErrorCode::TransportError, "channel is not open");
    }
    return core::network::send_frame(*socket_, static_cast<WsOpcode>(opcode), payload, true);
}

void WebSocketChannel::close() {
    cancel_.cancel();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (socket_) {
            auto sent = core::network::send_frame(*socket_, WsOpcode::CLOSE, "", true);
            if (sent.is_err()) {
                logger_->debug("[Channel] Close frame not sent: " + sent.error().message);
            }
            socket_->shutdown_both(); // unblocks the reader
        }
    }

    if (io_thread_.joinable()) {
        if (io_thread_.get_id() == std::this_thread::get_id()) {
            io_thread_.detach();
        } else {
            io_thread_.join();
        }
    }
}

void WebSocketChannel::run(std::string host, uint16_t port, interfaces::ChannelHandlers handlers,
                           common::CancellationToken token) {
    auto notify_closed = [&handlers](const std::string& reason) {
        if (handlers.on_closed) handlers.on_closed(reason);
    };

    auto connected = TcpSocket::connect(host, port, connect_timeout_, token);
    if (connected.is_err()) {
        logger_->debug("[Channel] " + connected.error().message);
        notify_closed(connected.error().message);
        return;
    }
    std::shared_ptr<TcpSocket> socket(connected.take().release());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (token.is_cancellation_requested()) {
            socket->close_socket();
            notify_closed("connect cancelled");
            return;
        }
        socket_ = socket;
    }

    std::string reason;
    auto handshake = core::network::client_handshake(*socket, host, port);
    if (handshake.is_err()) {
        reason = token.is_cancellation_requested() ? "connect cancelled" : handshake.error().message;
    } else {
        logger_->debug("[Channel] Open to " + host + ":" + std::to_string(port));
        if (handlers.on_open) handlers.on_open();
        reason = read_loop(*socket, handlers, token);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        socket_.reset();
    }
    socket->close_socket();
    notify_closed(reason);
}

std::string WebSocketChannel::read_loop(TcpSocket& socket, const interfaces::ChannelHandlers& handlers,
                                        const common::CancellationToken& token) {
    while (true) {
        auto message = core::network::read_message(socket);
        if (message.is_err()) {
            if (token.is_cancellation_requested()) return "closed";
            return message.error().message;
        }

        const auto& frame = message.unwrap();
        switch (frame.opcode) {
            case WsOpcode::TEXT:
                if (handlers.on_message) handlers.on_message(frame.payload);
                break;
            case WsOpcode::PING: {
                auto sent = send_frame_locked(static_cast<uint8_t>(WsOpcode::PONG), frame.payload);
                if (sent.is_err()) return sent.error().message;
                break;
            }
            case WsOpcode::CLOSE: {
                auto sent = send_frame_locked(static_cast<uint8_t>(WsOpcode::CLOSE), "");
                if (sent.is_err()) {
                    logger_->debug("[Channel] Close echo not sent: " + sent.error().message);
                }
                return "connection closed by host";
            }
            case WsOpcode::BINARY:
                logger_->debug("[Channel] Ignoring binary frame");
                break;
            default:
                break;
        }
    }
}

} // namespace client
