#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "common/Cancellation.hpp"
#include "common/Logger.hpp"
#include "interfaces/IClientChannel.hpp"

namespace core {
namespace network {
    class TcpSocket;
}
}

namespace client {

/**
 * @brief WebSocket client channel to a host's control port.
 *
 * open() spawns one IO thread that connects, performs the opening handshake,
 * then reads until the connection ends. Outgoing frames are masked. PINGs
 * from the host are answered on the IO thread.
 */
class WebSocketChannel : public interfaces::IClientChannel {
public:
    explicit WebSocketChannel(std::shared_ptr<common::ILogger> logger,
                              std::chrono::milliseconds connect_timeout = std::chrono::seconds(10));
    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    void open(const std::string& host, uint16_t port, interfaces::ChannelHandlers handlers) override;
    common::EmptyResult send_text(const std::string& text) override;
    void close() override;

private:
    void run(std::string host, uint16_t port, interfaces::ChannelHandlers handlers,
             common::CancellationToken token);
    std::string read_loop(core::network::TcpSocket& socket, const interfaces::ChannelHandlers& handlers,
                          const common::CancellationToken& token);
    common::EmptyResult send_frame_locked(uint8_t opcode, const std::string& payload);

    std::shared_ptr<common::ILogger> logger_;
    std::chrono::milliseconds connect_timeout_;

    common::CancellationSource cancel_;
    std::mutex mutex_; // guards socket_ and serializes writers
    std::shared_ptr<core::network::TcpSocket> socket_;
    std::atomic<bool> opened_{false};
    std::thread io_thread_;
};

} // namespace client
