#pragma once
#include <chrono>
#include <memory>
#include "common/Cancellation.hpp"
#include "common/Result.hpp"
#include "interfaces/INetworkSocket.hpp"
#include "core/NetworkDefs.hpp" // For native types like socket_t

namespace core {
namespace network {

    class TcpSocket : public INetworkSocket {
    public:
        explicit TcpSocket(socket_t fd, std::string remote_address = "");
        ~TcpSocket() override;

        TcpSocket(const TcpSocket&) = delete;
        TcpSocket& operator=(const TcpSocket&) = delete;

        // Resolve `host` and connect within `timeout`, checking `token`
        // between poll slices. The returned socket is blocking.
        static common::Result<std::unique_ptr<TcpSocket>> connect(
            const std::string& host,
            uint16_t port,
            std::chrono::milliseconds timeout,
            const common::CancellationToken& token);

        bool set_non_blocking(bool enable) override;
        bool set_no_delay(bool enable) override;

        std::pair<size_t, SocketError> send(const uint8_t* data, size_t size) override;
        std::pair<size_t, SocketError> recv(uint8_t* buffer, size_t max_size) override;
        SocketError wait_readable(int timeout_ms) override;

        void shutdown_both() override;
        void close_socket() override;
        bool is_valid() const override;
        std::string remote_address() const override { return remote_address_; }

    private:
        socket_t fd_;
        std::string remote_address_;
    };

} // namespace network
} // namespace core
