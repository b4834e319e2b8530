#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace core {
namespace network {

    enum class SocketError {
        Ok,
        WouldBlock, // Also returned by wait_readable() on timeout
        Disconnected,
        Fatal
    };

    class INetworkSocket {
    public:
        virtual ~INetworkSocket() = default;

        // Configuration
        virtual bool set_non_blocking(bool enable) = 0;
        virtual bool set_no_delay(bool enable) = 0;

        // IO Operations
        // Returns number of bytes sent or error
        virtual std::pair<size_t, SocketError> send(const uint8_t* data, size_t size) = 0;

        // Returns number of bytes received
        virtual std::pair<size_t, SocketError> recv(uint8_t* buffer, size_t max_size) = 0;

        // Block until data is readable (Ok), the timeout expires (WouldBlock)
        // or the socket fails (Fatal)
        virtual SocketError wait_readable(int timeout_ms) = 0;

        // Utilities
        virtual void shutdown_both() = 0; // Unblocks a reader on another thread
        virtual void close_socket() = 0;
        virtual bool is_valid() const = 0;
        virtual std::string remote_address() const = 0;
    };

} // namespace network
} // namespace core
