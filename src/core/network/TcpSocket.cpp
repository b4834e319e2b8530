#include "core/network/TcpSocket.hpp"
#include <cstring>

namespace core {
namespace network {

    TcpSocket::TcpSocket(socket_t fd, std::string remote_address)
        : fd_(fd), remote_address_(std::move(remote_address)) {}

    TcpSocket::~TcpSocket() {
        close_socket();
    }

    common::Result<std::unique_ptr<TcpSocket>> TcpSocket::connect(
        const std::string& host,
        uint16_t port,
        std::chrono::milliseconds timeout,
        const common::CancellationToken& token
    ) {
        using ConnectResult = common::Result<std::unique_ptr<TcpSocket>>;

        addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* info = nullptr;
        std::string port_text = std::to_string(port);
        int rc = getaddrinfo(host.c_str(), port_text.c_str(), &hints, &info);
        if (rc != 0 || !info) {
            return ConnectResult::err(common::ErrorCode::TransportError, "cannot resolve " + host);
        }
        sockaddr_in target;
        std::memcpy(&target, info->ai_addr, sizeof(target));
        freeaddrinfo(info);

        socket_t fd = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (!IS_VALID_SOCKET(fd)) {
            return ConnectResult::err(common::ErrorCode::SystemError, "socket() failed");
        }
        auto sock = std::make_unique<TcpSocket>(fd, address_to_string(target));
        sock->set_non_blocking(true);

        rc = ::connect(fd, reinterpret_cast<sockaddr*>(&target), sizeof(target));
        if (rc != 0) {
            int err = last_socket_error();
            #ifdef _WIN32
            bool in_progress = err == WSAEWOULDBLOCK || err == WSAEINPROGRESS;
            #else
            bool in_progress = err == EINPROGRESS;
            #endif
            if (!in_progress) {
                return ConnectResult::err(common::ErrorCode::TransportError,
                                          "connect to " + host + " failed: " + std::strerror(err));
            }

            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (true) {
                if (token.is_cancellation_requested()) {
                    return ConnectResult::err(common::ErrorCode::Cancelled, "connect cancelled");
                }
                auto now = std::chrono::steady_clock::now();
                if (now >= deadline) {
                    return ConnectResult::err(common::ErrorCode::Timeout, "connect to " + host + " timed out");
                }

                pollfd_t pfd;
                pfd.fd = fd;
                pfd.events = POLLOUT;
                pfd.revents = 0;
                int ready = poll_sockets(&pfd, 1, 100);
                if (ready < 0) {
                    return ConnectResult::err(common::ErrorCode::TransportError, "poll failed during connect");
                }
                if (ready == 0) continue;

                int so_error = 0;
                socklen_t len = sizeof(so_error);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&so_error), &len);
                if (so_error != 0) {
                    return ConnectResult::err(common::ErrorCode::TransportError,
                                              "connect to " + host + " failed: " + std::strerror(so_error));
                }
                break;
            }
        }

        sock->set_non_blocking(false);
        sock->set_no_delay(true);
        return ConnectResult(std::move(sock));
    }

    bool TcpSocket::set_non_blocking(bool enable) {
        if (!IS_VALID_SOCKET(fd_)) return false;
        #ifdef _WIN32
            u_long mode = enable ? 1 : 0;
            return ioctlsocket(fd_, FIONBIO, &mode) == 0;
        #else
            int flags = fcntl(fd_, F_GETFL, 0);
            if (flags == -1) return false;
            if (enable) flags |= O_NONBLOCK;
            else flags &= ~O_NONBLOCK;
            return fcntl(fd_, F_SETFL, flags) == 0;
        #endif
    }

    bool TcpSocket::set_no_delay(bool enable) {
        if (!IS_VALID_SOCKET(fd_)) return false;
        int flag = enable ? 1 : 0;
        return setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, (const char*)&flag, sizeof(flag)) == 0;
    }

    std::pair<size_t, SocketError> TcpSocket::send(const uint8_t* data, size_t size) {
        if (!IS_VALID_SOCKET(fd_)) return {0, SocketError::Fatal};

        #ifdef MSG_NOSIGNAL
        const int flags = MSG_NOSIGNAL; // Peer gone must not raise SIGPIPE
        #else
        const int flags = 0;
        #endif
        ssize_t sent = ::send(fd_, (const SOCK_BUF_TYPE)data, (int)size, flags);

        if (sent < 0) {
            #ifdef _WIN32
                int err = WSAGetLastError();
                if (err == WSAEWOULDBLOCK) return {0, SocketError::WouldBlock};
                if (err == WSAECONNRESET || err == WSAECONNABORTED) return {0, SocketError::Disconnected};
            #else
                if (errno == EAGAIN || errno == EWOULDBLOCK) return {0, SocketError::WouldBlock};
                if (errno == EPIPE || errno == ECONNRESET) return {0, SocketError::Disconnected};
            #endif
            return {0, SocketError::Fatal};
        }
        return {(size_t)sent, SocketError::Ok};
    }

    std::pair<size_t, SocketError> TcpSocket::recv(uint8_t* buffer, size_t max_size) {
        if (!IS_VALID_SOCKET(fd_)) return {0, SocketError::Fatal};

        ssize_t received = ::recv(fd_, (SOCK_BUF_TYPE)buffer, (int)max_size, 0);

        if (received > 0) {
            return {(size_t)received, SocketError::Ok};
        } else if (received == 0) {
            return {0, SocketError::Disconnected}; // EOF
        } else {
            #ifdef _WIN32
                int err = WSAGetLastError();
                if (err == WSAEWOULDBLOCK) return {0, SocketError::WouldBlock};
                if (err == WSAECONNRESET || err == WSAECONNABORTED) return {0, SocketError::Disconnected};
            #else
                if (errno == EAGAIN || errno == EWOULDBLOCK) return {0, SocketError::WouldBlock};
                if (errno == ECONNRESET) return {0, SocketError::Disconnected};
            #endif
            return {0, SocketError::Fatal};
        }
    }

    SocketError TcpSocket::wait_readable(int timeout_ms) {
        if (!IS_VALID_SOCKET(fd_)) return SocketError::Fatal;

        pollfd_t pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll_sockets(&pfd, 1, timeout_ms);
        if (ready < 0) {
            #ifndef _WIN32
            if (errno == EINTR) return SocketError::WouldBlock;
            #endif
            return SocketError::Fatal;
        }
        if (ready == 0) return SocketError::WouldBlock;
        // POLLHUP/POLLERR: let the following recv() report the condition
        return SocketError::Ok;
    }

    void TcpSocket::shutdown_both() {
        if (IS_VALID_SOCKET(fd_)) {
            shutdown(fd_, SHUTDOWN_BOTH);
        }
    }

    void TcpSocket::close_socket() {
        if (IS_VALID_SOCKET(fd_)) {
            CLOSE_SOCKET(fd_);
            fd_ = INVALID_SOCKET;
        }
    }

    bool TcpSocket::is_valid() const {
        return IS_VALID_SOCKET(fd_);
    }

} // namespace network
} // namespace core
