#pragma once

#include <string>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #include <BaseTsd.h>
    #pragma comment(lib, "ws2_32.lib")

    // Windows recv returns int, but ssize_t is standard in our codebase
    typedef SSIZE_T ssize_t;

    typedef SOCKET socket_t;
    #define CLOSE_SOCKET(s) closesocket(s)
    #define IS_VALID_SOCKET(s) ((s) != INVALID_SOCKET)
    #define SHUTDOWN_BOTH SD_BOTH

    // Windows expects char* for buffer in send/recv
    #define SOCK_BUF_TYPE char*

    // socklen_t handling
    typedef int socklen_t;

    // Helper to initialize Winsock
    inline void init_network() {
        WSADATA wsaData;
        WSAStartup(MAKEWORD(2, 2), &wsaData);
    }

    inline void cleanup_network() {
        WSACleanup();
    }

    inline int last_socket_error() { return WSAGetLastError(); }

    inline int poll_sockets(WSAPOLLFD* fds, unsigned long count, int timeout_ms) {
        return WSAPoll(fds, count, timeout_ms);
    }
    typedef WSAPOLLFD pollfd_t;

#else
    #include <sys/types.h>
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h>
    #include <arpa/inet.h>
    #include <netdb.h>
    #include <poll.h>
    #include <unistd.h>
    #include <sys/ioctl.h>
    #include <fcntl.h>
    #include <errno.h>

    typedef int socket_t;
    #define CLOSE_SOCKET(s) close(s)
    #define IS_VALID_SOCKET(s) ((s) >= 0)
    #define INVALID_SOCKET (-1)
    #define SHUTDOWN_BOTH SHUT_RDWR

    #define SOCK_BUF_TYPE void*

    inline void init_network() {}
    inline void cleanup_network() {}

    inline int last_socket_error() { return errno; }

    inline int poll_sockets(struct pollfd* fds, nfds_t count, int timeout_ms) {
        return ::poll(fds, count, timeout_ms);
    }
    typedef struct pollfd pollfd_t;
#endif

namespace core {

    // Printable "a.b.c.d" for an IPv4 socket address
    inline std::string address_to_string(const sockaddr_in& addr) {
        char buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
        return std::string(buf);
    }

    // Best guess of this machine's LAN address: the source address the kernel
    // would pick to reach a public host (no packet is sent). Falls back to
    // loopback when there is no route.
    inline std::string detect_local_ip() {
        socket_t s = socket(AF_INET, SOCK_DGRAM, 0);
        if (!IS_VALID_SOCKET(s)) return "127.0.0.1";

        sockaddr_in probe{};
        probe.sin_family = AF_INET;
        probe.sin_port = htons(80);
        inet_pton(AF_INET, "8.8.8.8", &probe.sin_addr);

        std::string result = "127.0.0.1";
        if (connect(s, reinterpret_cast<sockaddr*>(&probe), sizeof(probe)) == 0) {
            sockaddr_in local{};
            socklen_t len = sizeof(local);
            if (getsockname(s, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
                std::string ip = address_to_string(local);
                if (!ip.empty() && ip != "0.0.0.0") result = ip;
            }
        }
        CLOSE_SOCKET(s);
        return result;
    }

} // namespace core
