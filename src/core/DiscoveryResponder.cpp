#include "core/DiscoveryResponder.hpp"
#include <cstring>

namespace core {

    static const int POLL_INTERVAL_MS = 1000;
    static const size_t MAX_DATAGRAM = 1024;

    DiscoveryResponder::DiscoveryResponder(uint16_t discovery_port,
                                           HostRecord advertisement,
                                           std::shared_ptr<common::ILogger> logger)
        : requested_port_(discovery_port),
          advertisement_(std::move(advertisement)),
          logger_(logger ? std::move(logger) : common::make_null_logger()) {
    }

    DiscoveryResponder::~DiscoveryResponder() {
        stop();
    }

    bool DiscoveryResponder::is_discovery_request(const std::string& datagram) {
        const char* ws = " \t\r\n";
        size_t first = datagram.find_first_not_of(ws);
        if (first == std::string::npos) return false;
        size_t last = datagram.find_last_not_of(ws);
        return datagram.compare(first, last - first + 1, protocol::DISCOVERY_REQUEST) == 0;
    }

    common::EmptyResult DiscoveryResponder::start() {
        if (running_) return common::EmptyResult::success();

        // Create UDP socket
        sock_ = socket(AF_INET, SOCK_DGRAM, 0);
        if (!IS_VALID_SOCKET(sock_)) {
            return common::EmptyResult::err(common::ErrorCode::SystemError, "Failed to create UDP socket");
        }

        int reuse = 1;
        setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, (const char*)&reuse, sizeof(reuse));

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(requested_port_);

        if (bind(sock_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
            int err = last_socket_error();
            CLOSE_SOCKET(sock_);
            sock_ = INVALID_SOCKET;
            return common::EmptyResult::err(common::ErrorCode::TransportError,
                                            "Failed to bind UDP " + std::to_string(requested_port_) +
                                            ": " + std::strerror(err));
        }

        sockaddr_in bound;
        socklen_t len = sizeof(bound);
        bound_port_ = getsockname(sock_, (struct sockaddr*)&bound, &len) == 0
            ? ntohs(bound.sin_port) : requested_port_;

        running_ = true;
        thread_ = std::thread(&DiscoveryResponder::respond_loop, this);
        logger_->info("[Discovery] Responding on UDP " + std::to_string(bound_port_) + " as '" +
                      advertisement_.name + "' (" + advertisement_.advertised_ip + ":" +
                      std::to_string(advertisement_.port) + ")");
        return common::EmptyResult::success();
    }

    void DiscoveryResponder::stop() {
        if (!running_.exchange(false)) return;

        if (thread_.joinable()) {
            thread_.join();
        }

        if (IS_VALID_SOCKET(sock_)) {
            CLOSE_SOCKET(sock_);
            sock_ = INVALID_SOCKET;
        }
        logger_->info("[Discovery] Stopped");
    }

    void DiscoveryResponder::respond_loop() {
        const std::string reply = reply_payload();
        char buffer[MAX_DATAGRAM];

        while (running_) {
            pollfd_t pfd;
            pfd.fd = sock_;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int ready = poll_sockets(&pfd, 1, POLL_INTERVAL_MS);
            if (ready <= 0) continue;

            struct sockaddr_in sender;
            socklen_t sender_len = sizeof(sender);
            int received = recvfrom(sock_, (SOCK_BUF_TYPE)buffer, sizeof(buffer), 0,
                                    (struct sockaddr*)&sender, &sender_len);
            if (received <= 0) continue;

            std::string datagram(buffer, static_cast<size_t>(received));
            if (!is_discovery_request(datagram)) {
                logger_->debug("[Discovery] Ignored datagram from " + address_to_string(sender));
                continue;
            }

            int sent = sendto(sock_, (const SOCK_BUF_TYPE)reply.data(), (int)reply.size(), 0,
                              (struct sockaddr*)&sender, sender_len);
            if (sent < 0) {
                logger_->warn("[Discovery] Reply to " + address_to_string(sender) + " failed");
            } else {
                logger_->debug("[Discovery] Answered " + address_to_string(sender));
            }
        }
    }

} // namespace core
