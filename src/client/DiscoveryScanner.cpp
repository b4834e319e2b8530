#include "client/DiscoveryScanner.hpp"
#include <algorithm>
#include <cstring>
#include "core/NetworkDefs.hpp"
#include "core/Protocol.hpp"

namespace client {

static const size_t MAX_DATAGRAM = 2048;
static const int POLL_SLICE_MS = 100;

bool DiscoveryCollector::add(core::HostRecord record) {
    auto same_address = [&record](const core::HostRecord& h) { return h.address == record.address; };
    if (std::any_of(hosts_.begin(), hosts_.end(), same_address)) {
        return false;
    }
    hosts_.push_back(std::move(record));
    return true;
}

DiscoveryScanner::DiscoveryScanner(DiscoverySettings settings, std::shared_ptr<common::ILogger> logger)
    : settings_(std::move(settings)),
      logger_(logger ? std::move(logger) : common::make_null_logger()) {
}

DiscoveryScanner::~DiscoveryScanner() {
    stop();
}

common::Result<std::vector<core::HostRecord>> DiscoveryScanner::scan_once(
    const common::CancellationToken& token) const {
    using ScanResult = common::Result<std::vector<core::HostRecord>>;

    sockaddr_in target;
    memset(&target, 0, sizeof(target));
    target.sin_family = AF_INET;
    target.sin_port = htons(settings_.port);
    if (inet_pton(AF_INET, settings_.broadcast_address.c_str(), &target.sin_addr) != 1) {
        return ScanResult::err(common::ErrorCode::InvalidArgument,
                               "Invalid broadcast address: " + settings_.broadcast_address);
    }

    socket_t sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (!IS_VALID_SOCKET(sock)) {
        return ScanResult::err(common::ErrorCode::SystemError, "Failed to create UDP socket");
    }

    int enable = 1;
    setsockopt(sock, SOL_SOCKET, SO_BROADCAST, (const char*)&enable, sizeof(enable));

    sockaddr_in local;
    memset(&local, 0, sizeof(local));
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = 0;
    if (bind(sock, (struct sockaddr*)&local, sizeof(local)) < 0) {
        CLOSE_SOCKET(sock);
        return ScanResult::err(common::ErrorCode::TransportError, "Failed to bind discovery socket");
    }

    const std::string request = core::protocol::DISCOVERY_REQUEST;
    int sent = sendto(sock, (const SOCK_BUF_TYPE)request.data(), (int)request.size(), 0,
                      (struct sockaddr*)&target, sizeof(target));
    if (sent < 0) {
        int err = last_socket_error();
        CLOSE_SOCKET(sock);
        return ScanResult::err(common::ErrorCode::TransportError,
                               "Discovery broadcast failed: " + std::string(std::strerror(err)));
    }
    logger_->debug("[Scanner] Broadcast to " + settings_.broadcast_address + ":" +
                   std::to_string(settings_.port));

    DiscoveryCollector collector;
    char buffer[MAX_DATAGRAM];
    auto deadline = std::chrono::steady_clock::now() + settings_.window;

    while (!token.is_cancellation_requested()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;

        pollfd_t pfd;
        pfd.fd = sock;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll_sockets(&pfd, 1, static_cast<int>(std::min<long long>(remaining, POLL_SLICE_MS)));
        if (ready <= 0) continue;

        sockaddr_in sender;
        socklen_t sender_len = sizeof(sender);
        int received = recvfrom(sock, (SOCK_BUF_TYPE)buffer, sizeof(buffer), 0,
                                (struct sockaddr*)&sender, &sender_len);
        if (received <= 0) continue;

        const std::string source = core::address_to_string(sender);
        auto parsed = core::parse_discovery_reply(std::string(buffer, static_cast<size_t>(received)), source);
        if (parsed.is_err()) {
            logger_->debug("[Scanner] Ignored reply from " + source + ": " + parsed.error().message);
            continue;
        }
        if (collector.add(parsed.take())) {
            logger_->debug("[Scanner] Found host at " + source);
        }
    }

    CLOSE_SOCKET(sock);
    return ScanResult::ok(collector.hosts());
}

void DiscoveryScanner::start(HostsCallback on_hosts) {
    if (running_.exchange(true)) return;

    cancel_.reset();
    thread_ = std::thread(&DiscoveryScanner::scan_loop, this, std::move(on_hosts), cancel_.get_token());
    logger_->info("[Scanner] Discovery started");
}

void DiscoveryScanner::stop() {
    if (!running_.exchange(false)) return;

    cancel_.cancel();
    if (thread_.joinable()) {
        thread_.join();
    }
    logger_->info("[Scanner] Discovery stopped");
}

void DiscoveryScanner::scan_loop(HostsCallback on_hosts, common::CancellationToken token) {
    while (!token.is_cancellation_requested()) {
        auto started = std::chrono::steady_clock::now();

        auto result = scan_once(token);
        if (token.is_cancellation_requested()) break;

        if (result.is_err()) {
            logger_->warn("[Scanner] " + result.error().message);
        } else if (on_hosts) {
            on_hosts(result.unwrap());
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (elapsed < settings_.interval) {
            token.sleep_for(settings_.interval - elapsed);
        }
    }
}

} // namespace client
