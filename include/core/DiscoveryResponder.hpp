#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/HostRecord.hpp"
#include "core/NetworkDefs.hpp"

namespace core {

// ============================================================================
// DiscoveryResponder - answers LAN discovery broadcasts
// ============================================================================
// Binds UDP on the discovery port and replies, unicast to the sender, with
// this host's advertisement whenever a datagram carrying the discovery
// request arrives. Everything else is ignored.
// ============================================================================

class DiscoveryResponder {
public:
    // `advertisement.port` is the control port clients should connect to;
    // `discovery_port` 0 picks a free port (tests)
    DiscoveryResponder(uint16_t discovery_port,
                       HostRecord advertisement,
                       std::shared_ptr<common::ILogger> logger);
    ~DiscoveryResponder();

    // Start background responder thread. Idempotent.
    common::EmptyResult start();

    // Stop responding. Idempotent.
    void stop();

    bool is_running() const { return running_; }
    uint16_t port() const { return bound_port_; }

    // The request literal, surrounding whitespace ignored
    static bool is_discovery_request(const std::string& datagram);

    std::string reply_payload() const { return encode_discovery_reply(advertisement_); }

private:
    void respond_loop();

    uint16_t requested_port_;
    uint16_t bound_port_ = 0;
    HostRecord advertisement_;
    std::shared_ptr<common::ILogger> logger_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    socket_t sock_ = INVALID_SOCKET;
};

} // namespace core
