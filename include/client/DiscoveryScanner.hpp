#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "common/Cancellation.hpp"
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/HostRecord.hpp"

namespace client {

// Replies collected during one discovery window, one per source address.
// The first reply from an address wins; later ones are duplicates.
class DiscoveryCollector {
public:
    // Returns false if the address was already seen in this window
    bool add(core::HostRecord record);

    const std::vector<core::HostRecord>& hosts() const { return hosts_; }
    void clear() { hosts_.clear(); }

private:
    std::vector<core::HostRecord> hosts_;
};

struct DiscoverySettings {
    std::string broadcast_address = "255.255.255.255";
    uint16_t port = 9876;
    std::chrono::milliseconds window{3000};   // how long replies are collected
    std::chrono::milliseconds interval{5000}; // period between scan starts
};

// ============================================================================
// DiscoveryScanner - client side host enumeration
// ============================================================================
// Each scan binds an ephemeral UDP socket, broadcasts the discovery request
// and collects replies for the window. start() repeats scans on a background
// thread until stop().
// ============================================================================

class DiscoveryScanner {
public:
    using HostsCallback = std::function<void(const std::vector<core::HostRecord>&)>;

    DiscoveryScanner(DiscoverySettings settings, std::shared_ptr<common::ILogger> logger);
    ~DiscoveryScanner();

    DiscoveryScanner(const DiscoveryScanner&) = delete;
    DiscoveryScanner& operator=(const DiscoveryScanner&) = delete;

    // One blocking scan. Returns early (with what was collected) when cancelled.
    common::Result<std::vector<core::HostRecord>> scan_once(const common::CancellationToken& token) const;

    // Scan periodically; `on_hosts` runs on the scanner thread after every
    // completed window. Idempotent.
    void start(HostsCallback on_hosts);

    // Cancels the current window and the interval wait, then joins. Idempotent.
    void stop();

    bool is_running() const { return running_; }
    const DiscoverySettings& settings() const { return settings_; }

private:
    void scan_loop(HostsCallback on_hosts, common::CancellationToken token);

    DiscoverySettings settings_;
    std::shared_ptr<common::ILogger> logger_;

    std::atomic<bool> running_{false};
    common::CancellationSource cancel_;
    std::thread thread_;
};

} // namespace client
