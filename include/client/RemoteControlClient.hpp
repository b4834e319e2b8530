#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "client/ConnectionStateMachine.hpp"
#include "client/DiscoveryScanner.hpp"
#include "client/HostDirectory.hpp"
#include "common/Logger.hpp"
#include "interfaces/IClientChannel.hpp"
#include "interfaces/IExecutor.hpp"
#include "interfaces/ISettingsStore.hpp"

namespace client {

struct ClientOptions {
    DiscoverySettings discovery;
    ReconnectPolicy reconnect;
};

/**
 * @brief UI-facing client API.
 *
 * Wires discovery, the saved host list and the connection state machine
 * together. The UI reads connection_status() and discovered_hosts() (or
 * subscribes to them) and calls the actions below; nothing here blocks.
 *
 * A host is saved to the directory once a connection to it becomes Active,
 * and every host found by discovery is saved as it is found.
 *
 * The executor must outlive this object and be idle or stopped when it is
 * destroyed.
 */
class RemoteControlClient {
public:
    using HostsObserver = std::function<void(const std::vector<core::HostRecord>&)>;

    RemoteControlClient(interfaces::IExecutor& executor,
                        interfaces::ChannelFactory channel_factory,
                        std::shared_ptr<interfaces::ISettingsStore> store,
                        std::shared_ptr<common::ILogger> logger,
                        ClientOptions options = ClientOptions());
    ~RemoteControlClient();

    RemoteControlClient(const RemoteControlClient&) = delete;
    RemoteControlClient& operator=(const RemoteControlClient&) = delete;

    // ========== Discovery ==========

    void start_discovery();
    void stop_discovery();
    bool is_discovering() const { return scanner_.is_running(); }

    // Hosts from the last discovery window that found any; until then, the saved list
    std::vector<core::HostRecord> discovered_hosts() const;
    std::vector<core::HostRecord> saved_hosts() const { return directory_.hosts(); }

    // Results of one discovery window; the scanner calls this after every window.
    // A non-empty result replaces the discovered list and is saved, an empty one is ignored.
    void on_hosts_found(const std::vector<core::HostRecord>& hosts);

    common::Result<core::HostRecord> add_manual_host(const std::string& endpoint, const std::string& name = "");
    bool forget_host(const std::string& address);

    // ========== Connection ==========

    void connect(const core::HostRecord& host, const std::string& pin);
    void disconnect();
    void retry();

    ConnectionStatus connection_status() const { return machine_->status(); }

    // ========== Input ==========

    void send_move(double dx, double dy);
    void send_click(const std::string& button, std::optional<bool> down = std::nullopt);
    void send_key(const std::string& text);
    void send_hotkey(const std::vector<std::string>& keys);
    void send_scroll(int dx, int dy);
    void send_ping();

    // ========== Observation ==========

    ConnectionStateMachine::SubscriptionId subscribe_status(ConnectionStateMachine::StatusObserver observer);
    void unsubscribe_status(ConnectionStateMachine::SubscriptionId id);
    void subscribe_hosts(HostsObserver observer);

private:
    void on_status(const ConnectionStatus& status);

    std::shared_ptr<common::ILogger> logger_;
    HostDirectory directory_;
    DiscoveryScanner scanner_;
    std::shared_ptr<ConnectionStateMachine> machine_;
    ConnectionStateMachine::SubscriptionId status_subscription_ = 0;
    ConnectionState last_state_ = ConnectionState::Idle;

    mutable std::mutex hosts_mutex_;
    std::vector<core::HostRecord> discovered_;
    HostsObserver hosts_observer_;
};

} // namespace client
