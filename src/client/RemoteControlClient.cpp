#include "client/RemoteControlClient.hpp"

namespace client {

using namespace core::protocol;

RemoteControlClient::RemoteControlClient(interfaces::IExecutor& executor,
                                         interfaces::ChannelFactory channel_factory,
                                         std::shared_ptr<interfaces::ISettingsStore> store,
                                         std::shared_ptr<common::ILogger> logger,
                                         ClientOptions options)
    : logger_(logger ? std::move(logger) : common::make_null_logger()),
      directory_(std::move(store), logger_),
      scanner_(options.discovery, logger_),
      machine_(ConnectionStateMachine::create(executor, std::move(channel_factory), logger_, options.reconnect)) {
    auto loaded = directory_.load();
    if (loaded.is_err()) {
        logger_->warn("[Client] Saved hosts unavailable: " + loaded.error().message);
    }
    discovered_ = directory_.hosts();

    status_subscription_ = machine_->subscribe([this](const ConnectionStatus& status) { on_status(status); });
}

RemoteControlClient::~RemoteControlClient() {
    scanner_.stop();
    machine_->unsubscribe(status_subscription_);
}

// ========== Discovery ==========

void RemoteControlClient::start_discovery() {
    scanner_.start([this](const std::vector<core::HostRecord>& hosts) { on_hosts_found(hosts); });
}

void RemoteControlClient::stop_discovery() {
    scanner_.stop();
}

std::vector<core::HostRecord> RemoteControlClient::discovered_hosts() const {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    return discovered_;
}

void RemoteControlClient::on_hosts_found(const std::vector<core::HostRecord>& hosts) {
    if (hosts.empty()) {
        logger_->debug("[Client] Discovery window found no hosts");
        return;
    }

    for (const auto& host : hosts) {
        auto saved = directory_.remember(host);
        if (saved.is_err()) {
            logger_->warn("[Client] Could not save " + host.address + ": " + saved.error().message);
        }
    }

    HostsObserver observer;
    {
        std::lock_guard<std::mutex> lock(hosts_mutex_);
        discovered_ = hosts;
        observer = hosts_observer_;
    }
    logger_->info("[Client] Discovered " + std::to_string(hosts.size()) + " host(s)");
    if (observer) observer(hosts);
}

common::Result<core::HostRecord> RemoteControlClient::add_manual_host(const std::string& endpoint,
                                                                      const std::string& name) {
    return directory_.add_manual(endpoint, name);
}

bool RemoteControlClient::forget_host(const std::string& address) {
    return directory_.forget(address);
}

// ========== Connection ==========

void RemoteControlClient::connect(const core::HostRecord& host, const std::string& pin) {
    machine_->connect(host, pin);
}

void RemoteControlClient::disconnect() {
    machine_->disconnect();
}

void RemoteControlClient::retry() {
    machine_->retry();
}

void RemoteControlClient::on_status(const ConnectionStatus& status) {
    // Runs on the executor; remember a host the first time it becomes usable
    if (status.state == ConnectionState::Active && last_state_ != ConnectionState::Active && status.host) {
        auto saved = directory_.remember(*status.host);
        if (saved.is_err()) {
            logger_->warn("[Client] Could not save " + status.host->address + ": " + saved.error().message);
        }
    }
    last_state_ = status.state;
}

// ========== Input ==========

void RemoteControlClient::send_move(double dx, double dy) {
    machine_->send(Move{dx, dy});
}

void RemoteControlClient::send_click(const std::string& button, std::optional<bool> down) {
    machine_->send(Click{button, down});
}

void RemoteControlClient::send_key(const std::string& text) {
    machine_->send(Key{text});
}

void RemoteControlClient::send_hotkey(const std::vector<std::string>& keys) {
    machine_->send(Hotkey{keys});
}

void RemoteControlClient::send_scroll(int dx, int dy) {
    machine_->send(Scroll{dx, dy});
}

void RemoteControlClient::send_ping() {
    machine_->send(Ping{});
}

// ========== Observation ==========

ConnectionStateMachine::SubscriptionId RemoteControlClient::subscribe_status(
    ConnectionStateMachine::StatusObserver observer) {
    return machine_->subscribe(std::move(observer));
}

void RemoteControlClient::unsubscribe_status(ConnectionStateMachine::SubscriptionId id) {
    machine_->unsubscribe(id);
}

void RemoteControlClient::subscribe_hosts(HostsObserver observer) {
    std::lock_guard<std::mutex> lock(hosts_mutex_);
    hosts_observer_ = std::move(observer);
}

} // namespace client
