#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "common/Logger.hpp"
#include "core/HostRecord.hpp"
#include "core/Protocol.hpp"
#include "interfaces/IClientChannel.hpp"
#include "interfaces/IExecutor.hpp"

namespace client {

enum class ConnectionState {
    Idle,
    Connecting,
    Authenticating,
    Active,
    Disconnected,
    Reconnecting,
    GivenUp
};

const char* to_string(ConnectionState state) noexcept;

struct ConnectionStatus {
    ConnectionState state = ConnectionState::Idle;
    int retry_count = 0;
    std::string last_error;
    std::optional<core::HostRecord> host;
    std::chrono::milliseconds next_retry_delay{0}; // set while Reconnecting

    bool operator==(const ConnectionStatus& o) const {
        return state == o.state && retry_count == o.retry_count && last_error == o.last_error &&
               host == o.host && next_retry_delay == o.next_retry_delay;
    }
};

struct ReconnectPolicy {
    int max_retries = 5;
    std::chrono::milliseconds base_delay{1000};      // delay grows by this per retry
    std::chrono::milliseconds max_delay{5000};
    std::chrono::milliseconds connect_timeout{10000}; // open to Active
    std::chrono::milliseconds settle_delay{100};      // open to Hello

    std::chrono::milliseconds delay_for(int retry_count) const {
        auto delay = base_delay * retry_count;
        return delay < max_delay ? delay : max_delay;
    }
};

/**
 * @brief Client side connection lifecycle.
 *
 *   Idle -> Connecting -> Authenticating -> Active
 *                 \             |            |
 *                  +----> Disconnected <-----+
 *                              |
 *              Reconnecting(n) -> Connecting   (n <= max_retries)
 *              GivenUp                         (otherwise, until retry())
 *
 * All transitions run on the executor. Public methods may be called from any
 * thread; they post onto the executor. Channel callbacks and timers carry the
 * attempt generation they were created for and are dropped once a newer
 * attempt (or a reset) has started.
 */
class ConnectionStateMachine : public std::enable_shared_from_this<ConnectionStateMachine> {
public:
    using StatusObserver = std::function<void(const ConnectionStatus&)>;
    using MessageObserver = std::function<void(const core::protocol::ControlMessage&)>;
    using SubscriptionId = uint64_t;

    static std::shared_ptr<ConnectionStateMachine> create(interfaces::IExecutor& executor,
                                                          interfaces::ChannelFactory channel_factory,
                                                          std::shared_ptr<common::ILogger> logger,
                                                          ReconnectPolicy policy = ReconnectPolicy());
    ~ConnectionStateMachine();

    // Start a fresh attempt against `host`, authenticating with `pin`.
    // Retry counter and last error are reset.
    void connect(const core::HostRecord& host, const std::string& pin);

    // Close the channel and return to Idle. Host and PIN are kept for retry().
    void disconnect();

    // Reset the retry counter and reconnect to the last host (any state but Idle without a host)
    void retry();

    // Drop everything: channel, timers, host, counters
    void reset();

    // Queue one message. Dropped (debug logged) unless Active when it runs.
    void send(const core::protocol::ControlMessage& message);

    // Snapshot; safe from any thread
    ConnectionStatus status() const;

    // Observers run on the executor thread
    SubscriptionId subscribe(StatusObserver observer);

    // Once this returns the observer is not running and will not run again.
    // Callable from inside an observer.
    void unsubscribe(SubscriptionId id);

    // Every decoded message received from the host (Ok, Error, Pong...).
    // Replacing it waits for a call in progress, like unsubscribe().
    void set_message_observer(MessageObserver observer);

private:
    ConnectionStateMachine(interfaces::IExecutor& executor,
                           interfaces::ChannelFactory channel_factory,
                           std::shared_ptr<common::ILogger> logger,
                           ReconnectPolicy policy);

    // All of the following run on the executor
    void begin_attempt();
    void on_open(uint64_t generation);
    void on_settled(uint64_t generation);
    void on_text(uint64_t generation, const std::string& text);
    void on_closed(uint64_t generation, const std::string& reason);
    void on_timeout(uint64_t generation);
    void fail(const std::string& reason);
    void on_retry_timer(uint64_t generation);
    void teardown();
    void set_state(ConnectionState state);
    void publish();

    // Post `fn` bound to a weak self so a destroyed machine ignores it
    void post_guarded(std::function<void(ConnectionStateMachine&)> fn);
    interfaces::TimerId schedule_guarded(std::chrono::milliseconds delay,
                                         std::function<void(ConnectionStateMachine&)> fn);

    interfaces::IExecutor& executor_;
    interfaces::ChannelFactory channel_factory_;
    std::shared_ptr<common::ILogger> logger_;
    ReconnectPolicy policy_;

    // Executor-thread state
    std::unique_ptr<interfaces::IClientChannel> channel_;
    std::string pin_;
    uint64_t generation_ = 0;
    std::optional<interfaces::TimerId> settle_timer_;
    std::optional<interfaces::TimerId> timeout_timer_;
    std::optional<interfaces::TimerId> retry_timer_;

    // Shared with other threads
    mutable std::mutex status_mutex_;
    ConnectionStatus status_;

    // Held while observers run; recursive so an observer may unsubscribe itself
    std::recursive_mutex dispatch_mutex_;
    std::mutex observer_mutex_;
    std::map<SubscriptionId, StatusObserver> observers_;
    SubscriptionId next_subscription_ = 1;
    MessageObserver message_observer_;
};

} // namespace client
