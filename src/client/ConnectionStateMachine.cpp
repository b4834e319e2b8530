#include "client/ConnectionStateMachine.hpp"

namespace client {

using namespace core::protocol;

const char* to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Idle:           return "Idle";
        case ConnectionState::Connecting:     return "Connecting";
        case ConnectionState::Authenticating: return "Authenticating";
        case ConnectionState::Active:         return "Active";
        case ConnectionState::Disconnected:   return "Disconnected";
        case ConnectionState::Reconnecting:   return "Reconnecting";
        case ConnectionState::GivenUp:        return "GivenUp";
    }
    return "Idle";
}

std::shared_ptr<ConnectionStateMachine> ConnectionStateMachine::create(
    interfaces::IExecutor& executor,
    interfaces::ChannelFactory channel_factory,
    std::shared_ptr<common::ILogger> logger,
    ReconnectPolicy policy) {
    return std::shared_ptr<ConnectionStateMachine>(
        new ConnectionStateMachine(executor, std::move(channel_factory), std::move(logger), policy));
}

ConnectionStateMachine::ConnectionStateMachine(interfaces::IExecutor& executor,
                                               interfaces::ChannelFactory channel_factory,
                                               std::shared_ptr<common::ILogger> logger,
                                               ReconnectPolicy policy)
    : executor_(executor),
      channel_factory_(std::move(channel_factory)),
      logger_(logger ? std::move(logger) : common::make_null_logger()),
      policy_(policy) {
}

ConnectionStateMachine::~ConnectionStateMachine() {
    if (channel_) {
        channel_->close();
    }
}

// ========== Public API (any thread) ==========

void ConnectionStateMachine::connect(const core::HostRecord& host, const std::string& pin) {
    post_guarded([host, pin](ConnectionStateMachine& m) {
        {
            std::lock_guard<std::mutex> lock(m.status_mutex_);
            m.status_.host = host;
            m.status_.retry_count = 0;
            m.status_.last_error.clear();
        }
        m.pin_ = pin;
        m.logger_->info("[Connection] Connecting to " + host.name + " (" + host.address + ":" +
                        std::to_string(host.port) + ")");
        m.begin_attempt();
    });
}

void ConnectionStateMachine::disconnect() {
    post_guarded([](ConnectionStateMachine& m) {
        m.teardown();
        {
            std::lock_guard<std::mutex> lock(m.status_mutex_);
            m.status_.retry_count = 0;
        }
        m.set_state(ConnectionState::Idle);
        m.logger_->info("[Connection] Disconnected by user");
        m.publish();
    });
}

void ConnectionStateMachine::retry() {
    post_guarded([](ConnectionStateMachine& m) {
        {
            std::lock_guard<std::mutex> lock(m.status_mutex_);
            if (!m.status_.host) {
                m.logger_->warn("[Connection] Nothing to retry: no host selected");
                return;
            }
            m.status_.retry_count = 0;
            m.status_.last_error.clear();
        }
        m.begin_attempt();
    });
}

void ConnectionStateMachine::reset() {
    post_guarded([](ConnectionStateMachine& m) {
        m.teardown();
        m.pin_.clear();
        {
            std::lock_guard<std::mutex> lock(m.status_mutex_);
            m.status_ = ConnectionStatus();
        }
        m.publish();
    });
}

void ConnectionStateMachine::send(const ControlMessage& message) {
    post_guarded([message](ConnectionStateMachine& m) {
        if (m.status().state != ConnectionState::Active || !m.channel_) {
            m.logger_->debug(std::string("[Connection] Dropping '") + type_tag(message) + "': not connected");
            return;
        }
        auto sent = m.channel_->send_text(encode(message));
        if (sent.is_err()) {
            // The channel reports the broken transport through on_closed
            m.logger_->warn("[Connection] Send failed: " + sent.error().message);
        }
    });
}

ConnectionStatus ConnectionStateMachine::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

ConnectionStateMachine::SubscriptionId ConnectionStateMachine::subscribe(StatusObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    SubscriptionId id = next_subscription_++;
    observers_[id] = std::move(observer);
    return id;
}

void ConnectionStateMachine::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observers_.erase(id);
}

void ConnectionStateMachine::set_message_observer(MessageObserver observer) {
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);
    std::lock_guard<std::mutex> lock(observer_mutex_);
    message_observer_ = std::move(observer);
}

// ========== Transitions (executor thread) ==========

void ConnectionStateMachine::begin_attempt() {
    teardown();

    core::HostRecord host;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        host = *status_.host;
        status_.next_retry_delay = std::chrono::milliseconds(0);
    }
    set_state(ConnectionState::Connecting);
    publish();

    const uint64_t generation = generation_;
    // Runs on the channel's IO thread. The executor outlives this machine.
    std::weak_ptr<ConnectionStateMachine> weak = shared_from_this();
    interfaces::IExecutor* executor = &executor_;
    auto guarded = [weak, executor](std::function<void(ConnectionStateMachine&)> fn) {
        executor->post([weak, fn]() {
            if (auto self = weak.lock()) fn(*self);
        });
    };

    interfaces::ChannelHandlers handlers;
    handlers.on_open = [guarded, generation]() {
        guarded([generation](ConnectionStateMachine& m) { m.on_open(generation); });
    };
    handlers.on_message = [guarded, generation](const std::string& text) {
        guarded([generation, text](ConnectionStateMachine& m) { m.on_text(generation, text); });
    };
    handlers.on_closed = [guarded, generation](const std::string& reason) {
        guarded([generation, reason](ConnectionStateMachine& m) { m.on_closed(generation, reason); });
    };

    timeout_timer_ = schedule_guarded(policy_.connect_timeout, [generation](ConnectionStateMachine& m) {
        m.on_timeout(generation);
    });

    channel_ = channel_factory_();
    if (!channel_) {
        fail("no channel available");
        return;
    }
    channel_->open(host.address, host.port, std::move(handlers));
}

void ConnectionStateMachine::on_open(uint64_t generation) {
    if (generation != generation_ || status().state != ConnectionState::Connecting) return;

    logger_->debug("[Connection] Channel open, authenticating shortly");
    settle_timer_ = schedule_guarded(policy_.settle_delay, [generation](ConnectionStateMachine& m) {
        m.on_settled(generation);
    });
}

void ConnectionStateMachine::on_settled(uint64_t generation) {
    if (generation != generation_ || status().state != ConnectionState::Connecting) return;
    settle_timer_.reset();

    auto sent = channel_->send_text(encode(Hello{pin_}));
    if (sent.is_err()) {
        fail(sent.error().message);
        return;
    }
    set_state(ConnectionState::Authenticating);
    publish();
}

void ConnectionStateMachine::on_text(uint64_t generation, const std::string& text) {
    if (generation != generation_) return;

    auto decoded = decode(text);
    if (decoded.is_err()) {
        logger_->warn("[Connection] Ignoring bad message from host: " + decoded.error().message);
        return;
    }
    const ControlMessage& message = decoded.unwrap();

    {
        std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);
        MessageObserver observer;
        {
            std::lock_guard<std::mutex> lock(observer_mutex_);
            observer = message_observer_;
        }
        if (observer) observer(message);
    }

    const ConnectionState state = status().state;
    if (state == ConnectionState::Connecting) {
        // A host refusing the connection (server full) answers before Hello
        if (const auto* error = std::get_if<Error>(&message)) {
            fail(error->message);
        }
    } else if (state == ConnectionState::Authenticating) {
        if (const auto* ok = std::get_if<Ok>(&message)) {
            if (timeout_timer_) {
                executor_.cancel(*timeout_timer_);
                timeout_timer_.reset();
            }
            {
                std::lock_guard<std::mutex> lock(status_mutex_);
                status_.retry_count = 0;
                status_.last_error.clear();
                if (status_.host && !ok->server.empty()) status_.host->name = ok->server;
                if (status_.host && !ok->capabilities.empty()) status_.host->capabilities = ok->capabilities;
            }
            set_state(ConnectionState::Active);
            logger_->info("[Connection] Authenticated" + (ok->server.empty() ? "" : " with " + ok->server));
            publish();
        } else if (const auto* error = std::get_if<Error>(&message)) {
            fail(error->message);
        }
    } else if (state == ConnectionState::Active) {
        if (const auto* error = std::get_if<Error>(&message)) {
            logger_->warn("[Connection] Host reported: " + error->message);
            {
                std::lock_guard<std::mutex> lock(status_mutex_);
                status_.last_error = error->message;
            }
            publish();
        }
    }
}

void ConnectionStateMachine::on_closed(uint64_t generation, const std::string& reason) {
    if (generation != generation_) return;

    const ConnectionState state = status().state;
    if (state == ConnectionState::Connecting || state == ConnectionState::Authenticating ||
        state == ConnectionState::Active) {
        fail(reason);
    }
}

void ConnectionStateMachine::on_timeout(uint64_t generation) {
    if (generation != generation_) return;
    timeout_timer_.reset();

    const ConnectionState state = status().state;
    if (state == ConnectionState::Connecting || state == ConnectionState::Authenticating) {
        fail("connection timed out");
    }
}

void ConnectionStateMachine::fail(const std::string& reason) {
    teardown();

    int retry_count;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.last_error = reason;
        retry_count = status_.retry_count;
    }
    set_state(ConnectionState::Disconnected);
    logger_->warn("[Connection] Disconnected: " + reason);
    publish();

    if (retry_count >= policy_.max_retries) {
        set_state(ConnectionState::GivenUp);
        logger_->warn("[Connection] Giving up after " + std::to_string(retry_count) + " retries");
        publish();
        return;
    }

    ++retry_count;
    const auto delay = policy_.delay_for(retry_count);
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.retry_count = retry_count;
        status_.next_retry_delay = delay;
    }
    set_state(ConnectionState::Reconnecting);
    logger_->info("[Connection] Retry " + std::to_string(retry_count) + " in " +
                  std::to_string(delay.count()) + "ms");

    const uint64_t generation = generation_;
    retry_timer_ = schedule_guarded(delay, [generation](ConnectionStateMachine& m) {
        m.on_retry_timer(generation);
    });
    publish();
}

void ConnectionStateMachine::on_retry_timer(uint64_t generation) {
    if (generation != generation_) return;
    retry_timer_.reset();
    if (status().state == ConnectionState::Reconnecting) {
        begin_attempt();
    }
}

// Close the channel, cancel every timer and invalidate outstanding callbacks
void ConnectionStateMachine::teardown() {
    for (auto* timer : {&settle_timer_, &timeout_timer_, &retry_timer_}) {
        if (*timer) {
            executor_.cancel(**timer);
            timer->reset();
        }
    }
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
    ++generation_;
}

void ConnectionStateMachine::set_state(ConnectionState state) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (status_.state != state) {
        logger_->debug(std::string("[Connection] ") + to_string(status_.state) + " -> " + to_string(state));
    }
    status_.state = state;
    if (state != ConnectionState::Reconnecting) {
        status_.next_retry_delay = std::chrono::milliseconds(0);
    }
}

void ConnectionStateMachine::publish() {
    const ConnectionStatus snapshot = status();
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);
    std::map<SubscriptionId, StatusObserver> observers;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observers = observers_;
    }
    for (const auto& entry : observers) {
        {
            // An earlier observer in this round may have removed it
            std::lock_guard<std::mutex> lock(observer_mutex_);
            if (observers_.find(entry.first) == observers_.end()) continue;
        }
        entry.second(snapshot);
    }
}

void ConnectionStateMachine::post_guarded(std::function<void(ConnectionStateMachine&)> fn) {
    std::weak_ptr<ConnectionStateMachine> weak = shared_from_this();
    executor_.post([weak, fn]() {
        if (auto self = weak.lock()) fn(*self);
    });
}

interfaces::TimerId ConnectionStateMachine::schedule_guarded(std::chrono::milliseconds delay,
                                                             std::function<void(ConnectionStateMachine&)> fn) {
    std::weak_ptr<ConnectionStateMachine> weak = shared_from_this();
    return executor_.schedule(delay, [weak, fn]() {
        if (auto self = weak.lock()) fn(*self);
    });
}

} // namespace client
