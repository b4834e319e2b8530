#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include "common/Logger.hpp"
#include "interfaces/IExecutor.hpp"

namespace client {

/**
 * @brief Single-threaded serial executor with one-shot timers.
 *
 * Every input of the client state machine (UI call, channel event, timer)
 * is posted here, so state is only ever touched from this one thread.
 * Posted tasks run before due timers; timers run in deadline order.
 */
class EventLoop : public interfaces::IExecutor {
public:
    explicit EventLoop(std::shared_ptr<common::ILogger> logger = nullptr);
    ~EventLoop() override;

    // Non-copyable, non-movable
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(std::function<void()> task) override;
    interfaces::TimerId schedule(std::chrono::milliseconds delay, std::function<void()> task) override;
    void cancel(interfaces::TimerId id) override;

    // Stop accepting work and join the thread. Pending tasks and timers are dropped.
    void stop();

    bool is_loop_thread() const { return std::this_thread::get_id() == thread_.get_id(); }

private:
    using Clock = std::chrono::steady_clock;
    using TimerQueue = std::multimap<Clock::time_point, std::pair<interfaces::TimerId, std::function<void()>>>;

    void run();
    void invoke(const std::function<void()>& task);

    std::shared_ptr<common::ILogger> logger_;

    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> tasks_;
    TimerQueue timers_;
    std::unordered_map<interfaces::TimerId, TimerQueue::iterator> timer_index_;
    interfaces::TimerId next_timer_id_ = 1;
    bool stop_ = false;

    std::thread thread_;
};

} // namespace client
