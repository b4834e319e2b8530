#include "client/EventLoop.hpp"
#include <exception>

namespace client {

EventLoop::EventLoop(std::shared_ptr<common::ILogger> logger)
    : logger_(logger ? std::move(logger) : common::make_null_logger()) {
    thread_ = std::thread(&EventLoop::run, this);
}

EventLoop::~EventLoop() {
    stop();
}

void EventLoop::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return;
        tasks_.push_back(std::move(task));
    }
    wake_.notify_one();
}

interfaces::TimerId EventLoop::schedule(std::chrono::milliseconds delay, std::function<void()> task) {
    interfaces::TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        if (stop_) return id;
        auto it = timers_.emplace(Clock::now() + delay, std::make_pair(id, std::move(task)));
        timer_index_[id] = it;
    }
    wake_.notify_one();
    return id;
}

void EventLoop::cancel(interfaces::TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = timer_index_.find(id);
    if (found == timer_index_.end()) return;
    timers_.erase(found->second);
    timer_index_.erase(found);
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ && !thread_.joinable()) return;
        stop_ = true;
        tasks_.clear();
        timers_.clear();
        timer_index_.clear();
    }
    wake_.notify_all();

    // A task calling stop() from inside the loop cannot join itself
    if (thread_.joinable() && !is_loop_thread()) {
        thread_.join();
    }
}

void EventLoop::run() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (!stop_ && tasks_.empty()) {
                if (timers_.empty()) {
                    wake_.wait(lock);
                    continue;
                }
                auto next = timers_.begin();
                if (next->first <= Clock::now()) {
                    task = std::move(next->second.second);
                    timer_index_.erase(next->second.first);
                    timers_.erase(next);
                    break;
                }
                wake_.wait_until(lock, next->first);
            }

            if (stop_) return;

            if (!task) {
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
        }

        // Execute task outside the lock
        invoke(task);
    }
}

void EventLoop::invoke(const std::function<void()>& task) {
    try {
        task();
    } catch (const std::exception& e) {
        logger_->error(std::string("[EventLoop] Task failed: ") + e.what());
    }
}

} // namespace client
