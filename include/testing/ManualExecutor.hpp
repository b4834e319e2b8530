#pragma once
#include "interfaces/IExecutor.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <utility>

namespace testing {

    /**
     * Deterministic executor with a virtual clock. Nothing runs until the
     * test calls run_pending() or advance(). Single threaded.
     */
    class ManualExecutor : public interfaces::IExecutor {
    public:
        void post(std::function<void()> task) override {
            tasks_.push_back(std::move(task));
        }

        interfaces::TimerId schedule(std::chrono::milliseconds delay, std::function<void()> task) override {
            interfaces::TimerId id = next_id_++;
            timers_[id] = Timer{now_ + delay, std::move(task)};
            return id;
        }

        void cancel(interfaces::TimerId id) override {
            timers_.erase(id);
        }

        // Run posted tasks (including ones they post) until the queue is empty
        void run_pending() {
            while (!tasks_.empty()) {
                auto task = std::move(tasks_.front());
                tasks_.pop_front();
                task();
            }
        }

        // Move the clock forward, firing due timers in deadline order and
        // draining posted tasks after each one
        void advance(std::chrono::milliseconds delta) {
            run_pending();
            const auto target = now_ + delta;
            while (true) {
                auto next = timers_.end();
                for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                    if (it->second.deadline <= target &&
                        (next == timers_.end() || it->second.deadline < next->second.deadline)) {
                        next = it;
                    }
                }
                if (next == timers_.end()) break;

                now_ = next->second.deadline;
                auto task = std::move(next->second.task);
                timers_.erase(next);
                task();
                run_pending();
            }
            now_ = target;
        }

        size_t pending_timers() const { return timers_.size(); }
        std::chrono::milliseconds now() const { return now_; }

        // Delay until the earliest timer, or -1ms when none is pending
        std::chrono::milliseconds next_timer_in() const {
            std::chrono::milliseconds best(-1);
            for (const auto& entry : timers_) {
                auto in = entry.second.deadline - now_;
                if (best.count() < 0 || in < best) best = in;
            }
            return best;
        }

    private:
        struct Timer {
            std::chrono::milliseconds deadline;
            std::function<void()> task;
        };

        std::chrono::milliseconds now_{0};
        interfaces::TimerId next_id_ = 1;
        std::deque<std::function<void()>> tasks_;
        std::map<interfaces::TimerId, Timer> timers_;
    };

} // namespace testing
