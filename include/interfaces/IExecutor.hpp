#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace interfaces {

    using TimerId = uint64_t;

    /**
     * Serial executor with one-shot timers. Tasks run one at a time in
     * submission order; a timer task runs on the same thread as posted tasks.
     */
    class IExecutor {
    public:
        virtual ~IExecutor() = default;

        virtual void post(std::function<void()> task) = 0;

        virtual TimerId schedule(std::chrono::milliseconds delay, std::function<void()> task) = 0;

        // Cancelling an already fired or unknown timer is a no-op
        virtual void cancel(TimerId id) = 0;
    };

}
