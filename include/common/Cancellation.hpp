#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace common {

    // The Token (View) - Passed to workers
    class CancellationToken {
        struct State {
            std::atomic<bool> requested{false};
        };
        std::shared_ptr<State> state;

    public:
        CancellationToken() : state(std::make_shared<State>()) {}

        // Check with ACQUIRE memory order (sees writes from owner)
        bool is_cancellation_requested() const {
            return state && state->requested.load(std::memory_order_acquire);
        }

        // Sleep in short slices so a cancel is noticed within `slice`.
        // Returns false if cancelled before the full duration elapsed.
        bool sleep_for(std::chrono::milliseconds duration,
                       std::chrono::milliseconds slice = std::chrono::milliseconds(100)) const {
            auto deadline = std::chrono::steady_clock::now() + duration;
            while (!is_cancellation_requested()) {
                auto now = std::chrono::steady_clock::now();
                if (now >= deadline) return true;
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
                std::this_thread::sleep_for(remaining < slice ? remaining : slice);
            }
            return false;
        }

        friend class CancellationSource;
    };

    // The Source (Owner) - Held by controller
    class CancellationSource {
        CancellationToken token;

    public:
        // Set with RELEASE memory order (flushes prior writes)
        void cancel() {
            if (token.state) {
                token.state->requested.store(true, std::memory_order_release);
            }
        }

        bool is_cancelled() const { return token.is_cancellation_requested(); }

        CancellationToken get_token() const { return token; }

        void reset() {
            token = CancellationToken(); // Create fresh state
        }
    };

} // namespace common
