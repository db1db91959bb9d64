#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace common {

    // The Token (View) - Passed to workers
    class CancellationToken {
        struct State {
            std::atomic<bool> requested{false};
            std::mutex mutex;
            std::condition_variable cv;
        };
        std::shared_ptr<State> state;

    public:
        CancellationToken() : state(std::make_shared<State>()) {}

        // Check with ACQUIRE memory order (sees writes from owner)
        bool is_cancellation_requested() const {
            return state && state->requested.load(std::memory_order_acquire);
        }

        // Interruptible sleep. Returns true when cancellation arrived before the
        // deadline, false when the full duration elapsed.
        bool wait_for(std::chrono::milliseconds duration) const {
            if (!state) return false;
            std::unique_lock<std::mutex> lock(state->mutex);
            return state->cv.wait_for(lock, duration, [this] {
                return state->requested.load(std::memory_order_acquire);
            });
        }

        friend class CancellationSource;
    };

    // The Source (Owner) - Held by controller
    class CancellationSource {
        CancellationToken token;

    public:
        // Set with RELEASE memory order and wake every sleeper
        void cancel() {
            if (!token.state) return;
            {
                std::lock_guard<std::mutex> lock(token.state->mutex);
                token.state->requested.store(true, std::memory_order_release);
            }
            token.state->cv.notify_all();
        }

        bool is_cancelled() const { return token.is_cancellation_requested(); }

        CancellationToken get_token() const { return token; }

        void reset() {
            token = CancellationToken(); // Create fresh state
        }
    };

} // namespace common
