#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace kvplane {

/// Shared cooperative shutdown signal. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled.store(true);
        }
        state_->cv.notify_all();
    }

    bool isCancelled() const { return state_->cancelled.load(); }

    /// Sleep up to `timeout`; returns true as soon as the token is cancelled.
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this]() { return state_->cancelled.load(); });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::atomic<bool> cancelled{false};
    };

    std::shared_ptr<State> state_;
};

// Process-wide flag set from signal handlers; main() forwards it to tokens.
extern std::atomic<bool> g_running_flag;

inline bool is_running() { return g_running_flag.load(); }
inline void request_shutdown() { g_running_flag.store(false); }

}  // namespace kvplane
