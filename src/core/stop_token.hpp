#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace chromadex {

// Shared cancellation flag with an interruptible sleep.
class StopToken {
public:
    StopToken() = default;
    StopToken(const StopToken&) = delete;
    StopToken& operator=(const StopToken&) = delete;

    void request_stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_.store(true);
        }
        cv_.notify_all();
    }

    bool stop_requested() const { return stopped_.load(); }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(false);
    }

    // Returns false if the sleep was cut short by a stop request.
    template <typename Rep, typename Period>
    bool sleep_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return stopped_.load(); });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> stopped_{false};
};

}
