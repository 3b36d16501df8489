#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace mailsift::crawler {

// Cooperative stop signal. The crawler polls it at batch boundaries; a batch
// already in flight always finishes.
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool isCancelled() const {
        return cancelled_.load();
    }

    // Sleep for up to delay; returns true if cancelled before or during the wait
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> delay) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, delay, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace mailsift::crawler
