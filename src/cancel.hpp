#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace cliai {

// Cooperative cancellation signal for one turn. Checked at every suspension
// point: before and during retry waits, and between body reads.
class CancelToken {
public:
    void cancel();
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Sleep for up to `duration`. Returns false if cancelled before it elapsed.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace cliai
