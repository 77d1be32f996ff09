#include "cancel.hpp"

namespace cliai {

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancelToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    bool woke = cv_.wait_for(lock, duration, [this] { return cancelled(); });
    return !woke;
}

} // namespace cliai
