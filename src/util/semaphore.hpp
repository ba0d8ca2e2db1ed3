// File: src/util/semaphore.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace engram {

/// Counting semaphore capping concurrent work
class Semaphore {
public:
    explicit Semaphore(size_t permits) : permits_(permits == 0 ? 1 : permits) {}

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    /// Wait at most `timeout`; false when no permit became free
    template <typename Rep, typename Period>
    bool TryAcquireFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return permits_ > 0; })) {
            return false;
        }
        --permits_;
        return true;
    }

    void Release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++permits_;
        }
        cv_.notify_one();
    }

    size_t Available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return permits_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t permits_;
};

/// Returns a permit taken with TryAcquireFor when it goes out of scope
class SemaphoreGuard {
public:
    SemaphoreGuard(Semaphore& semaphore, std::adopt_lock_t) : semaphore_(semaphore) {}
    ~SemaphoreGuard() { semaphore_.Release(); }

    SemaphoreGuard(const SemaphoreGuard&) = delete;
    SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;

private:
    Semaphore& semaphore_;
};

} // namespace engram
