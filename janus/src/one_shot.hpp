#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace janus {

/**
 * Single-resolution slot.
 *
 * Any number of producers may race to resolve it; the first compare-and-set
 * wins and every later attempt returns false without touching the value.
 */
template <typename T>
class OneShot {
public:
    bool try_resolve(T value) {
        bool expected = false;
        if (!claimed_.compare_exchange_strong(expected, true)) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            value_ = std::move(value);
        }
        cv_.notify_all();
        return true;
    }

    bool resolved() const { return claimed_.load(); }

    T wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return value_.has_value(); });
        return *value_;
    }

    template <typename Rep, typename Period>
    std::optional<T> wait_for(const std::chrono::duration<Rep, Period>& duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, duration, [this] { return value_.has_value(); })) {
            return std::nullopt;
        }
        return value_;
    }

private:
    std::atomic<bool> claimed_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> value_;
};

} // namespace janus
