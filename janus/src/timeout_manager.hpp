#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace janus {

/**
 * Deadline scheduler keyed by request id.
 *
 * A single timer thread fires callbacks outside the internal lock, so a
 * callback may call back into the manager. Registering an id that is already
 * scheduled replaces the earlier deadline.
 */
class TimeoutManager {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    TimeoutManager();
    ~TimeoutManager();

    TimeoutManager(const TimeoutManager&) = delete;
    TimeoutManager& operator=(const TimeoutManager&) = delete;

    void register_timeout(const std::string& id, std::chrono::milliseconds timeout, Callback callback);

    /// Returns false when nothing was scheduled under `id` (already fired or cancelled).
    bool cancel(const std::string& id);

    /// Pushes an active deadline further out. Returns false when `id` is not active.
    bool extend(const std::string& id, std::chrono::milliseconds extra);

    bool has_active(const std::string& id) const;
    size_t active_count() const;
    void clear();

private:
    struct Entry {
        Clock::time_point deadline;
        Callback callback;
        uint64_t generation = 0;
    };

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, Entry> entries_;
    std::multimap<Clock::time_point, std::pair<std::string, uint64_t>> schedule_;
    uint64_t next_generation_ = 0;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace janus
