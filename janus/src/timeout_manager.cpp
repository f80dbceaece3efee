#include "timeout_manager.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <vector>

namespace janus {

TimeoutManager::TimeoutManager() : thread_(&TimeoutManager::run, this) {}

TimeoutManager::~TimeoutManager() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        entries_.clear();
        schedule_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void TimeoutManager::register_timeout(const std::string& id, std::chrono::milliseconds timeout, Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry entry;
        entry.deadline = Clock::now() + timeout;
        entry.callback = std::move(callback);
        entry.generation = ++next_generation_;
        schedule_.emplace(entry.deadline, std::make_pair(id, entry.generation));
        entries_[id] = std::move(entry);
    }
    cv_.notify_all();
}

bool TimeoutManager::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Stale schedule_ slots are skipped by generation when they come due.
    return entries_.erase(id) > 0;
}

bool TimeoutManager::extend(const std::string& id, std::chrono::milliseconds extra) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return false;
        }
        it->second.deadline += extra;
        it->second.generation = ++next_generation_;
        schedule_.emplace(it->second.deadline, std::make_pair(id, it->second.generation));
    }
    cv_.notify_all();
    return true;
}

bool TimeoutManager::has_active(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

size_t TimeoutManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TimeoutManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    schedule_.clear();
}

void TimeoutManager::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (schedule_.empty()) {
            cv_.wait(lock, [this] { return stopping_ || !schedule_.empty(); });
            continue;
        }

        auto next = schedule_.begin()->first;
        if (Clock::now() < next) {
            cv_.wait_until(lock, next);
            continue;
        }

        std::vector<Callback> due;
        auto now = Clock::now();
        while (!schedule_.empty() && schedule_.begin()->first <= now) {
            auto [id, generation] = schedule_.begin()->second;
            schedule_.erase(schedule_.begin());
            auto it = entries_.find(id);
            if (it == entries_.end() || it->second.generation != generation) {
                continue;
            }
            due.push_back(std::move(it->second.callback));
            entries_.erase(it);
        }

        lock.unlock();
        for (auto& callback : due) {
            try {
                callback();
            } catch (const std::exception& exc) {
                LOG4CPLUS_ERROR(core_logger(), "Timeout callback failed: " << exc.what());
            } catch (...) {
                LOG4CPLUS_ERROR(core_logger(), "Timeout callback threw a non-standard exception");
            }
        }
        lock.lock();
    }
}

} // namespace janus
