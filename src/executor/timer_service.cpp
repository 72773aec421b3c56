/**
 * @file timer_service.cpp
 * @brief ThreadTimerService and ManualTimerService implementations.
 */

#include "executor/timer_service.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

namespace task_orchestrator {

// ─────────────────────────────────────────────
// ThreadTimerService
// ─────────────────────────────────────────────

ThreadTimerService::ThreadTimerService()
    : thread_([this](std::stop_token stop) { run(stop); }) {}

ThreadTimerService::~ThreadTimerService() {
    shutdown();
}

TimerId ThreadTimerService::arm(Milliseconds delay, Callback on_fire) {
    // A far-future delay saturates at the end of the steady clock instead of
    // wrapping into the past.
    auto now = std::chrono::steady_clock::now();
    auto headroom = std::chrono::duration_cast<Milliseconds>(SteadyTime::max() - now);
    auto deadline = now + std::clamp(delay, Milliseconds{0}, headroom);
    TimerId id;
    {
        std::lock_guard lock(mutex_);
        id = next_id_++;
        auto slot = deadlines_.emplace(deadline, id);
        timers_.emplace(id, Entry{slot, std::move(on_fire)});
    }
    cv_.notify_one();
    return id;
}

bool ThreadTimerService::disarm(TimerId id) {
    std::lock_guard lock(mutex_);
    auto it = timers_.find(id);
    if (it == timers_.end()) return false;
    deadlines_.erase(it->second.slot);
    timers_.erase(it);
    return true;
}

size_t ThreadTimerService::pending() const {
    std::lock_guard lock(mutex_);
    return timers_.size();
}

void ThreadTimerService::shutdown() {
    if (thread_.joinable()) {
        thread_.request_stop();
        cv_.notify_all();
        thread_.join();
    }
    std::lock_guard lock(mutex_);
    deadlines_.clear();
    timers_.clear();
}

uint64_t ThreadTimerService::fired_count() const noexcept {
    std::lock_guard lock(mutex_);
    return fired_;
}

void ThreadTimerService::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::vector<Callback> due;
        {
            std::unique_lock lock(mutex_);
            if (deadlines_.empty()) {
                cv_.wait(lock, stop, [this] { return !deadlines_.empty(); });
            } else {
                // Wake early when a sooner deadline is armed.
                auto next = deadlines_.begin()->first;
                // Saturated deadlines are waited for a day at a time.
                auto wake = std::min(next, std::chrono::steady_clock::now() + std::chrono::hours{24});
                cv_.wait_until(lock, stop, wake, [this, next] {
                    return deadlines_.empty() || deadlines_.begin()->first < next;
                });
            }
            if (stop.stop_requested()) return;

            auto now = std::chrono::steady_clock::now();
            while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
                auto id = deadlines_.begin()->second;
                deadlines_.erase(deadlines_.begin());
                auto node = timers_.extract(id);
                due.push_back(std::move(node.mapped().callback));
                ++fired_;
            }
        }

        for (auto& callback : due) {
            callback();
        }
    }
}

// ─────────────────────────────────────────────
// ManualTimerService
// ─────────────────────────────────────────────

TimerId ManualTimerService::arm(Milliseconds delay, Callback on_fire) {
    std::lock_guard lock(mutex_);
    auto id = next_id_++;
    if (shut_down_) return id;
    auto clamped = std::max<int64_t>(delay.count(), 0);
    auto deadline = now_ > std::numeric_limits<int64_t>::max() - clamped
        ? std::numeric_limits<int64_t>::max() : now_ + clamped;
    timers_.emplace(id, Entry{deadline, clamped, sequence_++, std::move(on_fire)});
    return id;
}

bool ManualTimerService::disarm(TimerId id) {
    std::lock_guard lock(mutex_);
    return timers_.erase(id) > 0;
}

size_t ManualTimerService::pending() const {
    std::lock_guard lock(mutex_);
    return timers_.size();
}

void ManualTimerService::shutdown() {
    std::lock_guard lock(mutex_);
    shut_down_ = true;
    timers_.clear();
}

size_t ManualTimerService::advance(Milliseconds delta) {
    int64_t target;
    {
        std::lock_guard lock(mutex_);
        now_ = now_ > std::numeric_limits<int64_t>::max() - delta.count()
            ? std::numeric_limits<int64_t>::max() : now_ + delta.count();
        target = now_;
    }
    return fire_until(target);
}

size_t ManualTimerService::fire_all() {
    return fire_until(std::numeric_limits<int64_t>::max());
}

size_t ManualTimerService::fire_until(int64_t deadline) {
    size_t fired = 0;
    // Callbacks may arm new timers; keep draining until nothing is due.
    while (true) {
        Callback callback;
        {
            std::lock_guard lock(mutex_);
            auto next = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.deadline > deadline) continue;
                if (next == timers_.end()
                    || it->second.deadline < next->second.deadline
                    || (it->second.deadline == next->second.deadline
                        && it->second.sequence < next->second.sequence)) {
                    next = it;
                }
            }
            if (next == timers_.end()) break;
            callback = std::move(next->second.callback);
            timers_.erase(next);
        }
        callback();
        ++fired;
    }
    return fired;
}

bool ManualTimerService::is_armed(TimerId id) const {
    std::lock_guard lock(mutex_);
    return timers_.contains(id);
}

int64_t ManualTimerService::delay_of(TimerId id) const {
    std::lock_guard lock(mutex_);
    auto it = timers_.find(id);
    return it == timers_.end() ? -1 : it->second.delay;
}

Milliseconds ManualTimerService::now() const {
    std::lock_guard lock(mutex_);
    return Milliseconds{now_};
}

}  // namespace task_orchestrator
