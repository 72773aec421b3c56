/**
 * @file timer_service.hpp
 * @brief Per-task deferred timers.
 *
 * ITimerService is the arming primitive the SchedulingEngine uses. Fire
 * callbacks must be short (the engine only enqueues work on the worker
 * pool from them) and must not call back into the timer service.
 *
 * Arm/disarm and firing are linearized by the service's own mutex:
 * disarm() returns true only if it removed the timer before it fired.
 */

#pragma once

#include "core/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace task_orchestrator {

class ITimerService {
public:
    using Callback = std::function<void()>;

    virtual ~ITimerService() = default;

    /// Arm a one-shot timer firing `delay` from now.
    virtual TimerId arm(Milliseconds delay, Callback on_fire) = 0;

    /// Cancel a timer. False when it already fired or never existed.
    virtual bool disarm(TimerId id) = 0;

    /// Number of timers armed and not yet fired.
    [[nodiscard]] virtual size_t pending() const = 0;

    /// Stop firing and discard all pending timers. Idempotent.
    virtual void shutdown() = 0;
};

// ─────────────────────────────────────────────
// ThreadTimerService
// ─────────────────────────────────────────────

/**
 * @brief Timer service backed by one std::jthread and a deadline-ordered multimap.
 */
class ThreadTimerService : public ITimerService {
public:
    ThreadTimerService();
    ~ThreadTimerService() override;

    ThreadTimerService(const ThreadTimerService&) = delete;
    ThreadTimerService& operator=(const ThreadTimerService&) = delete;

    TimerId arm(Milliseconds delay, Callback on_fire) override;
    bool disarm(TimerId id) override;
    [[nodiscard]] size_t pending() const override;
    void shutdown() override;

    [[nodiscard]] uint64_t fired_count() const noexcept;

private:
    struct Entry {
        std::multimap<SteadyTime, TimerId>::iterator slot;
        Callback callback;
    };

    void run(std::stop_token stop);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::multimap<SteadyTime, TimerId> deadlines_;
    std::unordered_map<TimerId, Entry> timers_;
    TimerId next_id_ = 1;
    uint64_t fired_ = 0;
    std::jthread thread_;
};

// ─────────────────────────────────────────────
// ManualTimerService
// ─────────────────────────────────────────────

/**
 * @brief Timer service on a virtual time line, for tests.
 *
 * Nothing fires until advance() or fire_all() is called; callbacks run on
 * the calling thread, in deadline order (arming order for ties).
 */
class ManualTimerService : public ITimerService {
public:
    TimerId arm(Milliseconds delay, Callback on_fire) override;
    bool disarm(TimerId id) override;
    [[nodiscard]] size_t pending() const override;
    void shutdown() override;

    /// Move virtual time forward and fire everything now due. Returns count fired.
    size_t advance(Milliseconds delta);

    /// Fire every pending timer regardless of deadline. Returns count fired.
    size_t fire_all();

    [[nodiscard]] bool is_armed(TimerId id) const;

    /// Delay a pending timer was armed with, or -1 when not pending.
    [[nodiscard]] int64_t delay_of(TimerId id) const;

    [[nodiscard]] Milliseconds now() const;

private:
    struct Entry {
        int64_t deadline;
        int64_t delay;
        uint64_t sequence;
        Callback callback;
    };

    size_t fire_until(int64_t deadline);

    mutable std::mutex mutex_;
    std::unordered_map<TimerId, Entry> timers_;
    int64_t now_ = 0;
    TimerId next_id_ = 1;
    uint64_t sequence_ = 0;
    bool shut_down_ = false;
};

}  // namespace task_orchestrator
