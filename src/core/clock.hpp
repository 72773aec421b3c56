/**
 * @file clock.hpp
 * @brief Wall-clock abstraction for admission-time defaults and arming delays.
 */

#pragma once

#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <limits>

namespace task_orchestrator {

// ── Saturating epoch arithmetic ──────────────
// Caller-supplied times may sit anywhere in the int64 range, so offsets
// between them clamp instead of wrapping.

[[nodiscard]] constexpr EpochMillis saturating_add(EpochMillis a, int64_t b) noexcept {
    constexpr auto lo = std::numeric_limits<EpochMillis>::min();
    constexpr auto hi = std::numeric_limits<EpochMillis>::max();
    if (b > 0 && a > hi - b) return hi;
    if (b < 0 && a < lo - b) return lo;
    return a + b;
}

[[nodiscard]] constexpr int64_t saturating_sub(EpochMillis a, EpochMillis b) noexcept {
    constexpr auto lo = std::numeric_limits<EpochMillis>::min();
    constexpr auto hi = std::numeric_limits<EpochMillis>::max();
    if (b < 0 && a > hi + b) return hi;
    if (b > 0 && a < lo + b) return lo;
    return a - b;
}

/// Milliseconds from `now` until `when`, never negative.
[[nodiscard]] constexpr int64_t millis_until(EpochMillis when, EpochMillis now) noexcept {
    auto delta = saturating_sub(when, now);
    return delta < 0 ? 0 : delta;
}

class IClock {
public:
    virtual ~IClock() = default;

    /// Current wall-clock time in epoch milliseconds.
    [[nodiscard]] virtual EpochMillis now_ms() const = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] EpochMillis now_ms() const override {
        return std::chrono::duration_cast<Milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

/**
 * @brief Clock that only moves when told to, for deterministic tests.
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(EpochMillis start = 0) : now_(start) {}

    [[nodiscard]] EpochMillis now_ms() const override { return now_.load(); }

    void set(EpochMillis now) noexcept { now_.store(now); }
    void advance(Milliseconds delta) noexcept { now_.fetch_add(delta.count()); }

private:
    std::atomic<EpochMillis> now_;
};

}  // namespace task_orchestrator
