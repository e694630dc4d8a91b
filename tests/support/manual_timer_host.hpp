#pragma once

#include <tempora.hpp>

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

namespace tempora::test_support {

/**
 * TimerHost driven entirely by the test.
 *
 * Keeps two clocks: a monotonic clock that timers are measured on, and a
 * wall clock returned by now(). advance() moves both; skew_wall_clock()
 * moves only the wall clock, the way an NTP step or suspend would.
 * Callbacks run synchronously from advance(), in (due, scheduling order).
 */
class ManualTimerHost final : public TimerHost {
public:
    explicit ManualTimerHost(Instant start = Instant()) : wall_(start) {}

    Instant now() const override { return wall_; }

    void schedule_once(Duration delay, Callback callback) override {
        double ms = delay.as_milliseconds();
        if (!(ms > 0.0)) {
            ms = 0.0;
        }
        requested_.push_back(delay.as_milliseconds());
        timers_.push_back(Timer{monotonic_ms_ + ms, next_seq_++, std::move(callback)});
    }

    /// Move both clocks forward by `by`, running every callback that falls due
    void advance(Duration by) {
        const double end = monotonic_ms_ + by.as_milliseconds();
        for (;;) {
            auto next = std::min_element(timers_.begin(), timers_.end(),
                                         [](const Timer& a, const Timer& b) {
                                             return a.due_ms != b.due_ms ? a.due_ms < b.due_ms
                                                                         : a.seq < b.seq;
                                         });
            if (next == timers_.end() || next->due_ms > end) {
                break;
            }
            step_to(std::max(next->due_ms, monotonic_ms_));
            Callback callback = std::move(next->callback);
            timers_.erase(next);
            callback();
        }
        step_to(end);
    }

    /// Move only the wall clock
    void skew_wall_clock(Duration by) { wall_ = wall_.add(by); }

    /// Every delay passed to schedule_once(), unclamped, in call order
    const std::vector<double>& requested_delays() const { return requested_; }

    std::size_t pending() const { return timers_.size(); }

private:
    struct Timer {
        double due_ms;
        uint64_t seq;
        Callback callback;
    };

    void step_to(double monotonic_ms) {
        wall_ = wall_.add(Duration(monotonic_ms - monotonic_ms_));
        monotonic_ms_ = monotonic_ms;
    }

    Instant wall_;
    double monotonic_ms_{0.0};
    uint64_t next_seq_{0};
    std::vector<double> requested_;
    std::vector<Timer> timers_;
};

} // namespace tempora::test_support
