#pragma once

#include "tempora/breakdown.hpp"
#include "tempora/duration.hpp"
#include "tempora/instant.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <cmath>
#include <cstdint>
#include <cstdio>

namespace tempora {

/// Longest single host-timer wait used by fire_at() before re-reading the clock
inline constexpr double REANCHOR_INTERVAL_MS = 30'000.0;

/**
 * @brief Host clock and single-shot timer
 *
 * The only collaborator the scheduler functions need. Implementations
 * promise that each scheduled callback runs exactly once, not before its
 * delay has elapsed, and never re-entrantly with another callback of the
 * same host. Nothing is promised about how late a callback may run.
 */
class TimerHost {
public:
    using Callback = std::function<void()>;

    virtual ~TimerHost() = default;

    /// Current wall-clock instant
    virtual Instant now() const = 0;

    /// Run `callback` once after `delay`; zero, negative or NaN means as soon as possible
    virtual void schedule_once(Duration delay, Callback callback) = 0;
};

/**
 * @brief Default TimerHost backed by one helper thread
 *
 * Callbacks run on the helper thread one at a time, ordered by due time and
 * then by scheduling order. Delays are measured on the steady clock; now()
 * reads the system clock.
 *
 * Destruction stops the thread; callbacks that are still pending are
 * dropped. A callback must not block on a future that only another callback
 * of the same TimerThread can satisfy.
 *
 * @note Thread safety: schedule_once() and now() may be called from any
 *       thread, including from inside a callback.
 */
class TimerThread final : public TimerHost {
public:
    TimerThread() : worker_([this] { run(); }) {}

    ~TimerThread() override {
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
        }
        wake_.notify_all();
        worker_.join();
    }

    TimerThread(const TimerThread&) = delete;
    TimerThread& operator=(const TimerThread&) = delete;

    Instant now() const override { return Instant::now(); }

    void schedule_once(Duration delay, Callback callback) override {
        // Keep the delay inside what steady_clock arithmetic can represent
        constexpr double MAX_DELAY_MS = 1e12;
        double ms = delay.as_milliseconds();
        if (!(ms > 0.0)) {
            ms = 0.0;
        }
        ms = std::min(ms, MAX_DELAY_MS);

        const auto wait = std::chrono::ceil<std::chrono::steady_clock::duration>(
            std::chrono::duration<double, std::milli>(ms));
        {
            std::lock_guard lock(mutex_);
            queue_.push_back(Entry{std::chrono::steady_clock::now() + wait, next_seq_++,
                                   std::move(callback)});
            std::push_heap(queue_.begin(), queue_.end(), Later{});
        }
        wake_.notify_one();
    }

    /// Number of callbacks not yet run
    std::size_t pending() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    struct Entry {
        std::chrono::steady_clock::time_point due;
        uint64_t seq;
        Callback callback;
    };

    // Heap comparator: the earliest (due, seq) ends up on top
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const noexcept {
            if (a.due != b.due) {
                return a.due > b.due;
            }
            return a.seq > b.seq;
        }
    };

    void run() {
        std::unique_lock lock(mutex_);
        while (!stopping_) {
            if (queue_.empty()) {
                wake_.wait(lock);
                continue;
            }
            const auto due = queue_.front().due;
            if (std::chrono::steady_clock::now() < due) {
                wake_.wait_until(lock, due);
                continue;
            }

            std::pop_heap(queue_.begin(), queue_.end(), Later{});
            Entry entry = std::move(queue_.back());
            queue_.pop_back();

            lock.unlock();
            invoke(entry.callback);
            lock.lock();
        }
    }

    static void invoke(const Callback& callback) {
        try {
            callback();
        } catch (const std::exception& e) {
            std::fprintf(stderr, "tempora: timer callback threw: %s\n", e.what());
        } catch (...) {
            std::fprintf(stderr, "tempora: timer callback threw an unknown exception\n");
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::vector<Entry> queue_;
    uint64_t next_seq_{0};
    bool stopping_{false};
    std::thread worker_; // last: started after the state above exists
};

/// Process-wide TimerThread used by the overloads without a host argument
inline TimerHost& default_timer_host() {
    static TimerThread host;
    return host;
}

/**
 * @brief Run `callback` once `target` is reached
 *
 * Platform timers are not trusted over long delays. While the target is
 * REANCHOR_INTERVAL_MS or more away, only a REANCHOR_INTERVAL_MS wait is
 * scheduled, after which the distance is recomputed against the live clock
 * and the original target. The final sub-interval segment is scheduled
 * once, directly against the target, so completion is not quantized to
 * the re-anchoring interval.
 *
 * Each re-anchor is a fresh host-timer task; the call stack does not grow
 * with the distance to the target. There is no cancellation.
 *
 * @param host Clock and timer; must outlive the callback
 * @param target Instant to fire at; a target in the past fires as soon as possible
 * @param callback Invoked once on the host's callback context
 */
inline void fire_at(TimerHost& host, Instant target, TimerHost::Callback callback) {
    const Duration remaining = host.now().difference(target);

    // Negated so a NaN distance fires instead of re-anchoring forever
    if (!(remaining.as_milliseconds() >= REANCHOR_INTERVAL_MS)) {
        host.schedule_once(remaining, std::move(callback));
        return;
    }

#ifdef TEMPORA_TRACE_SCHEDULER
    std::fprintf(stderr, "tempora: %.0f ms to %s, re-anchoring in %.0f ms\n",
                 remaining.as_milliseconds(), target.to_string().c_str(), REANCHOR_INTERVAL_MS);
#endif

    host.schedule_once(Duration(REANCHOR_INTERVAL_MS),
                       [&host, target, callback = std::move(callback)]() mutable {
                           fire_at(host, target, std::move(callback));
                       });
}

inline void fire_at(TimerHost& host, Instant::time_point target, TimerHost::Callback callback) {
    fire_at(host, Instant(target), std::move(callback));
}

inline void fire_at(Instant target, TimerHost::Callback callback) {
    fire_at(default_timer_host(), target, std::move(callback));
}

inline void fire_at(Instant::time_point target, TimerHost::Callback callback) {
    fire_at(default_timer_host(), Instant(target), std::move(callback));
}

/**
 * @brief What delayed_completion() waits for
 *
 * Duration, Breakdown and raw milliseconds are measured from now;
 * Instant and time_point are absolute.
 */
using WaitTarget =
    std::variant<Duration, double, Breakdown, Instant, std::chrono::system_clock::time_point>;

/// Absolute instant a WaitTarget refers to, relative to `host`'s clock
inline Instant resolve_target(const TimerHost& host, const WaitTarget& target) {
    return std::visit(
        [&host](const auto& value) -> Instant {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, Instant>) {
                return value;
            } else if constexpr (std::is_same_v<T, std::chrono::system_clock::time_point>) {
                return Instant(value);
            } else {
                return host.now().add(Duration(value));
            }
        },
        target);
}

/**
 * @brief Future that becomes ready once `target` is reached
 *
 * @code
 *   delayed_completion(Duration::from_seconds(90)).wait();
 *   delayed_completion(Instant::parse("2030-01-01 GMT").value()).wait();
 * @endcode
 *
 * Built on fire_at(), so long waits are re-anchored the same way.
 */
inline std::future<void> delayed_completion(TimerHost& host, const WaitTarget& target) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    fire_at(host, resolve_target(host, target), [promise]() { promise->set_value(); });
    return future;
}

inline std::future<void> delayed_completion(TimerHost& host, double milliseconds) {
    return delayed_completion(host, WaitTarget(Duration(milliseconds)));
}

inline std::future<void> delayed_completion(const WaitTarget& target) {
    return delayed_completion(default_timer_host(), target);
}

inline std::future<void> delayed_completion(double milliseconds) {
    return delayed_completion(default_timer_host(), milliseconds);
}

} // namespace tempora
