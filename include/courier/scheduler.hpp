#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "types.hpp"
#include "util.hpp"

namespace courier {

using timer_id = uint64_t;

/// Source of one-shot timers.  Services never sleep or spawn threads; they ask a Scheduler to call
/// them back, and the host decides how timers are driven.
class Scheduler {
  public:
    virtual ~Scheduler() = default;

    /// Arranges for `fn` to be invoked once, `delay` from now.  Returns an id for `cancel`.
    virtual timer_id schedule(std::chrono::milliseconds delay, std::function<void()> fn) = 0;

    /// Cancels a timer that has not fired yet.  Returns false if there was no such timer.
    virtual bool cancel(timer_id id) = 0;
};

/// Scheduler driven by the host's event loop: the host calls `process()` whenever it wakes up
/// (typically at `next_due()`), and every timer that is due according to the clock runs on the
/// calling thread.
class TimerQueue : public Scheduler {
  public:
    explicit TimerQueue(clock_fn clock = now_ms);

    timer_id schedule(std::chrono::milliseconds delay, std::function<void()> fn) override;
    bool cancel(timer_id id) override;

    /// API: scheduler/TimerQueue::process
    ///
    /// Runs all timers whose due time is not after the current clock time, earliest first.  Timers
    /// scheduled by a callback run in the same call if they are already due.
    ///
    /// Outputs:
    /// - the number of callbacks invoked.
    size_t process();

    // Due time of the earliest pending timer, if any.
    std::optional<sys_ms> next_due() const;

    size_t size() const { return timers_.size(); }
    bool empty() const { return timers_.empty(); }

  private:
    clock_fn clock_;
    timer_id next_id_ = 1;
    std::map<std::pair<sys_ms, timer_id>, std::function<void()>> timers_;
    std::unordered_map<timer_id, sys_ms> due_;
};

/// Table of pending retries keyed by the id of the item being retried.  Scheduling a retry for a
/// key replaces (and cancels) any retry already pending for it, and the entry is dropped once its
/// timer fires or is cancelled.
class RetryRegistry {
  public:
    explicit RetryRegistry(Scheduler& scheduler);
    ~RetryRegistry();

    RetryRegistry(const RetryRegistry&) = delete;
    RetryRegistry& operator=(const RetryRegistry&) = delete;

    void schedule(const std::string& key, std::chrono::milliseconds delay, std::function<void()> fn);
    bool cancel(std::string_view key);
    void cancel_all();

    bool pending(std::string_view key) const { return timers_.count(key) > 0; }
    size_t size() const { return timers_.size(); }

  private:
    Scheduler& scheduler_;
    std::map<std::string, timer_id, std::less<>> timers_;
};

}  // namespace courier
