#include "courier/scheduler.hpp"

namespace courier {

TimerQueue::TimerQueue(clock_fn clock) : clock_{std::move(clock)} {}

timer_id TimerQueue::schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
    auto id = next_id_++;
    auto due = clock_() + delay;
    timers_.emplace(std::make_pair(due, id), std::move(fn));
    due_.emplace(id, due);
    return id;
}

bool TimerQueue::cancel(timer_id id) {
    auto it = due_.find(id);
    if (it == due_.end())
        return false;
    timers_.erase(std::make_pair(it->second, id));
    due_.erase(it);
    return true;
}

size_t TimerQueue::process() {
    size_t ran = 0;
    while (!timers_.empty()) {
        auto it = timers_.begin();
        if (it->first.first > clock_())
            break;
        auto fn = std::move(it->second);
        due_.erase(it->first.second);
        timers_.erase(it);
        fn();
        ran++;
    }
    return ran;
}

std::optional<sys_ms> TimerQueue::next_due() const {
    if (timers_.empty())
        return std::nullopt;
    return timers_.begin()->first.first;
}

RetryRegistry::RetryRegistry(Scheduler& scheduler) : scheduler_{scheduler} {}

RetryRegistry::~RetryRegistry() {
    cancel_all();
}

void RetryRegistry::schedule(
        const std::string& key, std::chrono::milliseconds delay, std::function<void()> fn) {
    cancel(key);
    auto id = scheduler_.schedule(delay, [this, key, fn = std::move(fn)] {
        timers_.erase(key);
        fn();
    });
    timers_.emplace(key, id);
}

bool RetryRegistry::cancel(std::string_view key) {
    auto it = timers_.find(key);
    if (it == timers_.end())
        return false;
    scheduler_.cancel(it->second);
    timers_.erase(it);
    return true;
}

void RetryRegistry::cancel_all() {
    for (auto& [key, id] : timers_)
        scheduler_.cancel(id);
    timers_.clear();
}

}  // namespace courier
