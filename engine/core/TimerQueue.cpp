#include "TimerQueue.h"

#include <algorithm>
#include <utility>

namespace Surge {

namespace {
// Repeating timers never fire more often than this, so a zero interval cannot stall advance().
constexpr double kMinIntervalMs = 1.0;
}  // namespace

TimerHandle TimerQueue::schedule(double delayMs, std::function<void()> callback) {
    return add(delayMs, 0.0, false, std::move(callback));
}

TimerHandle TimerQueue::scheduleRepeating(double intervalMs, std::function<void()> callback) {
    const double interval = std::max(kMinIntervalMs, intervalMs);
    return add(interval, interval, true, std::move(callback));
}

TimerHandle TimerQueue::add(double delayMs, double intervalMs, bool repeating, std::function<void()> callback) {
    Timer timer{};
    timer.handle = ++lastIssued_;
    timer.dueMs = nowMs_ + std::max(0.0, delayMs);
    timer.intervalMs = intervalMs;
    timer.repeating = repeating;
    timer.callback = std::move(callback);
    timers_.push_back(std::move(timer));
    return lastIssued_;
}

bool TimerQueue::cancel(TimerHandle handle) {
    auto it = std::find_if(timers_.begin(), timers_.end(), [handle](const Timer& t) { return t.handle == handle; });
    if (it == timers_.end()) {
        return false;
    }
    timers_.erase(it);
    return true;
}

bool TimerQueue::isPending(TimerHandle handle) const {
    return std::any_of(timers_.begin(), timers_.end(), [handle](const Timer& t) { return t.handle == handle; });
}

void TimerQueue::advance(double deltaMs) {
    const double target = nowMs_ + std::max(0.0, deltaMs);
    while (true) {
        auto due = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->dueMs <= target && (due == timers_.end() || it->dueMs < due->dueMs)) {
                due = it;
            }
        }
        if (due == timers_.end()) {
            break;
        }

        nowMs_ = std::max(nowMs_, due->dueMs);
        std::function<void()> callback = due->callback;
        if (due->repeating) {
            due->dueMs += due->intervalMs;
        } else {
            timers_.erase(due);
        }
        if (callback) {
            callback();
        }
    }
    nowMs_ = target;
}

void TimerQueue::clear() { timers_.clear(); }

std::size_t TimerQueue::pendingCount() const { return timers_.size(); }

}  // namespace Surge
