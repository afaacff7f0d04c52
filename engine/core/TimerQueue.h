// Frame-driven timers: one-shot and repeating callbacks fired from advance(), cancellable by handle.
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace Surge {

using TimerHandle = std::uint32_t;
constexpr TimerHandle kInvalidTimer = 0;

class TimerQueue {
public:
    TimerHandle schedule(double delayMs, std::function<void()> callback);
    TimerHandle scheduleRepeating(double intervalMs, std::function<void()> callback);

    // Returns false if the handle is unknown or already fired/cancelled.
    bool cancel(TimerHandle handle);
    bool isPending(TimerHandle handle) const;

    // Moves the clock forward and fires every timer that came due, earliest first.
    // Callbacks observe nowMs() equal to their own due time and may schedule or cancel timers.
    void advance(double deltaMs);
    void clear();

    double nowMs() const { return nowMs_; }
    std::size_t pendingCount() const;

private:
    struct Timer {
        TimerHandle handle{kInvalidTimer};
        double dueMs{0.0};
        double intervalMs{0.0};
        bool repeating{false};
        std::function<void()> callback;
    };

    TimerHandle add(double delayMs, double intervalMs, bool repeating, std::function<void()> callback);

    std::vector<Timer> timers_;
    TimerHandle lastIssued_{kInvalidTimer};
    double nowMs_{0.0};
};

}  // namespace Surge
