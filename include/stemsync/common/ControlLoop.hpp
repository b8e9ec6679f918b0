#pragma once

#include "stemsync/common/ControlScheduler.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>

namespace stemsync::common {

/// Single-threaded timer queue driven by the owner's event loop.
/// The owner calls runDue() between input events; nextDeadline() bounds how long it may wait.
class ControlLoop : public ControlScheduler {
public:
    using Clock = std::chrono::steady_clock;

    ControlLoop() = default;

    ControlLoop(const ControlLoop&) = delete;
    ControlLoop& operator=(const ControlLoop&) = delete;

    TimerId scheduleRepeating(std::chrono::milliseconds interval, Callback callback) override;
    void cancel(TimerId id) override;

    /// Scheduling relative to an explicit time point (used by scheduleRepeating with Clock::now()).
    TimerId scheduleRepeatingAt(Clock::time_point now, std::chrono::milliseconds interval, Callback callback);

    /// Run every timer whose deadline is at or before `now`. Each timer fires at most once per call.
    /// Returns the number of callbacks invoked.
    size_t runDue(Clock::time_point now);
    size_t runDue() { return runDue(Clock::now()); }

    [[nodiscard]] std::optional<Clock::time_point> nextDeadline() const;
    [[nodiscard]] size_t activeTimerCount() const { return timers_.size(); }

private:
    struct Timer {
        Clock::time_point deadline;
        std::chrono::milliseconds interval{0};
        Callback callback;
    };

    std::map<TimerId, Timer> timers_;
    TimerId nextId_ = 1;
};

}  // namespace stemsync::common
