#include "stemsync/common/ControlLoop.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace stemsync::common {

ControlScheduler::TimerId ControlLoop::scheduleRepeating(std::chrono::milliseconds interval, Callback callback) {
    return scheduleRepeatingAt(Clock::now(), interval, std::move(callback));
}

ControlScheduler::TimerId ControlLoop::scheduleRepeatingAt(Clock::time_point now, std::chrono::milliseconds interval,
                                                          Callback callback) {
    // A zero interval would spin the owner's loop.
    const auto effectiveInterval = std::max(interval, std::chrono::milliseconds(1));
    const TimerId id = nextId_++;
    timers_.emplace(id, Timer{
                            .deadline = now + effectiveInterval,
                            .interval = effectiveInterval,
                            .callback = std::move(callback),
                        });
    return id;
}

void ControlLoop::cancel(TimerId id) {
    timers_.erase(id);
}

size_t ControlLoop::runDue(Clock::time_point now) {
    std::vector<TimerId> due;
    for (const auto& [id, timer] : timers_) {
        if (timer.deadline <= now) {
            due.push_back(id);
        }
    }

    size_t fired = 0;
    for (const TimerId id : due) {
        // A previous callback in this pass may have cancelled this timer.
        auto it = timers_.find(id);
        if (it == timers_.end()) {
            continue;
        }

        Timer& timer = it->second;
        timer.deadline += timer.interval;
        if (timer.deadline <= now) {
            timer.deadline = now + timer.interval;
        }

        // Copy so the callback may cancel its own timer.
        Callback callback = timer.callback;
        callback();
        ++fired;
    }
    return fired;
}

std::optional<ControlLoop::Clock::time_point> ControlLoop::nextDeadline() const {
    std::optional<Clock::time_point> earliest;
    for (const auto& [id, timer] : timers_) {
        if (!earliest.has_value() || timer.deadline < *earliest) {
            earliest = timer.deadline;
        }
    }
    return earliest;
}

}  // namespace stemsync::common
