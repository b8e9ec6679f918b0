#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace stemsync::common {

/// Cooperative timer service on the control thread.
/// Callbacks never run on the audio thread and must not block.
class ControlScheduler {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;

    static constexpr TimerId kInvalidTimer = 0;

    virtual ~ControlScheduler() = default;

    /// Fire `callback` every `interval` until cancelled. The first tick is one interval from now.
    virtual TimerId scheduleRepeating(std::chrono::milliseconds interval, Callback callback) = 0;

    /// Cancel a timer. After this returns the callback is never invoked again. Unknown ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

}  // namespace stemsync::common
