#pragma once

#include "stemsync/audio/AudioTypes.hpp"
#include "stemsync/common/ControlScheduler.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace stemsync::playback {

struct ClockAcquisitionOptions {
    std::chrono::milliseconds retryInterval{10};
    int maxAttempts = 30;
};

/// Bounded, cancellable wait for a fresh render clock reading.
///
/// Right after the output device (re)starts, the clock may report nothing, or the value it had
/// before the last stop. Starting tracks against such a reading desynchronizes them, so the
/// reading is polled once synchronously and then on a repeating control timer until it is fresh
/// or the attempt cap is reached.
class ClockAcquisition {
public:
    using ReadingProvider = std::function<std::optional<audio::ClockReading>()>;
    using AcquiredCallback = std::function<void(int attempt)>;
    using GaveUpCallback = std::function<void(int attempts)>;

    using Options = ClockAcquisitionOptions;

    explicit ClockAcquisition(common::ControlScheduler& scheduler, Options options = {});
    ~ClockAcquisition();

    ClockAcquisition(const ClockAcquisition&) = delete;
    ClockAcquisition& operator=(const ClockAcquisition&) = delete;

    /// Begin acquiring. Cancels any acquisition already in progress.
    /// Attempt 0 runs before this returns; when it succeeds `onAcquired(0)` has already been called
    /// and the return value is true. Otherwise attempts 1..maxAttempts-1 run on the scheduler, one per
    /// tick, and tick maxAttempts gives up without polling: exactly one of `onAcquired(n)` or
    /// `onGaveUp(maxAttempts)` is called later, unless cancel() runs first.
    bool start(ReadingProvider provider, std::optional<audio::ClockReading> prior, AcquiredCallback onAcquired,
               GaveUpCallback onGaveUp);

    /// Stop polling. Neither callback fires for the cancelled run.
    void cancel();

    [[nodiscard]] bool isPending() const { return timer_ != common::ControlScheduler::kInvalidTimer; }

    /// Attempts polled by the current (or most recent) run, attempt 0 included.
    [[nodiscard]] int attemptsPolled() const { return attemptsPolled_; }

    [[nodiscard]] const Options& options() const { return options_; }

private:
    void tick(uint64_t generation);
    bool poll();
    void reset();

    common::ControlScheduler& scheduler_;
    Options options_;

    common::ControlScheduler::TimerId timer_ = common::ControlScheduler::kInvalidTimer;
    uint64_t generation_ = 0;
    int attempt_ = 0;
    int attemptsPolled_ = 0;

    ReadingProvider provider_;
    std::optional<audio::ClockReading> prior_;
    AcquiredCallback onAcquired_;
    GaveUpCallback onGaveUp_;
};

}  // namespace stemsync::playback
