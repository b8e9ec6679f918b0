#include "stemsync/playback/ClockAcquisition.hpp"

#include <algorithm>
#include <utility>

namespace stemsync::playback {

ClockAcquisition::ClockAcquisition(common::ControlScheduler& scheduler, Options options)
    : scheduler_(scheduler), options_(options) {
    options_.maxAttempts = std::max(options_.maxAttempts, 0);
}

ClockAcquisition::~ClockAcquisition() {
    cancel();
}

bool ClockAcquisition::start(ReadingProvider provider, std::optional<audio::ClockReading> prior,
                             AcquiredCallback onAcquired, GaveUpCallback onGaveUp) {
    cancel();

    provider_ = std::move(provider);
    prior_ = prior;
    onAcquired_ = std::move(onAcquired);
    onGaveUp_ = std::move(onGaveUp);
    attempt_ = 0;
    attemptsPolled_ = 0;

    if (poll()) {
        auto acquired = std::move(onAcquired_);
        reset();
        if (acquired) {
            acquired(0);
        }
        return true;
    }

    if (options_.maxAttempts == 0) {
        auto gaveUp = std::move(onGaveUp_);
        reset();
        if (gaveUp) {
            gaveUp(0);
        }
        return false;
    }

    const uint64_t generation = generation_;
    timer_ = scheduler_.scheduleRepeating(options_.retryInterval, [this, generation]() { tick(generation); });
    return false;
}

void ClockAcquisition::cancel() {
    if (timer_ != common::ControlScheduler::kInvalidTimer) {
        scheduler_.cancel(timer_);
    }
    reset();
}

void ClockAcquisition::tick(uint64_t generation) {
    // A tick from a cancelled or restarted run.
    if (generation != generation_ || timer_ == common::ControlScheduler::kInvalidTimer) {
        return;
    }

    ++attempt_;
    const int attempt = attempt_;
    // Attempts 0..maxAttempts-1 poll; the tick after the last one only gives up.
    if (attempt >= options_.maxAttempts) {
        auto gaveUp = std::move(onGaveUp_);
        cancel();
        if (gaveUp) {
            gaveUp(attempt);
        }
        return;
    }

    if (poll()) {
        auto acquired = std::move(onAcquired_);
        cancel();
        if (acquired) {
            acquired(attempt);
        }
    }
}

bool ClockAcquisition::poll() {
    ++attemptsPolled_;
    if (!provider_) {
        return false;
    }
    return audio::isFreshReading(provider_(), prior_);
}

void ClockAcquisition::reset() {
    timer_ = common::ControlScheduler::kInvalidTimer;
    ++generation_;
    attempt_ = 0;
    provider_ = nullptr;
    prior_.reset();
    onAcquired_ = nullptr;
    onGaveUp_ = nullptr;
}

}  // namespace stemsync::playback
