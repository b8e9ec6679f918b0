#pragma once

#include "stemsync/audio/AudioSession.hpp"
#include "stemsync/audio/AudioSource.hpp"
#include "stemsync/audio/AudioTypes.hpp"
#include "stemsync/audio/RenderGraph.hpp"
#include "stemsync/common/ControlScheduler.hpp"
#include "stemsync/playback/ClockAcquisition.hpp"
#include "stemsync/playback/PlaybackTypes.hpp"
#include "stemsync/playback/Timeline.hpp"

#include <cstddef>
#include <deque>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stemsync::playback {

/// Owns the tracks of one composition and keeps them phase-locked to a shared timeline.
///
/// All operations run on the control thread. An operation requested from inside another one
/// (an observer or now-playing sink calling back in) is queued and runs after the current
/// operation completes; load() is rejected with LoadError::Busy instead.
class TimelineCoordinator {
public:
    struct Options {
        ClockAcquisition::Options acquisition{};
        PartialLoadPolicy partialLoadPolicy = PartialLoadPolicy::SkipFailed;
        bool deactivateSessionOnPause = false;
        std::string title;
        std::string artist;
    };

    using ChangeCallback = std::function<void(PlaybackState state)>;

    TimelineCoordinator(audio::AudioSession& session, audio::RenderGraph& graph, common::ControlScheduler& scheduler,
                        audio::SourceOpener opener, Options options);
    TimelineCoordinator(audio::AudioSession& session, audio::RenderGraph& graph, common::ControlScheduler& scheduler);
    ~TimelineCoordinator();

    TimelineCoordinator(const TimelineCoordinator&) = delete;
    TimelineCoordinator& operator=(const TimelineCoordinator&) = delete;

    /// Replace the timeline with `paths`, stopped and positioned at 0.
    std::expected<LoadReport, LoadError> load(const std::vector<std::filesystem::path>& paths);

    /// Start or resume. Returns once the start is armed; tracks begin when the clock is acquired.
    std::expected<void, audio::DeviceError> play();

    void pause();

    /// Reposition every track to `seconds` on the shared timeline; resynchronizes when playing.
    void seek(double seconds);

    /// True only while audio is actually being produced.
    [[nodiscard]] bool isPlaying() const;

    [[nodiscard]] PlaybackState state() const { return state_; }
    [[nodiscard]] double durationSeconds() const { return timeline_.durationSeconds; }
    [[nodiscard]] double currentTimeSeconds() const;
    [[nodiscard]] size_t trackCount() const { return timeline_.tracks.size(); }
    [[nodiscard]] const Track& track(size_t index) const { return *timeline_.tracks.at(index); }
    [[nodiscard]] bool isAcquiring() const { return acquisition_.isPending(); }
    [[nodiscard]] bool lastStartWasSynchronized() const { return lastStartSynchronized_; }
    [[nodiscard]] const std::optional<audio::ClockReading>& lastPausedReading() const { return lastPausedReading_; }
    [[nodiscard]] const Options& options() const { return options_; }

    /// Called whenever a start or stop takes audible effect, never on a mere request.
    void setChangeCallback(ChangeCallback callback) { changeCallback_ = std::move(callback); }

    /// Non-owning. Pass nullptr to disconnect.
    void setNowPlayingSink(NowPlayingSink* sink) { nowPlayingSink_ = sink; }

    [[nodiscard]] NowPlayingInfo nowPlayingInfo() const;

private:
    class OperationGuard;

    std::expected<void, audio::DeviceError> ensureOutputRunning();
    void beginAcquisition();
    void onClockAcquired(int attempt);
    void onAcquisitionGaveUp(int attempts);
    void startTracks(bool synchronized);
    [[nodiscard]] std::optional<audio::RenderInstant> synchronizedStartInstant() const;
    void repositionTracks(double seconds);
    void clearTimeline();
    void notifyChange();
    void drainDeferred();

    audio::AudioSession& session_;
    audio::RenderGraph& graph_;
    audio::SourceOpener opener_;
    Options options_;
    ClockAcquisition acquisition_;

    Timeline timeline_;
    PlaybackState state_ = PlaybackState::Stopped;
    std::optional<audio::ClockReading> lastPausedReading_;
    bool lastStartSynchronized_ = false;

    ChangeCallback changeCallback_;
    NowPlayingSink* nowPlayingSink_ = nullptr;

    bool busy_ = false;
    std::deque<std::function<void()>> deferred_;
};

}  // namespace stemsync::playback
