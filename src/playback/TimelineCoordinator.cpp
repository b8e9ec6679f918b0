#include "stemsync/playback/TimelineCoordinator.hpp"

#include "stemsync/common/Logger.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace stemsync::playback {

/// Marks the coordinator busy for the duration of an operation. Only the outermost guard
/// releases it and then runs operations that were queued meanwhile.
class TimelineCoordinator::OperationGuard {
public:
    explicit OperationGuard(TimelineCoordinator& coordinator)
        : coordinator_(coordinator), outermost_(!coordinator.busy_) {
        coordinator_.busy_ = true;
    }

    ~OperationGuard() {
        if (outermost_) {
            coordinator_.busy_ = false;
            coordinator_.drainDeferred();
        }
    }

    OperationGuard(const OperationGuard&) = delete;
    OperationGuard& operator=(const OperationGuard&) = delete;

private:
    TimelineCoordinator& coordinator_;
    bool outermost_;
};

TimelineCoordinator::TimelineCoordinator(audio::AudioSession& session, audio::RenderGraph& graph,
                                         common::ControlScheduler& scheduler, audio::SourceOpener opener,
                                         Options options)
    : session_(session), graph_(graph), opener_(std::move(opener)), options_(std::move(options)),
      acquisition_(scheduler, options_.acquisition) {
    if (!opener_) {
        opener_ = audio::openAudioFile;
    }
}

TimelineCoordinator::TimelineCoordinator(audio::AudioSession& session, audio::RenderGraph& graph,
                                         common::ControlScheduler& scheduler)
    : TimelineCoordinator(session, graph, scheduler, audio::openAudioFile, Options{}) {}

TimelineCoordinator::~TimelineCoordinator() {
    acquisition_.cancel();
    deferred_.clear();
    clearTimeline();
    if (session_.isActive()) {
        session_.deactivate();
    }
}

std::expected<LoadReport, LoadError> TimelineCoordinator::load(const std::vector<std::filesystem::path>& paths) {
    if (busy_) {
        common::Logger::logWarning("load() rejected: another playback operation is in progress");
        return std::unexpected(LoadError::Busy);
    }
    OperationGuard guard(*this);

    const PlaybackState previous = state_;
    acquisition_.cancel();
    clearTimeline();
    lastPausedReading_.reset();
    lastStartSynchronized_ = false;
    state_ = PlaybackState::Stopped;

    auto fail = [&](LoadError error) -> std::expected<LoadReport, LoadError> {
        common::Logger::logError(std::format("Load failed: {}", toString(error)));
        if (previous != PlaybackState::Stopped) {
            notifyChange();
        }
        return std::unexpected(error);
    };

    if (paths.empty()) {
        return fail(LoadError::NoPlayableSource);
    }

    LoadReport report;
    std::vector<std::unique_ptr<audio::AudioSource>> sources;
    sources.reserve(paths.size());
    for (const auto& path : paths) {
        auto opened = opener_(path);
        if (!opened.has_value()) {
            common::Logger::logWarning(std::format("Skipping '{}': {}", path.string(), opened.error()));
            report.skipped.push_back(SkippedSource{.path = path, .reason = opened.error()});
            continue;
        }
        if (!*opened || (*opened)->sampleRate() == 0) {
            common::Logger::logWarning(std::format("Skipping '{}': source reports no sample rate", path.string()));
            report.skipped.push_back(SkippedSource{.path = path, .reason = "source reports no sample rate"});
            continue;
        }
        sources.push_back(std::move(*opened));
    }

    if (sources.empty()) {
        return fail(LoadError::NoPlayableSource);
    }
    if (!report.skipped.empty() && options_.partialLoadPolicy == PartialLoadPolicy::RequireAll) {
        return fail(LoadError::PartialDecodeFailure);
    }

    // The reference source fixes the mixer format.
    const uint32_t referenceRate = sources.front()->sampleRate();
    graph_.configure(audio::RenderFormat{.sampleRate = referenceRate, .channels = 2});

    {
        audio::ScopedCommandBatch batch(graph_);
        for (auto& source : sources) {
            if (source->sampleRate() != referenceRate) {
                common::Logger::logWarning(std::format("'{}' is {} Hz but the reference track is {} Hz; it will drift",
                                                       source->name(), source->sampleRate(), referenceRate));
            }
            timeline_.tracks.push_back(std::make_unique<Track>(std::move(source), graph_));
        }
    }
    timeline_.recomputeDuration();

    repositionTracks(0.0);

    report.loadedCount = timeline_.tracks.size();
    report.durationSeconds = timeline_.durationSeconds;
    common::Logger::log(std::format("Loaded {} track(s), {:.3f} s at {} Hz ({} skipped)", report.loadedCount,
                                    report.durationSeconds, referenceRate, report.skipped.size()));

    if (previous != PlaybackState::Stopped) {
        notifyChange();
    }
    return report;
}

std::expected<void, audio::DeviceError> TimelineCoordinator::play() {
    if (busy_) {
        deferred_.emplace_back([this]() {
            if (auto started = play(); !started.has_value()) {
                common::Logger::logError(std::format("Deferred play() failed: {}", audio::toString(started.error())));
            }
        });
        return {};
    }
    OperationGuard guard(*this);

    if (timeline_.empty()) {
        common::Logger::logWarning("play() ignored: no tracks loaded");
        return {};
    }
    if (state_ == PlaybackState::Playing) {
        return {};
    }

    if (auto running = ensureOutputRunning(); !running.has_value()) {
        return std::unexpected(running.error());
    }

    state_ = PlaybackState::Playing;
    beginAcquisition();
    return {};
}

void TimelineCoordinator::pause() {
    if (busy_) {
        deferred_.emplace_back([this]() { pause(); });
        return;
    }
    OperationGuard guard(*this);

    if (state_ != PlaybackState::Playing) {
        return;
    }

    acquisition_.cancel();

    {
        audio::ScopedCommandBatch batch(graph_);
        for (auto& track : timeline_.tracks) {
            track->pause();
        }
    }
    graph_.stop();
    // Read once the device is stopped: the clock is frozen and a restart reports exactly this value.
    lastPausedReading_ = timeline_.reference().lastRenderTime();
    if (options_.deactivateSessionOnPause) {
        session_.deactivate();
    }

    state_ = PlaybackState::Paused;
    common::Logger::logDebug(std::format("Paused at {:.3f} s", currentTimeSeconds()));
    notifyChange();
}

void TimelineCoordinator::seek(double seconds) {
    if (busy_) {
        deferred_.emplace_back([this, seconds]() { seek(seconds); });
        return;
    }
    OperationGuard guard(*this);

    if (timeline_.empty()) {
        return;
    }

    acquisition_.cancel();
    repositionTracks(seconds);

    if (state_ == PlaybackState::Playing) {
        if (auto running = ensureOutputRunning(); !running.has_value()) {
            common::Logger::logError(
                std::format("Seek could not resume playback: {}", audio::toString(running.error())));
            state_ = PlaybackState::Paused;
            notifyChange();
            return;
        }
        beginAcquisition();
    }
}

bool TimelineCoordinator::isPlaying() const {
    if (timeline_.empty() || !graph_.isRunning()) {
        return false;
    }
    return timeline_.reference().isPlaying();
}

double TimelineCoordinator::currentTimeSeconds() const {
    if (timeline_.empty()) {
        return 0.0;
    }
    return std::min(timeline_.reference().positionSeconds(), timeline_.durationSeconds);
}

NowPlayingInfo TimelineCoordinator::nowPlayingInfo() const {
    return NowPlayingInfo{
        .title = options_.title,
        .artist = options_.artist,
        .durationSeconds = timeline_.durationSeconds,
        .playbackRate = isPlaying() ? 1.0 : 0.0,
        .elapsedSeconds = currentTimeSeconds(),
    };
}

std::expected<void, audio::DeviceError> TimelineCoordinator::ensureOutputRunning() {
    if (graph_.isRunning()) {
        return {};
    }

    if (!session_.isActive()) {
        if (auto activated = session_.activate(); !activated.has_value()) {
            common::Logger::logError(std::format("play() aborted: {}", audio::toString(activated.error())));
            return std::unexpected(activated.error());
        }
    }

    if (auto started = graph_.start(); !started.has_value()) {
        common::Logger::logError(std::format("play() aborted: {}", audio::toString(started.error())));
        return std::unexpected(started.error());
    }
    return {};
}

void TimelineCoordinator::beginAcquisition() {
    acquisition_.start([this]() { return timeline_.reference().lastRenderTime(); }, lastPausedReading_,
                       [this](int attempt) { onClockAcquired(attempt); },
                       [this](int attempts) { onAcquisitionGaveUp(attempts); });
}

void TimelineCoordinator::onClockAcquired(int attempt) {
    common::Logger::logDebug(std::format("Got a fresh render time at attempt {}", attempt));
    startTracks(true);
}

void TimelineCoordinator::onAcquisitionGaveUp(int attempts) {
    common::Logger::logWarning(
        std::format("No fresh render time after {} attempts; starting tracks unsynchronized", attempts));
    startTracks(false);
}

void TimelineCoordinator::startTracks(bool synchronized) {
    OperationGuard guard(*this);

    // Cancellation keeps late acquisitions away; this guards against a caller-side misuse.
    if (state_ != PlaybackState::Playing || timeline_.empty()) {
        return;
    }

    const std::optional<audio::RenderInstant> startInstant =
        synchronized ? synchronizedStartInstant() : std::nullopt;
    {
        audio::ScopedCommandBatch batch(graph_);
        for (auto& track : timeline_.tracks) {
            track->play(startInstant);
        }
    }

    lastStartSynchronized_ = startInstant.has_value();
    if (startInstant.has_value()) {
        common::Logger::logDebug(std::format("Started {} track(s) at sample time {}", timeline_.tracks.size(),
                                             startInstant->sampleTime));
    } else {
        common::Logger::logDebug(std::format("Started {} track(s) with no shared start time", timeline_.tracks.size()));
    }
    notifyChange();
}

std::optional<audio::RenderInstant> TimelineCoordinator::synchronizedStartInstant() const {
    const Track& reference = timeline_.reference();
    const auto renderTime = reference.lastRenderTime();
    if (!renderTime.has_value() || !renderTime->sampleTimeValid) {
        return std::nullopt;
    }

    // Cross-rate tracks share the reference track's rate for the instant.
    const double sampleRate = static_cast<double>(reference.sampleRate());
    const audio::RenderInstant reading{.sampleTime = renderTime->sampleTime, .sampleRate = renderTime->sampleRate};
    return audio::RenderInstant{
        .sampleTime = audio::instantAtRate(reading, sampleRate),
        .sampleRate = sampleRate,
    };
}

void TimelineCoordinator::repositionTracks(double seconds) {
    audio::ScopedCommandBatch batch(graph_);
    for (auto& track : timeline_.tracks) {
        track->scheduleFrom(track->frameForTime(seconds));
    }
}

void TimelineCoordinator::clearTimeline() {
    if (timeline_.empty()) {
        graph_.stop();
        return;
    }

    {
        audio::ScopedCommandBatch batch(graph_);
        for (auto& track : timeline_.tracks) {
            track->stop();
        }
    }
    graph_.stop();

    {
        audio::ScopedCommandBatch batch(graph_);
        timeline_.tracks.clear();
    }
    timeline_.recomputeDuration();
}

void TimelineCoordinator::notifyChange() {
    if (changeCallback_) {
        changeCallback_(state_);
    }
    if (nowPlayingSink_ != nullptr) {
        nowPlayingSink_->publish(nowPlayingInfo());
    }
}

void TimelineCoordinator::drainDeferred() {
    while (!busy_ && !deferred_.empty()) {
        auto operation = std::move(deferred_.front());
        deferred_.pop_front();
        operation();
    }
}

}  // namespace stemsync::playback
