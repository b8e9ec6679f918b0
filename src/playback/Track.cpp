#include "stemsync/playback/Track.hpp"

#include <algorithm>
#include <cmath>

namespace stemsync::playback {
namespace {

// Absorbs representation error so e.g. 0.7 s at 30 kHz maps to frame 21000, not 20999.
constexpr double kFrameEpsilon = 1e-6;

}  // namespace

Track::Track(std::unique_ptr<audio::AudioSource> source, audio::RenderGraph& graph)
    : graph_(graph), source_(std::move(source)), sampleRate_(source_->sampleRate()),
      totalFrames_(source_->lengthFrames()) {
    node_ = graph_.attach(*source_);
}

Track::~Track() {
    if (node_) {
        node_->stop();
        graph_.detach(*node_);
        node_.reset();
    }
}

double Track::durationSeconds() const {
    if (sampleRate_ == 0) {
        return 0.0;
    }
    return static_cast<double>(totalFrames_) / static_cast<double>(sampleRate_);
}

uint64_t Track::frameForTime(double seconds) const {
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return 0;
    }
    const double frame = std::floor(seconds * static_cast<double>(sampleRate_) + kFrameEpsilon);
    if (frame >= static_cast<double>(totalFrames_)) {
        return totalFrames_;
    }
    return static_cast<uint64_t>(frame);
}

void Track::scheduleFrom(uint64_t startFrame, std::optional<audio::RenderInstant> startInstant) {
    cursorFrame_ = std::min(startFrame, totalFrames_);
    node_->stop();
    node_->scheduleSegment(cursorFrame_, totalFrames_ - cursorFrame_);
    if (startInstant.has_value()) {
        node_->play(startInstant);
    }
}

void Track::play(std::optional<audio::RenderInstant> at) {
    node_->play(at);
}

void Track::pause() {
    node_->pause();
}

void Track::stop() {
    node_->stop();
}

bool Track::isPlaying() const {
    return node_->isPlaying();
}

std::optional<audio::ClockReading> Track::lastRenderTime() const {
    return node_->lastRenderTime();
}

uint64_t Track::renderedFrames() const {
    return node_->renderedFrames();
}

double Track::positionSeconds() const {
    if (sampleRate_ == 0) {
        return 0.0;
    }
    const uint64_t position = std::min(cursorFrame_ + renderedFrames(), totalFrames_);
    return static_cast<double>(position) / static_cast<double>(sampleRate_);
}

}  // namespace stemsync::playback
