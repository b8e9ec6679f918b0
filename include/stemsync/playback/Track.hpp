#pragma once

#include "stemsync/audio/AudioSource.hpp"
#include "stemsync/audio/AudioTypes.hpp"
#include "stemsync/audio/RenderGraph.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace stemsync::playback {

/// One stem: a decoded source, its read cursor and the player node it renders through.
/// Constructing a Track attaches it to the render graph; destroying it stops and detaches it.
class Track {
public:
    Track(std::unique_ptr<audio::AudioSource> source, audio::RenderGraph& graph);
    ~Track();

    Track(const Track&) = delete;
    Track& operator=(const Track&) = delete;

    [[nodiscard]] const std::string& name() const { return source_->name(); }
    [[nodiscard]] uint32_t sampleRate() const { return sampleRate_; }
    [[nodiscard]] uint64_t totalFrames() const { return totalFrames_; }
    [[nodiscard]] uint64_t cursorFrame() const { return cursorFrame_; }
    [[nodiscard]] double durationSeconds() const;

    /// Source frame for a timeline position: floor(seconds * sampleRate) clamped to [0, totalFrames].
    [[nodiscard]] uint64_t frameForTime(double seconds) const;

    /// Re-arm the node to render [startFrame, totalFrames). Without a start instant the segment
    /// begins as soon as the node is played; with one the node is played gated on that instant.
    void scheduleFrom(uint64_t startFrame, std::optional<audio::RenderInstant> startInstant = std::nullopt);

    void play(std::optional<audio::RenderInstant> at);
    void pause();

    /// Halt emission and drop the schedule. cursorFrame() is left unchanged.
    void stop();

    [[nodiscard]] bool isPlaying() const;
    [[nodiscard]] std::optional<audio::ClockReading> lastRenderTime() const;

    /// Frames rendered since the last scheduleFrom().
    [[nodiscard]] uint64_t renderedFrames() const;

    /// Timeline position in seconds: cursor plus rendered frames, capped at the end of the source.
    [[nodiscard]] double positionSeconds() const;

private:
    audio::RenderGraph& graph_;
    std::unique_ptr<audio::AudioSource> source_;
    std::unique_ptr<audio::PlayerNode> node_;  // destroyed before source_
    uint32_t sampleRate_ = 0;
    uint64_t totalFrames_ = 0;
    uint64_t cursorFrame_ = 0;
};

}  // namespace stemsync::playback
