#pragma once

#include "stemsync/audio/AudioSource.hpp"
#include "stemsync/audio/AudioTypes.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>

namespace stemsync::audio {

/// A player attached to the render graph, fed by one AudioSource.
class PlayerNode {
public:
    virtual ~PlayerNode() = default;

    /// Queue source frames [startFrame, startFrame + frameCount). Replaces any pending segment.
    virtual void scheduleSegment(uint64_t startFrame, uint64_t frameCount) = 0;

    /// Start emitting the scheduled segment. With `at`, the first frame is held until the render
    /// clock reaches that instant; without it the node starts on the next render cycle.
    virtual void play(std::optional<RenderInstant> at) = 0;

    /// Halt emission, keeping the segment position.
    virtual void pause() = 0;

    /// Halt emission and drop the pending segment.
    virtual void stop() = 0;

    [[nodiscard]] virtual bool isPlaying() const = 0;

    /// Render clock reading of the graph this node renders in. Absent until the graph has rendered.
    [[nodiscard]] virtual std::optional<ClockReading> lastRenderTime() const = 0;

    /// Source frames emitted from the current segment.
    [[nodiscard]] virtual uint64_t renderedFrames() const = 0;
};

/// Mixer plus output device. Owns the render clock.
class RenderGraph {
public:
    virtual ~RenderGraph() = default;

    /// Connect the mixer at `format`. Starts a new clock epoch.
    virtual void configure(const RenderFormat& format) = 0;

    /// Register a player for `source`. `source` must outlive the node.
    virtual std::unique_ptr<PlayerNode> attach(AudioSource& source) = 0;

    /// Unregister a node returned by attach(). The node no longer renders once this returns.
    virtual void detach(PlayerNode& node) = 0;

    /// Start the output device. Must not be called inside a command batch.
    virtual std::expected<void, DeviceError> start() = 0;

    /// Stop the output device. Must not be called inside a command batch.
    virtual void stop() = 0;

    [[nodiscard]] virtual bool isRunning() const = 0;

    /// While a batch is open the render thread observes none of the node commands issued in it.
    virtual void beginCommandBatch() = 0;
    virtual void endCommandBatch() = 0;
};

class ScopedCommandBatch {
public:
    explicit ScopedCommandBatch(RenderGraph& graph) : graph_(graph) { graph_.beginCommandBatch(); }
    ~ScopedCommandBatch() { graph_.endCommandBatch(); }

    ScopedCommandBatch(const ScopedCommandBatch&) = delete;
    ScopedCommandBatch& operator=(const ScopedCommandBatch&) = delete;

private:
    RenderGraph& graph_;
};

}  // namespace stemsync::audio
