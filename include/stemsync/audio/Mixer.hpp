#pragma once

#include "stemsync/audio/AudioSource.hpp"
#include "stemsync/audio/AudioTypes.hpp"
#include "stemsync/audio/RenderGraph.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace stemsync::audio {

class MixerNode;

/// Device-independent half of the render graph: sums every attached node into an interleaved
/// float buffer and keeps the render clock. The device callback calls render(); nothing here
/// touches an output device.
class Mixer {
public:
    Mixer() = default;
    ~Mixer();

    Mixer(const Mixer&) = delete;
    Mixer& operator=(const Mixer&) = delete;

    /// Set the output format and start a new clock epoch.
    void configure(const RenderFormat& format);
    [[nodiscard]] RenderFormat format() const;

    std::unique_ptr<PlayerNode> attach(AudioSource& source);
    void detach(PlayerNode& node);

    /// Fill `output` (frameCount * channels floats) and advance the clock by `frameCount`.
    void render(float* output, uint32_t frameCount);

    /// Frames rendered since configure(). Absent until the first render() of the epoch.
    [[nodiscard]] std::optional<ClockReading> clockReading() const;

    /// Held for a whole render() and for a whole command batch.
    void lock() { mutex_.lock(); }
    void unlock() { mutex_.unlock(); }

private:
    friend class MixerNode;

    mutable std::recursive_mutex mutex_;
    RenderFormat format_{};
    std::vector<MixerNode*> nodes_;
    std::vector<float> scratch_;
    int64_t renderedFrames_ = 0;
    bool hasRendered_ = false;
};

}  // namespace stemsync::audio
