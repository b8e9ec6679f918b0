#pragma once

#include "stemsync/audio/AudioSession.hpp"
#include "stemsync/audio/RenderGraph.hpp"

#include <memory>

namespace stemsync::audio {

/// miniaudio render graph: every attached node is mixed into one stereo float playback device.
/// The render clock counts frames delivered to the device and survives device restarts, so a
/// reading taken right after start() reports the value from before the last stop() until the
/// first render cycle completes.
class AudioEngine : public RenderGraph {
public:
    struct Impl;

    explicit AudioEngine(MiniaudioSession& session);
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    void configure(const RenderFormat& format) override;
    std::unique_ptr<PlayerNode> attach(AudioSource& source) override;
    void detach(PlayerNode& node) override;

    std::expected<void, DeviceError> start() override;
    void stop() override;
    [[nodiscard]] bool isRunning() const override;

    void beginCommandBatch() override;
    void endCommandBatch() override;

private:
    MiniaudioSession& session_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace stemsync::audio
