#include "stemsync/audio/AudioEngine.hpp"

#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

#include "MiniaudioSessionImpl.hpp"
#include "stemsync/audio/Mixer.hpp"
#include "stemsync/common/Logger.hpp"

#include <atomic>
#include <format>
#include <memory>

namespace stemsync::audio {

struct AudioEngine::Impl {
    ma_device device{};
    bool deviceInitialized = false;
    std::atomic<bool> running{false};
    Mixer mixer;
};

namespace {

void dataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frame_count) {
    auto* impl = static_cast<AudioEngine::Impl*>(device->pUserData);
    if (!impl) {
        return;
    }
    impl->mixer.render(static_cast<float*>(output), frame_count);
}

}  // namespace

AudioEngine::AudioEngine(MiniaudioSession& session) : session_(session), impl_(std::make_unique<Impl>()) {}

AudioEngine::~AudioEngine() {
    stop();
}

void AudioEngine::configure(const RenderFormat& format) {
    stop();
    impl_->mixer.configure(format);
}

std::unique_ptr<PlayerNode> AudioEngine::attach(AudioSource& source) {
    return impl_->mixer.attach(source);
}

void AudioEngine::detach(PlayerNode& node) {
    impl_->mixer.detach(node);
}

std::expected<void, DeviceError> AudioEngine::start() {
    if (impl_->running.load()) {
        return {};
    }
    if (!session_.isActive()) {
        common::Logger::logError("Cannot start audio output: session is not active");
        return std::unexpected(DeviceError::ActivationFailed);
    }

    const RenderFormat format = impl_->mixer.format();
    ma_device_config config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = format.channels;
    config.sampleRate = format.sampleRate;
    config.dataCallback = dataCallback;
    config.pUserData = impl_.get();

    if (ma_device_init(&session_.impl().context, &config, &impl_->device) != MA_SUCCESS) {
        common::Logger::logError(std::format("Failed to open playback device at {} Hz", format.sampleRate));
        return std::unexpected(DeviceError::ActivationFailed);
    }
    impl_->deviceInitialized = true;

    if (ma_device_start(&impl_->device) != MA_SUCCESS) {
        common::Logger::logError("Failed to start playback device");
        ma_device_uninit(&impl_->device);
        impl_->deviceInitialized = false;
        return std::unexpected(DeviceError::ActivationFailed);
    }

    impl_->running.store(true);
    return {};
}

void AudioEngine::stop() {
    // Never hold the mixer lock here: uninit waits for the audio thread, which takes it.
    if (impl_ && impl_->deviceInitialized) {
        ma_device_uninit(&impl_->device);
        impl_->deviceInitialized = false;
    }
    if (impl_) {
        impl_->running.store(false);
    }
}

bool AudioEngine::isRunning() const {
    return impl_->running.load();
}

void AudioEngine::beginCommandBatch() {
    impl_->mixer.lock();
}

void AudioEngine::endCommandBatch() {
    impl_->mixer.unlock();
}

}  // namespace stemsync::audio
