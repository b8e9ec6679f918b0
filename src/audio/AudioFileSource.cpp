#include "stemsync/audio/AudioSource.hpp"

#include <miniaudio.h>

#include <format>

namespace stemsync::audio {
namespace {

constexpr ma_uint32 kRenderChannels = 2;

class AudioFileSource : public AudioSource {
public:
    AudioFileSource() = default;
    ~AudioFileSource() override {
        if (initialized_) {
            ma_decoder_uninit(&decoder_);
        }
    }

    AudioFileSource(const AudioFileSource&) = delete;
    AudioFileSource& operator=(const AudioFileSource&) = delete;

    std::expected<void, std::string> open(const std::filesystem::path& path) {
        name_ = path.filename().string();

        // Native sample rate: cross-rate playback is not converted.
        ma_decoder_config config = ma_decoder_config_init(ma_format_f32, kRenderChannels, 0);
        const ma_result initResult = ma_decoder_init_file(path.string().c_str(), &config, &decoder_);
        if (initResult != MA_SUCCESS) {
            return std::unexpected(
                std::format("Failed to decode '{}': {}", path.string(), ma_result_description(initResult)));
        }
        initialized_ = true;

        ma_format format = ma_format_unknown;
        ma_uint32 channels = 0;
        ma_uint32 sampleRate = 0;
        if (ma_decoder_get_data_format(&decoder_, &format, &channels, &sampleRate, nullptr, 0) != MA_SUCCESS ||
            sampleRate == 0) {
            return std::unexpected(std::format("'{}' reports no sample rate", path.string()));
        }
        sampleRate_ = sampleRate;

        ma_uint64 length = 0;
        if (ma_decoder_get_length_in_pcm_frames(&decoder_, &length) != MA_SUCCESS || length == 0) {
            return std::unexpected(std::format("'{}' has no decodable frames", path.string()));
        }
        lengthFrames_ = length;
        return {};
    }

    const std::string& name() const override { return name_; }
    uint32_t sampleRate() const override { return sampleRate_; }
    uint64_t lengthFrames() const override { return lengthFrames_; }

    bool seekToFrame(uint64_t frame) override {
        return ma_decoder_seek_to_pcm_frame(&decoder_, frame) == MA_SUCCESS;
    }

    uint64_t readFrames(float* output, uint64_t frameCount) override {
        ma_uint64 framesRead = 0;
        const ma_result result = ma_decoder_read_pcm_frames(&decoder_, output, frameCount, &framesRead);
        if (result != MA_SUCCESS && result != MA_AT_END) {
            return 0;
        }
        return framesRead;
    }

private:
    ma_decoder decoder_{};
    bool initialized_ = false;
    std::string name_;
    uint32_t sampleRate_ = 0;
    uint64_t lengthFrames_ = 0;
};

}  // namespace

std::expected<std::unique_ptr<AudioSource>, std::string> openAudioFile(const std::filesystem::path& path) {
    auto source = std::make_unique<AudioFileSource>();
    if (auto opened = source->open(path); !opened.has_value()) {
        return std::unexpected(opened.error());
    }
    return source;
}

}  // namespace stemsync::audio
