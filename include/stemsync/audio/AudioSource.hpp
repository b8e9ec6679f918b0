#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace stemsync::audio {

/// A decodable audio stream. Frames are counted at the source's native sample rate;
/// reads produce interleaved stereo float.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    [[nodiscard]] virtual const std::string& name() const = 0;
    [[nodiscard]] virtual uint32_t sampleRate() const = 0;
    [[nodiscard]] virtual uint64_t lengthFrames() const = 0;

    virtual bool seekToFrame(uint64_t frame) = 0;

    /// Read up to `frameCount` frames into `output` (2 * frameCount floats). Returns frames read; 0 at end.
    virtual uint64_t readFrames(float* output, uint64_t frameCount) = 0;
};

using SourceOpener =
    std::function<std::expected<std::unique_ptr<AudioSource>, std::string>(const std::filesystem::path& path)>;

/// Open a WAV/FLAC/MP3 file with the miniaudio decoder.
std::expected<std::unique_ptr<AudioSource>, std::string> openAudioFile(const std::filesystem::path& path);

}  // namespace stemsync::audio
