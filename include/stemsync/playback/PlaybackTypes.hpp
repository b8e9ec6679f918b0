#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace stemsync::playback {

/// Timeline-wide transport state. All tracks move in lockstep.
enum class PlaybackState : uint8_t {
    Stopped,
    Playing,
    Paused,
};

enum class LoadError {
    NoPlayableSource,      ///< Empty list, or no source decoded
    PartialDecodeFailure,  ///< Some sources failed and the policy requires all of them
    Busy,                  ///< load() issued from inside another coordinator operation
};

/// What load() does when some, but not all, sources fail to decode.
enum class PartialLoadPolicy : uint8_t {
    SkipFailed,  ///< Drop the failed sources, keep playing the rest
    RequireAll,  ///< Fail the whole load
};

struct SkippedSource {
    std::filesystem::path path;
    std::string reason;
};

struct LoadReport {
    size_t loadedCount = 0;
    double durationSeconds = 0.0;
    std::vector<SkippedSource> skipped;
};

/// Snapshot pushed to the now-playing display on every visible state change.
struct NowPlayingInfo {
    std::string title;
    std::string artist;
    double durationSeconds = 0.0;
    double playbackRate = 0.0;  ///< 0 when paused or stopped, 1 when audio is being produced
    double elapsedSeconds = 0.0;
};

class NowPlayingSink {
public:
    virtual ~NowPlayingSink() = default;
    virtual void publish(const NowPlayingInfo& info) = 0;
};

[[nodiscard]] std::string_view toString(PlaybackState state);
[[nodiscard]] std::string_view toString(LoadError error);
[[nodiscard]] std::string_view toString(PartialLoadPolicy policy);

}  // namespace stemsync::playback
