#include "stemsync/playback/PlaybackTypes.hpp"

namespace stemsync::playback {

std::string_view toString(PlaybackState state) {
    switch (state) {
    case PlaybackState::Stopped:
        return "stopped";
    case PlaybackState::Playing:
        return "playing";
    case PlaybackState::Paused:
        return "paused";
    }
    return "unknown";
}

std::string_view toString(LoadError error) {
    switch (error) {
    case LoadError::NoPlayableSource:
        return "No playable source";
    case LoadError::PartialDecodeFailure:
        return "One or more sources failed to decode";
    case LoadError::Busy:
        return "Another playback operation is in progress";
    }
    return "Unknown load error";
}

std::string_view toString(PartialLoadPolicy policy) {
    switch (policy) {
    case PartialLoadPolicy::SkipFailed:
        return "skip-failed";
    case PartialLoadPolicy::RequireAll:
        return "require-all";
    }
    return "unknown";
}

}  // namespace stemsync::playback
