#pragma once

#include "stemsync/playback/Track.hpp"

#include <memory>
#include <vector>

namespace stemsync::playback {

/// Tracks in caller order. The first track is the reference: its clock anchors synchronization
/// and its length defines the duration.
struct Timeline {
    std::vector<std::unique_ptr<Track>> tracks;
    double durationSeconds = 0.0;

    [[nodiscard]] bool empty() const { return tracks.empty(); }
    [[nodiscard]] Track& reference() { return *tracks.front(); }
    [[nodiscard]] const Track& reference() const { return *tracks.front(); }

    void recomputeDuration() { durationSeconds = empty() ? 0.0 : reference().durationSeconds(); }
};

}  // namespace stemsync::playback
