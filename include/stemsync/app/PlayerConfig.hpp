#pragma once

#include "stemsync/playback/PlaybackTypes.hpp"
#include "stemsync/playback/TimelineCoordinator.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace stemsync::app {

struct PlayerConfig {
    std::chrono::milliseconds retryInterval{10};
    int maxAttempts = 30;
    playback::PartialLoadPolicy partialLoadPolicy = playback::PartialLoadPolicy::SkipFailed;
    bool deactivateSessionOnPause = false;
    std::string title;
    std::string artist;
    std::optional<std::filesystem::path> logFile;
    bool verbose = false;

    [[nodiscard]] playback::TimelineCoordinator::Options toCoordinatorOptions() const;
};

/// Parse a player.json document. Missing keys keep their defaults; unknown keys are ignored.
std::expected<PlayerConfig, std::string> parsePlayerConfig(std::string_view text);

std::expected<PlayerConfig, std::string> loadPlayerConfigFile(const std::filesystem::path& path);

/// Load `explicitPath` when given (it must exist), otherwise the per-user player.json when present,
/// otherwise defaults.
std::expected<PlayerConfig, std::string> loadPlayerConfig(const std::optional<std::filesystem::path>& explicitPath);

}  // namespace stemsync::app
