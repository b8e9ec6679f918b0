#include "stemsync/app/PlayerConfig.hpp"

#include "stemsync/common/Paths.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace stemsync::app {
namespace {

constexpr int kMaxRetryIntervalMs = 1000;
constexpr int kMaxAttemptsLimit = 1000;

std::expected<void, std::string> readBool(const json& object, const char* key, bool& out) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (!it->is_boolean()) {
        return std::unexpected(std::format("'{}' must be a boolean", key));
    }
    out = it->get<bool>();
    return {};
}

std::expected<void, std::string> readString(const json& object, const char* key, std::string& out) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    out = it->get<std::string>();
    return {};
}

std::expected<void, std::string> readIntInRange(const json& object, const char* key, int minValue, int maxValue,
                                                int& out) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (!it->is_number_integer()) {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    const auto value = it->get<int64_t>();
    if (value < minValue || value > maxValue) {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, minValue, maxValue));
    }
    out = static_cast<int>(value);
    return {};
}

std::expected<const json*, std::string> readSection(const json& root, const char* key) {
    const auto it = root.find(key);
    if (it == root.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        return std::unexpected(std::format("'{}' must be an object", key));
    }
    return &*it;
}

std::expected<playback::PartialLoadPolicy, std::string> parsePolicy(std::string_view value) {
    if (value == "skip-failed") {
        return playback::PartialLoadPolicy::SkipFailed;
    }
    if (value == "require-all") {
        return playback::PartialLoadPolicy::RequireAll;
    }
    return std::unexpected(std::format("Unknown partialLoadPolicy '{}' (expected skip-failed or require-all)", value));
}

std::expected<PlayerConfig, std::string> parseRoot(const json& root) {
    if (!root.is_object()) {
        return std::unexpected("Config root must be an object");
    }

    PlayerConfig config;

    auto acquisition = readSection(root, "acquisition");
    if (!acquisition.has_value()) {
        return std::unexpected(acquisition.error());
    }
    if (*acquisition != nullptr) {
        int intervalMs = static_cast<int>(config.retryInterval.count());
        if (auto r = readIntInRange(**acquisition, "retryIntervalMs", 1, kMaxRetryIntervalMs, intervalMs); !r) {
            return std::unexpected(r.error());
        }
        config.retryInterval = std::chrono::milliseconds(intervalMs);
        if (auto r = readIntInRange(**acquisition, "maxAttempts", 0, kMaxAttemptsLimit, config.maxAttempts); !r) {
            return std::unexpected(r.error());
        }
    }

    if (const auto it = root.find("partialLoadPolicy"); it != root.end() && !it->is_null()) {
        std::string policy;
        if (auto r = readString(root, "partialLoadPolicy", policy); !r) {
            return std::unexpected(r.error());
        }
        auto parsed = parsePolicy(policy);
        if (!parsed.has_value()) {
            return std::unexpected(parsed.error());
        }
        config.partialLoadPolicy = *parsed;
    }

    if (auto r = readBool(root, "deactivateSessionOnPause", config.deactivateSessionOnPause); !r) {
        return std::unexpected(r.error());
    }

    auto nowPlaying = readSection(root, "nowPlaying");
    if (!nowPlaying.has_value()) {
        return std::unexpected(nowPlaying.error());
    }
    if (*nowPlaying != nullptr) {
        if (auto r = readString(**nowPlaying, "title", config.title); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = readString(**nowPlaying, "artist", config.artist); !r) {
            return std::unexpected(r.error());
        }
    }

    auto log = readSection(root, "log");
    if (!log.has_value()) {
        return std::unexpected(log.error());
    }
    if (*log != nullptr) {
        std::string file;
        if (auto r = readString(**log, "file", file); !r) {
            return std::unexpected(r.error());
        }
        if (!file.empty()) {
            config.logFile = std::filesystem::path(file);
        }
        if (auto r = readBool(**log, "verbose", config.verbose); !r) {
            return std::unexpected(r.error());
        }
    }

    return config;
}

}  // namespace

playback::TimelineCoordinator::Options PlayerConfig::toCoordinatorOptions() const {
    return playback::TimelineCoordinator::Options{
        .acquisition =
            playback::ClockAcquisition::Options{
                .retryInterval = retryInterval,
                .maxAttempts = maxAttempts,
            },
        .partialLoadPolicy = partialLoadPolicy,
        .deactivateSessionOnPause = deactivateSessionOnPause,
        .title = title,
        .artist = artist,
    };
}

std::expected<PlayerConfig, std::string> parsePlayerConfig(std::string_view text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::exception& e) {
        return std::unexpected(std::format("Invalid JSON: {}", e.what()));
    }
    return parseRoot(root);
}

std::expected<PlayerConfig, std::string> loadPlayerConfigFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(std::format("Failed to open '{}'", path.string()));
    }
    const std::string text(std::istreambuf_iterator<char>(in), {});
    auto parsed = parsePlayerConfig(text);
    if (!parsed.has_value()) {
        return std::unexpected(std::format("{}: {}", path.string(), parsed.error()));
    }
    return parsed;
}

std::expected<PlayerConfig, std::string> loadPlayerConfig(const std::optional<std::filesystem::path>& explicitPath) {
    if (explicitPath.has_value()) {
        return loadPlayerConfigFile(*explicitPath);
    }

    const auto defaultPath = common::userPlayerConfigPath();
    if (defaultPath.empty()) {
        return PlayerConfig{};
    }
    std::error_code ec;
    if (!std::filesystem::exists(defaultPath, ec) || ec) {
        return PlayerConfig{};
    }
    return loadPlayerConfigFile(defaultPath);
}

}  // namespace stemsync::app
