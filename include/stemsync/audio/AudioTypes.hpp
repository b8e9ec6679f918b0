#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace stemsync::audio {

/// Interleaved float format the render graph mixes in.
struct RenderFormat {
    uint32_t sampleRate = 48000;
    uint32_t channels = 2;

    bool operator==(const RenderFormat&) const = default;
};

/// One reading of the render clock, in frames rendered since the clock epoch.
struct ClockReading {
    int64_t sampleTime = 0;
    double sampleRate = 0.0;
    bool sampleTimeValid = false;
};

/// Shared gating instant: a node holds its first frame until the render clock reaches `sampleTime`.
struct RenderInstant {
    int64_t sampleTime = 0;
    double sampleRate = 0.0;

    bool operator==(const RenderInstant&) const = default;
};

/// Express `instant` in frames at `targetRate`.
[[nodiscard]] int64_t instantAtRate(const RenderInstant& instant, double targetRate);

/// True when `reading` is usable and differs from `prior` (or there is no prior reading).
[[nodiscard]] bool isFreshReading(const std::optional<ClockReading>& reading,
                                  const std::optional<ClockReading>& prior);

enum class DeviceError {
    SessionActivationFailed,
    ActivationFailed,
};

[[nodiscard]] std::string_view toString(DeviceError error);

}  // namespace stemsync::audio
