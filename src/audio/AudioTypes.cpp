#include "stemsync/audio/AudioTypes.hpp"

#include <cmath>

namespace stemsync::audio {

int64_t instantAtRate(const RenderInstant& instant, double targetRate) {
    if (instant.sampleRate <= 0.0 || targetRate <= 0.0 || instant.sampleRate == targetRate) {
        return instant.sampleTime;
    }
    return static_cast<int64_t>(
        std::llround(static_cast<double>(instant.sampleTime) * targetRate / instant.sampleRate));
}

bool isFreshReading(const std::optional<ClockReading>& reading, const std::optional<ClockReading>& prior) {
    if (!reading.has_value() || !reading->sampleTimeValid) {
        return false;
    }
    if (!prior.has_value() || !prior->sampleTimeValid) {
        return true;
    }
    return reading->sampleTime != prior->sampleTime;
}

std::string_view toString(DeviceError error) {
    switch (error) {
    case DeviceError::SessionActivationFailed:
        return "Audio session could not be activated";
    case DeviceError::ActivationFailed:
        return "Audio output could not be started";
    }
    return "Unknown device error";
}

}  // namespace stemsync::audio
