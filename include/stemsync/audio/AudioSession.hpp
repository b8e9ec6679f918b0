#pragma once

#include "stemsync/audio/AudioTypes.hpp"

#include <expected>
#include <memory>

namespace stemsync::audio {

/// OS-level audio session that must be active before the output device can start.
class AudioSession {
public:
    virtual ~AudioSession() = default;

    virtual std::expected<void, DeviceError> activate() = 0;
    virtual void deactivate() = 0;
    [[nodiscard]] virtual bool isActive() const = 0;
};

/// Session backed by a miniaudio context (backend selection and device enumeration).
class MiniaudioSession : public AudioSession {
public:
    struct Impl;

    MiniaudioSession();
    ~MiniaudioSession() override;

    MiniaudioSession(const MiniaudioSession&) = delete;
    MiniaudioSession& operator=(const MiniaudioSession&) = delete;

    std::expected<void, DeviceError> activate() override;
    void deactivate() override;
    [[nodiscard]] bool isActive() const override;

    Impl& impl() { return *impl_; }

private:
    std::unique_ptr<Impl> impl_;
};

}  // namespace stemsync::audio
