#include "stemsync/audio/AudioSession.hpp"

#include "MiniaudioSessionImpl.hpp"
#include "stemsync/common/Logger.hpp"

#include <format>

namespace stemsync::audio {

MiniaudioSession::MiniaudioSession() : impl_(std::make_unique<Impl>()) {}

MiniaudioSession::~MiniaudioSession() {
    deactivate();
}

std::expected<void, DeviceError> MiniaudioSession::activate() {
    if (impl_->active) {
        return {};
    }

    const ma_result result = ma_context_init(nullptr, 0, nullptr, &impl_->context);
    if (result != MA_SUCCESS) {
        common::Logger::logError(std::format("Audio context init failed: {}", ma_result_description(result)));
        return std::unexpected(DeviceError::SessionActivationFailed);
    }

    impl_->active = true;
    common::Logger::logDebug(std::format("Audio session active (backend: {})",
                                         ma_get_backend_name(impl_->context.backend)));
    return {};
}

void MiniaudioSession::deactivate() {
    if (impl_ && impl_->active) {
        ma_context_uninit(&impl_->context);
        impl_->active = false;
        common::Logger::logDebug("Audio session inactive");
    }
}

bool MiniaudioSession::isActive() const {
    return impl_->active;
}

}  // namespace stemsync::audio
