#pragma once

#include "stemsync/audio/AudioSession.hpp"

#include <miniaudio.h>

namespace stemsync::audio {

struct MiniaudioSession::Impl {
    ma_context context{};
    bool active = false;
};

}  // namespace stemsync::audio
