#include "stemsync/audio/Mixer.hpp"

#include "stemsync/common/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <format>

namespace stemsync::audio {

class MixerNode : public PlayerNode {
public:
    MixerNode(Mixer& mixer, AudioSource& source) : mixer_(mixer), source_(source) {}

    void scheduleSegment(uint64_t startFrame, uint64_t frameCount) override {
        std::lock_guard<std::recursive_mutex> lock(mixer_.mutex_);
        state_ = State::Idle;
        gate_.reset();
        rendered_.store(0);
        if (!source_.seekToFrame(startFrame)) {
            common::Logger::logWarning(
                std::format("'{}': seek to frame {} failed, segment dropped", source_.name(), startFrame));
            remaining_ = 0;
            return;
        }
        remaining_ = frameCount;
    }

    void play(std::optional<RenderInstant> at) override {
        std::lock_guard<std::recursive_mutex> lock(mixer_.mutex_);
        gate_ = at;
        state_ = State::Playing;
    }

    void pause() override {
        std::lock_guard<std::recursive_mutex> lock(mixer_.mutex_);
        if (state_ == State::Playing) {
            state_ = State::Paused;
        }
        gate_.reset();
    }

    void stop() override {
        std::lock_guard<std::recursive_mutex> lock(mixer_.mutex_);
        state_ = State::Idle;
        gate_.reset();
        remaining_ = 0;
        rendered_.store(0);
    }

    bool isPlaying() const override {
        std::lock_guard<std::recursive_mutex> lock(mixer_.mutex_);
        return state_ == State::Playing;
    }

    std::optional<ClockReading> lastRenderTime() const override { return mixer_.clockReading(); }

    uint64_t renderedFrames() const override { return rendered_.load(); }

    /// Add this node's frames for the cycle [cycleStart, cycleStart + frameCount). Caller holds the mixer lock.
    void mixInto(float* output, uint32_t frameCount, int64_t cycleStart, uint32_t channels,
                 std::vector<float>& scratch) {
        if (state_ != State::Playing || remaining_ == 0) {
            return;
        }

        uint32_t offset = 0;
        if (gate_.has_value()) {
            const int64_t gateFrame = instantAtRate(*gate_, static_cast<double>(mixer_.format_.sampleRate));
            if (gateFrame >= cycleStart + static_cast<int64_t>(frameCount)) {
                return;
            }
            // An instant that already passed opens at the head of this cycle.
            if (gateFrame > cycleStart) {
                offset = static_cast<uint32_t>(gateFrame - cycleStart);
            }
            gate_.reset();
        }

        const uint64_t wanted = std::min<uint64_t>(frameCount - offset, remaining_);
        scratch.resize(static_cast<size_t>(wanted) * 2);
        const uint64_t got = source_.readFrames(scratch.data(), wanted);

        for (uint64_t i = 0; i < got; ++i) {
            float* frame = output + (offset + i) * channels;
            frame[0] += scratch[i * 2];
            if (channels > 1) {
                frame[1] += scratch[i * 2 + 1];
            }
        }

        rendered_.fetch_add(got);
        remaining_ = (got < wanted) ? 0 : remaining_ - got;
    }

private:
    enum class State : uint8_t {
        Idle,
        Playing,
        Paused,
    };

    Mixer& mixer_;
    AudioSource& source_;
    State state_ = State::Idle;
    std::optional<RenderInstant> gate_;
    uint64_t remaining_ = 0;
    std::atomic<uint64_t> rendered_{0};
};

Mixer::~Mixer() = default;

void Mixer::configure(const RenderFormat& format) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    format_ = format;
    renderedFrames_ = 0;
    hasRendered_ = false;
}

RenderFormat Mixer::format() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return format_;
}

std::unique_ptr<PlayerNode> Mixer::attach(AudioSource& source) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto node = std::make_unique<MixerNode>(*this, source);
    nodes_.push_back(node.get());
    return node;
}

void Mixer::detach(PlayerNode& node) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    nodes_.erase(std::remove_if(nodes_.begin(), nodes_.end(),
                                [&node](const MixerNode* candidate) { return candidate == &node; }),
                 nodes_.end());
}

void Mixer::render(float* output, uint32_t frameCount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::memset(output, 0, static_cast<size_t>(frameCount) * format_.channels * sizeof(float));

    const int64_t cycleStart = renderedFrames_;
    for (MixerNode* node : nodes_) {
        node->mixInto(output, frameCount, cycleStart, format_.channels, scratch_);
    }

    renderedFrames_ = cycleStart + static_cast<int64_t>(frameCount);
    hasRendered_ = true;
}

std::optional<ClockReading> Mixer::clockReading() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!hasRendered_) {
        return std::nullopt;
    }
    return ClockReading{
        .sampleTime = renderedFrames_,
        .sampleRate = static_cast<double>(format_.sampleRate),
        .sampleTimeValid = true,
    };
}

}  // namespace stemsync::audio
