#include "stemsync/audio/Mixer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace stemsync::audio {
namespace {

constexpr uint32_t kCycle = 256;

/// Frame n of the source carries the value n + 1 on both channels, so every output sample
/// identifies which source frame landed there.
class RampSource : public AudioSource {
public:
    explicit RampSource(uint64_t lengthFrames, uint32_t sampleRate = 48000)
        : lengthFrames_(lengthFrames), sampleRate_(sampleRate) {}

    const std::string& name() const override { return name_; }
    uint32_t sampleRate() const override { return sampleRate_; }
    uint64_t lengthFrames() const override { return lengthFrames_; }

    bool seekToFrame(uint64_t frame) override {
        if (frame > lengthFrames_) {
            return false;
        }
        position_ = frame;
        return true;
    }

    uint64_t readFrames(float* output, uint64_t frameCount) override {
        const uint64_t count = std::min(frameCount, lengthFrames_ - position_);
        for (uint64_t i = 0; i < count; ++i) {
            const auto value = static_cast<float>(position_ + i + 1);
            output[i * 2] = value;
            output[i * 2 + 1] = value;
        }
        position_ += count;
        return count;
    }

private:
    std::string name_ = "ramp";
    uint64_t lengthFrames_;
    uint32_t sampleRate_;
    uint64_t position_ = 0;
};

class MixerTest : public ::testing::Test {
protected:
    void SetUp() override { mixer.configure(RenderFormat{.sampleRate = 48000, .channels = 2}); }

    /// Render one cycle and return its left channel.
    std::vector<float> renderCycle() {
        std::vector<float> interleaved(static_cast<size_t>(kCycle) * 2, -1.0f);
        mixer.render(interleaved.data(), kCycle);
        std::vector<float> left(kCycle);
        for (uint32_t i = 0; i < kCycle; ++i) {
            left[i] = interleaved[i * 2];
        }
        return left;
    }

    static std::optional<size_t> firstSoundingFrame(const std::vector<float>& samples) {
        const auto it = std::find_if(samples.begin(), samples.end(), [](float s) { return s != 0.0f; });
        if (it == samples.end()) {
            return std::nullopt;
        }
        return static_cast<size_t>(it - samples.begin());
    }

    static RenderInstant at(int64_t sampleTime, double sampleRate = 48000.0) {
        return RenderInstant{.sampleTime = sampleTime, .sampleRate = sampleRate};
    }

    Mixer mixer;
};

TEST_F(MixerTest, ClockIsAbsentUntilTheFirstCycleAndCountsRenderedFrames) {
    EXPECT_FALSE(mixer.clockReading().has_value());

    renderCycle();
    renderCycle();
    const auto reading = mixer.clockReading();
    ASSERT_TRUE(reading.has_value());
    EXPECT_TRUE(reading->sampleTimeValid);
    EXPECT_EQ(reading->sampleTime, 2 * static_cast<int64_t>(kCycle));
    EXPECT_DOUBLE_EQ(reading->sampleRate, 48000.0);

    mixer.configure(RenderFormat{.sampleRate = 44100, .channels = 2});
    EXPECT_FALSE(mixer.clockReading().has_value());
}

TEST_F(MixerTest, SilenceWhenNothingPlays) {
    RampSource source(10000);
    auto node = mixer.attach(source);
    node->scheduleSegment(0, 10000);

    const auto left = renderCycle();
    EXPECT_FALSE(firstSoundingFrame(left).has_value());
    EXPECT_EQ(node->renderedFrames(), 0u);
    mixer.detach(*node);
}

TEST_F(MixerTest, UngatedPlayStartsAtTheHeadOfTheNextCycle) {
    RampSource source(10000);
    auto node = mixer.attach(source);
    node->scheduleSegment(100, 9900);
    node->play(std::nullopt);

    const auto left = renderCycle();
    EXPECT_FLOAT_EQ(left[0], 101.0f);
    EXPECT_FLOAT_EQ(left[kCycle - 1], static_cast<float>(100 + kCycle));
    EXPECT_EQ(node->renderedFrames(), kCycle);
    mixer.detach(*node);
}

TEST_F(MixerTest, GateInsideTheCycleOffsetsTheFirstFrame) {
    RampSource source(10000);
    auto node = mixer.attach(source);
    renderCycle();  // clock now at kCycle

    node->scheduleSegment(0, 10000);
    node->play(at(300));
    const auto left = renderCycle();

    const size_t expectedOffset = 300 - kCycle;
    ASSERT_EQ(firstSoundingFrame(left), expectedOffset);
    EXPECT_FLOAT_EQ(left[expectedOffset], 1.0f);
    EXPECT_EQ(node->renderedFrames(), kCycle - expectedOffset);
    mixer.detach(*node);
}

TEST_F(MixerTest, GateThatAlreadyPassedOpensAtTheHeadOfTheCycle) {
    RampSource source(10000);
    auto node = mixer.attach(source);
    renderCycle();
    renderCycle();

    node->scheduleSegment(0, 10000);
    node->play(at(100));
    const auto left = renderCycle();

    ASSERT_EQ(firstSoundingFrame(left), 0u);
    EXPECT_FLOAT_EQ(left[0], 1.0f);
    mixer.detach(*node);
}

TEST_F(MixerTest, GateBeyondTheCycleStaysSilentUntilItsCycle) {
    RampSource source(10000);
    auto node = mixer.attach(source);
    renderCycle();

    node->scheduleSegment(0, 10000);
    node->play(at(600));

    const auto first = renderCycle();  // [256, 512)
    EXPECT_FALSE(firstSoundingFrame(first).has_value());
    EXPECT_EQ(node->renderedFrames(), 0u);

    const auto second = renderCycle();  // [512, 768)
    ASSERT_EQ(firstSoundingFrame(second), 600u - 2 * kCycle);
    EXPECT_FLOAT_EQ(second[600 - 2 * kCycle], 1.0f);
    mixer.detach(*node);
}

TEST_F(MixerTest, NodesGatedOnOneInstantSoundOnTheSameFrame) {
    RampSource drums(10000);
    RampSource bass(10000, 44100);
    auto drumsNode = mixer.attach(drums);
    auto bassNode = mixer.attach(bass);
    renderCycle();

    // Instant expressed at a different rate than the mixer; both resolve to mixer frame 300.
    const RenderInstant shared = at(150, 24000.0);
    mixer.lock();
    drumsNode->scheduleSegment(0, 10000);
    bassNode->scheduleSegment(0, 10000);
    drumsNode->play(shared);
    bassNode->play(shared);
    mixer.unlock();
    const auto left = renderCycle();

    const size_t expectedOffset = 300 - kCycle;
    ASSERT_EQ(firstSoundingFrame(left), expectedOffset);
    // Both first frames (value 1 each) land on the same output frame.
    EXPECT_FLOAT_EQ(left[expectedOffset], 2.0f);
    EXPECT_FLOAT_EQ(left[expectedOffset + 1], 4.0f);
    EXPECT_EQ(drumsNode->renderedFrames(), bassNode->renderedFrames());

    mixer.detach(*drumsNode);
    mixer.detach(*bassNode);
}

TEST_F(MixerTest, PauseHoldsThePositionAndPlayResumesFromIt) {
    RampSource source(10000);
    auto node = mixer.attach(source);
    node->scheduleSegment(0, 10000);
    node->play(std::nullopt);
    renderCycle();

    node->pause();
    EXPECT_FALSE(node->isPlaying());
    EXPECT_FALSE(firstSoundingFrame(renderCycle()).has_value());

    node->play(std::nullopt);
    const auto left = renderCycle();
    EXPECT_FLOAT_EQ(left[0], static_cast<float>(kCycle + 1));
    mixer.detach(*node);
}

TEST_F(MixerTest, SegmentEndLeavesTheRestOfTheCycleSilent) {
    RampSource source(10000);
    auto node = mixer.attach(source);
    node->scheduleSegment(9900, 100);
    node->play(std::nullopt);

    const auto left = renderCycle();
    EXPECT_FLOAT_EQ(left[99], 10000.0f);
    EXPECT_FLOAT_EQ(left[100], 0.0f);
    EXPECT_EQ(node->renderedFrames(), 100u);
    mixer.detach(*node);
}

TEST_F(MixerTest, StopAndDetachSilenceTheNode) {
    RampSource first(10000);
    RampSource second(10000);
    auto stopped = mixer.attach(first);
    auto detached = mixer.attach(second);
    stopped->scheduleSegment(0, 10000);
    detached->scheduleSegment(0, 10000);
    stopped->play(std::nullopt);
    detached->play(std::nullopt);

    stopped->stop();
    mixer.detach(*detached);
    EXPECT_FALSE(firstSoundingFrame(renderCycle()).has_value());
    EXPECT_EQ(stopped->renderedFrames(), 0u);
    mixer.detach(*stopped);
}

}  // namespace
}  // namespace stemsync::audio
