#include "stemsync/playback/TimelineCoordinator.hpp"

#include "StemSyncTestHelpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <vector>

namespace stemsync::playback {
namespace {

using audio::RenderInstant;
using test_helpers::FakeAudioSession;
using test_helpers::FakePlayerNode;
using test_helpers::FakeRenderGraph;
using test_helpers::FakeSourceParams;
using test_helpers::ManualScheduler;

class TimelineCoordinatorSyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        coordinator = std::make_unique<TimelineCoordinator>(session, graph, scheduler,
                                                            test_helpers::makeFakeOpener({
                                                                {"drums.wav", FakeSourceParams{44100, 441000}},
                                                                {"bass.wav", FakeSourceParams{48000, 480000}},
                                                                {"keys.wav", FakeSourceParams{44100, 441000}},
                                                            }),
                                                            TimelineCoordinator::Options{});
        coordinator->setChangeCallback([this](PlaybackState state) { changes.push_back(state); });
        ASSERT_TRUE(coordinator->load({"drums.wav", "bass.wav", "keys.wav"}).has_value());
    }

    /// Play, pause and resume without the clock advancing, leaving the coordinator mid-acquisition.
    void resumeWithStaleClock() {
        graph.setClock(1000);
        ASSERT_TRUE(coordinator->play().has_value());
        coordinator->pause();
        graph.clearPlayCalls();
        changes.clear();
        ASSERT_TRUE(coordinator->play().has_value());
        ASSERT_TRUE(coordinator->isAcquiring());
    }

    void expectEveryTrackStartedOnceWith(const std::optional<RenderInstant>& instant) {
        ASSERT_EQ(graph.nodes.size(), 3u);
        for (const FakePlayerNode* node : graph.nodes) {
            ASSERT_EQ(node->playCalls.size(), 1u);
            EXPECT_EQ(node->playCalls.front(), instant);
        }
    }

    FakeAudioSession session;
    FakeRenderGraph graph;
    ManualScheduler scheduler;
    std::vector<PlaybackState> changes;
    std::unique_ptr<TimelineCoordinator> coordinator;
};

TEST_F(TimelineCoordinatorSyncTest, FreshClockStartsEveryTrackImmediatelyAtOneInstant) {
    graph.setClock(1000);
    ASSERT_TRUE(coordinator->play().has_value());

    expectEveryTrackStartedOnceWith(RenderInstant{.sampleTime = 1000, .sampleRate = 44100.0});
    EXPECT_TRUE(coordinator->lastStartWasSynchronized());
    EXPECT_FALSE(coordinator->isAcquiring());
    EXPECT_EQ(scheduler.scheduledCount, 0);
    EXPECT_EQ(changes, std::vector<PlaybackState>{PlaybackState::Playing});
}

TEST_F(TimelineCoordinatorSyncTest, RetriesUntilTheClockAdvances) {
    resumeWithStaleClock();
    EXPECT_EQ(scheduler.lastInterval, std::chrono::milliseconds(10));

    scheduler.tick(5);
    EXPECT_EQ(graph.totalPlayCalls(), 0u);
    EXPECT_TRUE(changes.empty());
    EXPECT_TRUE(coordinator->isAcquiring());
    EXPECT_FALSE(coordinator->isPlaying());

    graph.setClock(1480);
    scheduler.tick();

    expectEveryTrackStartedOnceWith(RenderInstant{.sampleTime = 1480, .sampleRate = 44100.0});
    EXPECT_TRUE(coordinator->lastStartWasSynchronized());
    EXPECT_FALSE(coordinator->isAcquiring());
    EXPECT_EQ(scheduler.activeCount(), 0u);
    EXPECT_EQ(changes, std::vector<PlaybackState>{PlaybackState::Playing});
    EXPECT_TRUE(coordinator->isPlaying());
}

TEST_F(TimelineCoordinatorSyncTest, FallsBackToAnUngatedStartAfterThirtyRetries) {
    resumeWithStaleClock();

    scheduler.tick(29);
    EXPECT_EQ(graph.totalPlayCalls(), 0u);
    EXPECT_TRUE(coordinator->isAcquiring());

    scheduler.tick();
    expectEveryTrackStartedOnceWith(std::nullopt);
    EXPECT_FALSE(coordinator->lastStartWasSynchronized());
    EXPECT_FALSE(coordinator->isAcquiring());
    EXPECT_EQ(changes, std::vector<PlaybackState>{PlaybackState::Playing});

    scheduler.tick(10);
    EXPECT_EQ(graph.totalPlayCalls(), 3u);
}

TEST_F(TimelineCoordinatorSyncTest, NoClockReadingAtAllStillStartsPlayback) {
    ASSERT_TRUE(coordinator->play().has_value());
    EXPECT_EQ(graph.totalPlayCalls(), 0u);

    scheduler.tick(30);
    expectEveryTrackStartedOnceWith(std::nullopt);
    EXPECT_TRUE(coordinator->isPlaying());
}

TEST_F(TimelineCoordinatorSyncTest, PlayDuringAcquisitionDoesNotRestartIt) {
    resumeWithStaleClock();
    scheduler.tick(10);

    ASSERT_TRUE(coordinator->play().has_value());
    EXPECT_EQ(scheduler.activeCount(), 1u);

    scheduler.tick(20);
    expectEveryTrackStartedOnceWith(std::nullopt);
}

TEST_F(TimelineCoordinatorSyncTest, PauseDuringAcquisitionPreventsALateStart) {
    resumeWithStaleClock();
    scheduler.tick(3);

    coordinator->pause();
    EXPECT_EQ(coordinator->state(), PlaybackState::Paused);
    EXPECT_FALSE(coordinator->isAcquiring());
    EXPECT_EQ(scheduler.activeCount(), 0u);
    EXPECT_EQ(changes, std::vector<PlaybackState>{PlaybackState::Paused});

    graph.setClock(5000);
    scheduler.tick(40);
    EXPECT_EQ(graph.totalPlayCalls(), 0u);
    EXPECT_FALSE(coordinator->isPlaying());
}

TEST_F(TimelineCoordinatorSyncTest, LoadDuringAcquisitionCancelsIt) {
    resumeWithStaleClock();
    scheduler.tick(2);

    ASSERT_TRUE(coordinator->load({"keys.wav", "drums.wav"}).has_value());
    EXPECT_EQ(scheduler.activeCount(), 0u);
    EXPECT_EQ(coordinator->state(), PlaybackState::Stopped);

    scheduler.tick(40);
    EXPECT_EQ(graph.totalPlayCalls(), 0u);
}

TEST_F(TimelineCoordinatorSyncTest, SeekWhilePlayingReschedulesAndResynchronizes) {
    graph.setClock(1000);
    ASSERT_TRUE(coordinator->play().has_value());
    graph.clearPlayCalls();
    changes.clear();

    graph.setClock(7000);
    coordinator->seek(2.5);

    EXPECT_EQ(*graph.nodes[0]->scheduledStart, 110250u);
    EXPECT_EQ(*graph.nodes[1]->scheduledStart, 120000u);
    EXPECT_EQ(*graph.nodes[2]->scheduledStart, 110250u);
    expectEveryTrackStartedOnceWith(RenderInstant{.sampleTime = 7000, .sampleRate = 44100.0});
    EXPECT_EQ(coordinator->state(), PlaybackState::Playing);
    EXPECT_EQ(changes, std::vector<PlaybackState>{PlaybackState::Playing});
}

TEST_F(TimelineCoordinatorSyncTest, SeekDuringAcquisitionRestartsTheRetryBudget) {
    resumeWithStaleClock();
    scheduler.tick(10);
    const int cancelledBefore = scheduler.cancelledCount;

    coordinator->seek(1.0);
    EXPECT_EQ(scheduler.cancelledCount, cancelledBefore + 1);
    EXPECT_EQ(scheduler.activeCount(), 1u);

    scheduler.tick(29);
    EXPECT_EQ(graph.totalPlayCalls(), 0u);

    scheduler.tick();
    expectEveryTrackStartedOnceWith(std::nullopt);
    EXPECT_EQ(*graph.nodes[0]->scheduledStart, 44100u);
    EXPECT_EQ(*graph.nodes[1]->scheduledStart, 48000u);
}

TEST_F(TimelineCoordinatorSyncTest, SeekThenPlayStartsFromTheSeekFrames) {
    coordinator->seek(2.5);
    graph.setClock(64);
    ASSERT_TRUE(coordinator->play().has_value());

    EXPECT_EQ(*graph.nodes[0]->scheduledStart, 110250u);
    EXPECT_EQ(*graph.nodes[1]->scheduledStart, 120000u);
    EXPECT_EQ(graph.nodes[1]->scheduledCount, 480000u - 120000u);
    expectEveryTrackStartedOnceWith(RenderInstant{.sampleTime = 64, .sampleRate = 44100.0});
}

TEST_F(TimelineCoordinatorSyncTest, StartInstantIsExpressedAtTheReferenceRate) {
    graph.clock = audio::ClockReading{.sampleTime = 2000, .sampleRate = 88200.0, .sampleTimeValid = true};
    ASSERT_TRUE(coordinator->play().has_value());

    // The 48 kHz track gets the same instant as the others.
    expectEveryTrackStartedOnceWith(RenderInstant{.sampleTime = 1000, .sampleRate = 44100.0});
}

TEST_F(TimelineCoordinatorSyncTest, EveryPlayerCommandIsIssuedInsideABatch) {
    graph.setClock(10);
    ASSERT_TRUE(coordinator->play().has_value());
    coordinator->seek(3.0);
    coordinator->pause();
    coordinator->seek(1.0);
    ASSERT_TRUE(coordinator->play().has_value());
    scheduler.tick(30);

    for (const FakePlayerNode* node : graph.nodes) {
        EXPECT_EQ(node->commandsOutsideBatch, 0);
    }
    EXPECT_EQ(graph.batchDepth, 0);
}

TEST_F(TimelineCoordinatorSyncTest, GraphIsNeverStartedInsideABatch) {
    struct BatchCheckingGraph : FakeRenderGraph {
        std::expected<void, audio::DeviceError> start() override {
            EXPECT_EQ(batchDepth, 0);
            return FakeRenderGraph::start();
        }
        void stop() override {
            EXPECT_EQ(batchDepth, 0);
            FakeRenderGraph::stop();
        }
    };
    BatchCheckingGraph checkingGraph;
    FakeAudioSession checkingSession;
    ManualScheduler checkingScheduler;
    TimelineCoordinator checked(checkingSession, checkingGraph, checkingScheduler,
                                test_helpers::makeFakeOpener({{"a.wav", FakeSourceParams{}}}),
                                TimelineCoordinator::Options{});

    ASSERT_TRUE(checked.load({"a.wav"}).has_value());
    checkingGraph.setClock(1);
    ASSERT_TRUE(checked.play().has_value());
    checked.pause();
    ASSERT_TRUE(checked.play().has_value());
    checkingScheduler.tick(30);
    ASSERT_TRUE(checked.load({"a.wav"}).has_value());
}

TEST_F(TimelineCoordinatorSyncTest, ClockMovingOnTheFinalTickStillFallsBack) {
    resumeWithStaleClock();
    scheduler.tick(29);
    EXPECT_EQ(graph.totalPlayCalls(), 0u);

    graph.setClock(4000);
    scheduler.tick();
    expectEveryTrackStartedOnceWith(std::nullopt);
    EXPECT_FALSE(coordinator->lastStartWasSynchronized());
}

TEST_F(TimelineCoordinatorSyncTest, PausedReadingIsTakenOnceTheDeviceHasStopped) {
    // The device completes one more cycle between the node pauses and the halt.
    struct TrailingCycleGraph : FakeRenderGraph {
        void stop() override {
            if (running && clock.has_value()) {
                clock->sampleTime += 256;
            }
            FakeRenderGraph::stop();
        }
    };
    TrailingCycleGraph trailingGraph;
    FakeAudioSession trailingSession;
    ManualScheduler trailingScheduler;
    TimelineCoordinator checked(trailingSession, trailingGraph, trailingScheduler,
                                test_helpers::makeFakeOpener({{"a.wav", FakeSourceParams{}}}),
                                TimelineCoordinator::Options{});
    ASSERT_TRUE(checked.load({"a.wav"}).has_value());
    trailingGraph.setClock(1000);
    ASSERT_TRUE(checked.play().has_value());
    ASSERT_EQ(trailingGraph.totalPlayCalls(), 1u);

    checked.pause();
    ASSERT_TRUE(checked.lastPausedReading().has_value());
    EXPECT_EQ(checked.lastPausedReading()->sampleTime, 1256);

    // Restarted device still reports the frozen value: not fresh.
    trailingGraph.clearPlayCalls();
    ASSERT_TRUE(checked.play().has_value());
    EXPECT_TRUE(checked.isAcquiring());
    EXPECT_EQ(trailingGraph.totalPlayCalls(), 0u);

    trailingGraph.setClock(1512);
    trailingScheduler.tick();
    EXPECT_FALSE(checked.isAcquiring());
    ASSERT_EQ(trailingGraph.totalPlayCalls(), 1u);
    EXPECT_EQ(trailingGraph.nodes.front()->playCalls.front(),
              (RenderInstant{.sampleTime = 1512, .sampleRate = 44100.0}));
}

}  // namespace
}  // namespace stemsync::playback
