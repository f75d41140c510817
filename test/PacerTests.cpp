#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include "Stream/core/ByteRing.hpp"
#include "Stream/core/HeadroomEstimator.hpp"
#include "Stream/core/Pacer.hpp"
#include "Stream/core/PacingThread.hpp"
#include "Stream/core/StagingRing.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace VPB;
using namespace VPB::Stream;

class PacerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.logger = spdlog::default_logger();
        staging_ = std::make_unique<StagingRing>(config_.effectiveRingCapacity(), config_.logger);
        playback_ = std::make_unique<ByteRing>(config_.effectiveRingCapacity());
        estimator_ = std::make_unique<HeadroomEstimator>(config_);
    }

    std::unique_ptr<Pacer> makePacer(int sliceMs = 5, int prerollMs = 40) {
        return std::make_unique<Pacer>(*staging_, *playback_, *estimator_, producerMutex_,
                                       config_.bytesPerMs(), sliceMs, prerollMs, config_.logger);
    }

    void stageFrames(size_t count, size_t frameBytes = 320) {
        std::vector<uint8_t> frame(frameBytes, 0x7F);
        for (size_t i = 0; i < count; ++i) {
            ASSERT_EQ(staging_->write(frame.data(), frame.size()), frameBytes);
        }
    }

    void drainPlayback(size_t bytes) {
        std::vector<uint8_t> sink(bytes);
        ASSERT_EQ(playback_->read(sink.data(), sink.size()), bytes);
    }

    BridgeConfig config_;
    std::mutex producerMutex_;
    std::unique_ptr<StagingRing> staging_;
    std::unique_ptr<ByteRing> playback_;
    std::unique_ptr<HeadroomEstimator> estimator_;
};

TEST_F(PacerTest, Construction_DerivesSliceAndPrerollBytes) {
    auto pacer = makePacer(5, 40);
    EXPECT_EQ(pacer->sliceBytes(), 160u);
    EXPECT_EQ(pacer->prerollBytes(), 1280u);

    auto defaults = makePacer(0, -10);
    EXPECT_EQ(defaults->sliceMs(), 5);
    EXPECT_EQ(defaults->prerollBytes(), 0u);
}

TEST_F(PacerTest, Preroll_DoesNotExitBelowPrerollBytes) {
    auto pacer = makePacer();
    stageFrames(3); // 960 bytes, short of 1280

    PacerStep s1 = pacer->step();
    EXPECT_EQ(s1.phase, PacerPhase::PrerollFilling);
    EXPECT_EQ(s1.moved, 960u);
    EXPECT_EQ(s1.sleepSlices, 0u);

    PacerStep s2 = pacer->step();
    EXPECT_EQ(s2.phase, PacerPhase::PrerollWaiting);
    EXPECT_EQ(s2.moved, 0u);
    EXPECT_EQ(s2.sleepSlices, 1u);
    EXPECT_FALSE(pacer->didPreroll());
    EXPECT_EQ(playback_->availableToRead(), 960u);
}

TEST_F(PacerTest, TenFrames_Slice5Preroll40_PlaybackHoldsPrerollBeforeFirstSteadyStep) {
    auto pacer = makePacer(5, 40);
    stageFrames(10);

    PacerStep s1 = pacer->step();
    EXPECT_EQ(s1.phase, PacerPhase::PrerollFilling);
    EXPECT_EQ(s1.moved, 1280u);

    PacerStep s2 = pacer->step();
    EXPECT_EQ(s2.phase, PacerPhase::PrerollSatisfied);
    EXPECT_TRUE(pacer->didPreroll());
    EXPECT_GE(playback_->availableToRead(), 1280u);

    // Level 1280 exceeds target (320) + slice (160): only the steady slice moves
    PacerStep s3 = pacer->step();
    EXPECT_EQ(s3.phase, PacerPhase::Steady);
    EXPECT_EQ(s3.moved, 160u);
    EXPECT_EQ(s3.playbackLevel, 1440u);
    EXPECT_EQ(s3.sleepSlices, 1u);
    EXPECT_EQ(staging_->availableToRead(), 3200u - 1440u);
}

TEST_F(PacerTest, Steady_TopsUpToTargetPlusSliceThenFeedsSlice) {
    auto pacer = makePacer();
    stageFrames(10);
    pacer->step();
    pacer->step();
    ASSERT_TRUE(pacer->didPreroll());

    drainPlayback(1180); // leave 100 bytes queued

    PacerStep s = pacer->step();
    EXPECT_EQ(s.phase, PacerPhase::Steady);
    EXPECT_EQ(s.moved, 380u + 160u); // top-up to 480, then one slice
    EXPECT_EQ(s.playbackLevel, 640u);
}

TEST_F(PacerTest, Steady_UsesRenderGuardWhenLarger) {
    auto pacer = makePacer();
    stageFrames(20);
    pacer->step();
    pacer->step();
    ASSERT_TRUE(pacer->didPreroll());

    estimator_->recordPull(1280); // guard = 1920 bytes
    PacerStep s = pacer->step();
    EXPECT_EQ(s.playbackLevel, 1920u + 160u + 160u);
}

TEST_F(PacerTest, Steady_NothingStaged_SleepsExtraSlice) {
    auto pacer = makePacer();
    stageFrames(4); // exactly the preroll
    pacer->step();
    pacer->step();
    ASSERT_TRUE(pacer->didPreroll());
    drainPlayback(1200);

    PacerStep s = pacer->step();
    EXPECT_EQ(s.phase, PacerPhase::Steady);
    EXPECT_EQ(s.moved, 0u);
    EXPECT_EQ(s.sleepSlices, 2u);
}

TEST_F(PacerTest, DrainedPlayback_ReentersPreroll) {
    auto pacer = makePacer();
    stageFrames(10);
    pacer->step();
    pacer->step();
    ASSERT_TRUE(pacer->didPreroll());

    drainPlayback(1280);
    PacerStep s = pacer->step();
    EXPECT_EQ(s.phase, PacerPhase::PrerollFilling);
    EXPECT_EQ(s.moved, 1280u);
    EXPECT_FALSE(pacer->didPreroll());
}

TEST_F(PacerTest, Preroll_ClampedToPlaybackCapacity) {
    playback_ = std::make_unique<ByteRing>(1000);
    auto pacer = makePacer(5, 40);
    EXPECT_EQ(pacer->prerollBytes(), 1000u);

    stageFrames(10);
    pacer->step();
    EXPECT_EQ(pacer->step().phase, PacerPhase::PrerollSatisfied);
}

TEST_F(PacerTest, PacingThread_FillsPlaybackAndStops) {
    PacingThread thread(config_.logger);
    stageFrames(10);

    ASSERT_TRUE(thread.start(makePacer()).has_value());
    EXPECT_TRUE(thread.isRunning());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (playback_->availableToRead() < 1280 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_GE(playback_->availableToRead(), 1280u);

    thread.stop();
    EXPECT_FALSE(thread.isRunning());
    EXPECT_GT(thread.iterations(), 0u);
    thread.stop(); // idempotent
}

TEST_F(PacerTest, PacingThread_SecondStart_InvalidState) {
    PacingThread thread(config_.logger);
    ASSERT_TRUE(thread.start(makePacer()).has_value());

    auto again = thread.start(makePacer());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), BridgeError::InvalidState);
    thread.stop();
}

TEST_F(PacerTest, PacingThread_StopInterruptsLongSleep) {
    PacingThread thread(config_.logger);
    // Empty staging: every step asks for a 500ms sleep
    ASSERT_TRUE(thread.start(makePacer(500, 40)).has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    const auto before = std::chrono::steady_clock::now();
    thread.stop();
    const auto elapsed = std::chrono::steady_clock::now() - before;
    EXPECT_LT(elapsed, std::chrono::milliseconds(400));
}
