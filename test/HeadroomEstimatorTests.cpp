#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include "Stream/core/HeadroomEstimator.hpp"
#include "Stream/core/LegacyBuffers.hpp"
#include "Stream/core/ScratchBuffer.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace VPB;
using namespace VPB::Stream;

class HeadroomEstimatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.logger = spdlog::default_logger();
    }

    BridgeConfig config_;
};

TEST_F(HeadroomEstimatorTest, RecordPull_TracksLastAndMax) {
    HeadroomEstimator est(config_);
    est.recordPull(320);
    est.recordPull(640);
    est.recordPull(160);
    EXPECT_EQ(est.renderLastBytes(), 160u);
    EXPECT_EQ(est.renderMaxBytes(), 640u);
}

TEST_F(HeadroomEstimatorTest, Decay_AppliedEveryHundredPulls) {
    HeadroomEstimator est(config_);
    est.recordPull(640);
    for (int i = 0; i < 98; ++i) {
        est.recordPull(320);
    }
    EXPECT_EQ(est.renderMaxBytes(), 640u);

    est.recordPull(320); // 100th pull
    EXPECT_EQ(est.renderMaxBytes(), 628u); // 640 - 640 * 0.02
}

TEST_F(HeadroomEstimatorTest, Decay_NeverBelowCurrentPull) {
    HeadroomEstimator est(config_);
    est.recordPull(1000);
    for (int i = 0; i < 99; ++i) {
        est.recordPull(990);
    }
    EXPECT_EQ(est.renderMaxBytes(), 990u);
}

TEST_F(HeadroomEstimatorTest, TargetBytes_MaxOfHeadroomAndGuard) {
    HeadroomEstimator est(config_);
    const size_t bytesPerMs = config_.bytesPerMs();
    EXPECT_EQ(est.targetBytes(bytesPerMs), 320u); // 10ms headroom, no pulls yet

    est.recordPull(640);
    EXPECT_EQ(est.renderGuardBytes(), 960u); // 640 * 1.5
    EXPECT_EQ(est.targetBytes(bytesPerMs), 960u);

    est.setHeadroomMs(50);
    EXPECT_EQ(est.targetBytes(bytesPerMs), 1600u);
}

TEST_F(HeadroomEstimatorTest, SetHeadroomMs_NegativeClampsToZero) {
    HeadroomEstimator est(config_);
    est.setHeadroomMs(-25);
    EXPECT_EQ(est.headroomMs(), 0);
    EXPECT_EQ(est.targetBytes(config_.bytesPerMs()), 0u);
}

TEST_F(HeadroomEstimatorTest, Configure_ClampsGuardMultiplier) {
    config_.renderGuardMultiplier = 9.0;
    HeadroomEstimator est(config_);
    EXPECT_DOUBLE_EQ(est.guardMultiplier(), 4.0);

    config_.renderGuardMultiplier = 0.5;
    est.configure(config_);
    EXPECT_DOUBLE_EQ(est.guardMultiplier(), 1.0);
}

TEST_F(HeadroomEstimatorTest, UnderflowCounter_IncrementsAndResets) {
    HeadroomEstimator est(config_);
    est.recordUnderflow();
    est.recordUnderflow();
    EXPECT_EQ(est.underflowCount(), 2u);
    est.resetStatistics();
    EXPECT_EQ(est.underflowCount(), 2u);
    est.resetUnderflowCount();
    EXPECT_EQ(est.underflowCount(), 0u);
}

TEST_F(HeadroomEstimatorTest, ResetStatistics_WhilePullsRecorded) {
    config_.decayIntervalPulls = 7;
    HeadroomEstimator est(config_);
    std::atomic<bool> stop{false};

    std::thread render([&] {
        while (!stop.load()) {
            est.recordPull(320);
        }
    });
    for (int i = 0; i < 2000; ++i) {
        est.resetStatistics();
        EXPECT_LE(est.renderMaxBytes(), 320u);
    }
    stop.store(true);
    render.join();

    est.resetStatistics();
    EXPECT_EQ(est.renderMaxBytes(), 0u);
    est.recordPull(160);
    EXPECT_EQ(est.renderLastBytes(), 160u);
    EXPECT_EQ(est.renderMaxBytes(), 160u);
}

TEST(ScratchBufferTest, Acquire_GrowsOnlyForLargerSlices) {
    ScratchBuffer scratch;
    uint8_t* first = scratch.acquire(320);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(scratch.acquire(160), first);
    EXPECT_EQ(scratch.acquire(320), first);
    EXPECT_EQ(scratch.growCount(), 1u);

    ASSERT_NE(scratch.acquire(640), nullptr);
    EXPECT_EQ(scratch.capacity(), 640u);
    EXPECT_EQ(scratch.growCount(), 2u);

    scratch.release();
    EXPECT_EQ(scratch.capacity(), 0u);
}

TEST(LegacyBuffersTest, CaptureAppend_BoundedByReservation) {
    LegacyCaptureBuffer capture;
    ASSERT_TRUE(capture.reserve(10));
    std::vector<uint8_t> data(8, 0x33);

    EXPECT_EQ(capture.append(data.data(), data.size()), 0u); // not recording yet
    capture.begin();
    EXPECT_EQ(capture.append(data.data(), data.size()), 8u);
    EXPECT_EQ(capture.append(data.data(), data.size()), 2u);
    capture.end();

    EXPECT_EQ(capture.size(), 10u);
    EXPECT_EQ(capture.droppedBytes(), 6u);

    std::vector<uint8_t> out(4);
    EXPECT_EQ(capture.copy(out.data(), out.size()), 4u);
    capture.clear();
    EXPECT_EQ(capture.size(), 0u);
}

TEST(LegacyBuffersTest, PlaybackRender_ZeroFillsTail) {
    LegacyPlaybackBuffer playback;
    std::vector<uint8_t> data(6, 0x44);
    ASSERT_TRUE(playback.load(data.data(), data.size()));

    std::vector<uint8_t> out(4, 0xFF);
    EXPECT_EQ(playback.render(out.data(), out.size()), 4u);
    EXPECT_EQ(out, std::vector<uint8_t>(4, 0x44));

    EXPECT_EQ(playback.render(out.data(), out.size()), 2u);
    EXPECT_EQ(out, (std::vector<uint8_t>{0x44, 0x44, 0, 0}));
    EXPECT_TRUE(playback.finished());
}
