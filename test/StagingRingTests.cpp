#include <gtest/gtest.h>
#include "Stream/core/ByteRing.hpp"
#include "Stream/core/StagingRing.hpp"
#include <spdlog/spdlog.h>
#include <vector>

using namespace VPB::Stream;

class StagingRingTest : public ::testing::Test {
protected:
    static std::vector<uint8_t> sequence(size_t n, uint8_t start) {
        std::vector<uint8_t> v(n);
        for (size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>(start + i);
        return v;
    }

    std::shared_ptr<spdlog::logger> logger_ = spdlog::default_logger();
};

TEST_F(StagingRingTest, Write_GrowsAndPreservesOrder) {
    StagingRing ring(16, logger_);
    auto a = sequence(10, 0);
    ASSERT_EQ(ring.write(a.data(), a.size()), 10u);

    std::vector<uint8_t> out(6);
    ASSERT_EQ(ring.read(out.data(), out.size()), 6u);

    // 4 pending + 20 new wraps the old storage and forces growth
    auto b = sequence(20, 50);
    ASSERT_EQ(ring.write(b.data(), b.size()), 20u);
    EXPECT_EQ(ring.growthCount(), 1u);
    EXPECT_EQ(ring.capacity(), 36u); // max(32, 24, 24 + 12)
    EXPECT_EQ(ring.availableToRead(), 24u);

    std::vector<uint8_t> all(64);
    ASSERT_EQ(ring.read(all.data(), all.size()), 24u);
    std::vector<uint8_t> expected = {6, 7, 8, 9};
    expected.insert(expected.end(), b.begin(), b.end());
    all.resize(24);
    EXPECT_EQ(all, expected);
}

TEST_F(StagingRingTest, Write_FromZeroCapacity_AllocatesNeedPlusHalf) {
    StagingRing ring(0, logger_);
    auto data = sequence(10, 1);
    ASSERT_EQ(ring.write(data.data(), data.size()), 10u);
    EXPECT_EQ(ring.capacity(), 15u);

    std::vector<uint8_t> out(10);
    ASSERT_EQ(ring.read(out.data(), out.size()), 10u);
    EXPECT_EQ(out, data);
}

TEST_F(StagingRingTest, Write_ManyGrowths_NoGapsOrReordering) {
    StagingRing ring(8, logger_);
    std::vector<uint8_t> expected;
    for (int i = 0; i < 50; ++i) {
        auto chunk = sequence(static_cast<size_t>(i % 7 + 1), static_cast<uint8_t>(expected.size()));
        ASSERT_EQ(ring.write(chunk.data(), chunk.size()), chunk.size());
        expected.insert(expected.end(), chunk.begin(), chunk.end());
        if (i % 5 == 0) {
            std::vector<uint8_t> partial(3);
            const size_t got = ring.read(partial.data(), partial.size());
            ASSERT_TRUE(std::equal(partial.begin(), partial.begin() + got, expected.begin()));
            expected.erase(expected.begin(), expected.begin() + got);
        }
    }
    std::vector<uint8_t> rest(expected.size() + 10);
    ASSERT_EQ(ring.read(rest.data(), rest.size()), expected.size());
    rest.resize(expected.size());
    EXPECT_EQ(rest, expected);
    EXPECT_GT(ring.growthCount(), 0u);
}

TEST_F(StagingRingTest, DrainInto_NeverDropsInDestination) {
    StagingRing staging(64, logger_);
    ByteRing playback(8);

    auto pre = sequence(5, 200);
    playback.write(pre.data(), pre.size());

    auto staged = sequence(10, 0);
    staging.write(staged.data(), staged.size());

    EXPECT_EQ(staging.drainInto(playback, 100), 3u);
    EXPECT_EQ(playback.droppedBytes(), 0u);
    EXPECT_EQ(playback.availableToRead(), 8u);
    EXPECT_EQ(staging.availableToRead(), 7u);

    std::vector<uint8_t> out(8);
    playback.read(out.data(), out.size());
    EXPECT_EQ(out, (std::vector<uint8_t>{200, 201, 202, 203, 204, 0, 1, 2}));
}

TEST_F(StagingRingTest, DrainInto_RespectsMaxBytesAndWrap) {
    StagingRing staging(16, logger_);
    ByteRing playback(64);

    auto a = sequence(12, 0);
    staging.write(a.data(), a.size());
    std::vector<uint8_t> sink(10);
    staging.read(sink.data(), sink.size());
    auto b = sequence(10, 12); // wraps within 16 bytes
    staging.write(b.data(), b.size());
    ASSERT_EQ(staging.growthCount(), 0u);

    EXPECT_EQ(staging.drainInto(playback, 7), 7u);
    EXPECT_EQ(staging.drainInto(playback, 100), 5u);
    EXPECT_EQ(staging.drainInto(playback, 100), 0u);

    std::vector<uint8_t> out(12);
    ASSERT_EQ(playback.read(out.data(), out.size()), 12u);
    EXPECT_EQ(out, sequence(12, 10));
}

TEST_F(StagingRingTest, Flush_DiscardsPendingKeepsCapacity) {
    StagingRing staging(32, logger_);
    auto data = sequence(20, 0);
    staging.write(data.data(), data.size());
    staging.flush();
    EXPECT_EQ(staging.availableToRead(), 0u);
    EXPECT_EQ(staging.capacity(), 32u);

    std::vector<uint8_t> out(4);
    EXPECT_EQ(staging.read(out.data(), out.size()), 0u);
}
