#include <gtest/gtest.h>
#include "Stream/core/ByteRing.hpp"
#include <atomic>
#include <numeric>
#include <random>
#include <thread>
#include <vector>

using namespace VPB;
using namespace VPB::Stream;

namespace {
std::vector<uint8_t> sequence(size_t n, uint8_t start = 0) {
    std::vector<uint8_t> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>(start + i);
    return v;
}
}

class ByteRingTest : public ::testing::Test {
protected:
    void expectCursorsBounded(const ByteRing& ring) {
        const size_t w = ring.writeCursor();
        const size_t r = ring.readCursor();
        ASSERT_LE(r, w);
        ASSERT_LE(w - r, ring.capacity());
        ASSERT_EQ(ring.availableToRead() + ring.availableToWrite(), ring.capacity());
    }
};

TEST_F(ByteRingTest, Create_ZeroCapacity_BadArgument) {
    auto ring = ByteRing::create(0);
    ASSERT_FALSE(ring.has_value());
    EXPECT_EQ(ring.error(), BridgeError::BadArgument);
}

TEST_F(ByteRingTest, Create_ValidCapacity_StartsEmpty) {
    auto ring = ByteRing::create(64);
    ASSERT_TRUE(ring.has_value());
    EXPECT_EQ((*ring)->capacity(), 64u);
    EXPECT_EQ((*ring)->availableToRead(), 0u);
    EXPECT_EQ((*ring)->availableToWrite(), 64u);
}

TEST_F(ByteRingTest, WriteRead_PreservesOrderAcrossWrap) {
    ByteRing ring(16);
    auto first = sequence(12);
    ASSERT_EQ(ring.write(first.data(), first.size()), 12u);

    std::vector<uint8_t> out(10);
    ASSERT_EQ(ring.read(out.data(), out.size()), 10u);
    EXPECT_EQ(out, std::vector<uint8_t>(first.begin(), first.begin() + 10));

    auto second = sequence(10, 100);
    ring.write(second.data(), second.size());
    expectCursorsBounded(ring);

    std::vector<uint8_t> rest(32);
    ASSERT_EQ(ring.read(rest.data(), rest.size()), 12u);
    EXPECT_EQ(rest[0], 10);
    EXPECT_EQ(rest[1], 11);
    for (size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(rest[2 + i], static_cast<uint8_t>(100 + i));
    }
}

TEST_F(ByteRingTest, Read_NeverReturnsMoreThanAvailable) {
    ByteRing ring(32);
    auto data = sequence(5);
    ring.write(data.data(), data.size());

    std::vector<uint8_t> out(100, 0xEE);
    EXPECT_EQ(ring.read(out.data(), out.size()), 5u);
    EXPECT_EQ(out[5], 0xEE);
    EXPECT_EQ(ring.read(out.data(), out.size()), 0u);
}

TEST_F(ByteRingTest, Write_Overflow_DropsExactlyTheOldestBytes) {
    ByteRing ring(8);
    auto a = sequence(6, 1);   // 1..6
    auto b = sequence(5, 7);   // 7..11
    ring.write(a.data(), a.size());

    const size_t expectedDrop = b.size() - ring.availableToWrite();
    EXPECT_EQ(ring.write(b.data(), b.size()), b.size());
    EXPECT_EQ(ring.droppedBytes(), expectedDrop);
    expectCursorsBounded(ring);

    std::vector<uint8_t> out(8);
    ASSERT_EQ(ring.read(out.data(), out.size()), 8u);
    EXPECT_EQ(out, sequence(8, 4)); // 4..11
}

TEST_F(ByteRingTest, Write_LargerThanCapacity_RetainsNewestBytes) {
    ByteRing ring(32000);
    std::vector<uint8_t> big(64000);
    for (size_t i = 0; i < big.size(); ++i) big[i] = static_cast<uint8_t>(i % 251);

    EXPECT_EQ(ring.write(big.data(), big.size()), big.size());
    EXPECT_EQ(ring.availableToRead(), 32000u);
    expectCursorsBounded(ring);

    std::vector<uint8_t> out(32000);
    ASSERT_EQ(ring.read(out.data(), out.size()), 32000u);
    EXPECT_TRUE(std::equal(out.begin(), out.end(), big.begin() + 32000));
}

TEST_F(ByteRingTest, Flush_DropsPendingBytes) {
    ByteRing ring(64);
    auto data = sequence(40);
    ring.write(data.data(), data.size());
    ring.flush();
    EXPECT_EQ(ring.availableToRead(), 0u);
    EXPECT_EQ(ring.availableToWrite(), 64u);
    expectCursorsBounded(ring);

    // Ring remains usable after a flush
    ring.write(data.data(), 10);
    std::vector<uint8_t> out(10);
    EXPECT_EQ(ring.read(out.data(), out.size()), 10u);
    EXPECT_EQ(out, sequence(10));
}

TEST_F(ByteRingTest, NullOrEmptyArguments_AreNoOps) {
    ByteRing ring(16);
    EXPECT_EQ(ring.write(nullptr, 10), 0u);
    uint8_t byte = 1;
    EXPECT_EQ(ring.write(&byte, 0), 0u);
    EXPECT_EQ(ring.read(nullptr, 10), 0u);
    EXPECT_EQ(ring.availableToRead(), 0u);
}

TEST_F(ByteRingTest, RandomOperations_CursorsStayBounded) {
    ByteRing ring(97);
    std::mt19937 gen(1234);
    std::uniform_int_distribution<int> op(0, 9);
    std::uniform_int_distribution<size_t> len(0, 150);
    std::vector<uint8_t> buf(150, 0x5A);

    for (int i = 0; i < 5000; ++i) {
        const int choice = op(gen);
        if (choice < 5) {
            ring.write(buf.data(), len(gen));
        } else if (choice < 9) {
            const size_t before = ring.availableToRead();
            const size_t got = ring.read(buf.data(), len(gen));
            ASSERT_LE(got, before);
        } else {
            ring.flush();
        }
        expectCursorsBounded(ring);
    }
}

TEST_F(ByteRingTest, ConcurrentProducerConsumer_DeliversBytesInOrder) {
    ByteRing ring(4096);
    constexpr size_t kTotal = 1 << 20;
    std::atomic<bool> orderViolation{false};

    std::thread producer([&] {
        std::vector<uint8_t> chunk(300);
        size_t produced = 0;
        while (produced < kTotal) {
            const size_t n = std::min(chunk.size(), kTotal - produced);
            if (ring.availableToWrite() < n) {
                std::this_thread::yield();
                continue;
            }
            for (size_t i = 0; i < n; ++i) chunk[i] = static_cast<uint8_t>((produced + i) % 251);
            ring.write(chunk.data(), n);
            produced += n;
        }
    });

    std::vector<uint8_t> out(512);
    size_t consumed = 0;
    while (consumed < kTotal) {
        const size_t got = ring.read(out.data(), out.size());
        for (size_t i = 0; i < got; ++i) {
            if (out[i] != static_cast<uint8_t>((consumed + i) % 251)) {
                orderViolation.store(true);
            }
        }
        consumed += got;
        if (got == 0) std::this_thread::yield();
    }
    producer.join();

    EXPECT_FALSE(orderViolation.load());
    EXPECT_EQ(ring.droppedBytes(), 0u);
    EXPECT_EQ(ring.availableToRead(), 0u);
}
