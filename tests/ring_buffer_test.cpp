#include "audio/framer.hpp"
#include "audio/ring_buffer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace wakescribe;
using namespace wakescribe::test;

TEST(RingBuffer, OverwritesOldestOnceFull) {
    RingBuffer<int> rb(4);
    for (int i = 1; i <= 6; ++i) rb.push(i);

    EXPECT_EQ(rb.size(), 4u);
    EXPECT_EQ(rb.totalPushed(), 6u);
    std::vector<int> out;
    rb.copyLast(4, out);
    EXPECT_EQ(out, (std::vector<int>{3, 4, 5, 6}));

    out.clear();
    rb.copyLast(10, out);
    EXPECT_EQ(out.size(), 4u);
}

TEST(RingBuffer, BulkPushWrapsAndKeepsNewest) {
    RingBuffer<int> rb(5);
    const int a[] = {1, 2, 3};
    const int b[] = {4, 5, 6, 7};
    rb.push(a, 3);
    rb.push(b, 4);

    std::vector<int> out;
    rb.copyLast(5, out);
    EXPECT_EQ(out, (std::vector<int>{3, 4, 5, 6, 7}));

    const int big[] = {10, 11, 12, 13, 14, 15, 16};
    rb.push(big, 7);
    out.clear();
    rb.copyLast(5, out);
    EXPECT_EQ(out, (std::vector<int>{12, 13, 14, 15, 16}));
    EXPECT_EQ(rb.totalPushed(), 14u);

    rb.push(big, 0);
    EXPECT_EQ(rb.totalPushed(), 14u);
}

TEST(RingBuffer, PartialFillReportsSize) {
    RingBuffer<int> rb(8);
    const int a[] = {1, 2, 3};
    rb.push(a, 3);
    EXPECT_EQ(rb.size(), 3u);
    rb.clear();
    EXPECT_EQ(rb.size(), 0u);
}

TEST(RingBuffer, ZeroCapacityIsRejected) {
    EXPECT_THROW(RingBuffer<int>(0), std::invalid_argument);
}

TEST(Framer, WindowNeverExceedsCapacity) {
    Framer framer(kRate, 1500);
    EXPECT_EQ(framer.capacitySamples(), 24000u);

    for (int i = 0; i < 20; ++i) framer.push(makeFrame(static_cast<int16_t>(i + 1), i * 100));

    EXPECT_EQ(framer.buffered(), std::chrono::milliseconds(1500));
    EXPECT_EQ(framer.end(), 20u * kFrameSamples);

    WindowSlice all = framer.snapshot();
    EXPECT_EQ(all.samples.size(), 24000u);
    EXPECT_EQ(all.begin, 8000u);
    EXPECT_EQ(all.end, 32000u);
    // Oldest surviving frame is the sixth one pushed.
    EXPECT_EQ(all.samples.front(), 6);
    EXPECT_EQ(all.samples.back(), 20);
    EXPECT_EQ(all.endCapturedAt, steadyOrigin() + std::chrono::milliseconds(1900));
}

TEST(Framer, SliceSinceReturnsOnlyNewerSamples) {
    Framer framer(kRate, 1500);
    for (int i = 0; i < 3; ++i) framer.push(makeFrame(static_cast<int16_t>(i + 1), i * 100));

    WindowSlice tail = framer.sliceSince(kFrameSamples * 2);
    EXPECT_EQ(tail.begin, 3200u);
    EXPECT_EQ(tail.samples.size(), static_cast<std::size_t>(kFrameSamples));
    EXPECT_EQ(tail.samples.front(), 3);

    WindowSlice none = framer.sliceSince(framer.end());
    EXPECT_TRUE(none.samples.empty());
}

TEST(Framer, RejectsMismatchedSampleRate) {
    Framer framer(kRate, 1500);
    AudioFrame f = makeFrame(1, 0);
    f.sampleRate = 48000;
    EXPECT_THROW(framer.push(f), std::invalid_argument);
}
