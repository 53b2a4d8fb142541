#include "FrameSequence.hpp"

#include <gtest/gtest.h>

namespace {

TEST(FrameSequenceTest, StartsAtZeroAndIncreases)
{
    FrameSequence sequence;

    EXPECT_EQ(sequence.next(1), 0u);
    EXPECT_EQ(sequence.next(1), 1u);
    EXPECT_EQ(sequence.next(1), 2u);
    EXPECT_EQ(sequence.count(1), 3u);
}

TEST(FrameSequenceTest, WindowsAreCountedIndependently)
{
    FrameSequence sequence;

    EXPECT_EQ(sequence.next(1), 0u);
    EXPECT_EQ(sequence.next(1), 1u);
    EXPECT_EQ(sequence.next(2), 0u);
    EXPECT_EQ(sequence.next(1), 2u);
    EXPECT_EQ(sequence.count(2), 1u);
}

TEST(FrameSequenceTest, StrictlyIncreasingOverManyFrames)
{
    FrameSequence sequence;

    auto previous = sequence.next(5);
    for (int i = 0; i < 1000; ++i) {
        const auto current = sequence.next(5);
        EXPECT_GT(current, previous);
        previous = current;
    }
}

TEST(FrameSequenceTest, UnknownWindowHasNoFrames)
{
    const FrameSequence sequence;
    EXPECT_EQ(sequence.count(42), 0u);
}

TEST(FrameSequenceTest, ForgetRestartsCounting)
{
    FrameSequence sequence;
    sequence.next(3);
    sequence.next(3);

    sequence.forget(3);

    EXPECT_EQ(sequence.count(3), 0u);
    EXPECT_EQ(sequence.next(3), 0u);
}

} // namespace
