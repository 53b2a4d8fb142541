#include "PendingSubmission.hpp"
#include "TestBackend.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using ::testing::ElementsAre;

class PendingSubmissionTest : public ::testing::Test {
protected:
    PendingSubmission<MarkerEncoder> submission_;
    int                              waits_ = 0;

    auto waitForFence()
    {
        return [this] { ++waits_; };
    }
};

TEST_F(PendingSubmissionTest, NothingToWaitForBeforeTheFirstSubmit)
{
    submission_.retire(waitForFence());

    EXPECT_FALSE(submission_.pending());
    EXPECT_EQ(waits_, 0);
}

TEST_F(PendingSubmissionTest, SuccessfulSubmitIsWaitedOnOnce)
{
    MarkerEncoder encoder;
    encoder.record("clear");

    auto submitted = std::vector<std::string>{};
    submission_.submit(std::move(encoder), [&] { submitted.push_back("queue"); });

    EXPECT_TRUE(submission_.pending());
    EXPECT_THAT(submitted, ElementsAre("queue"));

    submission_.retire(waitForFence());
    submission_.retire(waitForFence());

    EXPECT_FALSE(submission_.pending());
    EXPECT_EQ(waits_, 1);
}

// A device lost during submit must not leave a fence that nothing will signal.
TEST_F(PendingSubmissionTest, FailedSubmitLeavesNothingPending)
{
    EXPECT_THROW(
        submission_.submit(
            MarkerEncoder{},
            [] { throw std::runtime_error{"device lost"}; }),
        std::runtime_error);

    EXPECT_FALSE(submission_.pending());

    submission_.retire(waitForFence());
    EXPECT_EQ(waits_, 0);
}

TEST_F(PendingSubmissionTest, FailedWaitKeepsSubmissionPending)
{
    submission_.submit(MarkerEncoder{}, [] {});

    EXPECT_THROW(
        submission_.retire([] { throw std::runtime_error{"wait timed out"}; }),
        std::runtime_error);

    EXPECT_TRUE(submission_.pending());
}

TEST_F(PendingSubmissionTest, SubmitWithoutRetiringIsRejected)
{
    submission_.submit(MarkerEncoder{}, [] {});

    auto submits = 0;
    EXPECT_THROW(
        submission_.submit(MarkerEncoder{}, [&] { ++submits; }),
        std::logic_error);
    EXPECT_EQ(submits, 0);
}

} // namespace
