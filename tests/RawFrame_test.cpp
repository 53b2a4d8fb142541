#include "RawFrame.hpp"
#include "TestBackend.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using Frame = BasicRawFrame<FakeBackend>;

using ::testing::ElementsAre;
using ::testing::IsEmpty;

class RawFrameTest : public ::testing::Test {
protected:
    static constexpr WindowId kWindow = 1;

    FakeDevice  device_{7};
    FakeQueue   queue_{7};
    FakeTexture texture_{7};
    Rect        rect_ = Rect::fromSize(800.0f, 600.0f);
};

TEST_F(RawFrameTest, RecordsAcrossGuardsAndFinishesInOrder)
{
    Frame frame{device_, queue_, kWindow, 0, texture_, FakeFormat::Bgra8Srgb, rect_};

    EXPECT_EQ(frame.windowId(), kWindow);
    EXPECT_EQ(frame.nth(), 0u);
    EXPECT_TRUE(frame.rect() == (Rect{{0.0f, 0.0f}, {800.0f, 600.0f}}));
    EXPECT_EQ(frame.textureFormat(), FakeFormat::Bgra8Srgb);

    frame.commandEncoder()->record("A");
    frame.commandEncoder()->record("B");

    const auto finished = std::move(frame).finish();

    EXPECT_THAT(finished.encoder.commands, ElementsAre("A", "B"));
    EXPECT_EQ(finished.windowId, kWindow);
    EXPECT_EQ(finished.nth, 0u);
    EXPECT_EQ(&finished.queue, &queue_);
}

TEST_F(RawFrameTest, AccessorsAreStable)
{
    Frame frame{device_, queue_, kWindow, 3, texture_, FakeFormat::Rgba8Unorm, rect_};

    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(frame.windowId(), kWindow);
        EXPECT_EQ(frame.nth(), 3u);
        EXPECT_TRUE(frame.rect() == rect_);
        EXPECT_EQ(frame.textureFormat(), FakeFormat::Rgba8Unorm);
        EXPECT_EQ(&frame.queue(), &queue_);
        EXPECT_EQ(&frame.swapchainTexture(), &texture_);

        frame.commandEncoder()->record("draw");
    }
}

TEST_F(RawFrameTest, BorrowsTextureAndQueue)
{
    Frame frame{device_, queue_, kWindow, 0, texture_, FakeFormat::Rgba8Unorm, rect_};

    EXPECT_EQ(&frame.swapchainTexture(), &texture_);
    EXPECT_EQ(&frame.queue(), &queue_);
}

TEST_F(RawFrameTest, EncoderIsCreatedFromTheGivenDevice)
{
    const auto created = FakeBackend::encodersCreated.load();

    Frame frame{device_, queue_, kWindow, 0, texture_, FakeFormat::Rgba8Unorm, rect_};

    EXPECT_EQ(FakeBackend::encodersCreated.load(), created + 1);
    EXPECT_EQ(frame.commandEncoder()->deviceId, device_.id);
    EXPECT_THAT(frame.commandEncoder()->commands, IsEmpty());
}

TEST_F(RawFrameTest, RecordingStateFollowsLifecycle)
{
    Frame frame{device_, queue_, kWindow, 0, texture_, FakeFormat::Rgba8Unorm, rect_};
    EXPECT_EQ(frame.recordingState(), RecordingState::Empty);

    frame.commandEncoder()->record("A");
    EXPECT_EQ(frame.recordingState(), RecordingState::Recording);

    [[maybe_unused]] auto finished = std::move(frame).finish();
    EXPECT_EQ(frame.recordingState(), RecordingState::Finished);
}

TEST_F(RawFrameTest, SecondFinishIsRejected)
{
    Frame frame{device_, queue_, kWindow, 0, texture_, FakeFormat::Rgba8Unorm, rect_};
    frame.commandEncoder()->record("A");

    const auto finished = std::move(frame).finish();
    EXPECT_THAT(finished.encoder.commands, ElementsAre("A"));

    EXPECT_THROW([[maybe_unused]] auto _ = std::move(frame).finish(), std::logic_error);
}

TEST_F(RawFrameTest, EncoderAfterFinishIsRejected)
{
    Frame frame{device_, queue_, kWindow, 0, texture_, FakeFormat::Rgba8Unorm, rect_};
    [[maybe_unused]] auto finished = std::move(frame).finish();

    EXPECT_THROW([[maybe_unused]] auto _ = frame.commandEncoder(), std::logic_error);
}

using RawFrameDeathTest = RawFrameTest;

TEST_F(RawFrameDeathTest, FinishWhileGuardHeldAborts)
{
    const auto finishWhileHeld = [this] {
        Frame frame{device_, queue_, kWindow, 0, texture_, FakeFormat::Rgba8Unorm, rect_};

        auto guard = frame.commandEncoder();
        [[maybe_unused]] auto finished = std::move(frame).finish();
    };

    EXPECT_DEATH(finishWhileHeld(), "guard is still held");
}

TEST_F(RawFrameTest, PoisonedEncoderFailsFinish)
{
    Frame frame{device_, queue_, kWindow, 0, texture_, FakeFormat::Rgba8Unorm, rect_};

    EXPECT_THROW(
        {
            auto guard = frame.commandEncoder();
            throw std::runtime_error{"draw failed"};
        },
        std::runtime_error);

    EXPECT_THROW([[maybe_unused]] auto _ = frame.commandEncoder(), RecordingPoisoned);
    EXPECT_THROW([[maybe_unused]] auto _ = std::move(frame).finish(), RecordingPoisoned);
}

// The frame trusts its caller: a queue and a texture of different devices are
// accepted as is.
TEST_F(RawFrameTest, DoesNotCheckQueueAndTextureDevice)
{
    const auto deviceA  = FakeDevice{1};
    const auto queueA   = FakeQueue{1};
    const auto textureB = FakeTexture{2};

    Frame frame{deviceA, queueA, kWindow, 0, textureB, FakeFormat::Rgba8Unorm, rect_};
    frame.commandEncoder()->record("A");

    EXPECT_EQ(frame.queue().deviceId, 1);
    EXPECT_EQ(frame.swapchainTexture().deviceId, 2);

    const auto finished = std::move(frame).finish();
    EXPECT_EQ(finished.queue.deviceId, 1);
    EXPECT_THAT(finished.encoder.commands, ElementsAre("A"));
}

class RawFrameConcurrencyTest : public ::testing::TestWithParam<int> {
protected:
    FakeDevice  device_{1};
    FakeQueue   queue_{1};
    FakeTexture texture_{1};
};

// Each thread records a begin/end pair under one guard and then a numbered
// sequence under separate guards. Pairs must stay adjacent, sequences ordered
// per thread, nothing lost.
TEST_P(RawFrameConcurrencyTest, GuardsSerializeRecording)
{
    const auto     threadCount     = GetParam();
    constexpr auto kStepsPerThread = 16;

    Frame frame{
        device_,
        queue_,
        1,
        0,
        texture_,
        FakeFormat::Rgba8Unorm,
        Rect::fromSize(640.0f, 480.0f)};

    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([&frame, t] {
            {
                auto encoder = frame.commandEncoder();
                encoder->record(std::to_string(t) + ":begin");
                std::this_thread::yield();
                encoder->record(std::to_string(t) + ":end");
            }
            for (int step = 0; step < kStepsPerThread; ++step) {
                frame.commandEncoder()->record(
                    std::to_string(t) + ":" + std::to_string(step));
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    const auto finished = std::move(frame).finish();
    const auto &commands = finished.encoder.commands;

    ASSERT_EQ(
        commands.size(),
        static_cast<std::size_t>(threadCount * (kStepsPerThread + 2)));

    std::map<int, int> nextStep;
    for (std::size_t i = 0; i < commands.size(); ++i) {
        const auto &command = commands[i];
        const auto  colon   = command.find(':');
        ASSERT_NE(colon, std::string::npos) << command;

        const auto thread = std::stoi(command.substr(0, colon));
        const auto marker = command.substr(colon + 1);

        if (marker == "begin") {
            ASSERT_LT(i + 1, commands.size());
            EXPECT_EQ(commands[i + 1], std::to_string(thread) + ":end");
            EXPECT_EQ(nextStep.count(thread), 0u) << "numbered step before begin";
        } else if (marker == "end") {
            ASSERT_GT(i, 0u);
            EXPECT_EQ(commands[i - 1], std::to_string(thread) + ":begin");
            nextStep[thread] = 0;
        } else {
            ASSERT_EQ(nextStep.count(thread), 1u) << command;
            EXPECT_EQ(std::stoi(marker), nextStep[thread]);
            ++nextStep[thread];
        }
    }

    ASSERT_EQ(nextStep.size(), static_cast<std::size_t>(threadCount));
    for (const auto &[thread, steps] : nextStep) {
        EXPECT_EQ(steps, kStepsPerThread) << "thread " << thread;
    }
}

INSTANTIATE_TEST_SUITE_P(ThreadCounts, RawFrameConcurrencyTest, ::testing::Values(1, 2, 8));

} // namespace
