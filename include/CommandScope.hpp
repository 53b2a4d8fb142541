#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

// Thrown when a previous holder of the encoder left its scope by exception.
// The recorded command stream can no longer be trusted.
struct RecordingPoisoned : std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class RecordingState : uint8_t { Empty, Recording, Finished };

// Owns the single encoder of a frame and serializes access to it.
//
// Callers record through a Guard returned by lock(). The guard holds the mutex
// until it goes out of scope. Waiters are woken in no particular order.
template <typename Encoder>
class CommandScope
{
  public:
    class Guard
    {
      public:
        Guard(const Guard &)                     = delete;
        auto operator=(const Guard &) -> Guard & = delete;

        ~Guard()
        {
            if (std::uncaught_exceptions() > uncaughtOnEntry) {
                scope.tainted.store(true);
            }
            scope.outstanding.fetch_sub(1);
        }

        auto operator*() const -> Encoder &
        {
            return scope.encoder;
        }
        auto operator->() const -> Encoder *
        {
            return &scope.encoder;
        }

      private:
        friend class CommandScope;

        Guard(
            const CommandScope            &owner,
            std::unique_lock<std::mutex> &&held)
            : scope{owner},
              ownership{std::move(held)},
              uncaughtOnEntry{std::uncaught_exceptions()}
        {
        }

        const CommandScope          &scope;
        std::unique_lock<std::mutex> ownership;
        int                          uncaughtOnEntry;
    };

    explicit CommandScope(Encoder &&encoder_)
        : encoder{std::move(encoder_)}
    {
    }

    CommandScope(const CommandScope &)                     = delete;
    auto operator=(const CommandScope &) -> CommandScope & = delete;

    // Blocks until no other guard is alive.
    [[nodiscard]]
    auto lock() const -> Guard
    {
        std::unique_lock<std::mutex> held{mutex};

        if (currentState.load() == RecordingState::Finished) {
            throw std::logic_error{"command encoder accessed after the frame finished"};
        }
        if (tainted.load()) {
            throw RecordingPoisoned{
                "failed to acquire lock to command encoder: a previous holder failed "
                "while recording"};
        }

        currentState.store(RecordingState::Recording);

        // Counted only once the mutex is held, so finish() sees every live guard.
        outstanding.fetch_add(1);
        return Guard{*this, std::move(held)};
    }

    // Yields the encoder for submission. Terminal.
    [[nodiscard]]
    auto finish() && -> Encoder
    {
        if (currentState.load() == RecordingState::Finished) {
            throw std::logic_error{"command encoder already finished"};
        }
        // A guard outliving the frame would write into a destroyed encoder.
        if (outstanding.load() != 0) {
            fmt::print(
                stderr,
                "command encoder finished while a guard is still held past the end of "
                "the frame\n");
            std::abort();
        }

        std::lock_guard<std::mutex> hold{mutex};

        if (tainted.load()) {
            throw RecordingPoisoned{"failed to lock command encoder: recording was poisoned"};
        }

        currentState.store(RecordingState::Finished);
        return std::move(encoder);
    }

    [[nodiscard]]
    auto state() const -> RecordingState
    {
        return currentState.load();
    }

    [[nodiscard]]
    auto poisoned() const -> bool
    {
        return tainted.load();
    }

  private:
    mutable std::mutex                  mutex;
    mutable Encoder                     encoder;
    mutable std::atomic<RecordingState> currentState{RecordingState::Empty};
    mutable std::atomic<bool>           tainted{false};
    mutable std::atomic<int>            outstanding{0};
};
