#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <utility>

#include <SDL3/SDL_video.h>

#include "CommandScope.hpp"
#include "Geometry.hpp"

using WindowId = SDL_WindowID;

// The recorded work of one frame, ready to be submitted to `queue`.
template <typename Backend>
struct FinishedFrame {
    WindowId                       windowId;
    uint64_t                       nth;
    const typename Backend::Queue &queue;
    typename Backend::Encoder      encoder;
};

// Allows the view of a window to draw a single frame directly to its swapchain image.
//
// A frame borrows the swapchain texture and the queue of the device that owns the
// swapchain. Both must outlive the frame; the frame driver guarantees this by
// keeping the frame on its stack for the duration of the view callback only.
//
// Commands recorded through commandEncoder() are submitted to queue() by the
// driver once the view returns. The frame does not check that the queue and the
// texture belong to the same device.
template <typename Backend>
class BasicRawFrame
{
  public:
    using Device      = typename Backend::Device;
    using Queue       = typename Backend::Queue;
    using TextureView = typename Backend::TextureView;
    using Format      = typename Backend::Format;
    using Encoder     = typename Backend::Encoder;
    using Guard       = typename CommandScope<Encoder>::Guard;

    BasicRawFrame(
        const Device      &device,
        const Queue       &queue,
        WindowId           windowId,
        uint64_t           nth,
        const TextureView &swapchainTexture,
        Format             textureFormat,
        Rect               windowRect)
        : scope{std::in_place, Backend::createEncoder(device)},
          id{windowId},
          frameNumber{nth},
          texture{swapchainTexture},
          targetQueue{queue},
          format{textureFormat},
          area{windowRect}
    {
    }

    BasicRawFrame(const BasicRawFrame &)                     = delete;
    BasicRawFrame(BasicRawFrame &&)                          = delete;
    auto operator=(const BasicRawFrame &) -> BasicRawFrame & = delete;
    auto operator=(BasicRawFrame &&) -> BasicRawFrame &      = delete;

    // Exclusive access to the encoder. Blocks while another guard is alive.
    // Throws RecordingPoisoned if a previous holder failed while recording.
    [[nodiscard]]
    auto commandEncoder() const -> Guard
    {
        if (!scope) {
            throw std::logic_error{"command encoder requested from a finished frame"};
        }
        return scope->lock();
    }

    // Consumes the frame. Called by the frame driver after the view has returned.
    [[nodiscard]]
    auto finish() && -> FinishedFrame<Backend>
    {
        if (!scope) {
            throw std::logic_error{"frame finished twice"};
        }

        auto encoder = std::move(*scope).finish();
        scope.reset();

        return FinishedFrame<Backend>{id, frameNumber, targetQueue, std::move(encoder)};
    }

    [[nodiscard]]
    auto recordingState() const -> RecordingState
    {
        return scope ? scope->state() : RecordingState::Finished;
    }

    // The id of the window whose surface this frame draws to.
    auto windowId() const -> WindowId
    {
        return id;
    }

    // Frames are counted per window, starting at 0.
    auto nth() const -> uint64_t
    {
        return frameNumber;
    }

    // The full surface of the window at the time the frame was created.
    auto rect() const -> Rect
    {
        return area;
    }

    auto swapchainTexture() const -> const TextureView &
    {
        return texture;
    }

    auto textureFormat() const -> Format
    {
        return format;
    }

    // The queue the recorded commands will be submitted to.
    auto queue() const -> const Queue &
    {
        return targetQueue;
    }

  private:
    std::optional<CommandScope<Encoder>> scope;

    WindowId           id;
    uint64_t           frameNumber;
    const TextureView &texture;
    const Queue       &targetQueue;
    Format             format;
    Rect               area;
};
