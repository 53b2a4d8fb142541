#pragma once

#include <concepts>
#include <exception>
#include <functional>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

#include "FrameSequence.hpp"
#include "RawFrame.hpp"

// Runs the view of a window for one frame and hands back the recorded work.
//
// The caller acquires the swapchain image before drawFrame() and submits the
// returned FinishedFrame to its queue and presents afterwards.
template <typename Backend>
class FrameDriver
{
  public:
    using Frame       = BasicRawFrame<Backend>;
    using Device      = typename Backend::Device;
    using Queue       = typename Backend::Queue;
    using TextureView = typename Backend::TextureView;
    using Format      = typename Backend::Format;

    template <typename View>
        requires std::invocable<View &, const Frame &>
    auto drawFrame(
        const Device      &device,
        const Queue       &queue,
        WindowId           window,
        const TextureView &swapchainTexture,
        Format             textureFormat,
        Rect               windowRect,
        View             &&view) -> FinishedFrame<Backend>
    {
        if (!inFlight.insert(window).second) {
            throw std::logic_error{
                fmt::format("window {} already has a frame in progress", window)};
        }
        auto release = InFlight{inFlight, window};

        const auto nth = sequence.next(window);

        Frame frame{
            device,
            queue,
            window,
            nth,
            swapchainTexture,
            textureFormat,
            windowRect};

        try {
            std::invoke(view, std::as_const(frame));
            return std::move(frame).finish();
        } catch (const std::exception &e) {
            fmt::print(stderr, "Frame {} of window {} lost: {}\n", nth, window, e.what());
            throw;
        }
    }

    [[nodiscard]]
    auto frameCount(WindowId window) const -> uint64_t
    {
        return sequence.count(window);
    }

    auto closeWindow(WindowId window) -> void
    {
        sequence.forget(window);
    }

  private:
    struct InFlight {
        InFlight(
            std::unordered_set<WindowId> &windows_,
            WindowId                      window_)
            : windows{windows_},
              window{window_}
        {
        }
        InFlight(const InFlight &)                     = delete;
        auto operator=(const InFlight &) -> InFlight & = delete;
        ~InFlight()
        {
            windows.erase(window);
        }

        std::unordered_set<WindowId> &windows;
        WindowId                      window;
    };

    FrameSequence                sequence;
    std::unordered_set<WindowId> inFlight;
};
