#pragma once

#include <cstdint>
#include <optional>

#include <vulkan/vulkan_raii.hpp>

#include "Command.hpp"
#include "Device.hpp"
#include "PendingSubmission.hpp"
#include "RuntimeConfig.hpp"
#include "Surface.hpp"
#include "Swapchain.hpp"
#include "VulkanBackend.hpp"
#include "Window.hpp"

struct AcquiredImage {
    uint32_t                   index;
    vk::Image                  image;
    const vk::raii::ImageView &view;
};

// One window and everything needed to present to it: the Vulkan surface, its
// swapchain and the synchronization of the single frame in flight.
//
// The swapchain image is in eColorAttachmentOptimal for the whole duration of a
// frame's view and must be left in that layout. Its contents are undefined when
// the view starts.
class WindowSurface
{
  public:
    WindowSurface(
        const Instance       &instance,
        const PhysicalDevice &physicalDevice,
        const Device         &device,
        Window              &&window,
        const SurfaceConfig  &config);

    ~WindowSurface();

    WindowSurface(const WindowSurface &)                     = delete;
    auto operator=(const WindowSurface &) -> WindowSurface & = delete;

    // Waits for the previous frame of this window, then acquires the next image.
    // Returns nothing when the window is minimized or the swapchain had to be
    // recreated; the caller skips the frame.
    [[nodiscard]]
    auto acquire() -> std::optional<AcquiredImage>;

    // Submits the finished frame to its queue between the layout transitions of
    // `image`, then presents. Keeps the frame's command buffer alive until the GPU
    // is done with it.
    auto submitAndPresent(
        VulkanFinishedFrame &&finished,
        const AcquiredImage  &image) -> void;

    auto requestRecreate() -> void;

    [[nodiscard]]
    auto id() const -> WindowId;
    [[nodiscard]]
    auto rect() const -> Rect;
    [[nodiscard]]
    auto format() const -> vk::Format;
    [[nodiscard]]
    auto extent() const -> vk::Extent2D;

  private:
    auto waitForLastFrame() const -> void;

    const PhysicalDevice &physicalDevice;
    const Device         &device;

    Window   window;
    WindowId windowId;
    Surface  surface;

    Swapchain swapchain;

    vk::raii::Semaphore imageAvailable;
    vk::raii::Fence     inFlight;

    // Layout transitions recorded around the view's commands
    Command prologue;
    Command epilogue;

    // The view's command buffer, kept until inFlight has signaled
    PendingSubmission<Command> submitted;
};
