#include "WindowSurface.hpp"

#include "Utility.hpp"

#include <fmt/base.h>
#include <fmt/format.h>

#include <array>
#include <limits>
#include <stdexcept>

#include <vulkan/vulkan_to_string.hpp>

namespace {
constexpr auto boundaryPoolFlags = vk::CommandPoolCreateFlagBits::eTransient
                                 | vk::CommandPoolCreateFlagBits::eResetCommandBuffer;
}

WindowSurface::WindowSurface(
    const Instance       &instance,
    const PhysicalDevice &physicalDevice_,
    const Device         &device_,
    Window              &&window_,
    const SurfaceConfig  &config)
    : physicalDevice{physicalDevice_},
      device{device_},
      window{std::move(window_)},
      windowId{getWindowId(window.get())},
      surface{
          instance,
          window.get()},
      swapchain{
          device,
          physicalDevice,
          surface,
          config,
          getFramebufferExtent(window.get())},
      imageAvailable{
          device.handle,
          vk::SemaphoreCreateInfo{}},
      inFlight{
          device.handle,
          vk::FenceCreateInfo{vk::FenceCreateFlagBits::eSignaled}},
      prologue{
          device,
          boundaryPoolFlags},
      epilogue{
          device,
          boundaryPoolFlags}
{
}

WindowSurface::~WindowSurface()
{
    try {
        submitted.retire([this] { waitForLastFrame(); });
    } catch (const vk::SystemError &e) {
        fmt::println(
            stderr,
            "Window {}: failed to wait for last frame: {}",
            windowId,
            e.what());
    } catch (const std::runtime_error &e) {
        fmt::println(stderr, "{}", e.what());
    }
}

auto WindowSurface::waitForLastFrame() const -> void
{
    if (device.handle.waitForFences(*inFlight, vk::True, std::numeric_limits<uint64_t>::max())
        != vk::Result::eSuccess) {
        throw std::runtime_error{
            fmt::format("Window {}: failed to wait for frame fence", windowId)};
    }
}

auto WindowSurface::acquire() -> std::optional<AcquiredImage>
{
    const auto framebufferExtent = getFramebufferExtent(window.get());
    if (framebufferExtent.width == 0 || framebufferExtent.height == 0) {
        return std::nullopt;
    }

    submitted.retire([this] { waitForLastFrame(); });

    if (swapchain.needRecreate) {
        swapchain.recreate(device, physicalDevice, surface, framebufferExtent);
    }

    const auto result = swapchain.acquireNextImage(*imageAvailable);

    if (result == vk::Result::eErrorOutOfDateKHR) {
        swapchain.needRecreate = true;
        return std::nullopt;
    }

    // The image is acquired and the semaphore will signal; draw it and recreate next time.
    if (result == vk::Result::eSuboptimalKHR) {
        swapchain.needRecreate = true;
    } else if (result != vk::Result::eSuccess) {
        throw std::runtime_error{fmt::format(
            "Window {}: failed to acquire swapchain image: {}",
            windowId,
            vk::to_string(result))};
    }

    prologue.buffer.reset();
    prologue.begin();
    cmdTransitionImageLayout(
        prologue.buffer,
        swapchain.nextImage(),
        vk::ImageLayout::eUndefined,
        vk::ImageLayout::eColorAttachmentOptimal);
    prologue.end();

    return AcquiredImage{
        swapchain.nextImageIndex,
        swapchain.nextImage(),
        swapchain.nextImageView()};
}

auto WindowSurface::submitAndPresent(
    VulkanFinishedFrame &&finished,
    const AcquiredImage  &image) -> void
{
    epilogue.buffer.reset();
    epilogue.begin();
    cmdTransitionImageLayout(
        epilogue.buffer,
        image.image,
        vk::ImageLayout::eColorAttachmentOptimal,
        vk::ImageLayout::ePresentSrcKHR);
    epilogue.end();

    finished.encoder.end();

    const auto renderFinished = swapchain.renderFinishedSemaphore();

    auto waitSemaphoreSubmitInfo = vk::SemaphoreSubmitInfo{
        *imageAvailable,
        {},
        vk::PipelineStageFlagBits2::eAllCommands};

    auto signalSemaphoreSubmitInfo = vk::SemaphoreSubmitInfo{
        renderFinished,
        {},
        vk::PipelineStageFlagBits2::eAllCommands};

    const auto commandBufferSubmitInfos = std::array{
        vk::CommandBufferSubmitInfo{*prologue.buffer},
        vk::CommandBufferSubmitInfo{*finished.encoder.buffer},
        vk::CommandBufferSubmitInfo{*epilogue.buffer}};

    // The fence is only waited on once submit2 has returned.
    submitted.submit(std::move(finished.encoder), [&] {
        device.handle.resetFences(*inFlight);
        finished.queue.submit2(
            vk::SubmitInfo2{
                {},
                waitSemaphoreSubmitInfo,
                commandBufferSubmitInfos,
                signalSemaphoreSubmitInfo},
            *inFlight);
    });

    try {
        const auto presentResult = finished.queue.presentKHR(
            vk::PresentInfoKHR{renderFinished, *swapchain.handle, image.index});

        if (presentResult == vk::Result::eSuboptimalKHR) {
            swapchain.needRecreate = true;
        }
    } catch (const vk::OutOfDateKHRError &) {
        swapchain.needRecreate = true;
    }
}

auto WindowSurface::requestRecreate() -> void
{
    swapchain.needRecreate = true;
}

auto WindowSurface::id() const -> WindowId
{
    return windowId;
}

auto WindowSurface::rect() const -> Rect
{
    return getWindowRect(window.get());
}

auto WindowSurface::format() const -> vk::Format
{
    return swapchain.imageFormat;
}

auto WindowSurface::extent() const -> vk::Extent2D
{
    return swapchain.extent();
}
