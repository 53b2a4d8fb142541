#include "Swapchain.hpp"

#include <algorithm>
#include <array>
#include <fmt/base.h>
#include <limits>
#include <stdexcept>
#include <tuple>

Swapchain::Swapchain(
    const Device         &device,
    const PhysicalDevice &physicalDevice,
    const Surface        &surface,
    const SurfaceConfig  &config_,
    vk::Extent2D          desiredExtent)
    : config{config_}
{
    create(device, physicalDevice, surface, desiredExtent);
}

auto Swapchain::chooseSurfaceFormat(
    const std::vector<vk::SurfaceFormatKHR> &availableFormats) -> vk::SurfaceFormatKHR
{
    constexpr auto preferredSurfaceFormats = std::array{
        vk::Format::eB8G8R8A8Srgb,
        vk::Format::eR8G8B8A8Srgb,
        vk::Format::eB8G8R8A8Unorm};

    constexpr auto preferredColorSpace = vk::ColorSpaceKHR::eSrgbNonlinear;

    for (auto preferredSurfaceFormat : preferredSurfaceFormats) {
        for (auto format : availableFormats) {
            if (format.format == preferredSurfaceFormat
                && format.colorSpace == preferredColorSpace) {
                return format;
            }
        }
    }

    return availableFormats.front();
}

auto Swapchain::choosePresentMode(
    const std::vector<vk::PresentModeKHR> &preferredPresentModes,
    const std::vector<vk::PresentModeKHR> &availablePresentModes) -> vk::PresentModeKHR
{
    for (auto preferredPresentMode : preferredPresentModes) {
        if (std::ranges::contains(availablePresentModes, preferredPresentMode)) {
            return preferredPresentMode;
        }
    }

    return vk::PresentModeKHR::eFifo;
}

auto Swapchain::chooseExtent(
    const vk::SurfaceCapabilitiesKHR &capabilities,
    const vk::Extent2D               &desired) -> vk::Extent2D
{
    if (capabilities.currentExtent.width != std::numeric_limits<uint32_t>::max()) {
        return capabilities.currentExtent;
    }

    return vk::Extent2D{
        std::clamp(
            desired.width,
            capabilities.minImageExtent.width,
            capabilities.maxImageExtent.width),
        std::clamp(
            desired.height,
            capabilities.minImageExtent.height,
            capabilities.maxImageExtent.height)};
}

auto Swapchain::create(
    const Device         &device,
    const PhysicalDevice &physicalDevice,
    const Surface        &surface,
    vk::Extent2D          desiredExtent,
    vk::SwapchainKHR      oldSwapchain) -> void
{
    const auto capabilities =
        physicalDevice.handle.getSurfaceCapabilitiesKHR(surface.handle);
    const auto formats = physicalDevice.handle.getSurfaceFormatsKHR(surface.handle);
    const auto presentModes =
        physicalDevice.handle.getSurfacePresentModesKHR(surface.handle);

    if (formats.empty() || presentModes.empty()) {
        throw std::runtime_error("Surface reports no formats or present modes");
    }

    const auto surfaceFormat = chooseSurfaceFormat(formats);
    const auto presentMode   = choosePresentMode(config.presentModes, presentModes);
    swapchainExtent          = chooseExtent(capabilities, desiredExtent);

    if (swapchainExtent.width == 0 || swapchainExtent.height == 0) {
        throw std::runtime_error("Cannot create swapchain with zero extent");
    }

    const auto imageCount = std::clamp(
        config.minImageCount,
        capabilities.minImageCount,
        capabilities.maxImageCount > 0 ? capabilities.maxImageCount : UINT32_MAX);

    vk::SwapchainCreateInfoKHR createInfo{
        {},
        surface.handle,
        imageCount,
        surfaceFormat.format,
        surfaceFormat.colorSpace,
        swapchainExtent,
        1u,
        vk::ImageUsageFlagBits::eColorAttachment,
        vk::SharingMode::eExclusive,
        0u,
        nullptr,
        capabilities.currentTransform,
        vk::CompositeAlphaFlagBitsKHR::eOpaque,
        presentMode,
        vk::True,
        oldSwapchain};

    handle      = vk::raii::SwapchainKHR(device.handle, createInfo);
    imageFormat = surfaceFormat.format;
    images      = handle.getImages();

    imageViews.clear();
    renderFinishedSemaphores.clear();

    for (vk::Image image : images) {
        imageViews.emplace_back(
            device.handle,
            vk::ImageViewCreateInfo{
                {},
                image,
                vk::ImageViewType::e2D,
                imageFormat,
                {},
                {vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1}});

        renderFinishedSemaphores.emplace_back(device.handle, vk::SemaphoreCreateInfo{});
    }

    nextImageIndex = 0u;
}

auto Swapchain::recreate(
    const Device         &device,
    const PhysicalDevice &physicalDevice,
    const Surface        &surface,
    vk::Extent2D          desiredExtent) -> void
{
    device.graphicsQueue.waitIdle();

    // Keep the old swapchain alive until its replacement exists.
    auto oldHandle = std::move(handle);
    imageViews.clear();

    create(device, physicalDevice, surface, desiredExtent, *oldHandle);

    fmt::println(
        stderr,
        "Swapchain recreated at {}x{}",
        swapchainExtent.width,
        swapchainExtent.height);

    needRecreate = false;
}

auto Swapchain::acquireNextImage(vk::Semaphore signalSemaphore) -> vk::Result
{
    try {
        vk::Result result;
        std::tie(result, nextImageIndex) =
            handle.acquireNextImage(std::numeric_limits<uint64_t>::max(), signalSemaphore);
        return result;
    } catch (const vk::OutOfDateKHRError &) {
        return vk::Result::eErrorOutOfDateKHR;
    }
}

auto Swapchain::renderFinishedSemaphore() const -> vk::Semaphore
{
    return *renderFinishedSemaphores[nextImageIndex];
}

auto Swapchain::nextImage() const -> vk::Image
{
    return images[nextImageIndex];
}

auto Swapchain::nextImageView() const -> const vk::raii::ImageView &
{
    return imageViews[nextImageIndex];
}

auto Swapchain::extent() const -> vk::Extent2D
{
    return swapchainExtent;
}
