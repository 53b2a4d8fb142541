#pragma once

#include <vector>

#include <vulkan/vulkan_raii.hpp>

#include "Device.hpp"
#include "RuntimeConfig.hpp"
#include "Surface.hpp"

struct Swapchain {
    Swapchain(
        const Device         &device,
        const PhysicalDevice &physicalDevice,
        const Surface        &surface,
        const SurfaceConfig  &config,
        vk::Extent2D          desiredExtent);

    auto create(
        const Device         &device,
        const PhysicalDevice &physicalDevice,
        const Surface        &surface,
        vk::Extent2D          desiredExtent,
        vk::SwapchainKHR      oldSwapchain = {}) -> void;

    auto recreate(
        const Device         &device,
        const PhysicalDevice &physicalDevice,
        const Surface        &surface,
        vk::Extent2D          desiredExtent) -> void;

    [[nodiscard]]
    static auto chooseSurfaceFormat(
        const std::vector<vk::SurfaceFormatKHR> &availableFormats)
        -> vk::SurfaceFormatKHR;

    [[nodiscard]]
    static auto choosePresentMode(
        const std::vector<vk::PresentModeKHR> &preferredPresentModes,
        const std::vector<vk::PresentModeKHR> &availablePresentModes)
        -> vk::PresentModeKHR;

    [[nodiscard]]
    static auto chooseExtent(
        const vk::SurfaceCapabilitiesKHR &caps,
        const vk::Extent2D               &desired) -> vk::Extent2D;

    // Returns eErrorOutOfDateKHR instead of throwing.
    [[nodiscard]]
    auto acquireNextImage(vk::Semaphore signalSemaphore) -> vk::Result;

    [[nodiscard]]
    auto renderFinishedSemaphore() const -> vk::Semaphore;

    [[nodiscard]]
    auto nextImage() const -> vk::Image;

    [[nodiscard]]
    auto nextImageView() const -> const vk::raii::ImageView &;

    [[nodiscard]]
    auto extent() const -> vk::Extent2D;

    SurfaceConfig                    config;
    vk::raii::SwapchainKHR           handle = nullptr;
    vk::Extent2D                     swapchainExtent;
    uint32_t                         nextImageIndex = 0u;
    std::vector<vk::Image>           images;
    std::vector<vk::raii::ImageView> imageViews;
    vk::Format                       imageFormat = vk::Format::eUndefined;
    bool                             needRecreate = false;

    // Signalled by the frame submission, waited on by presentation
    std::vector<vk::raii::Semaphore> renderFinishedSemaphores;
};
