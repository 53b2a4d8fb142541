#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <vulkan/vulkan.hpp>

struct WindowConfig {
    std::string title  = "swapframe";
    int         width  = 800;
    int         height = 600;
};

struct SurfaceConfig {
    // Tried in order, FIFO is the fallback.
    std::vector<vk::PresentModeKHR> presentModes{
        vk::PresentModeKHR::eMailbox,
        vk::PresentModeKHR::eImmediate};

    uint32_t minImageCount = 3u;
};

struct GpuConfig {
    bool enableValidation = true;

    std::vector<const char *> deviceExtensions{VK_KHR_SWAPCHAIN_EXTENSION_NAME};
};

struct DemoConfig {
    GpuConfig     gpu;
    WindowConfig  window;
    SurfaceConfig surface;

    uint32_t windowCount = 2u;

    std::array<float, 4> clearColor{0.2f, 0.5f, 1.0f, 1.0f};
};
