#pragma once

#include <limits>
#include <vector>

#include <vulkan/vulkan_raii.hpp>

#include "Instance.hpp"
#include "PhysicalDevice.hpp"

struct QueueFamilyIndices {
    uint32_t graphicsIndex = std::numeric_limits<uint32_t>::max();

    auto complete() const -> bool
    {
        return graphicsIndex != std::numeric_limits<uint32_t>::max();
    }
};

// Logical device with a single queue that can both render and present.
// Every window surface of the process presents through graphicsQueue.
struct Device {
    Device(
        const Instance                  &instance,
        const PhysicalDevice            &physicalDevice,
        const std::vector<const char *> &requiredExtensions);

    static auto createDevice(
        const PhysicalDevice            &physicalDevice,
        const QueueFamilyIndices        &queueFamilyIndices,
        const std::vector<const char *> &requiredExtensions) -> vk::raii::Device;

    static auto findQueueFamilies(
        const Instance       &instance,
        const PhysicalDevice &physicalDevice) -> QueueFamilyIndices;

    QueueFamilyIndices queueFamilyIndices;
    vk::raii::Device   handle;
    vk::raii::Queue    graphicsQueue;
};
