#include "Device.hpp"

#include <SDL3/SDL_vulkan.h>

#include <stdexcept>
#include <vector>

Device::Device(
    const Instance                  &instance,
    const PhysicalDevice            &physicalDevice,
    const std::vector<const char *> &requiredExtensions)
    : queueFamilyIndices{findQueueFamilies(
          instance,
          physicalDevice)},
      handle{createDevice(
          physicalDevice,
          queueFamilyIndices,
          requiredExtensions)},
      graphicsQueue(
          handle,
          queueFamilyIndices.graphicsIndex,
          0)
{
}

auto Device::createDevice(
    const PhysicalDevice            &physicalDevice,
    const QueueFamilyIndices        &queueFamilyIndices,
    const std::vector<const char *> &requiredExtensions) -> vk::raii::Device
{
    auto features = vk::StructureChain<
        vk::PhysicalDeviceFeatures2,
        vk::PhysicalDeviceVulkan13Features>{};

    features.get<vk::PhysicalDeviceVulkan13Features>()
        .setSynchronization2(vk::True)
        .setDynamicRendering(vk::True);

    const float queuePriority = 1.0f;

    auto queueCreateInfo = vk::DeviceQueueCreateInfo{
        {},
        queueFamilyIndices.graphicsIndex,
        1,
        &queuePriority};

    auto deviceCreateInfo = vk::DeviceCreateInfo{
        {},
        queueCreateInfo,
        {},
        requiredExtensions,
        {},
        &features.get<vk::PhysicalDeviceFeatures2>()};

    return {physicalDevice.handle, deviceCreateInfo};
}

auto Device::findQueueFamilies(
    const Instance       &instance,
    const PhysicalDevice &physicalDevice) -> QueueFamilyIndices
{
    auto queueFamilyIndices = QueueFamilyIndices{};

    const auto queueFamilyProperties = physicalDevice.handle.getQueueFamilyProperties();

    for (uint32_t index = 0; index < queueFamilyProperties.size(); ++index) {
        const auto &properties = queueFamilyProperties[index];

        const auto presents = SDL_Vulkan_GetPresentationSupport(
            *instance.handle,
            *physicalDevice.handle,
            index);

        if ((properties.queueFlags & vk::QueueFlagBits::eGraphics) && presents) {
            queueFamilyIndices.graphicsIndex = index;
            break;
        }
    }

    if (!queueFamilyIndices.complete()) {
        throw std::runtime_error(
            "Device does not have a unified graphics + present queue. Support for "
            "separate queues not implemented yet.");
    }

    return queueFamilyIndices;
}
