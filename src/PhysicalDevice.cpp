#include "PhysicalDevice.hpp"

#include <fmt/base.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <iterator>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

PhysicalDevice::PhysicalDevice(
    const Instance                  &instance,
    const std::vector<const char *> &requiredExtensions)
    : handle{choosePhysicalDevice(
          instance,
          requiredExtensions)}
{
}

auto PhysicalDevice::getMissingExtensions(
    const vk::raii::PhysicalDevice  &physicalDevice,
    const std::vector<const char *> &requiredExtensions) -> std::vector<std::string>
{
    auto deviceExtensions =
        physicalDevice.enumerateDeviceExtensionProperties()
        | std::views::transform(
            [](const vk::ExtensionProperties &properties) -> std::string {
                return properties.extensionName;
            })
        | std::ranges::to<std::vector>();

    return requiredExtensions
         | std::views::filter([&](std::string_view s) {
               return !std::ranges::contains(deviceExtensions, s);
           })
         | std::ranges::to<std::vector<std::string>>();
}

// Prefers a discrete GPU, falls back to the first integrated one.
auto PhysicalDevice::choosePhysicalDevice(
    const Instance                  &instance,
    const std::vector<const char *> &requiredExtensions) -> vk::raii::PhysicalDevice
{
    auto physicalDevices = vk::raii::PhysicalDevices{instance.handle};

    if (physicalDevices.empty()) {
        throw std::runtime_error{"No Vulkan-capable devices found."};
    }

    auto diagnostic = fmt::memory_buffer{};
    auto out        = std::back_inserter(diagnostic);

    auto candidates = std::vector<vk::raii::PhysicalDevice *>{};

    for (auto &physicalDevice : physicalDevices) {
        const auto properties = physicalDevice.getProperties();
        const auto name       = std::string_view{properties.deviceName};

        if (properties.apiVersion < vk::ApiVersion13) {
            fmt::format_to(out, "Device \"{}\" does not have Vulkan 1.3 or newer\n", name);
            continue;
        }

        if (auto missing = getMissingExtensions(physicalDevice, requiredExtensions);
            !missing.empty()) {
            fmt::format_to(
                out,
                "Device \"{}\" missing required extensions: {}\n",
                name,
                fmt::join(missing, ", "));
            continue;
        }

        if (properties.deviceType == vk::PhysicalDeviceType::eDiscreteGpu
            || properties.deviceType == vk::PhysicalDeviceType::eIntegratedGpu) {
            candidates.push_back(&physicalDevice);
        }
    }

    if (candidates.empty()) {
        fmt::format_to(out, "No devices satisfied renderer requirements.");
        throw std::runtime_error{fmt::to_string(diagnostic)};
    }

    const auto discrete = std::ranges::find_if(candidates, [](auto *candidate) {
        return candidate->getProperties().deviceType
            == vk::PhysicalDeviceType::eDiscreteGpu;
    });

    auto *chosen = discrete != candidates.end() ? *discrete : candidates.front();

    fmt::println(
        stderr,
        "Using GPU \"{}\"",
        std::string_view{chosen->getProperties().deviceName});

    return std::move(*chosen);
}
