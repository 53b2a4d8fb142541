#include "Instance.hpp"

#include <SDL3/SDL_vulkan.h>

#include <vulkan/vulkan_to_string.hpp>

#include <fmt/base.h>
#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {
constexpr auto validationLayerName = "VK_LAYER_KHRONOS_validation";

VKAPI_ATTR VkBool32 VKAPI_CALL debugMessageFunc(
    vk::DebugUtilsMessageSeverityFlagBitsEXT      messageSeverity,
    vk::DebugUtilsMessageTypeFlagsEXT             messageTypes,
    vk::DebugUtilsMessengerCallbackDataEXT const *pCallbackData,
    void * /*pUserData*/)
{
    auto message = fmt::memory_buffer{};
    auto out     = std::back_inserter(message);

    fmt::format_to(
        out,
        "{}: {}:\n\tmessageIDName   = <{}>\n\tmessageIdNumber = {}\n\tmessage         = <{}>\n",
        vk::to_string(messageSeverity),
        vk::to_string(messageTypes),
        pCallbackData->pMessageIdName ? pCallbackData->pMessageIdName : "",
        pCallbackData->messageIdNumber,
        pCallbackData->pMessage ? pCallbackData->pMessage : "");

    for (uint32_t i = 0; i < pCallbackData->cmdBufLabelCount; i++) {
        fmt::format_to(
            out,
            "\tCommandBuffer label = <{}>\n",
            pCallbackData->pCmdBufLabels[i].pLabelName);
    }
    for (uint32_t i = 0; i < pCallbackData->objectCount; i++) {
        const auto &object = pCallbackData->pObjects[i];
        fmt::format_to(
            out,
            "\tObject {}: {} {:#x} <{}>\n",
            i,
            vk::to_string(object.objectType),
            object.objectHandle,
            object.pObjectName ? object.pObjectName : "");
    }

    fmt::print(stderr, "{}", fmt::to_string(message));

    return false;
}
} // namespace

Instance::Instance(const GpuConfig &config)
    : context{},
      validation{config.enableValidation},
      handle{createInstance(
          context,
          validation)},
      debugUtils{
          validation ? createDebugUtilsMessenger(handle)
                     : vk::raii::DebugUtilsMessengerEXT{nullptr}}
{
}

auto Instance::createDebugUtilsMessenger(const vk::raii::Instance &instance)
    -> vk::raii::DebugUtilsMessengerEXT
{
    vk::DebugUtilsMessageSeverityFlagsEXT severityFlags(
        vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning
        | vk::DebugUtilsMessageSeverityFlagBitsEXT::eError);

    vk::DebugUtilsMessageTypeFlagsEXT messageTypeFlags(
        vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral
        | vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance
        | vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation);

    return {
        instance,
        vk::DebugUtilsMessengerCreateInfoEXT{
            {},
            severityFlags,
            messageTypeFlags,
            &debugMessageFunc}};
}

// Drops validation when the layer is not installed.
auto Instance::createInstance(
    const vk::raii::Context &context,
    bool                    &enableValidation) -> vk::raii::Instance
{
    auto instanceLayers = std::vector<const char *>{};

    if (enableValidation) {
        auto availableLayers =
            context.enumerateInstanceLayerProperties()
            | std::views::transform(
                [](const vk::LayerProperties &properties) -> std::string {
                    return properties.layerName;
                })
            | std::ranges::to<std::vector>();

        if (std::ranges::contains(availableLayers, std::string{validationLayerName})) {
            instanceLayers.push_back(validationLayerName);
        } else {
            fmt::println(
                stderr,
                "Warning: validation layer not found, continuing without it.");
            enableValidation = false;
        }
    }

    auto instanceExtensions = std::vector<const char *>{VK_KHR_SURFACE_EXTENSION_NAME};
    if (enableValidation) {
        instanceExtensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    Uint32 sdlExtensionCount     = 0;
    auto   sdlInstanceExtensions = SDL_Vulkan_GetInstanceExtensions(&sdlExtensionCount);
    if (!sdlInstanceExtensions) {
        throw std::runtime_error{fmt::format(
            "SDL_Vulkan_GetInstanceExtensions failed: {}",
            SDL_GetError())};
    }

    // SDL also reports VK_KHR_surface
    for (auto extension : std::span{sdlInstanceExtensions, sdlExtensionCount}) {
        const auto requested = std::ranges::any_of(
            instanceExtensions,
            [extension](std::string_view name) { return name == extension; });
        if (!requested) {
            instanceExtensions.push_back(extension);
        }
    }

    auto availableExtensions =
        context.enumerateInstanceExtensionProperties()
        | std::views::transform(
            [](const vk::ExtensionProperties &properties) -> std::string {
                return properties.extensionName;
            })
        | std::ranges::to<std::vector>();

    for (auto extension : instanceExtensions) {
        if (!std::ranges::contains(availableExtensions, std::string{extension})) {
            throw std::runtime_error{fmt::format(
                "Required Vulkan instance extension missing: {}",
                extension)};
        }
    }

    const auto applicationInfo =
        vk::ApplicationInfo{"swapframe", 1, "swapframe", 1, vk::ApiVersion13};

    return {
        context,
        vk::InstanceCreateInfo{
            {},
            &applicationInfo,
            instanceLayers,
            instanceExtensions}};
}
