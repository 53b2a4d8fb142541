#pragma once

#include <vulkan/vulkan_raii.hpp>

#include "RuntimeConfig.hpp"

struct Instance {

    explicit Instance(const GpuConfig &config);

    static auto createInstance(
        const vk::raii::Context &context,
        bool                    &enableValidation) -> vk::raii::Instance;

    static auto createDebugUtilsMessenger(const vk::raii::Instance &instance)
        -> vk::raii::DebugUtilsMessengerEXT;

    vk::raii::Context                context;
    bool                             validation;
    vk::raii::Instance               handle;
    vk::raii::DebugUtilsMessengerEXT debugUtils;
};
