#pragma once

#include <vulkan/vulkan_raii.hpp>

#include "Device.hpp"

// A transient command pool with one primary command buffer, recording as soon
// as it is created. One Command backs the encoder of one frame.
struct Command {
    explicit Command(
        const Device              &device,
        vk::CommandPoolCreateFlags poolFlags = vk::CommandPoolCreateFlagBits::eTransient);

    Command(Command &&)                     = default;
    auto operator=(Command &&) -> Command & = default;

    auto begin() -> void;
    auto end() -> void;

    vk::raii::CommandPool   pool;
    vk::raii::CommandBuffer buffer;
};
