#pragma once

#include <vulkan/vulkan_raii.hpp>

#include "Command.hpp"
#include "Device.hpp"
#include "RawFrame.hpp"

// Frames backed by a Vulkan device. The encoder is a primary command buffer that
// is already recording when the frame is handed to the view.
struct VulkanBackend {
    using Device      = ::Device;
    using Queue       = vk::raii::Queue;
    using TextureView = vk::raii::ImageView;
    using Format      = vk::Format;
    using Encoder     = Command;

    static auto createEncoder(const Device &device) -> Command;
};

using RawFrame            = BasicRawFrame<VulkanBackend>;
using VulkanFinishedFrame = FinishedFrame<VulkanBackend>;
