#pragma once

#include <tuple>

#include <vulkan/vulkan_raii.hpp>

auto makePipelineStageAccessTuple(vk::ImageLayout state) -> std::tuple<
    vk::PipelineStageFlags2,
    vk::AccessFlags2>;

void cmdTransitionImageLayout(
    const vk::raii::CommandBuffer &cmd,
    vk::Image                      image,
    vk::ImageLayout                oldLayout,
    vk::ImageLayout                newLayout,
    vk::ImageAspectFlags           aspectMask = vk::ImageAspectFlagBits::eColor);
