#include "Utility.hpp"

#include <fmt/format.h>

#include <stdexcept>

#include <vulkan/vulkan_to_string.hpp>

auto makePipelineStageAccessTuple(vk::ImageLayout state) -> std::tuple<
    vk::PipelineStageFlags2,
    vk::AccessFlags2>
{
    switch (state) {
    case vk::ImageLayout::eUndefined:
        return std::make_tuple(
            vk::PipelineStageFlagBits2::eTopOfPipe,
            vk::AccessFlagBits2::eNone);
    case vk::ImageLayout::eColorAttachmentOptimal:
        return std::make_tuple(
            vk::PipelineStageFlagBits2::eColorAttachmentOutput,
            vk::AccessFlagBits2::eColorAttachmentRead
                | vk::AccessFlagBits2::eColorAttachmentWrite);
    case vk::ImageLayout::ePresentSrcKHR:
        return std::make_tuple(
            vk::PipelineStageFlagBits2::eBottomOfPipe,
            vk::AccessFlagBits2::eNone);
    default:
        throw std::invalid_argument{
            fmt::format("Unsupported layout transition: {}", vk::to_string(state))};
    }
}

void cmdTransitionImageLayout(
    const vk::raii::CommandBuffer &cmd,
    vk::Image                      image,
    vk::ImageLayout                oldLayout,
    vk::ImageLayout                newLayout,
    vk::ImageAspectFlags           aspectMask)
{
    const auto [srcStage, srcAccess] = makePipelineStageAccessTuple(oldLayout);
    const auto [dstStage, dstAccess] = makePipelineStageAccessTuple(newLayout);

    auto barrier = vk::ImageMemoryBarrier2{
        srcStage,
        srcAccess,
        dstStage,
        dstAccess,
        oldLayout,
        newLayout,
        vk::QueueFamilyIgnored,
        vk::QueueFamilyIgnored,
        image,
        {aspectMask, 0, 1, 0, 1}};

    cmd.pipelineBarrier2(vk::DependencyInfo{}.setImageMemoryBarriers(barrier));
}
