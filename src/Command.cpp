#include "Command.hpp"

Command::Command(
    const Device              &device,
    vk::CommandPoolCreateFlags poolFlags)
    : pool{
          device.handle,
          vk::CommandPoolCreateInfo{
              poolFlags,
              device.queueFamilyIndices.graphicsIndex}},
      buffer{std::move(
          vk::raii::CommandBuffers{
              device.handle,
              vk::CommandBufferAllocateInfo{
                  pool,
                  vk::CommandBufferLevel::ePrimary,
                  1}}
              .front())}
{
}

auto Command::begin() -> void
{
    buffer.begin({vk::CommandBufferUsageFlagBits::eOneTimeSubmit});
}

auto Command::end() -> void
{
    buffer.end();
}
