#include "VulkanBackend.hpp"

auto VulkanBackend::createEncoder(const Device &device) -> Command
{
    auto command = Command{device};
    command.begin();
    return command;
}
