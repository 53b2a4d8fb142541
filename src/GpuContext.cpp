#include "GpuContext.hpp"

GpuContext::GpuContext(const GpuConfig &config)
    : instance{config},
      physicalDevice{
          instance,
          config.deviceExtensions},
      device{
          instance,
          physicalDevice,
          config.deviceExtensions}
{
}

auto GpuContext::waitIdle() const -> void
{
    device.graphicsQueue.waitIdle();
}
