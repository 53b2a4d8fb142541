#pragma once

#include <vulkan/vulkan_raii.hpp>

#include "Device.hpp"
#include "Instance.hpp"
#include "PhysicalDevice.hpp"
#include "RuntimeConfig.hpp"

// Process-wide Vulkan objects shared by every window.
struct GpuContext {
    explicit GpuContext(const GpuConfig &config);

    // Waits until the queue has drained, e.g. before tearing windows down.
    auto waitIdle() const -> void;

    Instance       instance;
    PhysicalDevice physicalDevice;
    Device         device;
};
