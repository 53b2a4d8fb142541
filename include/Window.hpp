#pragma once

#include <vulkan/vulkan.hpp>

#include <SDL3/SDL_video.h>

#include <memory>

#include "Geometry.hpp"
#include "RawFrame.hpp"
#include "RuntimeConfig.hpp"

struct WindowDeleter {
    void operator()(SDL_Window *window) const;
};

using Window = std::unique_ptr<SDL_Window, WindowDeleter>;

// Initializes SDL video and the Vulkan loader once per process.
auto initVideo() -> void;

auto createWindow(const WindowConfig &config) -> Window;

auto getWindowId(SDL_Window *window) -> WindowId;

// Logical window area, origin at the top-left corner.
auto getWindowRect(SDL_Window *window) -> Rect;

auto getFramebufferExtent(SDL_Window *window) -> vk::Extent2D;
