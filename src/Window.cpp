#include "Window.hpp"

#include <SDL3/SDL_init.h>
#include <SDL3/SDL_vulkan.h>
#include <fmt/base.h>
#include <fmt/format.h>

#include <stdexcept>

void WindowDeleter::operator()(SDL_Window *window) const
{
    SDL_DestroyWindow(window);
}

auto initVideo() -> void
{
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        throw std::runtime_error{fmt::format("SDL_Init Error: {}", SDL_GetError())};
    }

    // Dynamically load Vulkan loader library
    if (!SDL_Vulkan_LoadLibrary(nullptr)) {
        throw std::runtime_error{
            fmt::format("SDL_Vulkan_LoadLibrary Error: {}", SDL_GetError())};
    }
}

auto createWindow(const WindowConfig &config) -> Window
{
    auto window = SDL_CreateWindow(
        config.title.c_str(),
        config.width,
        config.height,
        SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        throw std::runtime_error{
            fmt::format("SDL_CreateWindow Error: {}", SDL_GetError())};
    }

    return Window{window};
}

auto getWindowId(SDL_Window *window) -> WindowId
{
    const auto id = SDL_GetWindowID(window);
    if (id == 0) {
        throw std::runtime_error{
            fmt::format("SDL_GetWindowID Error: {}", SDL_GetError())};
    }
    return id;
}

auto getWindowRect(SDL_Window *window) -> Rect
{
    int width  = 0;
    int height = 0;
    SDL_GetWindowSize(window, &width, &height);

    return Rect::fromSize(static_cast<float>(width), static_cast<float>(height));
}

auto getFramebufferExtent(SDL_Window *window) -> vk::Extent2D
{
    int width  = 0;
    int height = 0;
    SDL_GetWindowSizeInPixels(window, &width, &height);

    return vk::Extent2D{static_cast<uint32_t>(width), static_cast<uint32_t>(height)};
}
