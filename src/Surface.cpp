#include "Surface.hpp"

#include <SDL3/SDL_vulkan.h>
#include <fmt/format.h>

#include <stdexcept>

auto Surface::createSurface(
    const Instance &instance,
    SDL_Window     *window) -> vk::raii::SurfaceKHR
{
    VkSurfaceKHR surface = VK_NULL_HANDLE;
    if (!SDL_Vulkan_CreateSurface(window, *instance.handle, nullptr, &surface)) {
        throw std::runtime_error{
            fmt::format("SDL_Vulkan_CreateSurface failed: {}", SDL_GetError())};
    }
    return {instance.handle, surface};
}

Surface::Surface(
    const Instance &instance,
    SDL_Window     *window)
    : handle{createSurface(
          instance,
          window)}
{
}
