#pragma once

#include <vulkan/vulkan_raii.hpp>

#include <SDL3/SDL_video.h>

#include "Instance.hpp"

struct Surface {

    Surface(
        const Instance &instance,
        SDL_Window     *window);

    static auto createSurface(
        const Instance &instance,
        SDL_Window     *window) -> vk::raii::SurfaceKHR;

    vk::raii::SurfaceKHR handle;
};
