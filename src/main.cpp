#include "FrameDriver.hpp"
#include "GpuContext.hpp"
#include "VulkanBackend.hpp"
#include "Window.hpp"
#include "WindowSurface.hpp"

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_init.h>

#include <fmt/base.h>
#include <fmt/format.h>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <array>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <memory>
#include <ranges>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace {
auto parseConfig(
    int   argc,
    char *argv[]) -> DemoConfig
{
    auto config = DemoConfig{};

    if (argc > 1) {
        const auto arg = std::string_view{argv[1]};
        uint32_t   count{};
        const auto [end, error] =
            std::from_chars(arg.data(), arg.data() + arg.size(), count);
        if (error != std::errc{} || end != arg.data() + arg.size() || count == 0) {
            throw std::invalid_argument{
                fmt::format("Expected a positive window count, got \"{}\"", arg)};
        }
        config.windowCount = count;
    }

    return config;
}

// Slowly pulsing colour, offset per window so windows are distinguishable.
auto frameColor(
    const RawFrame             &frame,
    const std::array<float, 4> &base) -> glm::vec4
{
    constexpr auto period = 240u;

    const auto phase = static_cast<float>((frame.nth() + frame.windowId() * 60u) % period)
                     / static_cast<float>(period);
    const auto pulse = 0.5f + 0.5f * glm::sin(phase * glm::two_pi<float>());

    return glm::mix(
        glm::vec4{0.0f, 0.0f, 0.0f, 1.0f},
        glm::vec4{base[0], base[1], base[2], base[3]},
        pulse);
}

auto toClearColor(glm::vec4 color) -> vk::ClearColorValue
{
    return vk::ClearColorValue{std::array{color.r, color.g, color.b, color.a}};
}

// Clears the whole surface, then an inset covering the middle half of the window.
// The two passes take the encoder separately.
auto drawView(
    const RawFrame             &frame,
    vk::Extent2D                extent,
    const std::array<float, 4> &clearColor) -> void
{
    const auto color = frameColor(frame, clearColor);

    auto attachment = vk::RenderingAttachmentInfo{
        *frame.swapchainTexture(),
        vk::ImageLayout::eColorAttachmentOptimal,
        {},
        {},
        {},
        vk::AttachmentLoadOp::eClear,
        vk::AttachmentStoreOp::eStore,
        toClearColor(color)};

    const auto renderArea = vk::Rect2D{{}, extent};

    {
        auto encoder = frame.commandEncoder();
        encoder->buffer.beginRendering(
            vk::RenderingInfo{{}, renderArea, 1, {}, attachment});
        encoder->buffer.endRendering();
    }

    const auto rect = frame.rect();
    if (rect.w() <= 0.0f || rect.h() <= 0.0f) {
        return;
    }

    // Logical window units to framebuffer pixels
    const auto scale = glm::vec2{
        static_cast<float>(extent.width) / rect.w(),
        static_cast<float>(extent.height) / rect.h()};

    const auto insetPosition = (rect.position + rect.size * 0.25f) * scale;
    const auto insetSize     = rect.size * 0.5f * scale;

    const auto inset = vk::ClearRect{
        vk::Rect2D{
            {static_cast<int32_t>(insetPosition.x), static_cast<int32_t>(insetPosition.y)},
            {static_cast<uint32_t>(insetSize.x), static_cast<uint32_t>(insetSize.y)}},
        0,
        1};

    attachment.loadOp = vk::AttachmentLoadOp::eLoad;

    auto encoder = frame.commandEncoder();
    encoder->buffer.beginRendering(vk::RenderingInfo{{}, renderArea, 1, {}, attachment});
    encoder->buffer.clearAttachments(
        vk::ClearAttachment{
            vk::ImageAspectFlagBits::eColor,
            0,
            toClearColor(glm::vec4{glm::vec3{1.0f} - glm::vec3{color}, 1.0f})},
        inset);
    encoder->buffer.endRendering();
}

auto run(const DemoConfig &config) -> void
{
    initVideo();

    auto context = GpuContext{config.gpu};

    auto surfaces = std::vector<std::unique_ptr<WindowSurface>>{};
    for (auto index : std::views::iota(0u, config.windowCount)) {
        auto windowConfig  = config.window;
        windowConfig.title = fmt::format("{} #{}", config.window.title, index);

        surfaces.push_back(std::make_unique<WindowSurface>(
            context.instance,
            context.physicalDevice,
            context.device,
            createWindow(windowConfig),
            config.surface));
    }

    auto driver = FrameDriver<VulkanBackend>{};

    auto     running        = true;
    auto     previousTime   = std::chrono::steady_clock::now();
    auto     cumulativeTime = previousTime - previousTime;
    uint64_t frameCount     = 0;

    SDL_Event e;
    while (running) {
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_EVENT_QUIT) {
                running = false;
            }

            else if (e.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED) {
                const auto closed = e.window.windowID;
                context.waitIdle();
                std::erase_if(surfaces, [closed](const auto &surface) {
                    return surface->id() == closed;
                });
                driver.closeWindow(closed);
                running = running && !surfaces.empty();
            }

            else if (e.type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED) {
                for (auto &surface : surfaces) {
                    if (surface->id() == e.window.windowID) {
                        surface->requestRecreate();
                    }
                }
            }
        }

        for (auto &surface : surfaces) {
            const auto image = surface->acquire();
            if (!image) {
                continue;
            }

            const auto extent = surface->extent();

            auto finished = driver.drawFrame(
                context.device,
                context.device.graphicsQueue,
                surface->id(),
                image->view,
                surface->format(),
                surface->rect(),
                [&](const RawFrame &frame) { drawView(frame, extent, config.clearColor); });

            surface->submitAndPresent(std::move(finished), *image);
            ++frameCount;
        }

        auto currentTime = std::chrono::steady_clock::now();
        cumulativeTime += currentTime - previousTime;
        previousTime = currentTime;

        using namespace std::chrono_literals;

        if (cumulativeTime > 3s) {
            const auto seconds = std::chrono::duration<double>(cumulativeTime).count();
            fmt::println(
                stderr,
                "{:.1f} frames/s across {} windows",
                static_cast<double>(frameCount) / seconds,
                surfaces.size());

            cumulativeTime = {};
            frameCount     = 0;
        }
    }

    context.waitIdle();
}
} // namespace

auto main(
    int   argc,
    char *argv[]) -> int
{
    try {
        run(parseConfig(argc, argv));
    } catch (const std::exception &e) {
        fmt::println(stderr, "Fatal: {}", e.what());
        SDL_Quit();
        return EXIT_FAILURE;
    }

    SDL_Quit();
    return EXIT_SUCCESS;
}
