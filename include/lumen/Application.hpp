#pragma once

#include "PrimaryRenderer.hpp"
#include "SwapchainRenderTarget.hpp"
#include "VulkanContext.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace lumen {

struct ApplicationConfig {
    uint32_t window_width = 800;
    uint32_t window_height = 600;
    std::string window_title = "Lumen";
    bool resizable = false;
};

/**
 * @brief Window, swapchain target and renderer wired into a main loop
 *
 * Members are declared so the renderer is released first, then the
 * swapchain target with its window, then the device.
 */
class Application {
public:
    /**
     * @brief Called once per loop iteration before the frame is rendered
     *
     * The elapsed time since run() started is passed in seconds.
     */
    using UpdateCallback = std::function<void(PrimaryRenderer&, double)>;

    static std::expected<std::unique_ptr<Application>, std::string> create(const ApplicationConfig& config);

    ~Application() = default;

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * @brief Run until the window is closed (Escape closes it)
     *
     * Waits for the device to go idle once the loop ends.
     */
    std::expected<void, std::string> run(
        const UpdateCallback& update,
        const PrimaryRenderer::DrawCallback& draw = {}
    );

    [[nodiscard]] VulkanContext& context() const { return *m_context; }
    [[nodiscard]] SwapchainRenderTarget& target() const { return *m_target; }
    [[nodiscard]] PrimaryRenderer& renderer() const { return *m_renderer; }

private:
    Application() = default;

    std::unique_ptr<VulkanContext> m_context;
    std::unique_ptr<SwapchainRenderTarget> m_target;
    std::unique_ptr<PrimaryRenderer> m_renderer;
};

} // namespace lumen
