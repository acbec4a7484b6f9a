#include <lumen/Application.hpp>
#include <lumen/Logger.hpp>
#include <chrono>
#include <stdexcept>

namespace lumen {

std::expected<std::unique_ptr<Application>, std::string> Application::create(const ApplicationConfig& config) {
    std::unique_ptr<Application> app(new Application());

    try {
        app->m_context = std::make_unique<VulkanContext>(config.window_title);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Vulkan context creation failed: ") + e.what());
    }

    auto window = Window::create(
        static_cast<int>(config.window_width),
        static_cast<int>(config.window_height),
        config.window_title,
        config.resizable
    );
    if (!window) {
        return std::unexpected(window.error());
    }

    auto target = SwapchainRenderTarget::create(*app->m_context, std::move(*window));
    if (!target) {
        return std::unexpected(target.error());
    }
    app->m_target = std::move(*target);

    auto renderer = PrimaryRenderer::create(*app->m_context);
    if (!renderer) {
        return std::unexpected(renderer.error());
    }
    app->m_renderer = std::move(*renderer);

    return app;
}

std::expected<void, std::string> Application::run(
    const UpdateCallback& update,
    const PrimaryRenderer::DrawCallback& draw
) {
    auto& window = m_target->window();
    const auto start = std::chrono::steady_clock::now();
    uint64_t rendered = 0;
    uint64_t skipped = 0;

    while (!window.should_close()) {
        window.poll_events([](const KeyEvent& event, Window& source) {
            if (event.key == GLFW_KEY_ESCAPE && event.action == GLFW_PRESS) {
                source.set_should_close(true);
            }
        });

        if (update) {
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
            update(*m_renderer, elapsed.count());
        }

        auto status = m_renderer->render_to_target(*m_target, [&](RenderingRecorder& recorder, const FrameRenderInfo& info) {
            if (draw) {
                draw(recorder, info);
            }
        });

        switch (status) {
            case FrameStatus::eRendered:
                ++rendered;
                break;
            case FrameStatus::eSkipped:
                ++skipped;
                break;
            case FrameStatus::eRecordingFailed:
            case FrameStatus::eSubmitFailed:
                break;
        }
    }

    Logger::instance().debug("Main loop finished: {} frames rendered, {} skipped", rendered, skipped);

    auto result = m_context->wait_idle();
    LUMEN_CHECK_VK_RESULT_VOID(result, "Could not wait for device idle {}");
    return {};
}

} // namespace lumen
