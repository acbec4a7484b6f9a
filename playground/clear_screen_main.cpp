// Clear Screen - smallest possible Lumen program
// Cycles the clear color through the hue wheel; the draw callback records nothing.

#define GLM_ENABLE_EXPERIMENTAL
#include <lumen/Application.hpp>
#include <lumen/Logger.hpp>
#include <glm/glm.hpp>
#include <glm/gtx/color_space.hpp>
#include <cmath>

int main() {
    lumen::Logger::instance().info("Starting Lumen clear screen...");

    try {
        lumen::ApplicationConfig config{
            .window_width = 800,
            .window_height = 600,
            .window_title = "Lumen - Clear Screen"
        };

        auto app_result = lumen::Application::create(config);
        if (!app_result) {
            lumen::Logger::instance().error("Failed to create application: {}", app_result.error());
            return 1;
        }
        auto& app = *app_result;

        // One full turn of the hue wheel every 6 seconds
        auto update = [](lumen::PrimaryRenderer& renderer, double seconds) {
            float hue = static_cast<float>(std::fmod(seconds * 60.0, 360.0));
            glm::vec3 rgb = glm::rgbColor(glm::vec3(hue, 0.8f, 0.9f));
            renderer.set_clear_value(0, vk::ClearValue(vk::ClearColorValue(rgb.r, rgb.g, rgb.b, 1.0f)));
        };

        if (auto result = app->run(update); !result) {
            lumen::Logger::instance().error("Runtime error: {}", result.error());
            return 1;
        }

        lumen::Logger::instance().info("Application exited successfully");
        return 0;

    } catch (const std::exception& e) {
        lumen::Logger::instance().error("Unhandled exception: {}", e.what());
        return 1;
    }
}
