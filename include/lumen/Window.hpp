#pragma once

#include <lumen/Common.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lumen {

/**
 * @brief A key event queued by GLFW between two polls
 */
struct KeyEvent {
    double timestamp;
    int key;
    int scancode;
    int action;
    int mods;
};

/**
 * @brief GLFW window providing a Vulkan display surface
 *
 * Owns the GLFW window and, once created, the surface presented to.
 * The surface is destroyed before the window. Whatever presents to the
 * surface must be destroyed before this window.
 *
 * Responsibilities:
 * - GLFW window lifecycle
 * - Vulkan surface creation
 * - Framebuffer size queries
 * - Event polling with key event dispatch
 */
class Window {
public:
    using EventCallback = std::function<void(const KeyEvent&, Window&)>;

    /**
     * @brief Create a window without a client API
     *
     * @param width Initial window width
     * @param height Initial window height
     * @param title Window title
     * @param resizable Whether the user may resize the window
     * @return Window instance or error message
     */
    static std::expected<std::unique_ptr<Window>, std::string> create(
        int width,
        int height,
        std::string_view title,
        bool resizable = false
    );

    /**
     * @brief Initialize GLFW once per process
     *
     * Must run before any Vulkan instance is created, since instance
     * extensions are queried from GLFW.
     */
    static void ensure_glfw_initialized();

    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;
    Window(Window&&) = delete;
    Window& operator=(Window&&) = delete;

    /**
     * @brief Create the display surface for this window
     *
     * The window keeps the instance to destroy the surface with.
     */
    std::expected<void, std::string> create_surface(vk::Instance instance);

    [[nodiscard]] vk::SurfaceKHR surface() const { return m_surface; }
    [[nodiscard]] bool has_surface() const { return static_cast<bool>(m_surface); }

    [[nodiscard]] bool should_close() const;
    void set_should_close(bool value);

    /**
     * @brief Current framebuffer size in pixels
     */
    [[nodiscard]] vk::Extent2D framebuffer_size() const;

    [[nodiscard]] GLFWwindow* get_window_handle() const { return m_window_handle; }

    /**
     * @brief Poll GLFW and dispatch queued key events
     *
     * Events are collected first so the callback may freely act on the window.
     */
    void poll_events(const EventCallback& callback);

private:
    explicit Window(GLFWwindow* handle);

    static void key_callback(GLFWwindow* handle, int key, int scancode, int action, int mods);

    GLFWwindow* m_window_handle;
    vk::Instance m_instance;
    vk::SurfaceKHR m_surface;
    std::vector<KeyEvent> m_pending_events;
};

} // namespace lumen
