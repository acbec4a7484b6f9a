#include <lumen/Window.hpp>
#include <lumen/Logger.hpp>
#include <stdexcept>

namespace lumen {

void Window::ensure_glfw_initialized() {
    static bool initialized = false;
    if (!initialized) {
        if (!glfwInit()) {
            throw std::runtime_error("Failed to initialize GLFW");
        }
        initialized = true;
        Logger::instance().debug("Initialized GLFW {}", glfwGetVersionString());
    }
}

std::expected<std::unique_ptr<Window>, std::string> Window::create(
    int width,
    int height,
    std::string_view title,
    bool resizable
) {
    try {
        ensure_glfw_initialized();
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Window creation failed: ") + e.what());
    }

    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, resizable ? GLFW_TRUE : GLFW_FALSE);

    std::string window_title{title};
    GLFWwindow* handle = glfwCreateWindow(width, height, window_title.c_str(), nullptr, nullptr);
    if (!handle) {
        return std::unexpected("Failed to create GLFW window");
    }

    Logger::instance().debug("Created window '{}' ({}x{})", window_title, width, height);
    return std::unique_ptr<Window>(new Window(handle));
}

Window::Window(GLFWwindow* handle)
    : m_window_handle(handle)
    , m_instance(nullptr)
    , m_surface(nullptr)
{
    glfwSetWindowUserPointer(m_window_handle, this);
    glfwSetKeyCallback(m_window_handle, key_callback);
}

Window::~Window() {
    if (m_surface) {
        m_instance.destroySurfaceKHR(m_surface);
        m_surface = nullptr;
        Logger::instance().trace("Destroyed window surface");
    }
    if (m_window_handle) {
        glfwDestroyWindow(m_window_handle);
        Logger::instance().trace("Destroyed window");
    }
}

std::expected<void, std::string> Window::create_surface(vk::Instance instance) {
    if (m_surface) {
        return std::unexpected("Window already has a surface");
    }

    VkSurfaceKHR surface_c;
    VkResult result = glfwCreateWindowSurface(
        static_cast<VkInstance>(instance),
        m_window_handle,
        nullptr,
        &surface_c
    );

    if (result != VK_SUCCESS) {
        return std::unexpected(std::format("Failed to create window surface {}",
            vk::to_string(static_cast<vk::Result>(result))));
    }

    m_instance = instance;
    m_surface = vk::SurfaceKHR(surface_c);
    Logger::instance().debug("Created window surface");
    return {};
}

bool Window::should_close() const {
    return glfwWindowShouldClose(m_window_handle);
}

void Window::set_should_close(bool value) {
    glfwSetWindowShouldClose(m_window_handle, value ? GLFW_TRUE : GLFW_FALSE);
}

vk::Extent2D Window::framebuffer_size() const {
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_window_handle, &width, &height);
    return vk::Extent2D{static_cast<uint32_t>(width), static_cast<uint32_t>(height)};
}

void Window::poll_events(const EventCallback& callback) {
    glfwPollEvents();

    auto events = std::move(m_pending_events);
    m_pending_events.clear();
    for (const auto& event : events) {
        callback(event, *this);
    }
}

void Window::key_callback(GLFWwindow* handle, int key, int scancode, int action, int mods) {
    auto* window = static_cast<Window*>(glfwGetWindowUserPointer(handle));
    if (!window) return;

    window->m_pending_events.push_back(KeyEvent{
        .timestamp = glfwGetTime(),
        .key = key,
        .scancode = scancode,
        .action = action,
        .mods = mods,
    });
}

} // namespace lumen
