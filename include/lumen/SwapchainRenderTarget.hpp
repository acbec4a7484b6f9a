#ifndef LUMEN_SWAPCHAINRENDERTARGET_HPP
#define LUMEN_SWAPCHAINRENDERTARGET_HPP

#include "Common.hpp"
#include "RenderTarget.hpp"
#include "VulkanContext.hpp"
#include "Window.hpp"
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lumen {

/**
 * @brief Prefer B8G8R8A8 sRGB with a nonlinear sRGB color space, else the first format
 */
vk::SurfaceFormatKHR choose_surface_format(std::span<const vk::SurfaceFormatKHR> available_formats);

/**
 * @brief Prefer mailbox, fall back to FIFO (always available)
 */
vk::PresentModeKHR choose_present_mode(std::span<const vk::PresentModeKHR> available_modes);

/**
 * @brief Surface extent, or the framebuffer size clamped to the surface limits
 *        when the surface leaves the choice to the application
 */
vk::Extent2D choose_swapchain_extent(
    const vk::SurfaceCapabilitiesKHR& capabilities,
    vk::Extent2D framebuffer_size
);

/**
 * @brief One image more than the minimum, capped at the maximum (0 means unbounded)
 */
uint32_t choose_swapchain_image_count(const vk::SurfaceCapabilitiesKHR& capabilities);

/**
 * @brief Classify an acquire or present result
 *
 * Success and suboptimal keep the frame going. Everything else, an
 * out-of-date surface included, is an error naming the operation.
 */
std::expected<void, std::string> check_swapchain_result(vk::Result result, std::string_view operation);

/**
 * @brief Attachment describing one swapchain image for a frame
 *
 * Contents are discarded on arrival (undefined layout) and the image is
 * handed back ready for presentation. No queue family ownership is transferred.
 */
FrameRenderAttachment swapchain_attachment(vk::Image image, vk::ImageView image_view, vk::Format format);

/**
 * @brief Render target presenting to a window through a swapchain
 *
 * Takes ownership of the window. Resources are released in the order
 * image views, swapchain, then the window together with its surface.
 * The swapchain is never recreated; acquisition failures such as an
 * out-of-date surface surface as acquire() errors.
 */
class SwapchainRenderTarget final : public RenderTarget {
public:
    /**
     * @brief Build a swapchain for the window's surface
     *
     * Creates the surface first if the window does not have one yet.
     *
     * @param context Device the swapchain is created on; must outlive the target
     * @param window Window to present to
     * @return Render target or error message
     */
    static std::expected<std::unique_ptr<SwapchainRenderTarget>, std::string> create(
        VulkanContext& context,
        std::unique_ptr<Window> window
    );

    ~SwapchainRenderTarget() override;

    SwapchainRenderTarget(const SwapchainRenderTarget&) = delete;
    SwapchainRenderTarget& operator=(const SwapchainRenderTarget&) = delete;
    SwapchainRenderTarget(SwapchainRenderTarget&&) = delete;
    SwapchainRenderTarget& operator=(SwapchainRenderTarget&&) = delete;

    std::expected<FrameRenderInfo, std::string> acquire(const FrameSyncInfo& sync_info) override;
    std::expected<void, std::string> present(
        const FrameSyncInfo& sync_info,
        FrameRenderInfo frame_render_info
    ) override;

    [[nodiscard]] Window& window() const { return *m_window; }
    [[nodiscard]] vk::Extent2D extent() const { return m_extent; }
    [[nodiscard]] vk::Format format() const { return m_surface_format.format; }
    [[nodiscard]] vk::PresentModeKHR present_mode() const { return m_present_mode; }
    [[nodiscard]] uint32_t image_count() const { return static_cast<uint32_t>(m_images.size()); }

private:
    SwapchainRenderTarget(VulkanContext& context, std::unique_ptr<Window> window);

    std::expected<void, std::string> create_swapchain();
    void destroy_swapchain();

    VulkanContext* m_context;
    std::unique_ptr<Window> m_window;

    vk::SurfaceFormatKHR m_surface_format;
    vk::PresentModeKHR m_present_mode = vk::PresentModeKHR::eFifo;
    vk::Extent2D m_extent;
    vk::SwapchainKHR m_swapchain;
    std::vector<vk::Image> m_images;
    std::vector<vk::ImageView> m_image_views;
};

} // namespace lumen

#endif // LUMEN_SWAPCHAINRENDERTARGET_HPP
