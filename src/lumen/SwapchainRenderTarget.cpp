#include <lumen/SwapchainRenderTarget.hpp>
#include <lumen/Logger.hpp>
#include <algorithm>
#include <limits>

namespace lumen {

vk::SurfaceFormatKHR choose_surface_format(std::span<const vk::SurfaceFormatKHR> available_formats) {
    for (const auto& format : available_formats) {
        if (format.format == vk::Format::eB8G8R8A8Srgb &&
            format.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear) {
            return format;
        }
    }
    return available_formats[0];
}

vk::PresentModeKHR choose_present_mode(std::span<const vk::PresentModeKHR> available_modes) {
    for (const auto& mode : available_modes) {
        if (mode == vk::PresentModeKHR::eMailbox) {
            return mode;
        }
    }
    return vk::PresentModeKHR::eFifo;
}

vk::Extent2D choose_swapchain_extent(
    const vk::SurfaceCapabilitiesKHR& capabilities,
    vk::Extent2D framebuffer_size
) {
    if (capabilities.currentExtent.width != std::numeric_limits<uint32_t>::max()) {
        return capabilities.currentExtent;
    }

    // Window manager lets us choose, clamp to the valid range
    return vk::Extent2D{
        std::clamp(framebuffer_size.width,
            capabilities.minImageExtent.width,
            capabilities.maxImageExtent.width),
        std::clamp(framebuffer_size.height,
            capabilities.minImageExtent.height,
            capabilities.maxImageExtent.height),
    };
}

uint32_t choose_swapchain_image_count(const vk::SurfaceCapabilitiesKHR& capabilities) {
    uint32_t image_count = capabilities.minImageCount + 1;
    if (capabilities.maxImageCount > 0 && image_count > capabilities.maxImageCount) {
        image_count = capabilities.maxImageCount;
    }
    return image_count;
}

std::expected<void, std::string> check_swapchain_result(vk::Result result, std::string_view operation) {
    if (result == vk::Result::eSuccess || result == vk::Result::eSuboptimalKHR) {
        return {};
    }
    return std::unexpected(std::format("Could not {} swapchain image {}", operation, vk::to_string(result)));
}

FrameRenderAttachment swapchain_attachment(vk::Image image, vk::ImageView image_view, vk::Format format) {
    return FrameRenderAttachment{
        .image = image,
        .image_view = image_view,
        .format = format,
        .initial_state = {vk::ImageLayout::eUndefined, vk::AccessFlagBits2::eNone, VK_QUEUE_FAMILY_IGNORED},
        .final_state = {vk::ImageLayout::ePresentSrcKHR, vk::AccessFlagBits2::eNone, VK_QUEUE_FAMILY_IGNORED},
    };
}

// ============================================================================
// SwapchainRenderTarget
// ============================================================================

std::expected<std::unique_ptr<SwapchainRenderTarget>, std::string> SwapchainRenderTarget::create(
    VulkanContext& context,
    std::unique_ptr<Window> window
) {
    if (!window) {
        return std::unexpected("Swapchain render target needs a window");
    }

    if (!window->has_surface()) {
        if (auto result = window->create_surface(context.instance()); !result) {
            return std::unexpected(result.error());
        }
    }

    auto support_res = context.physical_device().getSurfaceSupportKHR(
        context.queue_families().present, window->surface());
    LUMEN_CHECK_VK_RESULT(support_res, "Could not query surface support {}");
    if (!support_res.value) {
        return std::unexpected("Present queue family cannot present to the window surface");
    }

    std::unique_ptr<SwapchainRenderTarget> target(new SwapchainRenderTarget(context, std::move(window)));
    if (auto result = target->create_swapchain(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().debug("Created swapchain: {}x{}, {} images, {}, {}",
        target->m_extent.width, target->m_extent.height, target->m_images.size(),
        vk::to_string(target->m_surface_format.format), vk::to_string(target->m_present_mode));
    return target;
}

SwapchainRenderTarget::SwapchainRenderTarget(VulkanContext& context, std::unique_ptr<Window> window)
    : m_context(&context)
    , m_window(std::move(window))
{}

SwapchainRenderTarget::~SwapchainRenderTarget() {
    destroy_swapchain();
    m_window.reset();
}

std::expected<void, std::string> SwapchainRenderTarget::create_swapchain() {
    auto physical_device = m_context->physical_device();
    auto surface = m_window->surface();

    auto surface_capabilities_res = physical_device.getSurfaceCapabilitiesKHR(surface);
    auto surface_formats_res = physical_device.getSurfaceFormatsKHR(surface);
    auto present_modes_res = physical_device.getSurfacePresentModesKHR(surface);

    if (surface_formats_res.result != vk::Result::eSuccess or
        present_modes_res.result != vk::Result::eSuccess or
        surface_capabilities_res.result != vk::Result::eSuccess or
        surface_formats_res.value.empty()) {
        return std::unexpected("Inadequate swapchain support");
    }

    const auto& surface_capabilities = surface_capabilities_res.value;
    m_surface_format = choose_surface_format(surface_formats_res.value);
    m_present_mode = choose_present_mode(present_modes_res.value);
    m_extent = choose_swapchain_extent(surface_capabilities, m_window->framebuffer_size());

    auto swapchain_info = vk::SwapchainCreateInfoKHR()
        .setSurface(surface)
        .setMinImageCount(choose_swapchain_image_count(surface_capabilities))
        .setImageFormat(m_surface_format.format)
        .setImageColorSpace(m_surface_format.colorSpace)
        .setImageExtent(m_extent)
        .setImageArrayLayers(1)
        .setImageUsage(vk::ImageUsageFlagBits::eColorAttachment)
        .setImageSharingMode(vk::SharingMode::eExclusive)
        .setPreTransform(surface_capabilities.currentTransform)
        .setCompositeAlpha(vk::CompositeAlphaFlagBitsKHR::eOpaque)
        .setPresentMode(m_present_mode)
        .setClipped(true);

    auto device = m_context->device();
    auto swapchain_res = device.createSwapchainKHR(swapchain_info);
    LUMEN_CHECK_VK_RESULT(swapchain_res, "Could not create swapchain {}");
    m_swapchain = swapchain_res.value;

    auto swapchain_imgs_res = device.getSwapchainImagesKHR(m_swapchain);
    LUMEN_CHECK_VK_RESULT(swapchain_imgs_res, "Could not get swapchain images {}");
    m_images = swapchain_imgs_res.value;

    m_image_views.reserve(m_images.size());
    for (const auto& image : m_images) {
        auto view_info = vk::ImageViewCreateInfo()
            .setImage(image)
            .setViewType(vk::ImageViewType::e2D)
            .setFormat(m_surface_format.format)
            .setComponents(vk::ComponentMapping())
            .setSubresourceRange(vk::ImageSubresourceRange()
                .setAspectMask(vk::ImageAspectFlagBits::eColor)
                .setBaseMipLevel(0)
                .setLevelCount(1)
                .setBaseArrayLayer(0)
                .setLayerCount(1));
        auto img_view_res = device.createImageView(view_info);
        LUMEN_CHECK_VK_RESULT(img_view_res, "Could not create image view {}");
        m_image_views.push_back(img_view_res.value);
    }

    return {};
}

void SwapchainRenderTarget::destroy_swapchain() {
    auto device = m_context->device();

    for (auto& view : m_image_views) {
        device.destroyImageView(view);
    }
    m_image_views.clear();
    m_images.clear();

    if (m_swapchain) {
        device.destroySwapchainKHR(m_swapchain);
        m_swapchain = nullptr;
        Logger::instance().trace("Destroyed swapchain");
    }
}

std::expected<FrameRenderInfo, std::string> SwapchainRenderTarget::acquire(const FrameSyncInfo& sync_info) {
    // Raw call: vk-hpp treats out-of-date as fatal
    uint32_t image_index = 0;
    VkResult result = VULKAN_HPP_DEFAULT_DISPATCHER.vkAcquireNextImageKHR(
        static_cast<VkDevice>(m_context->device()),
        static_cast<VkSwapchainKHR>(m_swapchain),
        std::numeric_limits<uint64_t>::max(),
        static_cast<VkSemaphore>(sync_info.image_available),
        VK_NULL_HANDLE,
        &image_index
    );

    if (auto checked = check_swapchain_result(static_cast<vk::Result>(result), "acquire"); !checked) {
        return std::unexpected(checked.error());
    }

    return FrameRenderInfo{
        .color_attachments = {
            swapchain_attachment(m_images[image_index], m_image_views[image_index], m_surface_format.format)
        },
        .extent = m_extent,
        .image_index = image_index,
    };
}

std::expected<void, std::string> SwapchainRenderTarget::present(
    const FrameSyncInfo& sync_info,
    FrameRenderInfo frame_render_info
) {
    auto present_info = vk::PresentInfoKHR()
        .setWaitSemaphores(sync_info.render_finished)
        .setSwapchains(m_swapchain)
        .setImageIndices(frame_render_info.image_index);

    VkResult result = VULKAN_HPP_DEFAULT_DISPATCHER.vkQueuePresentKHR(
        static_cast<VkQueue>(m_context->queues().present),
        reinterpret_cast<const VkPresentInfoKHR*>(&present_info)
    );

    return check_swapchain_result(static_cast<vk::Result>(result), "present");
}

} // namespace lumen
