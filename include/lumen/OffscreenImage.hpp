#ifndef LUMEN_OFFSCREENIMAGE_HPP
#define LUMEN_OFFSCREENIMAGE_HPP

#include "Common.hpp"
#include "VulkanContext.hpp"
#include <expected>
#include <string>

namespace lumen {

/**
 * @brief Device-local 2D color image with a single view
 *
 * Owns the image, its memory and the view; destroys them in reverse order.
 * Meant to back an ImageRenderTarget.
 */
class OffscreenImage
{
public:
    /**
     * @brief Create the image, allocate and bind device-local memory, create the view
     *
     * @param context Device to create on; must outlive the image
     * @param extent Image size in pixels
     * @param format Color format
     * @param usage Usage flags, color attachment is always added
     * @return Image or error message
     */
    static std::expected<OffscreenImage, std::string> create(
        const VulkanContext& context,
        vk::Extent2D extent,
        vk::Format format,
        vk::ImageUsageFlags usage = {}
    );

    ~OffscreenImage();

    OffscreenImage(const OffscreenImage&) = delete;
    OffscreenImage& operator=(const OffscreenImage&) = delete;
    OffscreenImage(OffscreenImage&& other) noexcept;
    OffscreenImage& operator=(OffscreenImage&& other) noexcept;

    [[nodiscard]] vk::Image image() const { return m_image; }
    [[nodiscard]] vk::ImageView view() const { return m_view; }
    [[nodiscard]] vk::Format format() const { return m_format; }
    [[nodiscard]] vk::Extent2D extent() const { return m_extent; }

private:
    OffscreenImage(const VulkanContext& context, vk::Extent2D extent, vk::Format format);

    std::expected<void, std::string> create_image(vk::ImageUsageFlags usage);
    std::expected<uint32_t, std::string> find_memory_type(
        uint32_t type_filter,
        vk::MemoryPropertyFlags properties
    ) const;
    void destroy();

    const VulkanContext* m_context;
    vk::Device m_device;
    vk::Extent2D m_extent;
    vk::Format m_format;
    vk::Image m_image;
    vk::DeviceMemory m_memory;
    vk::ImageView m_view;
};

} // namespace lumen

#endif // LUMEN_OFFSCREENIMAGE_HPP
