#include <lumen/OffscreenImage.hpp>
#include <lumen/Logger.hpp>
#include <utility>

namespace lumen {

std::expected<OffscreenImage, std::string> OffscreenImage::create(
    const VulkanContext& context,
    vk::Extent2D extent,
    vk::Format format,
    vk::ImageUsageFlags usage
) {
    OffscreenImage image(context, extent, format);

    if (auto result = image.create_image(usage); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().debug("Created offscreen image {}x{} {}",
        extent.width, extent.height, vk::to_string(format));
    return image;
}

OffscreenImage::OffscreenImage(const VulkanContext& context, vk::Extent2D extent, vk::Format format)
    : m_context(&context)
    , m_device(context.device())
    , m_extent(extent)
    , m_format(format)
{}

OffscreenImage::~OffscreenImage() {
    destroy();
}

OffscreenImage::OffscreenImage(OffscreenImage&& other) noexcept
    : m_context(other.m_context)
    , m_device(other.m_device)
    , m_extent(other.m_extent)
    , m_format(other.m_format)
    , m_image(std::exchange(other.m_image, nullptr))
    , m_memory(std::exchange(other.m_memory, nullptr))
    , m_view(std::exchange(other.m_view, nullptr))
{}

OffscreenImage& OffscreenImage::operator=(OffscreenImage&& other) noexcept {
    if (this != &other) {
        destroy();

        m_context = other.m_context;
        m_device = other.m_device;
        m_extent = other.m_extent;
        m_format = other.m_format;
        m_image = std::exchange(other.m_image, nullptr);
        m_memory = std::exchange(other.m_memory, nullptr);
        m_view = std::exchange(other.m_view, nullptr);
    }
    return *this;
}

std::expected<void, std::string> OffscreenImage::create_image(vk::ImageUsageFlags usage) {
    auto image_info = vk::ImageCreateInfo()
        .setImageType(vk::ImageType::e2D)
        .setFormat(m_format)
        .setExtent(vk::Extent3D(m_extent.width, m_extent.height, 1))
        .setMipLevels(1)
        .setArrayLayers(1)
        .setSamples(vk::SampleCountFlagBits::e1)
        .setTiling(vk::ImageTiling::eOptimal)
        .setUsage(usage | vk::ImageUsageFlagBits::eColorAttachment)
        .setSharingMode(vk::SharingMode::eExclusive)
        .setInitialLayout(vk::ImageLayout::eUndefined);

    auto image_res = m_device.createImage(image_info);
    LUMEN_CHECK_VK_RESULT(image_res, "Could not create offscreen image {}");
    m_image = image_res.value;

    auto mem_reqs = m_device.getImageMemoryRequirements(m_image);
    auto memory_type_result = find_memory_type(
        mem_reqs.memoryTypeBits,
        vk::MemoryPropertyFlagBits::eDeviceLocal
    );
    if (!memory_type_result) {
        return std::unexpected(memory_type_result.error());
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(mem_reqs.size)
        .setMemoryTypeIndex(*memory_type_result);

    auto memory_res = m_device.allocateMemory(alloc_info);
    LUMEN_CHECK_VK_RESULT(memory_res, "Could not allocate offscreen image memory {}");
    m_memory = memory_res.value;

    auto bind_res = m_device.bindImageMemory(m_image, m_memory, 0);
    LUMEN_CHECK_VK_RESULT_VOID(bind_res, "Could not bind offscreen image memory {}");

    auto view_info = vk::ImageViewCreateInfo()
        .setImage(m_image)
        .setViewType(vk::ImageViewType::e2D)
        .setFormat(m_format)
        .setSubresourceRange(vk::ImageSubresourceRange()
            .setAspectMask(vk::ImageAspectFlagBits::eColor)
            .setBaseMipLevel(0)
            .setLevelCount(1)
            .setBaseArrayLayer(0)
            .setLayerCount(1));

    auto view_res = m_device.createImageView(view_info);
    LUMEN_CHECK_VK_RESULT(view_res, "Could not create offscreen image view {}");
    m_view = view_res.value;

    return {};
}

std::expected<uint32_t, std::string> OffscreenImage::find_memory_type(
    uint32_t type_filter,
    vk::MemoryPropertyFlags properties
) const {
    auto mem_props = m_context->physical_device().getMemoryProperties();

    for (uint32_t i = 0; i < mem_props.memoryTypeCount; i++) {
        if ((type_filter & (1 << i)) &&
            (mem_props.memoryTypes[i].propertyFlags & properties) == properties) {
            return i;
        }
    }

    return std::unexpected("Failed to find suitable memory type");
}

void OffscreenImage::destroy() {
    if (m_view) {
        m_device.destroyImageView(m_view);
        m_view = nullptr;
    }
    if (m_image) {
        m_device.destroyImage(m_image);
        m_image = nullptr;
    }
    if (m_memory) {
        m_device.freeMemory(m_memory);
        m_memory = nullptr;
    }
}

} // namespace lumen
