#include <lumen/ImageRenderTarget.hpp>

namespace lumen {

ImageRenderTarget::ImageRenderTarget(
    DeviceContext& device,
    vk::Image image,
    vk::ImageView image_view,
    vk::Format format,
    vk::Extent2D extent,
    const FrameRenderAttachmentImageState& final_state
)
    : m_device(&device)
    , m_image(image)
    , m_image_view(image_view)
    , m_format(format)
    , m_extent(extent)
    , m_final_state(final_state)
    , m_current_state{vk::ImageLayout::eUndefined, vk::AccessFlagBits2::eNone, VK_QUEUE_FAMILY_IGNORED}
{}

std::expected<FrameRenderInfo, std::string> ImageRenderTarget::acquire(const FrameSyncInfo& sync_info) {
    auto submit_info = vk::SubmitInfo()
        .setSignalSemaphores(sync_info.image_available);

    auto result = m_device->submit(std::span<const vk::SubmitInfo>(&submit_info, 1), nullptr);
    LUMEN_CHECK_VK_RESULT_VOID(result, "Could not signal image availability {}");

    FrameRenderAttachment attachment{
        .image = m_image,
        .image_view = m_image_view,
        .format = m_format,
        .initial_state = m_current_state,
        .final_state = m_final_state,
    };

    return FrameRenderInfo{
        .color_attachments = {attachment},
        .extent = m_extent,
        .image_index = 0,
    };
}

std::expected<void, std::string> ImageRenderTarget::present(
    const FrameSyncInfo& sync_info,
    FrameRenderInfo frame_render_info
) {
    vk::PipelineStageFlags wait_stage = vk::PipelineStageFlagBits::eAllCommands;
    auto submit_info = vk::SubmitInfo()
        .setWaitSemaphores(sync_info.render_finished)
        .setWaitDstStageMask(wait_stage);

    auto result = m_device->submit(std::span<const vk::SubmitInfo>(&submit_info, 1), nullptr);
    LUMEN_CHECK_VK_RESULT_VOID(result, "Could not consume render completion {}");

    m_current_state = frame_render_info.color_attachments.front().final_state;
    return {};
}

} // namespace lumen
