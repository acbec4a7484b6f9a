#ifndef LUMEN_IMAGERENDERTARGET_HPP
#define LUMEN_IMAGERENDERTARGET_HPP

#include "Common.hpp"
#include "DeviceContext.hpp"
#include "RenderTarget.hpp"
#include <expected>
#include <string>

namespace lumen {

/**
 * @brief Render target backed by a single caller-owned color image
 *
 * There is nothing to acquire from or present to, so both phases submit an
 * empty batch on the main queue that only forwards the frame semaphores.
 * The image starts out undefined; every later frame starts from the final
 * state declared at construction.
 *
 * The image and view must outlive the target.
 */
class ImageRenderTarget final : public RenderTarget {
public:
    ImageRenderTarget(
        DeviceContext& device,
        vk::Image image,
        vk::ImageView image_view,
        vk::Format format,
        vk::Extent2D extent,
        const FrameRenderAttachmentImageState& final_state
    );

    std::expected<FrameRenderInfo, std::string> acquire(const FrameSyncInfo& sync_info) override;
    std::expected<void, std::string> present(
        const FrameSyncInfo& sync_info,
        FrameRenderInfo frame_render_info
    ) override;

    [[nodiscard]] vk::Extent2D extent() const { return m_extent; }
    [[nodiscard]] const FrameRenderAttachmentImageState& current_state() const { return m_current_state; }

private:
    DeviceContext* m_device;
    vk::Image m_image;
    vk::ImageView m_image_view;
    vk::Format m_format;
    vk::Extent2D m_extent;
    FrameRenderAttachmentImageState m_final_state;
    FrameRenderAttachmentImageState m_current_state;
};

} // namespace lumen

#endif // LUMEN_IMAGERENDERTARGET_HPP
