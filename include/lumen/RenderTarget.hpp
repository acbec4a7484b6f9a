#ifndef LUMEN_RENDERTARGET_HPP
#define LUMEN_RENDERTARGET_HPP

#include "Common.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace lumen {

/**
 * @brief Externally visible state of an attachment image
 *
 * Describes the image either before the frame's GPU commands run or after
 * they must have completed.
 */
struct FrameRenderAttachmentImageState {
    vk::ImageLayout layout;
    vk::AccessFlags2 access;
    uint32_t queue_family;

    bool operator==(const FrameRenderAttachmentImageState&) const = default;
};

struct FrameRenderAttachment {
    vk::Image image;
    vk::ImageView image_view;
    vk::Format format;
    FrameRenderAttachmentImageState initial_state;
    FrameRenderAttachmentImageState final_state;
};

/**
 * @brief Everything a single frame renders into
 *
 * Produced by RenderTarget::acquire(), handed back to RenderTarget::present().
 * Not meant to outlive the frame.
 */
struct FrameRenderInfo {
    std::vector<FrameRenderAttachment> color_attachments;
    vk::Extent2D extent;
    uint32_t image_index;
};

/**
 * @brief Per-slot semaphore pair borrowed by render targets
 *
 * image_available is signaled once the acquired image may be written,
 * render_finished is signaled once the frame's GPU work is done and the
 * image may be presented.
 */
struct FrameSyncInfo {
    vk::Semaphore image_available;
    vk::Semaphore render_finished;
};

/**
 * @brief Something frames can be rendered into
 *
 * The two operations always come as a pair: every successful acquire() is
 * followed by exactly one present() with the same sync info. A target only
 * deals in images and semaphores; recording and submission are the
 * caller's business.
 */
class RenderTarget {
public:
    virtual ~RenderTarget() = default;

    /**
     * @brief Obtain the next image to render into
     *
     * On success sync_info.image_available is armed to be signaled when the
     * image is safe to write.
     *
     * @return Attachments for this frame, or an error when no image can be
     *         acquired right now (minimized, out of date, lost surface)
     */
    virtual std::expected<FrameRenderInfo, std::string> acquire(const FrameSyncInfo& sync_info) = 0;

    /**
     * @brief Hand the acquired image back once sync_info.render_finished signals
     *
     * Failures are reported but are not fatal to the caller.
     */
    virtual std::expected<void, std::string> present(
        const FrameSyncInfo& sync_info,
        FrameRenderInfo frame_render_info
    ) = 0;
};

using FrameCallback = std::function<void(const FrameRenderInfo&)>;

/**
 * @brief Acquire, run the callback, present
 *
 * If acquisition fails the frame is dropped: neither the callback nor
 * present() runs. Otherwise present() always follows the callback.
 * Synchronizing anything beyond the target itself is up to the caller.
 *
 * @return true if the frame was acquired and presented (present errors
 *         are logged, not returned)
 */
bool render_frame(RenderTarget& target, const FrameSyncInfo& sync_info, const FrameCallback& callback);

} // namespace lumen

#endif // LUMEN_RENDERTARGET_HPP
