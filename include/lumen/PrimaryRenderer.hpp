#ifndef LUMEN_PRIMARYRENDERER_HPP
#define LUMEN_PRIMARYRENDERER_HPP

#include "Common.hpp"
#include "CommandBuffer.hpp"
#include "DeviceContext.hpp"
#include "RenderTarget.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lumen {

inline constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

template <typename T>
using FrameSet = std::array<T, MAX_FRAMES_IN_FLIGHT>;

/**
 * @brief Outcome of one PrimaryRenderer::render_to_target() call
 */
enum class FrameStatus
{
    eRendered,          ///< Recorded, submitted and presented
    eSkipped,           ///< Nothing acquired, nothing submitted, slot not consumed
    eRecordingFailed,   ///< Empty batch submitted in place of the frame, then presented
    eSubmitFailed       ///< Submission rejected; present was still attempted
};

/**
 * @brief Layout, access and queue family an attachment is rendered in
 *
 * Attachments arriving in any other state get a barrier before the pass,
 * attachments declaring any other final state get one after it.
 */
FrameRenderAttachmentImageState canonical_attachment_state(uint32_t main_queue_family);

/**
 * @brief Drives frames through render targets with MAX_FRAMES_IN_FLIGHT slots
 *
 * Every slot owns a semaphore pair, a fence and a primary command buffer.
 * Before a slot is reused, its fence from the previous round is waited on;
 * that wait is the only point where the CPU blocks on the GPU.
 *
 * Per frame:
 * 1. wait on the slot's fence if a signal is outstanding
 * 2. acquire from the target (skip the whole frame on failure)
 * 3. record: transitions into the attachment state, a dynamic rendering
 *    pass around the draw callback, transitions into the final states
 * 4. reset the fence, submit, present, advance the slot
 *
 * Clear values and the render area are read at recording time, so changes
 * only affect frames not yet recorded.
 */
class PrimaryRenderer
{
public:
    using DrawCallback = std::function<void(RenderingRecorder&, const FrameRenderInfo&)>;

    /**
     * @brief Create the per-slot semaphores, fences (signaled) and command buffers
     *
     * @param device Device to render with; must outlive the renderer
     * @return Renderer or error message
     */
    static std::expected<std::unique_ptr<PrimaryRenderer>, std::string> create(DeviceContext& device);

    ~PrimaryRenderer();

    PrimaryRenderer(const PrimaryRenderer&) = delete;
    PrimaryRenderer& operator=(const PrimaryRenderer&) = delete;
    PrimaryRenderer(PrimaryRenderer&&) = delete;
    PrimaryRenderer& operator=(PrimaryRenderer&&) = delete;

    /**
     * @brief Render one frame into the target
     *
     * @param target Where the frame is acquired from and presented to
     * @param callback Invoked once inside the rendering pass
     */
    FrameStatus render_to_target(RenderTarget& target, const DrawCallback& callback);

    /**
     * @brief Clear color attachment `index` to `value` at the start of the pass
     *
     * std::nullopt loads the previous contents instead, which is also the
     * behaviour for indices never set.
     */
    void set_clear_value(uint32_t index, std::optional<vk::ClearValue> value);

    /**
     * @brief Restrict the rendering pass to `area`, std::nullopt for the full extent
     */
    void set_render_area(std::optional<vk::Rect2D> area);

    [[nodiscard]] uint32_t current_frame() const { return m_current_frame; }

private:
    explicit PrimaryRenderer(DeviceContext& device);

    std::expected<void, std::string> create_frame_resources();
    void destroy_frame_resources();

    FrameStatus record_and_submit(
        uint32_t slot,
        const FrameRenderInfo& frame_render_info,
        const DrawCallback& callback
    );
    std::expected<void, std::string> record_frame(
        CommandBuffer& command_buffer,
        const FrameRenderInfo& frame_render_info,
        const DrawCallback& callback
    ) const;
    std::expected<void, std::string> submit_frame(uint32_t slot, vk::CommandBuffer command_buffer);

    std::vector<ImageTransition> pre_pass_transitions(const FrameRenderInfo& frame_render_info) const;
    std::vector<ImageTransition> post_pass_transitions(const FrameRenderInfo& frame_render_info) const;
    std::vector<vk::RenderingAttachmentInfo> color_attachment_infos(const FrameRenderInfo& frame_render_info) const;

    DeviceContext* m_device;

    FrameSet<FrameSyncInfo> m_sync_infos{};
    FrameSet<vk::Fence> m_fences{};
    // A fence is armed while it is signaled or submitted work will signal it
    FrameSet<bool> m_fence_armed{};
    std::vector<vk::CommandBuffer> m_command_buffers;

    uint32_t m_current_frame = 0;

    std::vector<std::optional<vk::ClearValue>> m_clear_values;
    std::optional<vk::Rect2D> m_render_area;
};

} // namespace lumen

#endif // LUMEN_PRIMARYRENDERER_HPP
