#include <lumen/PrimaryRenderer.hpp>
#include <lumen/Logger.hpp>
#include <limits>

namespace lumen {

namespace {

constexpr vk::ImageSubresourceRange COLOR_SUBRESOURCE_RANGE{
    vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1
};

bool transfers_ownership(uint32_t declared_family, uint32_t main_family) {
    return declared_family != VK_QUEUE_FAMILY_IGNORED && declared_family != main_family;
}

} // namespace

FrameRenderAttachmentImageState canonical_attachment_state(uint32_t main_queue_family) {
    return FrameRenderAttachmentImageState{
        .layout = vk::ImageLayout::eColorAttachmentOptimal,
        .access = vk::AccessFlagBits2::eColorAttachmentWrite,
        .queue_family = main_queue_family,
    };
}

std::expected<std::unique_ptr<PrimaryRenderer>, std::string> PrimaryRenderer::create(DeviceContext& device) {
    std::unique_ptr<PrimaryRenderer> renderer(new PrimaryRenderer(device));

    if (auto result = renderer->create_frame_resources(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().debug("Created primary renderer with {} frames in flight", MAX_FRAMES_IN_FLIGHT);
    return renderer;
}

PrimaryRenderer::PrimaryRenderer(DeviceContext& device)
    : m_device(&device)
{}

PrimaryRenderer::~PrimaryRenderer() {
    destroy_frame_resources();
}

std::expected<void, std::string> PrimaryRenderer::create_frame_resources() {
    for (uint32_t slot = 0; slot < MAX_FRAMES_IN_FLIGHT; ++slot) {
        auto image_available = m_device->create_semaphore();
        if (!image_available) {
            return std::unexpected(image_available.error());
        }
        m_sync_infos[slot].image_available = *image_available;

        auto render_finished = m_device->create_semaphore();
        if (!render_finished) {
            return std::unexpected(render_finished.error());
        }
        m_sync_infos[slot].render_finished = *render_finished;

        // Signaled so the first frame on each slot does not block
        auto fence = m_device->create_fence(true);
        if (!fence) {
            return std::unexpected(fence.error());
        }
        m_fences[slot] = *fence;
        m_fence_armed[slot] = true;
    }

    auto command_buffers = m_device->allocate_command_buffers(MAX_FRAMES_IN_FLIGHT, vk::CommandBufferLevel::ePrimary);
    if (!command_buffers) {
        return std::unexpected(command_buffers.error());
    }
    m_command_buffers = std::move(*command_buffers);

    return {};
}

void PrimaryRenderer::destroy_frame_resources() {
    std::vector<vk::Fence> armed_fences;
    for (uint32_t slot = 0; slot < MAX_FRAMES_IN_FLIGHT; ++slot) {
        if (m_fences[slot] && m_fence_armed[slot]) {
            armed_fences.push_back(m_fences[slot]);
        }
    }

    if (!armed_fences.empty()) {
        auto result = m_device->wait_for_fences(armed_fences, std::numeric_limits<uint64_t>::max());
        if (result != vk::Result::eSuccess) {
            Logger::instance().error("Waiting for frames in flight failed: {}", vk::to_string(result));
        }
    }

    if (!m_command_buffers.empty()) {
        m_device->free_command_buffers(m_command_buffers);
        m_command_buffers.clear();
    }

    for (uint32_t slot = 0; slot < MAX_FRAMES_IN_FLIGHT; ++slot) {
        if (m_fences[slot]) {
            m_device->destroy_fence(m_fences[slot]);
            m_fences[slot] = nullptr;
        }
        if (m_sync_infos[slot].image_available) {
            m_device->destroy_semaphore(m_sync_infos[slot].image_available);
            m_sync_infos[slot].image_available = nullptr;
        }
        if (m_sync_infos[slot].render_finished) {
            m_device->destroy_semaphore(m_sync_infos[slot].render_finished);
            m_sync_infos[slot].render_finished = nullptr;
        }
    }

    Logger::instance().trace("Destroyed primary renderer frame resources");
}

void PrimaryRenderer::set_clear_value(uint32_t index, std::optional<vk::ClearValue> value) {
    if (index >= m_clear_values.size()) {
        m_clear_values.resize(index + 1);
    }
    m_clear_values[index] = value;
}

void PrimaryRenderer::set_render_area(std::optional<vk::Rect2D> area) {
    m_render_area = area;
}

FrameStatus PrimaryRenderer::render_to_target(RenderTarget& target, const DrawCallback& callback) {
    const uint32_t slot = m_current_frame;

    if (m_fence_armed[slot]) {
        auto wait_result = m_device->wait_for_fences(
            std::span<const vk::Fence>(&m_fences[slot], 1),
            std::numeric_limits<uint64_t>::max()
        );
        if (wait_result != vk::Result::eSuccess) {
            Logger::instance().error("Waiting for frame slot {} failed: {}", slot, vk::to_string(wait_result));
            return FrameStatus::eSkipped;
        }
    }

    auto status = FrameStatus::eSkipped;
    bool acquired = render_frame(target, m_sync_infos[slot], [&](const FrameRenderInfo& frame_render_info) {
        status = record_and_submit(slot, frame_render_info, callback);
    });

    if (!acquired) {
        // Fence untouched, the next attempt reuses this slot without blocking
        return FrameStatus::eSkipped;
    }

    m_current_frame = (m_current_frame + 1) % MAX_FRAMES_IN_FLIGHT;
    return status;
}

FrameStatus PrimaryRenderer::record_and_submit(
    uint32_t slot,
    const FrameRenderInfo& frame_render_info,
    const DrawCallback& callback
) {
    CommandBuffer command_buffer(*m_device, m_command_buffers[slot]);

    auto recorded = record_frame(command_buffer, frame_render_info, callback);
    if (!recorded) {
        Logger::instance().warn("Recording frame failed, submitting an empty batch: {}", recorded.error());
    }

    // An empty batch still consumes image_available and signals render_finished and the fence
    auto submitted = submit_frame(slot, recorded ? command_buffer.handle() : vk::CommandBuffer());
    if (!submitted) {
        Logger::instance().error("{}", submitted.error());
        // Nothing signals render_finished now, yet the target still presents waiting on it
        Logger::instance().warn(
            "Frame slot {} presents without a signaled render_finished semaphore; "
            "its image_available semaphore stays signaled", slot);
        return FrameStatus::eSubmitFailed;
    }

    return recorded ? FrameStatus::eRendered : FrameStatus::eRecordingFailed;
}

std::expected<void, std::string> PrimaryRenderer::record_frame(
    CommandBuffer& command_buffer,
    const FrameRenderInfo& frame_render_info,
    const DrawCallback& callback
) const {
    auto recorder = command_buffer.begin(
        vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    if (!recorder) {
        return std::unexpected(recorder.error());
    }

    if (auto transitions = pre_pass_transitions(frame_render_info); !transitions.empty()) {
        recorder->image_transitions(transitions);
    }

    {
        auto color_attachments = color_attachment_infos(frame_render_info);
        auto rendering_info = vk::RenderingInfo()
            .setRenderArea(m_render_area.value_or(vk::Rect2D({0, 0}, frame_render_info.extent)))
            .setLayerCount(1)
            .setViewMask(0)
            .setColorAttachments(color_attachments);

        auto rendering = recorder->begin_rendering(rendering_info);
        callback(rendering, frame_render_info);
    }

    if (auto transitions = post_pass_transitions(frame_render_info); !transitions.empty()) {
        recorder->image_transitions(transitions);
    }

    return recorder->end();
}

std::expected<void, std::string> PrimaryRenderer::submit_frame(uint32_t slot, vk::CommandBuffer command_buffer) {
    const auto& sync_info = m_sync_infos[slot];

    auto reset_result = m_device->reset_fence(m_fences[slot]);
    LUMEN_CHECK_VK_RESULT_VOID(reset_result, "Could not reset frame fence {}");
    m_fence_armed[slot] = false;

    vk::PipelineStageFlags wait_stage = vk::PipelineStageFlagBits::eTopOfPipe;
    auto submit_info = vk::SubmitInfo()
        .setWaitSemaphores(sync_info.image_available)
        .setWaitDstStageMask(wait_stage)
        .setSignalSemaphores(sync_info.render_finished);
    if (command_buffer) {
        submit_info.setCommandBuffers(command_buffer);
    }

    auto submit_result = m_device->submit(std::span<const vk::SubmitInfo>(&submit_info, 1), m_fences[slot]);
    LUMEN_CHECK_VK_RESULT_VOID(submit_result, "Could not submit frame {}");
    m_fence_armed[slot] = true;

    return {};
}

std::vector<ImageTransition> PrimaryRenderer::pre_pass_transitions(const FrameRenderInfo& frame_render_info) const {
    const uint32_t main_family = m_device->queue_families().main;
    const auto canonical = canonical_attachment_state(main_family);

    std::vector<ImageTransition> transitions;
    for (const auto& attachment : frame_render_info.color_attachments) {
        const auto& initial = attachment.initial_state;
        if (initial == canonical) {
            continue;
        }

        const bool ownership = transfers_ownership(initial.queue_family, main_family);
        transitions.push_back(ImageTransition{
            .image = attachment.image,
            .subresource_range = COLOR_SUBRESOURCE_RANGE,
            .src_state = {
                .stage = initial.access ? vk::PipelineStageFlagBits2::eAllCommands
                                        : vk::PipelineStageFlagBits2::eTopOfPipe,
                .layout = initial.layout,
                .access = initial.access,
                .queue_family = ownership ? initial.queue_family : VK_QUEUE_FAMILY_IGNORED,
            },
            .dst_state = {
                .stage = vk::PipelineStageFlagBits2::eColorAttachmentOutput,
                .layout = canonical.layout,
                .access = canonical.access,
                .queue_family = ownership ? main_family : VK_QUEUE_FAMILY_IGNORED,
            },
        });
    }
    return transitions;
}

std::vector<ImageTransition> PrimaryRenderer::post_pass_transitions(const FrameRenderInfo& frame_render_info) const {
    const uint32_t main_family = m_device->queue_families().main;
    const auto canonical = canonical_attachment_state(main_family);

    std::vector<ImageTransition> transitions;
    for (const auto& attachment : frame_render_info.color_attachments) {
        const auto& final_state = attachment.final_state;
        if (final_state == canonical) {
            continue;
        }

        const bool ownership = transfers_ownership(final_state.queue_family, main_family);
        transitions.push_back(ImageTransition{
            .image = attachment.image,
            .subresource_range = COLOR_SUBRESOURCE_RANGE,
            .src_state = {
                .stage = vk::PipelineStageFlagBits2::eColorAttachmentOutput,
                .layout = canonical.layout,
                .access = canonical.access,
                .queue_family = ownership ? main_family : VK_QUEUE_FAMILY_IGNORED,
            },
            .dst_state = {
                .stage = final_state.access ? vk::PipelineStageFlagBits2::eAllCommands
                                            : vk::PipelineStageFlagBits2::eBottomOfPipe,
                .layout = final_state.layout,
                .access = final_state.access,
                .queue_family = ownership ? final_state.queue_family : VK_QUEUE_FAMILY_IGNORED,
            },
        });
    }
    return transitions;
}

std::vector<vk::RenderingAttachmentInfo> PrimaryRenderer::color_attachment_infos(
    const FrameRenderInfo& frame_render_info
) const {
    std::vector<vk::RenderingAttachmentInfo> infos;
    infos.reserve(frame_render_info.color_attachments.size());

    for (size_t i = 0; i < frame_render_info.color_attachments.size(); ++i) {
        const auto& attachment = frame_render_info.color_attachments[i];
        auto info = vk::RenderingAttachmentInfo()
            .setImageView(attachment.image_view)
            .setImageLayout(vk::ImageLayout::eColorAttachmentOptimal)
            .setLoadOp(vk::AttachmentLoadOp::eLoad)
            .setStoreOp(vk::AttachmentStoreOp::eStore);

        if (i < m_clear_values.size() && m_clear_values[i]) {
            info.setLoadOp(vk::AttachmentLoadOp::eClear)
                .setClearValue(*m_clear_values[i]);
        }
        infos.push_back(info);
    }
    return infos;
}

} // namespace lumen
