#include <lumen/CommandBuffer.hpp>
#include <lumen/Logger.hpp>
#include <utility>
#include <vector>

namespace lumen {

vk::ImageMemoryBarrier2 ImageTransition::to_barrier() const {
    return vk::ImageMemoryBarrier2()
        .setSrcStageMask(src_state.stage)
        .setSrcAccessMask(src_state.access)
        .setDstStageMask(dst_state.stage)
        .setDstAccessMask(dst_state.access)
        .setOldLayout(src_state.layout)
        .setNewLayout(dst_state.layout)
        .setSrcQueueFamilyIndex(src_state.queue_family)
        .setDstQueueFamilyIndex(dst_state.queue_family)
        .setImage(image)
        .setSubresourceRange(subresource_range);
}

// ============================================================================
// CommandRecorder
// ============================================================================

CommandRecorder::CommandRecorder(CommandBuffer& command_buffer)
    : m_command_buffer(&command_buffer)
{}

std::expected<CommandRecorder, std::string> CommandRecorder::begin(
    CommandBuffer& command_buffer,
    const vk::CommandBufferBeginInfo& begin_info
) {
    auto result = command_buffer.device().begin_command_buffer(command_buffer.handle(), begin_info);
    LUMEN_CHECK_VK_RESULT_VOID(result, "Could not begin command buffer {}");
    return CommandRecorder(command_buffer);
}

CommandRecorder::CommandRecorder(CommandRecorder&& other) noexcept
    : m_command_buffer(other.m_command_buffer)
{
    other.m_command_buffer = nullptr;
}

CommandRecorder::~CommandRecorder() {
    if (auto result = end(); !result) {
        Logger::instance().error("{}", result.error());
    }
}

std::expected<void, std::string> CommandRecorder::end() {
    if (!m_command_buffer) {
        return {};
    }

    auto* command_buffer = std::exchange(m_command_buffer, nullptr);
    auto result = command_buffer->device().end_command_buffer(command_buffer->handle());
    LUMEN_CHECK_VK_RESULT_VOID(result, "Could not end command buffer {}");
    return {};
}

void CommandRecorder::pipeline_barrier(const vk::DependencyInfo& dependency_info) const {
    m_command_buffer->device().cmd_pipeline_barrier2(m_command_buffer->handle(), dependency_info);
}

void CommandRecorder::image_transitions(std::span<const ImageTransition> transitions) const {
    std::vector<vk::ImageMemoryBarrier2> barriers;
    barriers.reserve(transitions.size());
    for (const auto& transition : transitions) {
        barriers.push_back(transition.to_barrier());
    }

    auto dependency_info = vk::DependencyInfo()
        .setImageMemoryBarriers(barriers);

    pipeline_barrier(dependency_info);
}

void CommandRecorder::image_transition(const ImageTransition& transition) const {
    image_transitions(std::span<const ImageTransition>(&transition, 1));
}

RenderingRecorder CommandRecorder::begin_rendering(const vk::RenderingInfo& rendering_info) const {
    return RenderingRecorder(*this, rendering_info);
}

void CommandRecorder::bind_graphics_pipeline(vk::Pipeline pipeline) const {
    m_command_buffer->device().cmd_bind_pipeline(
        m_command_buffer->handle(), vk::PipelineBindPoint::eGraphics, pipeline);
}

void CommandRecorder::draw(
    uint32_t vertex_count,
    uint32_t instance_count,
    uint32_t first_vertex,
    uint32_t first_instance
) const {
    m_command_buffer->device().cmd_draw(
        m_command_buffer->handle(), vertex_count, instance_count, first_vertex, first_instance);
}

void CommandRecorder::set_viewport(const vk::Viewport& viewport) const {
    m_command_buffer->device().cmd_set_viewport(m_command_buffer->handle(), viewport);
}

void CommandRecorder::set_scissor(const vk::Rect2D& scissor) const {
    m_command_buffer->device().cmd_set_scissor(m_command_buffer->handle(), scissor);
}

// ============================================================================
// RenderingRecorder
// ============================================================================

RenderingRecorder::RenderingRecorder(const CommandRecorder& recorder, const vk::RenderingInfo& rendering_info)
    : m_recorder(&recorder)
{
    auto& command_buffer = m_recorder->command_buffer();
    command_buffer.device().cmd_begin_rendering(command_buffer.handle(), rendering_info);
}

RenderingRecorder::~RenderingRecorder() {
    auto& command_buffer = m_recorder->command_buffer();
    command_buffer.device().cmd_end_rendering(command_buffer.handle());
}

void RenderingRecorder::bind_graphics_pipeline(vk::Pipeline pipeline) const {
    m_recorder->bind_graphics_pipeline(pipeline);
}

void RenderingRecorder::draw(
    uint32_t vertex_count,
    uint32_t instance_count,
    uint32_t first_vertex,
    uint32_t first_instance
) const {
    m_recorder->draw(vertex_count, instance_count, first_vertex, first_instance);
}

void RenderingRecorder::set_viewport(const vk::Viewport& viewport) const {
    m_recorder->set_viewport(viewport);
}

void RenderingRecorder::set_scissor(const vk::Rect2D& scissor) const {
    m_recorder->set_scissor(scissor);
}

} // namespace lumen
