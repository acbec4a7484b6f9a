#ifndef LUMEN_COMMANDBUFFER_HPP
#define LUMEN_COMMANDBUFFER_HPP

#include "Common.hpp"
#include "DeviceContext.hpp"
#include <expected>
#include <span>
#include <string>

namespace lumen {

class CommandBuffer;
class CommandRecorder;

/**
 * @brief One side of an image layout transition
 */
struct ImageTransitionState {
    vk::PipelineStageFlags2 stage;
    vk::ImageLayout layout;
    vk::AccessFlags2 access;
    uint32_t queue_family;
};

struct ImageTransition {
    vk::Image image;
    vk::ImageSubresourceRange subresource_range;
    ImageTransitionState src_state;
    ImageTransitionState dst_state;

    [[nodiscard]] vk::ImageMemoryBarrier2 to_barrier() const;
};

/**
 * @brief Rendering pass scope nested in an open recording session
 *
 * Construction records vkCmdBeginRendering, destruction always records the
 * matching vkCmdEndRendering, whether or not anything was drawn.
 */
class RenderingRecorder {
public:
    ~RenderingRecorder();

    RenderingRecorder(const RenderingRecorder&) = delete;
    RenderingRecorder& operator=(const RenderingRecorder&) = delete;
    RenderingRecorder(RenderingRecorder&&) = delete;
    RenderingRecorder& operator=(RenderingRecorder&&) = delete;

    void bind_graphics_pipeline(vk::Pipeline pipeline) const;
    void draw(uint32_t vertex_count, uint32_t instance_count, uint32_t first_vertex, uint32_t first_instance) const;
    void set_viewport(const vk::Viewport& viewport) const;
    void set_scissor(const vk::Rect2D& scissor) const;

    [[nodiscard]] const CommandRecorder& recorder() const { return *m_recorder; }

private:
    friend class CommandRecorder;
    RenderingRecorder(const CommandRecorder& recorder, const vk::RenderingInfo& rendering_info);

    const CommandRecorder* m_recorder;
};

/**
 * @brief Open recording session on a command buffer
 *
 * begin() records vkBeginCommandBuffer. The session is closed exactly once,
 * either by an explicit end() (which reports the result) or by the
 * destructor. Recording calls are only valid while the session is open.
 */
class CommandRecorder {
public:
    static std::expected<CommandRecorder, std::string> begin(
        CommandBuffer& command_buffer,
        const vk::CommandBufferBeginInfo& begin_info = {}
    );

    ~CommandRecorder();

    CommandRecorder(const CommandRecorder&) = delete;
    CommandRecorder& operator=(const CommandRecorder&) = delete;
    CommandRecorder(CommandRecorder&& other) noexcept;
    CommandRecorder& operator=(CommandRecorder&&) = delete;

    /**
     * @brief Finish recording
     *
     * After this call the recorder is closed and its destructor does nothing.
     */
    std::expected<void, std::string> end();

    [[nodiscard]] bool is_recording() const { return m_command_buffer != nullptr; }

    void pipeline_barrier(const vk::DependencyInfo& dependency_info) const;
    void image_transitions(std::span<const ImageTransition> transitions) const;
    void image_transition(const ImageTransition& transition) const;

    [[nodiscard]] RenderingRecorder begin_rendering(const vk::RenderingInfo& rendering_info) const;

    void bind_graphics_pipeline(vk::Pipeline pipeline) const;
    void draw(uint32_t vertex_count, uint32_t instance_count, uint32_t first_vertex, uint32_t first_instance) const;
    void set_viewport(const vk::Viewport& viewport) const;
    void set_scissor(const vk::Rect2D& scissor) const;

    [[nodiscard]] CommandBuffer& command_buffer() const { return *m_command_buffer; }

private:
    explicit CommandRecorder(CommandBuffer& command_buffer);

    CommandBuffer* m_command_buffer;
};

/**
 * @brief Native command buffer bound to the device that records it
 *
 * Does not own the handle; the pool it was allocated from does.
 */
class CommandBuffer {
public:
    CommandBuffer(DeviceContext& device, vk::CommandBuffer handle)
        : m_device(&device)
        , m_handle(handle)
    {}

    std::expected<CommandRecorder, std::string> begin(const vk::CommandBufferBeginInfo& begin_info = {}) {
        return CommandRecorder::begin(*this, begin_info);
    }

    [[nodiscard]] vk::CommandBuffer handle() const { return m_handle; }
    [[nodiscard]] DeviceContext& device() const { return *m_device; }

private:
    DeviceContext* m_device;
    vk::CommandBuffer m_handle;
};

} // namespace lumen

#endif // LUMEN_COMMANDBUFFER_HPP
