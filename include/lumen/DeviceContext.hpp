#ifndef LUMEN_DEVICECONTEXT_HPP
#define LUMEN_DEVICECONTEXT_HPP

#include "Common.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace lumen {

struct QueueFamilyInfo
{
    uint32_t main;
    uint32_t present;
    uint32_t transfer;

    [[nodiscard]] bool has_dedicated_transfer() const { return transfer != main; }
};

/**
 * @brief Device-level operations the frame loop depends on
 *
 * Everything above the device (command recording, render targets, the
 * primary renderer) talks to the GPU exclusively through this interface.
 * VulkanContext is the production implementation; tests substitute a
 * recording implementation that needs no GPU.
 *
 * Command buffer entry points take the native command buffer explicitly,
 * mirroring the vkCmd* functions they forward to.
 */
class DeviceContext
{
public:
    virtual ~DeviceContext() = default;

    [[nodiscard]] virtual const QueueFamilyInfo& queue_families() const = 0;

    // Synchronization primitives
    virtual std::expected<vk::Semaphore, std::string> create_semaphore() = 0;
    virtual std::expected<vk::Fence, std::string> create_fence(bool signaled) = 0;
    virtual void destroy_semaphore(vk::Semaphore semaphore) = 0;
    virtual void destroy_fence(vk::Fence fence) = 0;

    [[nodiscard]] virtual vk::Result wait_for_fences(std::span<const vk::Fence> fences, uint64_t timeout) = 0;
    [[nodiscard]] virtual vk::Result reset_fence(vk::Fence fence) = 0;

    // Command buffers from the main pool
    virtual std::expected<std::vector<vk::CommandBuffer>, std::string> allocate_command_buffers(
        uint32_t count,
        vk::CommandBufferLevel level
    ) = 0;
    virtual void free_command_buffers(std::span<const vk::CommandBuffer> command_buffers) = 0;

    /**
     * @brief Submit work to the main queue
     *
     * @param submits Batches to submit
     * @param fence Fence signaled once all batches complete, may be null
     */
    [[nodiscard]] virtual vk::Result submit(std::span<const vk::SubmitInfo> submits, vk::Fence fence) = 0;

    /**
     * @brief Block until the device has finished all work
     *
     * Intended to be called exactly once at full shutdown.
     */
    [[nodiscard]] virtual vk::Result wait_idle() = 0;

    // Recording
    [[nodiscard]] virtual vk::Result begin_command_buffer(
        vk::CommandBuffer cmd,
        const vk::CommandBufferBeginInfo& begin_info
    ) = 0;
    [[nodiscard]] virtual vk::Result end_command_buffer(vk::CommandBuffer cmd) = 0;
    virtual void cmd_pipeline_barrier2(vk::CommandBuffer cmd, const vk::DependencyInfo& dependency_info) = 0;
    virtual void cmd_begin_rendering(vk::CommandBuffer cmd, const vk::RenderingInfo& rendering_info) = 0;
    virtual void cmd_end_rendering(vk::CommandBuffer cmd) = 0;
    virtual void cmd_bind_pipeline(vk::CommandBuffer cmd, vk::PipelineBindPoint bind_point, vk::Pipeline pipeline) = 0;
    virtual void cmd_draw(
        vk::CommandBuffer cmd,
        uint32_t vertex_count,
        uint32_t instance_count,
        uint32_t first_vertex,
        uint32_t first_instance
    ) = 0;
    virtual void cmd_set_viewport(vk::CommandBuffer cmd, const vk::Viewport& viewport) = 0;
    virtual void cmd_set_scissor(vk::CommandBuffer cmd, const vk::Rect2D& scissor) = 0;
};

} // namespace lumen

#endif // LUMEN_DEVICECONTEXT_HPP
