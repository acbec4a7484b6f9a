#ifndef LUMEN_VULKANCONTEXT_HPP
#define LUMEN_VULKANCONTEXT_HPP

#include "Common.hpp"
#include "DeviceContext.hpp"
#include <functional>
#include <span>
#include <string_view>

namespace lumen {

struct Queues
{
    vk::Queue main;
    vk::Queue present;
    vk::Queue transfer;
};

/**
 * @brief Pick main, present and transfer queue families
 *
 * main is the first graphics-capable family, present prefers main when main
 * can present. transfer is the first transfer-only family (no graphics, no
 * compute); when the GPU has none it falls back to main.
 *
 * @param families Queue family properties of the physical device
 * @param supports_present Whether the family at an index can present
 * @return Chosen families, or an error if no graphics or no present family exists
 */
std::expected<QueueFamilyInfo, std::string> select_queue_families(
    std::span<const vk::QueueFamilyProperties> families,
    const std::function<bool(uint32_t)>& supports_present
);

class VulkanContext final : public DeviceContext
{
public:
    explicit VulkanContext(std::string_view title);
    ~VulkanContext() override;

    VulkanContext(const VulkanContext&) = delete;
    VulkanContext& operator=(const VulkanContext&) = delete;
    VulkanContext(VulkanContext&&) = delete;
    VulkanContext& operator=(VulkanContext&&) = delete;

    [[nodiscard]] vk::Instance instance() const { return m_instance; }
    [[nodiscard]] vk::PhysicalDevice physical_device() const { return m_physical_device; }
    [[nodiscard]] vk::Device device() const { return m_device; }
    [[nodiscard]] const Queues& queues() const { return m_queues; }
    [[nodiscard]] vk::CommandPool main_pool() const { return m_main_pool; }

    [[nodiscard]] const QueueFamilyInfo& queue_families() const override { return m_queue_families; }

    std::expected<vk::Semaphore, std::string> create_semaphore() override;
    std::expected<vk::Fence, std::string> create_fence(bool signaled) override;
    void destroy_semaphore(vk::Semaphore semaphore) override;
    void destroy_fence(vk::Fence fence) override;

    [[nodiscard]] vk::Result wait_for_fences(std::span<const vk::Fence> fences, uint64_t timeout) override;
    [[nodiscard]] vk::Result reset_fence(vk::Fence fence) override;

    std::expected<std::vector<vk::CommandBuffer>, std::string> allocate_command_buffers(
        uint32_t count,
        vk::CommandBufferLevel level
    ) override;
    void free_command_buffers(std::span<const vk::CommandBuffer> command_buffers) override;

    [[nodiscard]] vk::Result submit(std::span<const vk::SubmitInfo> submits, vk::Fence fence) override;
    [[nodiscard]] vk::Result wait_idle() override;

    [[nodiscard]] vk::Result begin_command_buffer(
        vk::CommandBuffer cmd,
        const vk::CommandBufferBeginInfo& begin_info
    ) override;
    [[nodiscard]] vk::Result end_command_buffer(vk::CommandBuffer cmd) override;
    void cmd_pipeline_barrier2(vk::CommandBuffer cmd, const vk::DependencyInfo& dependency_info) override;
    void cmd_begin_rendering(vk::CommandBuffer cmd, const vk::RenderingInfo& rendering_info) override;
    void cmd_end_rendering(vk::CommandBuffer cmd) override;
    void cmd_bind_pipeline(vk::CommandBuffer cmd, vk::PipelineBindPoint bind_point, vk::Pipeline pipeline) override;
    void cmd_draw(
        vk::CommandBuffer cmd,
        uint32_t vertex_count,
        uint32_t instance_count,
        uint32_t first_vertex,
        uint32_t first_instance
    ) override;
    void cmd_set_viewport(vk::CommandBuffer cmd, const vk::Viewport& viewport) override;
    void cmd_set_scissor(vk::CommandBuffer cmd, const vk::Rect2D& scissor) override;

private:
    vk::Instance m_instance;
    vk::DebugUtilsMessengerEXT m_debug_messenger;
    vk::PhysicalDevice m_physical_device;
    QueueFamilyInfo m_queue_families;
    vk::Device m_device;
    Queues m_queues;
    vk::CommandPool m_main_pool;
};

} // namespace lumen

#endif // LUMEN_VULKANCONTEXT_HPP
