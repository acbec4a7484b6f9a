#include <catch2/catch_test_macros.hpp>
#include <lumen/Common.hpp>
#include <Support/MockDeviceContext.hpp>
#include <array>

using namespace lumen::test;

// Drives the same Vulkan-Hpp wrappers VulkanContext calls, with entry points
// that fail, to check error results come back as values.

namespace {

VKAPI_ATTR VkResult VKAPI_CALL lost_queue_submit(VkQueue, uint32_t, const VkSubmitInfo*, VkFence) {
    return VK_ERROR_DEVICE_LOST;
}

VKAPI_ATTR VkResult VKAPI_CALL lost_wait_for_fences(VkDevice, uint32_t, const VkFence*, VkBool32, uint64_t) {
    return VK_ERROR_DEVICE_LOST;
}

VKAPI_ATTR VkResult VKAPI_CALL oom_reset_fences(VkDevice, uint32_t, const VkFence*) {
    return VK_ERROR_OUT_OF_DEVICE_MEMORY;
}

VKAPI_ATTR VkResult VKAPI_CALL oom_begin_command_buffer(VkCommandBuffer, const VkCommandBufferBeginInfo*) {
    return VK_ERROR_OUT_OF_HOST_MEMORY;
}

VKAPI_ATTR VkResult VKAPI_CALL oom_end_command_buffer(VkCommandBuffer) {
    return VK_ERROR_OUT_OF_HOST_MEMORY;
}

VULKAN_HPP_DEFAULT_DISPATCHER_TYPE failing_dispatcher() {
    VULKAN_HPP_DEFAULT_DISPATCHER_TYPE dispatcher;
    dispatcher.vkQueueSubmit = &lost_queue_submit;
    dispatcher.vkWaitForFences = &lost_wait_for_fences;
    dispatcher.vkResetFences = &oom_reset_fences;
    dispatcher.vkBeginCommandBuffer = &oom_begin_command_buffer;
    dispatcher.vkEndCommandBuffer = &oom_end_command_buffer;
    return dispatcher;
}

} // namespace

TEST_CASE("Vulkan error results are returned, not asserted", "[results]")
{
    const auto dispatcher = failing_dispatcher();
    const auto device = fake_handle<vk::Device>(1);
    const auto fence = fake_handle<vk::Fence>(2);

    SECTION("queue submission")
    {
        const auto queue = fake_handle<vk::Queue>(3);
        auto result = queue.submit(vk::SubmitInfo(), fence, dispatcher);
        REQUIRE(result == vk::Result::eErrorDeviceLost);
    }

    SECTION("fence wait and reset")
    {
        std::array<vk::Fence, 1> fences{fence};
        REQUIRE(device.waitForFences(fences, vk::True, 0, dispatcher) == vk::Result::eErrorDeviceLost);
        REQUIRE(device.resetFences(fences, dispatcher) == vk::Result::eErrorOutOfDeviceMemory);
    }

    SECTION("command buffer begin and end")
    {
        const auto command_buffer = fake_handle<vk::CommandBuffer>(4);
        REQUIRE(command_buffer.begin(vk::CommandBufferBeginInfo(), dispatcher) == vk::Result::eErrorOutOfHostMemory);
        REQUIRE(command_buffer.end(dispatcher) == vk::Result::eErrorOutOfHostMemory);
    }
}
