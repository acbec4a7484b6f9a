#include <catch2/catch_test_macros.hpp>
#include <lumen/CommandBuffer.hpp>
#include <lumen/Logger.hpp>
#include <Support/MockDeviceContext.hpp>

using namespace lumen;
using namespace lumen::test;

TEST_CASE("CommandRecorder begins and ends exactly once", "[command_buffer]")
{
    Logger::instance().set_level(spdlog::level::trace);
    MockDeviceContext device;
    CommandBuffer command_buffer(device, fake_handle<vk::CommandBuffer>(42));

    SECTION("destructor closes an open recording")
    {
        {
            auto recorder = command_buffer.begin();
            REQUIRE(recorder);
            REQUIRE(recorder->is_recording());
            REQUIRE(device.count(Call::eEndCommandBuffer) == 0);
        }
        REQUIRE(device.calls() == std::vector<Call>{Call::eBeginCommandBuffer, Call::eEndCommandBuffer});
        REQUIRE(device.events[0].command_buffer == fake_handle<vk::CommandBuffer>(42));
    }

    SECTION("explicit end is not repeated by the destructor")
    {
        {
            auto recorder = command_buffer.begin();
            REQUIRE(recorder);
            REQUIRE(recorder->end());
            REQUIRE_FALSE(recorder->is_recording());
            REQUIRE(recorder->end());
        }
        REQUIRE(device.count(Call::eEndCommandBuffer) == 1);
    }

    SECTION("moved-from recorder does not close the recording")
    {
        {
            auto recorder = command_buffer.begin();
            REQUIRE(recorder);
            CommandRecorder moved(std::move(*recorder));
            REQUIRE(moved.is_recording());
            REQUIRE_FALSE(recorder->is_recording());
        }
        REQUIRE(device.count(Call::eEndCommandBuffer) == 1);
    }

    SECTION("begin flags are forwarded")
    {
        auto recorder = command_buffer.begin(
            vk::CommandBufferBeginInfo().setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
        REQUIRE(recorder);
        REQUIRE(device.last_begin_flags == vk::CommandBufferUsageFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
    }
}

TEST_CASE("CommandRecorder reports device failures", "[command_buffer]")
{
    MockDeviceContext device;
    CommandBuffer command_buffer(device, fake_handle<vk::CommandBuffer>(7));

    SECTION("failed begin yields an error and never ends")
    {
        device.begin_result = vk::Result::eErrorOutOfHostMemory;
        {
            auto recorder = command_buffer.begin();
            REQUIRE_FALSE(recorder);
            REQUIRE(recorder.error().find("ErrorOutOfHostMemory") != std::string::npos);
        }
        REQUIRE(device.count(Call::eEndCommandBuffer) == 0);
    }

    SECTION("failed end is returned from end()")
    {
        device.end_result = vk::Result::eErrorOutOfDeviceMemory;
        auto recorder = command_buffer.begin();
        REQUIRE(recorder);

        auto result = recorder->end();
        REQUIRE_FALSE(result);
        REQUIRE_FALSE(recorder->is_recording());
        REQUIRE(device.count(Call::eEndCommandBuffer) == 1);
    }
}

TEST_CASE("RenderingRecorder scopes a rendering pass", "[command_buffer]")
{
    MockDeviceContext device;
    CommandBuffer command_buffer(device, fake_handle<vk::CommandBuffer>(3));
    const auto rendering_info = vk::RenderingInfo()
        .setRenderArea(vk::Rect2D({0, 0}, {64, 64}))
        .setLayerCount(1);

    SECTION("pass closes before recording, even when nothing is drawn")
    {
        {
            auto recorder = command_buffer.begin();
            REQUIRE(recorder);
            {
                auto rendering = recorder->begin_rendering(rendering_info);
            }
            REQUIRE(recorder->end());
        }
        REQUIRE(device.calls() == std::vector<Call>{
            Call::eBeginCommandBuffer,
            Call::eBeginRendering,
            Call::eEndRendering,
            Call::eEndCommandBuffer,
        });
        REQUIRE(device.renderings.front().render_area == vk::Rect2D({0, 0}, {64, 64}));
    }

    SECTION("drawing commands go to the outer command buffer")
    {
        auto recorder = command_buffer.begin();
        REQUIRE(recorder);
        {
            auto rendering = recorder->begin_rendering(rendering_info);
            rendering.set_viewport(vk::Viewport(0.0f, 0.0f, 64.0f, 64.0f, 0.0f, 1.0f));
            rendering.set_scissor(vk::Rect2D({0, 0}, {64, 64}));
            rendering.bind_graphics_pipeline(fake_handle<vk::Pipeline>(9));
            rendering.draw(6, 2, 0, 0);
            REQUIRE(&rendering.recorder() == &*recorder);
        }

        for (const auto& event : device.events) {
            REQUIRE(event.command_buffer == fake_handle<vk::CommandBuffer>(3));
        }
        REQUIRE(device.count(Call::eSetViewport) == 1);
        REQUIRE(device.count(Call::eSetScissor) == 1);
        REQUIRE(device.count(Call::eBindPipeline) == 1);
        REQUIRE(device.last_draw == std::pair<uint32_t, uint32_t>{6, 2});
    }
}

TEST_CASE("ImageTransition builds a synchronization2 barrier", "[command_buffer]")
{
    MockDeviceContext device;
    CommandBuffer command_buffer(device, fake_handle<vk::CommandBuffer>(5));

    ImageTransition transition{
        .image = fake_handle<vk::Image>(11),
        .subresource_range = vk::ImageSubresourceRange(vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1),
        .src_state = {
            .stage = vk::PipelineStageFlagBits2::eTransfer,
            .layout = vk::ImageLayout::eTransferDstOptimal,
            .access = vk::AccessFlagBits2::eTransferWrite,
            .queue_family = 1,
        },
        .dst_state = {
            .stage = vk::PipelineStageFlagBits2::eFragmentShader,
            .layout = vk::ImageLayout::eShaderReadOnlyOptimal,
            .access = vk::AccessFlagBits2::eShaderRead,
            .queue_family = 0,
        },
    };

    SECTION("to_barrier copies both sides")
    {
        auto barrier = transition.to_barrier();
        REQUIRE(barrier.image == fake_handle<vk::Image>(11));
        REQUIRE(barrier.oldLayout == vk::ImageLayout::eTransferDstOptimal);
        REQUIRE(barrier.newLayout == vk::ImageLayout::eShaderReadOnlyOptimal);
        REQUIRE(barrier.srcStageMask == vk::PipelineStageFlags2(vk::PipelineStageFlagBits2::eTransfer));
        REQUIRE(barrier.dstStageMask == vk::PipelineStageFlags2(vk::PipelineStageFlagBits2::eFragmentShader));
        REQUIRE(barrier.srcAccessMask == vk::AccessFlags2(vk::AccessFlagBits2::eTransferWrite));
        REQUIRE(barrier.dstAccessMask == vk::AccessFlags2(vk::AccessFlagBits2::eShaderRead));
        REQUIRE(barrier.srcQueueFamilyIndex == 1);
        REQUIRE(barrier.dstQueueFamilyIndex == 0);
    }

    SECTION("image_transition records a single barrier")
    {
        auto recorder = command_buffer.begin();
        REQUIRE(recorder);
        recorder->image_transition(transition);

        REQUIRE(device.barrier_batches.size() == 1);
        REQUIRE(device.barrier_batches[0].size() == 1);
        REQUIRE(device.barrier_batches[0][0].image == fake_handle<vk::Image>(11));
    }
}
