#include <catch2/catch_test_macros.hpp>
#include <lumen/ImageRenderTarget.hpp>
#include <lumen/PrimaryRenderer.hpp>
#include <Support/MockDeviceContext.hpp>

using namespace lumen;
using namespace lumen::test;

namespace {

void empty_draw(RenderingRecorder&, const FrameRenderInfo&) {}

} // namespace

TEST_CASE("ImageRenderTarget forwards frame semaphores", "[render_target]")
{
    MockDeviceContext device;
    const FrameRenderAttachmentImageState sampled{
        vk::ImageLayout::eShaderReadOnlyOptimal, vk::AccessFlagBits2::eShaderRead, 0
    };
    ImageRenderTarget target(
        device,
        fake_handle<vk::Image>(10),
        fake_handle<vk::ImageView>(11),
        vk::Format::eR8G8B8A8Unorm,
        vk::Extent2D{256, 256},
        sampled
    );
    const FrameSyncInfo sync_info{
        .image_available = fake_handle<vk::Semaphore>(1),
        .render_finished = fake_handle<vk::Semaphore>(2),
    };

    SECTION("acquire signals image_available with an empty batch")
    {
        auto frame = target.acquire(sync_info);
        REQUIRE(frame);
        REQUIRE(device.submits.size() == 1);
        REQUIRE(device.submits[0].command_buffers.empty());
        REQUIRE(device.submits[0].wait_semaphores.empty());
        REQUIRE(device.submits[0].signal_semaphores == std::vector<vk::Semaphore>{sync_info.image_available});
        REQUIRE_FALSE(device.submits[0].fence);
    }

    SECTION("acquire describes the wrapped image")
    {
        auto frame = target.acquire(sync_info);
        REQUIRE(frame);
        REQUIRE(frame->extent == vk::Extent2D{256, 256});
        REQUIRE(frame->color_attachments.size() == 1);

        const auto& attachment = frame->color_attachments.front();
        REQUIRE(attachment.image == fake_handle<vk::Image>(10));
        REQUIRE(attachment.image_view == fake_handle<vk::ImageView>(11));
        REQUIRE(attachment.format == vk::Format::eR8G8B8A8Unorm);
        REQUIRE(attachment.initial_state.layout == vk::ImageLayout::eUndefined);
        REQUIRE(attachment.final_state == sampled);
    }

    SECTION("present waits on render_finished and remembers the final state")
    {
        auto frame = target.acquire(sync_info);
        REQUIRE(frame);
        REQUIRE(target.present(sync_info, *frame));

        REQUIRE(device.submits.size() == 2);
        REQUIRE(device.submits[1].wait_semaphores == std::vector<vk::Semaphore>{sync_info.render_finished});
        REQUIRE(device.submits[1].wait_stages == std::vector<vk::PipelineStageFlags>{vk::PipelineStageFlagBits::eAllCommands});
        REQUIRE(device.submits[1].signal_semaphores.empty());
        REQUIRE(target.current_state() == sampled);

        auto next = target.acquire(sync_info);
        REQUIRE(next);
        REQUIRE(next->color_attachments.front().initial_state == sampled);
    }

    SECTION("submission failures surface as errors")
    {
        device.submit_result = vk::Result::eErrorDeviceLost;
        REQUIRE_FALSE(target.acquire(sync_info));
    }
}

TEST_CASE("ImageRenderTarget in the rendering state needs no steady-state barriers", "[render_target][renderer]")
{
    MockDeviceContext device;
    auto renderer = PrimaryRenderer::create(device);
    REQUIRE(renderer);

    ImageRenderTarget target(
        device,
        fake_handle<vk::Image>(10),
        fake_handle<vk::ImageView>(11),
        vk::Format::eR8G8B8A8Unorm,
        vk::Extent2D{256, 256},
        canonical_attachment_state(device.families.main)
    );

    REQUIRE((*renderer)->render_to_target(target, empty_draw) == FrameStatus::eRendered);
    REQUIRE(device.barrier_batches.size() == 1);
    REQUIRE(device.barrier_batches[0][0].oldLayout == vk::ImageLayout::eUndefined);

    for (int frame = 0; frame < 4; ++frame) {
        REQUIRE((*renderer)->render_to_target(target, empty_draw) == FrameStatus::eRendered);
    }
    REQUIRE(device.barrier_batches.size() == 1);
    REQUIRE(device.count(Call::ePipelineBarrier) == 1);
}
