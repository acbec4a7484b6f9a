#include <catch2/catch_test_macros.hpp>
#include <lumen/RenderTarget.hpp>
#include <Support/MockDeviceContext.hpp>

using namespace lumen;
using namespace lumen::test;

namespace {

FrameRenderInfo mock_frame() {
    FrameRenderAttachmentImageState state{vk::ImageLayout::eUndefined, vk::AccessFlagBits2::eNone, 0};
    return FrameRenderInfo{
        .color_attachments = {make_attachment(0, state, state)},
        .extent = vk::Extent2D{100, 50},
        .image_index = 3,
    };
}

} // namespace

TEST_CASE("render_frame acquires, runs the callback, presents", "[render_target]")
{
    MockDeviceContext device;
    MockRenderTarget target(device, mock_frame());
    const FrameSyncInfo sync_info{
        .image_available = fake_handle<vk::Semaphore>(1),
        .render_finished = fake_handle<vk::Semaphore>(2),
    };

    SECTION("successful acquire runs the callback between acquire and present")
    {
        uint32_t seen_index = 0;
        bool rendered = render_frame(target, sync_info, [&](const FrameRenderInfo& info) {
            device.log(Call::eDraw);
            seen_index = info.image_index;
        });

        REQUIRE(rendered);
        REQUIRE(seen_index == 3);
        REQUIRE(device.calls() == std::vector<Call>{Call::eAcquire, Call::eDraw, Call::ePresent});
        REQUIRE(target.presented.front().render_finished == sync_info.render_finished);
    }

    SECTION("failed acquire drops the frame")
    {
        target.fail_acquire = true;
        bool callback_ran = false;

        REQUIRE_FALSE(render_frame(target, sync_info, [&](const FrameRenderInfo&) { callback_ran = true; }));
        REQUIRE_FALSE(callback_ran);
        REQUIRE(target.presented.empty());
    }

    SECTION("present failure is not reported as a dropped frame")
    {
        target.fail_present = true;
        REQUIRE(render_frame(target, sync_info, [](const FrameRenderInfo&) {}));
        REQUIRE(target.presented.size() == 1);
    }
}
