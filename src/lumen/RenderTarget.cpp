#include <lumen/RenderTarget.hpp>
#include <lumen/Logger.hpp>

namespace lumen {

bool render_frame(RenderTarget& target, const FrameSyncInfo& sync_info, const FrameCallback& callback) {
    auto frame_render_info = target.acquire(sync_info);
    if (!frame_render_info) {
        Logger::instance().debug("Dropping frame, acquire failed: {}", frame_render_info.error());
        return false;
    }

    callback(*frame_render_info);

    if (auto result = target.present(sync_info, std::move(*frame_render_info)); !result) {
        Logger::instance().warn("Present failed: {}", result.error());
    }
    return true;
}

} // namespace lumen
