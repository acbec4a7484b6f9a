#include <catch2/catch_test_macros.hpp>
#include <lumen/SwapchainRenderTarget.hpp>
#include <limits>
#include <vector>

using namespace lumen;

TEST_CASE("Swapchain surface format selection", "[swapchain]")
{
    const vk::SurfaceFormatKHR unorm{vk::Format::eB8G8R8A8Unorm, vk::ColorSpaceKHR::eSrgbNonlinear};
    const vk::SurfaceFormatKHR srgb{vk::Format::eB8G8R8A8Srgb, vk::ColorSpaceKHR::eSrgbNonlinear};
    const vk::SurfaceFormatKHR srgb_hdr{vk::Format::eB8G8R8A8Srgb, vk::ColorSpaceKHR::eExtendedSrgbLinearEXT};

    SECTION("prefers sRGB BGRA with nonlinear sRGB color space")
    {
        std::vector<vk::SurfaceFormatKHR> formats{unorm, srgb_hdr, srgb};
        REQUIRE(choose_surface_format(formats) == srgb);
    }

    SECTION("falls back to the first format")
    {
        std::vector<vk::SurfaceFormatKHR> formats{unorm, srgb_hdr};
        REQUIRE(choose_surface_format(formats) == unorm);
    }
}

TEST_CASE("Swapchain present mode selection", "[swapchain]")
{
    SECTION("prefers mailbox")
    {
        std::vector<vk::PresentModeKHR> modes{
            vk::PresentModeKHR::eFifo, vk::PresentModeKHR::eImmediate, vk::PresentModeKHR::eMailbox
        };
        REQUIRE(choose_present_mode(modes) == vk::PresentModeKHR::eMailbox);
    }

    SECTION("falls back to FIFO")
    {
        std::vector<vk::PresentModeKHR> modes{vk::PresentModeKHR::eImmediate, vk::PresentModeKHR::eFifoRelaxed};
        REQUIRE(choose_present_mode(modes) == vk::PresentModeKHR::eFifo);
    }
}

TEST_CASE("Swapchain extent selection", "[swapchain]")
{
    vk::SurfaceCapabilitiesKHR capabilities;
    capabilities.minImageExtent = vk::Extent2D{64, 64};
    capabilities.maxImageExtent = vk::Extent2D{1920, 1080};

    SECTION("uses the surface's current extent when it is fixed")
    {
        capabilities.currentExtent = vk::Extent2D{800, 600};
        REQUIRE(choose_swapchain_extent(capabilities, {1024, 768}) == vk::Extent2D{800, 600});
    }

    SECTION("uses the framebuffer size when the surface leaves it open")
    {
        constexpr uint32_t open = std::numeric_limits<uint32_t>::max();
        capabilities.currentExtent = vk::Extent2D{open, open};

        REQUIRE(choose_swapchain_extent(capabilities, {1024, 768}) == vk::Extent2D{1024, 768});
        REQUIRE(choose_swapchain_extent(capabilities, {4000, 10}) == vk::Extent2D{1920, 64});
    }
}

TEST_CASE("Swapchain image count selection", "[swapchain]")
{
    vk::SurfaceCapabilitiesKHR capabilities;

    SECTION("one more than the minimum")
    {
        capabilities.minImageCount = 2;
        capabilities.maxImageCount = 8;
        REQUIRE(choose_swapchain_image_count(capabilities) == 3);
    }

    SECTION("capped at the maximum")
    {
        capabilities.minImageCount = 3;
        capabilities.maxImageCount = 3;
        REQUIRE(choose_swapchain_image_count(capabilities) == 3);
    }

    SECTION("zero maximum means unbounded")
    {
        capabilities.minImageCount = 4;
        capabilities.maxImageCount = 0;
        REQUIRE(choose_swapchain_image_count(capabilities) == 5);
    }
}
