#include <catch2/catch_test_macros.hpp>
#include <lumen/VulkanContext.hpp>
#include <vector>

using namespace lumen;

namespace {

vk::QueueFamilyProperties family(vk::QueueFlags flags) {
    return vk::QueueFamilyProperties(flags, 1);
}

const auto GRAPHICS = vk::QueueFlagBits::eGraphics | vk::QueueFlagBits::eCompute | vk::QueueFlagBits::eTransfer;
const auto COMPUTE = vk::QueueFlagBits::eCompute | vk::QueueFlagBits::eTransfer;
const auto TRANSFER = vk::QueueFlags(vk::QueueFlagBits::eTransfer);

} // namespace

TEST_CASE("Queue family selection", "[queues]")
{
    SECTION("single universal family serves everything")
    {
        std::vector<vk::QueueFamilyProperties> families{family(GRAPHICS)};
        auto result = select_queue_families(families, [](uint32_t) { return true; });

        REQUIRE(result);
        REQUIRE(result->main == 0);
        REQUIRE(result->present == 0);
        REQUIRE(result->transfer == 0);
        REQUIRE_FALSE(result->has_dedicated_transfer());
    }

    SECTION("dedicated transfer family is preferred over compute or graphics")
    {
        std::vector<vk::QueueFamilyProperties> families{family(GRAPHICS), family(COMPUTE), family(TRANSFER)};
        auto result = select_queue_families(families, [](uint32_t) { return true; });

        REQUIRE(result);
        REQUIRE(result->main == 0);
        REQUIRE(result->transfer == 2);
        REQUIRE(result->has_dedicated_transfer());
    }

    SECTION("main family presents when it can, even if an earlier family can too")
    {
        std::vector<vk::QueueFamilyProperties> families{family(TRANSFER), family(GRAPHICS)};
        auto result = select_queue_families(families, [](uint32_t) { return true; });

        REQUIRE(result);
        REQUIRE(result->main == 1);
        REQUIRE(result->present == 1);
        REQUIRE(result->transfer == 0);
    }

    SECTION("separate present family when main cannot present")
    {
        std::vector<vk::QueueFamilyProperties> families{family(GRAPHICS), family(COMPUTE)};
        auto result = select_queue_families(families, [](uint32_t index) { return index == 1; });

        REQUIRE(result);
        REQUIRE(result->main == 0);
        REQUIRE(result->present == 1);
        REQUIRE(result->transfer == 0);
    }

    SECTION("missing graphics family is an error")
    {
        std::vector<vk::QueueFamilyProperties> families{family(COMPUTE), family(TRANSFER)};
        auto result = select_queue_families(families, [](uint32_t) { return true; });

        REQUIRE_FALSE(result);
        REQUIRE(result.error() == "Missing required queue family support on targeted GPU");
    }

    SECTION("missing present support is an error")
    {
        std::vector<vk::QueueFamilyProperties> families{family(GRAPHICS), family(TRANSFER)};
        auto result = select_queue_families(families, [](uint32_t) { return false; });

        REQUIRE_FALSE(result);
    }
}
