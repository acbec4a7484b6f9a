#include <catch2/catch_test_macros.hpp>
#include <lumen/Logger.hpp>
#include <Support/LogCapture.hpp>
#include <memory>

using namespace lumen;
using namespace lumen::test;

TEST_CASE("Logger passes trace messages in every build", "[logger]")
{
    auto& logger = Logger::instance();

    SECTION("logger level admits trace")
    {
        REQUIRE(logger.should_log(spdlog::level::trace));
    }

    SECTION("file sink records trace")
    {
        bool found_file_sink = false;
        for (const auto& sink : logger.sinks()) {
            if (std::dynamic_pointer_cast<spdlog::sinks::basic_file_sink_mt>(sink)) {
                found_file_sink = true;
                REQUIRE(sink->level() == spdlog::level::trace);
            }
        }
        REQUIRE(found_file_sink);
    }

    SECTION("trace messages reach attached sinks")
    {
        LogCapture capture;
        Logger::instance().trace("frame slot {} recycled", 1);
        REQUIRE(capture.contains("frame slot 1 recycled"));
    }
}
