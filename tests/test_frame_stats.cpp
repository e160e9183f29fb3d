#include <catch2/catch.hpp>

#include "vista/core/FrameStats.hpp"

using vista::core::FpsCounter;

TEST_CASE("FPS counter windows", "[stats]")
{
    FpsCounter counter;

    SECTION("starts at zero and the first frame only anchors")
    {
        REQUIRE(counter.Fps() == 0.0F);
        REQUIRE_FALSE(counter.AddFrame(5000.0));
        REQUIRE(counter.Fps() == 0.0F);
    }

    SECTION("reports frames per second when a window closes")
    {
        REQUIRE_FALSE(counter.AddFrame(0.0));
        for (int frame = 1; frame < 60; ++frame)
        {
            REQUIRE_FALSE(counter.AddFrame(frame * 1000.0 / 60.0));
        }
        REQUIRE(counter.AddFrame(1001.0));
        REQUIRE(counter.Fps() == 60.0F);
    }

    SECTION("rounds to the nearest whole frame rate")
    {
        counter.AddFrame(0.0);
        counter.AddFrame(400.0);
        counter.AddFrame(800.0);
        REQUIRE(counter.AddFrame(1100.0));
        // 3 frames over 1.1 s.
        REQUIRE(counter.Fps() == 3.0F);
    }

    SECTION("value holds until the next window closes")
    {
        counter.AddFrame(0.0);
        REQUIRE(counter.AddFrame(1000.0));
        REQUIRE(counter.Fps() == 1.0F);
        REQUIRE_FALSE(counter.AddFrame(1500.0));
        REQUIRE(counter.Fps() == 1.0F);
        REQUIRE(counter.AddFrame(2000.0));
        REQUIRE(counter.Fps() == 2.0F);
    }

    SECTION("backwards clock counts as zero time")
    {
        counter.AddFrame(1000.0);
        REQUIRE_FALSE(counter.AddFrame(500.0));
        REQUIRE_FALSE(counter.AddFrame(1400.0));
        REQUIRE(counter.AddFrame(1500.0));
        REQUIRE(counter.Fps() == 3.0F);
    }

    SECTION("reset clears the value and anchor")
    {
        counter.AddFrame(0.0);
        counter.AddFrame(1000.0);
        counter.Reset();
        REQUIRE(counter.Fps() == 0.0F);
        REQUIRE_FALSE(counter.AddFrame(3000.0));
    }
}

TEST_CASE("FPS counter custom window", "[stats]")
{
    FpsCounter counter(250.0);
    REQUIRE(counter.WindowMs() == 250.0);
    counter.AddFrame(0.0);
    counter.AddFrame(125.0);
    REQUIRE(counter.AddFrame(250.0));
    REQUIRE(counter.Fps() == 8.0F);
}
