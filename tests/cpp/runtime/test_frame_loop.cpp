#include <stagehand/runtime/frame_loop.h>
#include <stagehand/util/errors.h>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <vector>

using namespace stagehand;
using namespace std::chrono_literals;

TEST_CASE("FrameLoop - rejects a null driver and a non-positive interval", "[runtime][frame_loop]") {
    REQUIRE_THROWS_AS(FrameLoop(nullptr), InvalidArgument);
    REQUIRE_THROWS_AS(FrameLoop(RafDriver::create(), 0ms), InvalidArgument);
}

TEST_CASE("FrameLoop - run_until stops when done", "[runtime][frame_loop]") {
    auto driver = RafDriver::create();
    FrameLoop loop{driver, 1ms};

    std::vector<double> times;
    auto stop = driver->ticker().on_tick([&](double time) { times.push_back(time); });

    auto frames = loop.run_until([&] { return times.size() >= 3; }, 5s);

    REQUIRE(frames == 3);
    REQUIRE(times.size() == 3);
    REQUIRE(times[0] >= 0.0);
    REQUIRE(times[0] <= times[1]);
    REQUIRE(times[1] <= times[2]);
    stop();
}

TEST_CASE("FrameLoop - request_stop from a frame ends the run", "[runtime][frame_loop]") {
    auto driver = RafDriver::create();
    FrameLoop loop{driver, 1ms};

    int ticks = 0;
    auto stop = driver->ticker().on_tick([&](double) {
        if (++ticks == 2) { loop.request_stop(); }
    });

    auto frames = loop.run_for(5s);
    REQUIRE(frames == 2);

    // A later run starts fresh and continues the same timeline
    auto before = driver->ticker().time();
    REQUIRE(loop.run_until([] { return true; }, 1s) == 1);
    REQUIRE(driver->ticker().time() >= before);
    stop();
}

TEST_CASE("FrameLoop - run_for returns after the duration", "[runtime][frame_loop]") {
    auto driver = RafDriver::create();
    FrameLoop loop{driver, 5ms};

    auto started = FrameLoop::clock::now();
    auto frames = loop.run_for(30ms);
    auto elapsed = FrameLoop::clock::now() - started;

    REQUIRE(frames >= 1);
    REQUIRE(elapsed >= 30ms);
    REQUIRE(loop.frame_interval() == 5ms);
}
