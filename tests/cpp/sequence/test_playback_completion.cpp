#include <stagehand/sequence/playback_completion.h>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace stagehand;

TEST_CASE("PlaybackCompletion - resolved completions run continuations immediately", "[sequence][completion]") {
    auto completion = PlaybackCompletion::resolved(true);
    REQUIRE(completion.is_resolved());
    REQUIRE(completion.result() == true);

    bool seen = false;
    completion.then([&](bool finished) { seen = finished; });
    REQUIRE(seen);
}

TEST_CASE("PlaybackCompletion - resolves once", "[sequence][completion]") {
    auto completion = PlaybackCompletion::pending({});
    REQUIRE_FALSE(completion.is_resolved());
    REQUIRE_FALSE(completion.result().has_value());

    std::vector<bool> seen;
    completion.then([&](bool finished) { seen.push_back(finished); });
    completion.then([&](bool finished) { seen.push_back(finished); });

    completion.resolve(true);
    completion.resolve(false);

    REQUIRE(seen == std::vector<bool>{true, true});
    REQUIRE(completion.result() == true);
}

TEST_CASE("PlaybackCompletion - copies share one outcome", "[sequence][completion]") {
    auto completion = PlaybackCompletion::pending({});
    auto copy = completion;
    copy.resolve(false);
    REQUIRE(completion.result() == false);
}

TEST_CASE("PlaybackCompletion - cancel", "[sequence][completion]") {
    int cancels = 0;
    auto completion = PlaybackCompletion::pending([&] { ++cancels; });

    completion.cancel();
    REQUIRE(cancels == 1);
    REQUIRE(completion.result() == false);

    completion.cancel();
    REQUIRE(cancels == 1);

    auto finished = PlaybackCompletion::pending([&] { ++cancels; });
    finished.resolve(true);
    finished.cancel();
    REQUIRE(cancels == 1);
    REQUIRE(finished.result() == true);
}
