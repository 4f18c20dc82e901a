#include <stagehand/project/state_editors.h>
#include <stagehand/runtime/core_context.h>
#include <stagehand/util/errors.h>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <vector>

using namespace stagehand;
using Catch::Approx;

namespace {

const PropLocation BOX_X{SheetId{"Scene"}, ObjectAddressKey{"Box"}, {"x"}};

ProjectSnapshot animated_state(double length = 2.0) {
    ProjectSnapshot state;
    set_primitive_prop_as_sequenced(state, BOX_X);
    state.sheets_by_id[SheetId{"Scene"}].sequence->length = length;
    set_keyframe_at_position(state, BOX_X, 0.0, 0.0);
    set_keyframe_at_position(state, BOX_X, 1.0, 100.0);
    return state;
}

struct RecordingAudio : AudioSync {
    void on_frame(const PlaybackFrame& frame) override { frames.push_back(frame); }

    std::vector<PlaybackFrame> frames;
};

}  // namespace

TEST_CASE("Sequence - created on first use with the snapshot length", "[project][sequence]") {
    CoreContext core;
    auto project = core.project(ProjectId{"demo"}, ProjectConfig{.state = animated_state(2.0)});
    auto sheet = project.sheet(SheetId{"Scene"});

    auto sequence = sheet.sequence();
    REQUIRE(sequence == sheet.sequence());
    REQUIRE(sequence.sheet() == sheet);
    REQUIRE(sequence.length() == 2.0);
    REQUIRE(sequence.position() == 0.0);
    REQUIRE(sequence.state() == PlaybackState::idle);
    REQUIRE(val(sequence.pointer()["subUnitsPerUnit"]).as_number() == DEFAULT_SUB_UNITS_PER_UNIT);

    auto empty = core.project(ProjectId{"empty"}).sheet(SheetId{"Scene"}).sequence();
    REQUIRE(empty.length() == DEFAULT_SEQUENCE_LENGTH);
}

TEST_CASE("Sequence - sequenced props follow the position", "[project][sequence]") {
    CoreContext core;
    auto project = core.project(ProjectId{"demo"}, ProjectConfig{.state = animated_state()});
    auto sheet = project.sheet(SheetId{"Scene"});
    auto box = sheet.object(ObjectAddressKey{"Box"}, {{"x", 0.0}, {"y", 7.0}});

    REQUIRE(box.value().at_path({"x"}).as_number() == 0.0);

    auto sequence = sheet.sequence();
    sequence.set_position(1.0);
    REQUIRE(box.value().at_path({"x"}).as_number() == 100.0);

    sequence.set_position(0.5);
    REQUIRE(box.value().at_path({"x"}).as_number() == Approx(50.0).margin(1e-4));

    sequence.set_position(2.0);
    REQUIRE(box.value().at_path({"x"}).as_number() == 100.0);
    REQUIRE(box.value().at_path({"y"}).as_number() == 7.0);
}

TEST_CASE("Sequence - sequenced values beat initial values", "[project][sequence]") {
    CoreContext core;
    auto project = core.project(ProjectId{"demo"}, ProjectConfig{.state = animated_state()});
    auto box = project.sheet(SheetId{"Scene"}).object(ObjectAddressKey{"Box"}, {{"x", 0.0}});

    box.set_initial_value(ValueMap{{"x", 42.0}});
    REQUIRE(box.value().at_path({"x"}).as_number() == 0.0);
}

TEST_CASE("Sequence - playback drives observers once per tick", "[project][sequence]") {
    CoreContext core;
    auto project = core.project(ProjectId{"demo"}, ProjectConfig{.state = animated_state()});
    auto sheet = project.sheet(SheetId{"Scene"});
    auto box = sheet.object(ObjectAddressKey{"Box"}, {{"x", 0.0}});
    auto sequence = sheet.sequence();
    auto driver = core.default_raf_driver();

    std::vector<double> seen;
    auto unsubscribe = core.on_change(box.props()["x"], [&](const Value& v) { seen.push_back(v.as_number()); });
    seen.clear();

    auto completion = sequence.play(PlayOptions{.range = PlaybackRange{0.0, 1.0}});
    REQUIRE(sequence.is_playing());
    REQUIRE(val(sequence.pointer()["playing"]).as_bool());

    driver->tick(0.0);
    driver->tick(500.0);
    REQUIRE(seen.size() == 1);
    REQUIRE(seen.back() == Approx(50.0).margin(1e-4));

    driver->tick(1000.0);
    REQUIRE(seen.back() == 100.0);
    REQUIRE(completion.result() == true);
    REQUIRE_FALSE(sequence.is_playing());

    unsubscribe();
}

TEST_CASE("Sequence - reload_state re-seeds live objects", "[project][sequence]") {
    CoreContext core;
    auto project = core.project(ProjectId{"demo"});
    auto sheet = project.sheet(SheetId{"Scene"});
    auto box = sheet.object(ObjectAddressKey{"Box"}, {{"x", 0.0}});
    auto sequence = sheet.sequence();
    sequence.set_position(1.0);
    REQUIRE(box.value().at_path({"x"}).as_number() == 0.0);

    project.reload_state(animated_state(4.0));
    REQUIRE(sequence.length() == 4.0);
    REQUIRE(box.value().at_path({"x"}).as_number() == 100.0);

    ProjectSnapshot bad;
    bad.definition_version = "1.0.0";
    REQUIRE_THROWS_AS(project.reload_state(bad), SchemaVersionMismatch);
    REQUIRE(project.state().sheets_by_id.contains(SheetId{"Scene"}));

    project.reload_state(ProjectSnapshot{});
    REQUIRE(box.value().at_path({"x"}).as_number() == 0.0);
    REQUIRE(sequence.length() == DEFAULT_SEQUENCE_LENGTH);
}

TEST_CASE("Sequence - keyframes of a prop", "[project][sequence]") {
    CoreContext core;
    auto project = core.project(ProjectId{"demo"}, ProjectConfig{.state = animated_state()});
    auto sheet = project.sheet(SheetId{"Scene"});
    auto box = sheet.object(ObjectAddressKey{"Box"}, {{"x", 0.0}, {"y", 0.0}});
    auto sequence = sheet.sequence();

    auto keyframes = sequence.keyframes(box.props()["x"]);
    REQUIRE(keyframes.size() == 2);
    REQUIRE(keyframes[0].position == 0.0);
    REQUIRE(keyframes[1].value.as_number() == 100.0);

    REQUIRE(sequence.keyframes(box.props()["y"]).empty());

    auto other = project.sheet(SheetId{"Other"}).object(ObjectAddressKey{"Box"}, {{"x", 0.0}});
    REQUIRE_THROWS_AS(sequence.keyframes(other.props()["x"]), InvalidArgument);
}

TEST_CASE("Sequence - attached audio receives frames", "[project][sequence]") {
    CoreContext core;
    auto sequence = core.project(ProjectId{"demo"}, ProjectConfig{.state = animated_state()})
                        .sheet(SheetId{"Scene"})
                        .sequence();
    auto audio = std::make_shared<RecordingAudio>();
    sequence.attach_audio(audio);

    auto completion = sequence.play(PlayOptions{.rate = 2.0});
    core.default_raf_driver()->tick(0.0);
    core.default_raf_driver()->tick(250.0);

    REQUIRE_FALSE(audio->frames.empty());
    REQUIRE(audio->frames.back().playing);
    REQUIRE(audio->frames.back().rate == 2.0);
    REQUIRE(audio->frames.back().position == Approx(0.5));

    sequence.pause();
    REQUIRE_FALSE(audio->frames.back().playing);
    REQUIRE(completion.result() == false);

    const auto count = audio->frames.size();
    sequence.attach_audio(nullptr);
    sequence.set_position(1.0);
    REQUIRE(audio->frames.size() == count);
}
