#include <stagehand/project/state_editors.h>
#include <stagehand/util/errors.h>

#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace stagehand;

namespace {

const SheetId SCENE{"Scene"};
const ObjectAddressKey BOX{"Box"};

PropLocation box_prop(PropPath path) { return PropLocation{SCENE, BOX, std::move(path)}; }

const BasicKeyframedTrack& track_of(const ProjectSnapshot& snapshot, const PropLocation& prop) {
    const auto* track = find_track(*snapshot.sheets_by_id.at(prop.sheet_id).sequence, prop.object_key,
                                   encode_path_to_prop(prop.path));
    REQUIRE(track != nullptr);
    return *track;
}

}  // namespace

TEST_CASE("set_primitive_prop_as_sequenced - creates the sequence and an empty track", "[project][editors]") {
    ProjectSnapshot snapshot;
    auto prop = box_prop({"position", "x"});

    auto id = set_primitive_prop_as_sequenced(snapshot, prop);

    REQUIRE(id.str().size() == 10);
    const auto& sequence = snapshot.sheets_by_id.at(SCENE).sequence;
    REQUIRE(sequence.has_value());
    REQUIRE(sequence->length == DEFAULT_SEQUENCE_LENGTH);

    const auto& track = track_of(snapshot, prop);
    REQUIRE(track.keyframes.empty());
    REQUIRE(track.debug_name == "position.x");

    REQUIRE(set_primitive_prop_as_sequenced(snapshot, prop) == id);
    REQUIRE(sequence->tracks_by_object.at(BOX).track_data.size() == 1);

    REQUIRE_THROWS_AS(set_primitive_prop_as_sequenced(snapshot, box_prop({})), InvalidArgument);
}

TEST_CASE("set_primitive_prop_as_sequenced - drops the static override of the prop only", "[project][editors]") {
    ProjectSnapshot snapshot;
    set_static_override(snapshot, box_prop({"position", "x"}), 3.0);
    set_static_override(snapshot, box_prop({"position", "y"}), 4.0);

    static_cast<void>(set_primitive_prop_as_sequenced(snapshot, box_prop({"position", "x"})));

    const auto& overrides = snapshot.sheets_by_id.at(SCENE).static_overrides.by_object.at(BOX);
    REQUIRE(overrides.at_path({"position", "x"}).is_undefined());
    REQUIRE(overrides.at_path({"position", "y"}).as_number() == 4.0);
}

TEST_CASE("set_primitive_prop_as_static - removes the track", "[project][editors]") {
    ProjectSnapshot snapshot;
    auto prop = box_prop({"opacity"});
    static_cast<void>(set_primitive_prop_as_sequenced(snapshot, prop));

    set_primitive_prop_as_static(snapshot, prop, 0.5);

    const auto& sheet = snapshot.sheets_by_id.at(SCENE);
    REQUIRE(find_track(*sheet.sequence, BOX, encode_path_to_prop(prop.path)) == nullptr);
    REQUIRE(sheet.sequence->tracks_by_object.at(BOX).track_data.empty());
    REQUIRE(sheet.static_overrides.by_object.at(BOX).at_path({"opacity"}).as_number() == 0.5);
}

TEST_CASE("set_keyframe_at_position - inserts sorted and updates in place", "[project][editors]") {
    ProjectSnapshot snapshot;
    auto prop = box_prop({"x"});
    static_cast<void>(set_primitive_prop_as_sequenced(snapshot, prop));

    auto late = set_keyframe_at_position(snapshot, prop, 2.0, 20.0);
    auto early = set_keyframe_at_position(snapshot, prop, 0.0, 0.0);
    auto middle = set_keyframe_at_position(snapshot, prop, 1.0, 10.0);

    const auto& keyframes = track_of(snapshot, prop).keyframes;
    REQUIRE(keyframes.size() == 3);
    REQUIRE(keyframes[0].id == early);
    REQUIRE(keyframes[1].id == middle);
    REQUIRE(keyframes[2].id == late);
    REQUIRE(keyframes[1].handles == DEFAULT_KEYFRAME_HANDLES);

    REQUIRE(set_keyframe_at_position(snapshot, prop, 1.0, 15.0) == middle);
    REQUIRE(track_of(snapshot, prop).keyframes.size() == 3);
    REQUIRE(track_of(snapshot, prop).keyframes[1].value.as_number() == 15.0);
}

TEST_CASE("set_keyframe_at_position - inherits connected_right from the left neighbour", "[project][editors]") {
    ProjectSnapshot snapshot;
    auto prop = box_prop({"x"});
    static_cast<void>(set_primitive_prop_as_sequenced(snapshot, prop));
    static_cast<void>(set_keyframe_at_position(snapshot, prop, 0.0, 0.0));
    static_cast<void>(set_keyframe_at_position(snapshot, prop, 4.0, 4.0));

    auto& sequence = *snapshot.sheets_by_id.at(SCENE).sequence;
    auto& track = sequence.tracks_by_object.at(BOX).track_data.begin()->second;
    track.keyframes[0].connected_right = false;

    static_cast<void>(set_keyframe_at_position(snapshot, prop, 2.0, 2.0));
    REQUIRE_FALSE(track_of(snapshot, prop).keyframes[1].connected_right);
}

TEST_CASE("set_keyframe_at_position - rejects bad input", "[project][editors]") {
    ProjectSnapshot snapshot;
    auto prop = box_prop({"x"});

    REQUIRE_THROWS_AS(set_keyframe_at_position(snapshot, prop, 1.0, 1.0), InvalidArgument);

    static_cast<void>(set_primitive_prop_as_sequenced(snapshot, prop));
    REQUIRE_THROWS_AS(set_keyframe_at_position(snapshot, prop, -1.0, 1.0), InvalidArgument);
    REQUIRE_THROWS_AS(set_keyframe_at_position(snapshot, prop, std::numeric_limits<double>::quiet_NaN(), 1.0),
                      InvalidArgument);
}

TEST_CASE("delete_keyframes", "[project][editors]") {
    ProjectSnapshot snapshot;
    auto prop = box_prop({"x"});
    static_cast<void>(set_primitive_prop_as_sequenced(snapshot, prop));
    auto a = set_keyframe_at_position(snapshot, prop, 0.0, 0.0);
    auto b = set_keyframe_at_position(snapshot, prop, 1.0, 1.0);
    auto c = set_keyframe_at_position(snapshot, prop, 2.0, 2.0);

    REQUIRE(delete_keyframes(snapshot, prop, {a, c, KeyframeId{"unknown"}}) == 2);

    const auto& keyframes = track_of(snapshot, prop).keyframes;
    REQUIRE(keyframes.size() == 1);
    REQUIRE(keyframes[0].id == b);

    REQUIRE_THROWS_AS(delete_keyframes(snapshot, box_prop({"y"}), {b}), InvalidArgument);
}

TEST_CASE("set_static_override - whole objects merge", "[project][editors]") {
    ProjectSnapshot snapshot;
    set_static_override(snapshot, box_prop({"x"}), 1.0);
    set_static_override(snapshot, box_prop({}), ValueMap{{"y", 2.0}});

    const auto& overrides = snapshot.sheets_by_id.at(SCENE).static_overrides.by_object.at(BOX);
    REQUIRE(overrides.at_path({"x"}).as_number() == 1.0);
    REQUIRE(overrides.at_path({"y"}).as_number() == 2.0);
}
