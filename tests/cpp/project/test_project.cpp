#include <stagehand/project/state_editors.h>
#include <stagehand/runtime/core_context.h>
#include <stagehand/util/errors.h>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace stagehand;

TEST_CASE("CoreContext - project ids", "[project]") {
    CoreContext core;

    REQUIRE_THROWS_AS(core.project(ProjectId{"ab"}), InvalidArgument);
    REQUIRE_THROWS_AS(core.project(ProjectId{" demo"}), InvalidArgument);
    REQUIRE_THROWS_AS(core.project(ProjectId{""}), InvalidArgument);

    auto project = core.project(ProjectId{"demo"});
    REQUIRE(project.id() == ProjectId{"demo"});
    REQUIRE(project.is_ready());
    REQUIRE(to_string(project.address()) == "demo");
}

TEST_CASE("CoreContext - asking twice returns the same project", "[project]") {
    CoreContext core;
    auto first = core.project(ProjectId{"demo"});
    auto second = core.project(ProjectId{"demo"});
    REQUIRE(first == second);

    ProjectConfig other;
    other.assets.base_url = "https://cdn.example.com";
    REQUIRE_THROWS_AS(core.project(ProjectId{"demo"}, other), InvalidArgument);
}

TEST_CASE("CoreContext - a snapshot at another version registers nothing", "[project]") {
    CoreContext core;
    ProjectSnapshot old;
    old.definition_version = "0.3.0";

    REQUIRE_THROWS_AS(core.project(ProjectId{"legacy"}, ProjectConfig{.state = old}), SchemaVersionMismatch);
    REQUIRE_FALSE(core.registry().find_project(ProjectId{"legacy"}).has_value());

    // The id is still free
    auto project = core.project(ProjectId{"legacy"});
    REQUIRE(project.state().definition_version == CURRENT_DEFINITION_VERSION);
}

TEST_CASE("Project - asset urls", "[project]") {
    CoreContext core;
    auto project = core.project(ProjectId{"demo"},
                                ProjectConfig{.assets = AssetsConfig{"https://cdn.example.com/assets/"}});

    REQUIRE(project.asset_url(Asset{AssetKind::image, "hero.png"}) == "https://cdn.example.com/assets/hero.png");
    REQUIRE_FALSE(project.asset_url(Asset{AssetKind::file, std::nullopt}).has_value());

    auto bare = core.project(ProjectId{"bare"});
    REQUIRE(bare.asset_url(Asset{AssetKind::file, "a.wav"}) == "/a.wav");
}

TEST_CASE("Sheet - instances and addresses", "[project][sheet]") {
    CoreContext core;
    auto project = core.project(ProjectId{"demo"});

    auto scene = project.sheet(SheetId{"Scene"});
    REQUIRE(scene == project.sheet(SheetId{"Scene"}, SheetInstanceId{"default"}));
    REQUIRE(to_string(scene.address()) == "demo/Scene#default");
    REQUIRE(scene.project() == project);

    auto second = project.sheet(SheetId{"Scene"}, SheetInstanceId{"second"});
    REQUIRE_FALSE(scene == second);
    REQUIRE(second.address().sheet_instance_id == SheetInstanceId{"second"});

    REQUIRE_THROWS_AS(project.sheet(SheetId{""}), InvalidArgument);
}

TEST_CASE("SheetObject - values start at the defaults", "[project][object]") {
    CoreContext core;
    auto sheet = core.project(ProjectId{"demo"}).sheet(SheetId{"Scene"});
    auto box = sheet.object(ObjectAddressKey{"Box"},
                            {{"position", {{"x", 0.0}, {"y", 1.0}}}, {"visible", true}, {"label", "box"}});

    REQUIRE(to_string(box.address()) == "demo/Scene#default/Box");
    REQUIRE(box.sheet() == sheet);
    REQUIRE(box.config().kind() == PropTypeKind::compound);
    REQUIRE(box.value().at_path({"position", "y"}).as_number() == 1.0);
    REQUIRE(box.value().at_path({"visible"}).as_bool());
    REQUIRE(val(box.props()["label"]).as_string() == "box");
}

TEST_CASE("SheetObject - identity and reconfiguration", "[project][object]") {
    CoreContext core;
    auto sheet = core.project(ProjectId{"demo"}).sheet(SheetId{"Scene"});
    auto box = sheet.object(ObjectAddressKey{"Box"}, {{"x", 0.0}});

    REQUIRE(sheet.object(ObjectAddressKey{"Box"}, {{"x", 0.0}}) == box);
    REQUIRE(sheet.existing_object(ObjectAddressKey{"Box"}) == box);
    REQUIRE_FALSE(sheet.existing_object(ObjectAddressKey{"Ball"}).has_value());

    REQUIRE_THROWS_AS(sheet.object(ObjectAddressKey{"Box"}, {{"x", 0.0}, {"y", 0.0}}), InvalidArgument);
    REQUIRE_THROWS_AS(sheet.object(ObjectAddressKey{"Scalar"}, 1.0), InvalidArgument);

    box.set_initial_value(ValueMap{{"x", 4.0}});
    auto reconfigured = sheet.object(ObjectAddressKey{"Box"}, {{"x", 0.0}, {"y", 2.0}}, ObjectOptions{.reconfigure = true});
    REQUIRE(reconfigured == box);
    REQUIRE(box.value().at_path({"x"}).as_number() == 4.0);
    REQUIRE(box.value().at_path({"y"}).as_number() == 2.0);
}

TEST_CASE("SheetObject - initial values and static overrides", "[project][object]") {
    ProjectSnapshot state;
    set_static_override(state, PropLocation{SheetId{"Scene"}, ObjectAddressKey{"Box"}, {"x"}}, 5.0);

    CoreContext core;
    auto project = core.project(ProjectId{"demo"}, ProjectConfig{.state = state});
    auto box = project.sheet(SheetId{"Scene"}).object(ObjectAddressKey{"Box"}, {{"x", 0.0}, {"y", 0.0}});

    REQUIRE(box.value().at_path({"x"}).as_number() == 5.0);

    box.set_initial_value(ValueMap{{"x", 1.0}, {"y", 2.0}});
    REQUIRE(box.value().at_path({"x"}).as_number() == 5.0);
    REQUIRE(box.value().at_path({"y"}).as_number() == 2.0);

    REQUIRE_THROWS_AS(box.set_initial_value(Value{3.0}), InvalidArgument);

    // Overrides that do not fit the prop are ignored
    auto edited = project.state();
    set_static_override(edited, PropLocation{SheetId{"Scene"}, ObjectAddressKey{"Box"}, {"x"}}, "wide");
    project.reload_state(edited);
    REQUIRE(box.value().at_path({"x"}).as_number() == 1.0);
}

TEST_CASE("SheetObject - on_values_change", "[project][object]") {
    CoreContext core;
    auto box = core.project(ProjectId{"demo"}).sheet(SheetId{"Scene"}).object(ObjectAddressKey{"Box"}, {{"x", 0.0}});

    std::vector<double> seen;
    auto unsubscribe = box.on_values_change([&](const Value& v) { seen.push_back(v.at_path({"x"}).as_number()); });
    REQUIRE(seen == std::vector<double>{0.0});

    box.set_initial_value(ValueMap{{"x", 1.0}});
    box.set_initial_value(ValueMap{{"x", 2.0}});
    REQUIRE(seen.size() == 1);

    core.default_raf_driver()->tick(16.0);
    REQUIRE(seen == std::vector<double>{0.0, 2.0});

    unsubscribe();
    unsubscribe();
    REQUIRE_FALSE(core.default_raf_driver()->is_active());
}

TEST_CASE("SheetObject - detach", "[project][object]") {
    CoreContext core;
    auto sheet = core.project(ProjectId{"demo"}).sheet(SheetId{"Scene"});
    auto box = sheet.object(ObjectAddressKey{"Box"}, {{"x", 0.0}});
    box.set_initial_value(ValueMap{{"x", 3.0}});
    auto pointer = box.props()["x"];

    sheet.detach_object(ObjectAddressKey{"Box"});
    REQUIRE(box.is_detached());
    REQUIRE_THROWS_AS(box.value(), InvalidArgument);
    REQUIRE_THROWS_AS(box.set_initial_value(ValueMap{{"x", 1.0}}), InvalidArgument);
    REQUIRE_FALSE(sheet.existing_object(ObjectAddressKey{"Box"}).has_value());

    // Outstanding pointers still read the last value
    REQUIRE(val(pointer).as_number() == 3.0);

    // Detaching twice only logs
    REQUIRE_NOTHROW(sheet.detach_object(ObjectAddressKey{"Box"}));

    auto fresh = sheet.object(ObjectAddressKey{"Box"}, {{"x", 0.0}});
    REQUIRE_FALSE(fresh == box);
    REQUIRE(fresh.value().at_path({"x"}).as_number() == 0.0);
}
