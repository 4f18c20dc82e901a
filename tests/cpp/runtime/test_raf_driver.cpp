#include <stagehand/reactive/atom.h>
#include <stagehand/runtime/raf_driver.h>
#include <stagehand/util/errors.h>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace stagehand;

TEST_CASE("RafDriver - names and ids", "[runtime][raf_driver]") {
    auto anonymous = RafDriver::create();
    auto named = RafDriver::create(RafDriverConfig{.name = "display"});

    REQUIRE(anonymous->id() != named->id());
    REQUIRE(anonymous->name() == "CustomRafDriver-" + std::to_string(anonymous->id()));
    REQUIRE(named->name() == "display");
}

TEST_CASE("RafDriver - start and stop follow the observers", "[runtime][raf_driver]") {
    int starts = 0;
    int stops = 0;
    auto driver = RafDriver::create(RafDriverConfig{
        .name = "counted",
        .start = [&] { ++starts; },
        .stop = [&] { ++stops; },
    });
    auto atom = Atom::create(Value{1.0});

    REQUIRE_FALSE(driver->is_active());

    auto first = on_change(atom->pointer(), [](const Value&) {}, *driver);
    auto second = on_change(atom->pointer(), [](const Value&) {}, *driver);
    REQUIRE(driver->is_active());
    REQUIRE(starts == 1);

    first();
    REQUIRE(stops == 0);
    second();
    REQUIRE(stops == 1);
    REQUIRE_FALSE(driver->is_active());
}

TEST_CASE("RafDriver - tick delivers changes", "[runtime][raf_driver]") {
    auto driver = RafDriver::create();
    auto atom = Atom::create(Value{1.0});

    double last = 0.0;
    auto unsubscribe = on_change(atom->pointer(), [&](const Value& v) { last = v.as_number(); }, *driver);
    REQUIRE(last == 1.0);

    atom->set(Value{2.0});
    REQUIRE(last == 1.0);
    driver->tick(16.0);
    REQUIRE(last == 2.0);
    REQUIRE(driver->ticker().time() == 16.0);

    unsubscribe();
}

TEST_CASE("RafDriver - null pointers cannot be observed", "[runtime][raf_driver]") {
    auto driver = RafDriver::create();
    REQUIRE_THROWS_AS(on_change(Pointer{}, [](const Value&) {}, *driver), InvalidArgument);
    REQUIRE_FALSE(driver->is_active());
}
