#include <stagehand/util/errors.h>
#include <stagehand/value/value.h>

#include <catch2/catch_test_macros.hpp>

using namespace stagehand;

namespace {

Value box() {
    return ValueMap{{"position", ValueMap{{"x", 1.0}, {"y", 2.0}}}, {"visible", true}, {"name", "box"}};
}

}  // namespace

TEST_CASE("Value - kinds and accessors", "[value]") {
    REQUIRE(Value{}.is_undefined());
    REQUIRE(Value{true}.as_bool());
    REQUIRE(Value{3}.as_number() == 3.0);
    REQUIRE(Value{"text"}.as_string() == "text");
    REQUIRE(Value{Rgba{1.0, 0.5, 0.0, 1.0}}.as_rgba() == Rgba{1.0, 0.5, 0.0, 1.0});
    REQUIRE(Value{Asset{AssetKind::image, "hero.png"}}.as_asset().id == "hero.png");
    REQUIRE(Value{ValueList{1.0, 2.0}}.as_list().size() == 2);

    REQUIRE_THROWS_AS(Value{1.0}.as_string(), InvalidArgument);
    REQUIRE_THROWS_AS(Value{}.as_map(), InvalidArgument);
}

TEST_CASE("Value - path reads", "[value]") {
    auto v = box();
    REQUIRE(v.at_path({"position", "x"}).as_number() == 1.0);
    REQUIRE(v.at_path({}) == v);
    REQUIRE(v.at_path({"position", "z"}).is_undefined());
    REQUIRE(v.at_path({"name", "length"}).is_undefined());
    REQUIRE(Value{ValueList{"a", "b"}}.at_path({std::size_t{1}}).as_string() == "b");
    REQUIRE(Value{ValueList{"a"}}.at_path({std::size_t{4}}).is_undefined());
}

TEST_CASE("Value - path writes are copy on write", "[value]") {
    auto v = box();
    auto moved = v.with_path({"position", "x"}, 5.0);

    REQUIRE(v.at_path({"position", "x"}).as_number() == 1.0);
    REQUIRE(moved.at_path({"position", "x"}).as_number() == 5.0);
    REQUIRE(moved.at_path({"position", "y"}).as_number() == 2.0);

    auto created = Value{}.with_path({"a", "b"}, true);
    REQUIRE(created.at_path({"a", "b"}).as_bool());

    auto list = Value{ValueList{1.0}};
    REQUIRE(list.with_path({std::size_t{1}}, 2.0).as_list().size() == 2);
    REQUIRE_THROWS_AS(list.with_path({std::size_t{3}}, 2.0), InvalidArgument);
    REQUIRE_THROWS_AS(v.with_path({"name", std::size_t{1}}, 2.0), InvalidArgument);
}

TEST_CASE("Value - equality and identity", "[value]") {
    Value a = ValueMap{{"x", 1.0}, {"y", 2.0}};
    Value b = ValueMap{{"y", 2.0}, {"x", 1.0}};
    Value c = a;

    REQUIRE(a == b);
    REQUIRE_FALSE(a.same(b));
    REQUIRE(a.same(c));
    REQUIRE(Value{1.0}.same(Value{1.0}));
    REQUIRE(Value{1.0} != Value{"1"});
}

TEST_CASE("ValueMap - keeps insertion order", "[value]") {
    ValueMap map{{"b", 1.0}, {"a", 2.0}};
    map.set("c", 3.0);
    map.set("b", 4.0);

    std::vector<std::string> keys;
    for (const auto& [key, value] : map) { keys.push_back(key); }
    REQUIRE(keys == std::vector<std::string>{"b", "a", "c"});
    REQUIRE(map.find("b")->as_number() == 4.0);

    REQUIRE(map.erase("a"));
    REQUIRE_FALSE(map.erase("a"));
    REQUIRE(map.size() == 2);
}

TEST_CASE("Value - deep merge", "[value]") {
    Value base = box();
    Value overlay = ValueMap{{"position", ValueMap{{"y", 9.0}}}, {"visible", false}};
    auto merged = deep_merge(base, overlay);

    REQUIRE(merged.at_path({"position", "x"}).as_number() == 1.0);
    REQUIRE(merged.at_path({"position", "y"}).as_number() == 9.0);
    REQUIRE_FALSE(merged.at_path({"visible"}).as_bool());
    REQUIRE(merged.at_path({"name"}).as_string() == "box");

    REQUIRE(deep_merge(base, Value{}) == base);
    REQUIRE(deep_merge(base, Value{3.0}) == Value{3.0});
}

TEST_CASE("Value - readable rendering", "[value]") {
    Value v = ValueMap{{"x", 1.5}, {"on", true}, {"tags", ValueList{"a"}}};
    REQUIRE(v.to_string() == R"({"x": 1.5, "on": true, "tags": ["a"]})");
    REQUIRE(Value{}.to_string() == "undefined");
}
