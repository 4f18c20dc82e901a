#include <stagehand/prop_types/types.h>

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <vector>

using namespace stagehand;

namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();

PropTypeConfig shape() {
    return types::enumeration("circle", {{"circle", {{"radius", 1.0}}}, {"square", {{"side", 2.0}}}});
}

Value enum_value(const std::string& name, Value payload) {
    ValueMap map;
    map.set(std::string{ENUM_CASE_KEY}, name);
    map.set(name, std::move(payload));
    return Value{std::move(map)};
}

}  // namespace

TEST_CASE("Sanitize - numbers must be finite", "[prop_types][sanitize]") {
    auto config = types::number(0.0);
    REQUIRE(sanitize(config, 2.5) == Value{2.5});
    REQUIRE_FALSE(sanitize(config, NaN).has_value());
    REQUIRE_FALSE(sanitize(config, std::numeric_limits<double>::infinity()).has_value());
    REQUIRE_FALSE(sanitize(config, "2.5").has_value());
    REQUIRE_FALSE(sanitize(config, Value{}).has_value());
}

TEST_CASE("Sanitize - leaves require their own kind", "[prop_types][sanitize]") {
    REQUIRE(sanitize(types::boolean(false), true) == Value{true});
    REQUIRE_FALSE(sanitize(types::boolean(false), 1.0).has_value());
    REQUIRE(sanitize(types::string("a"), "b") == Value{"b"});
    REQUIRE_FALSE(sanitize(types::string("a"), true).has_value());

    auto literal = types::string_literal("a", {{"a", "A"}, {"b", "B"}});
    REQUIRE(sanitize(literal, "b") == Value{"b"});
    REQUIRE_FALSE(sanitize(literal, "c").has_value());
}

TEST_CASE("Sanitize - rgba accepts colors and channel maps, clamped", "[prop_types][sanitize]") {
    auto config = types::rgba();
    REQUIRE(sanitize(config, Rgba{0.2, 0.4, 0.6, 1.0}) == Value{Rgba{0.2, 0.4, 0.6, 1.0}});
    REQUIRE(sanitize(config, Rgba{2.0, -1.0, 0.5, 1.5}) == Value{Rgba{1.0, 0.0, 0.5, 1.0}});
    REQUIRE(sanitize(config, ValueMap{{"r", 1.0}, {"g", 0.5}, {"b", 0.0}, {"a", 1.0}}) ==
            Value{Rgba{1.0, 0.5, 0.0, 1.0}});

    REQUIRE_FALSE(sanitize(config, ValueMap{{"r", 1.0}, {"g", 0.5}, {"b", 0.0}}).has_value());
    REQUIRE_FALSE(sanitize(config, ValueMap{{"r", NaN}, {"g", 0.5}, {"b", 0.0}, {"a", 1.0}}).has_value());
    REQUIRE_FALSE(sanitize(config, Rgba{NaN, 0.0, 0.0, 1.0}).has_value());
    REQUIRE_FALSE(sanitize(config, "#ff0000").has_value());
}

TEST_CASE("Sanitize - assets must match the kind", "[prop_types][sanitize]") {
    Asset image{AssetKind::image, "a.png"};
    Asset file{AssetKind::file, "a.txt"};

    REQUIRE(sanitize(types::image(), image) == Value{image});
    REQUIRE_FALSE(sanitize(types::image(), file).has_value());
    REQUIRE(sanitize(types::file(), file) == Value{file});
    REQUIRE_FALSE(sanitize(types::file(), "a.txt").has_value());
}

TEST_CASE("Sanitize - compounds keep the valid part", "[prop_types][sanitize]") {
    ShorthandProps fields{{"x", 0.0}, {"y", 0.0}, {"name", "box"}};
    auto config = types::compound(fields);

    Value raw = ValueMap{{"x", "bad"}, {"y", 3.0}, {"extra", 1.0}};
    auto partial = sanitize(config, raw);
    REQUIRE(partial.has_value());
    REQUIRE(*partial == Value{ValueMap{{"y", 3.0}}});

    REQUIRE(sanitize_or_default(config, raw) == Value{ValueMap{{"x", 0.0}, {"y", 3.0}, {"name", "box"}}});
    REQUIRE_FALSE(sanitize(config, 1.0).has_value());
    REQUIRE(sanitize_or_default(config, 1.0) == materialize_default(config));
}

TEST_CASE("Sanitize - enums need a declared case", "[prop_types][sanitize]") {
    auto config = shape();

    auto square = sanitize(config, enum_value("square", ValueMap{{"side", "bad"}}));
    REQUIRE(square.has_value());
    REQUIRE(*square == enum_value("square", ValueMap{{"side", 2.0}}));

    auto resized = sanitize(config, enum_value("circle", ValueMap{{"radius", 4.0}}));
    REQUIRE(*resized == enum_value("circle", ValueMap{{"radius", 4.0}}));

    REQUIRE_FALSE(sanitize(config, enum_value("triangle", ValueMap{})).has_value());
    REQUIRE_FALSE(sanitize(config, ValueMap{{"circle", ValueMap{}}}).has_value());
    REQUIRE(sanitize_or_default(config, 1.0) == materialize_default(config));
}

TEST_CASE("Sanitize - is idempotent", "[prop_types][sanitize]") {
    std::vector<std::pair<PropTypeConfig, std::vector<Value>>> cases{
        {types::number(1.0), {2.0, NaN, "x"}},
        {types::boolean(true), {false, 1.0}},
        {types::string("s"), {"t", 1.0}},
        {types::string_literal("a", {{"a", "A"}, {"b", "B"}}), {"b", "z"}},
        {types::rgba(), {Rgba{2.0, 0.5, -1.0, 1.0}, ValueMap{{"r", 0.1}, {"g", 0.2}, {"b", 0.3}, {"a", 0.4}}}},
        {types::image(), {Asset{AssetKind::image, "a"}, Asset{AssetKind::file, "b"}}},
        {types::compound({{"x", 1.0}, {"flag", false}}), {ValueMap{{"x", "no"}, {"flag", true}}, 3.0}},
        {shape(), {enum_value("square", ValueMap{{"side", NaN}}), enum_value("circle", Value{})}},
    };

    for (const auto& [config, raws] : cases) {
        for (const auto& raw : raws) {
            auto once = sanitize(config, raw);
            if (!once) { continue; }
            auto twice = sanitize(config, *once);
            REQUIRE(twice.has_value());
            REQUIRE(*twice == *once);
        }
    }
}
