#include <stagehand/prop_types/types.h>
#include <stagehand/util/errors.h>

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>

using namespace stagehand;

TEST_CASE("Shorthand - plain values become leaf props", "[prop_types][types]") {
    REQUIRE(ShorthandProp{1.5}.config()->kind() == PropTypeKind::number);
    REQUIRE(ShorthandProp{3}.config()->kind() == PropTypeKind::number);
    REQUIRE(ShorthandProp{true}.config()->kind() == PropTypeKind::boolean);
    REQUIRE(ShorthandProp{"text"}.config()->kind() == PropTypeKind::string);
    REQUIRE(ShorthandProp{std::string{"text"}}.config()->kind() == PropTypeKind::string);
}

TEST_CASE("Shorthand - nested lists become compounds in declared order", "[prop_types][types]") {
    ShorthandProp props = {{"position", {{"x", 0.0}, {"y", 1.0}}}, {"visible", true}};
    const auto& config = *props.config();

    REQUIRE(config.kind() == PropTypeKind::compound);
    const auto& compound = config.as<CompoundConfig>();
    REQUIRE(compound.props.size() == 2);
    REQUIRE(compound.props[0].name == "position");
    REQUIRE(compound.props[1].name == "visible");
    REQUIRE(compound.find("position")->kind() == PropTypeKind::compound);
    REQUIRE(compound.find("missing") == nullptr);

    auto defaults = materialize_default(config);
    REQUIRE(defaults == Value{ValueMap{{"position", ValueMap{{"x", 0.0}, {"y", 1.0}}}, {"visible", true}}});
}

TEST_CASE("Shorthand - from a raw value", "[prop_types][types]") {
    auto props = ShorthandProp::from_value(ValueMap{{"x", 2.0}, {"label", "hi"}});
    REQUIRE(props.config()->kind() == PropTypeKind::compound);
    REQUIRE(materialize_default(*props.config()).at_path({"label"}).as_string() == "hi");

    REQUIRE_THROWS_AS(ShorthandProp::from_value(Value{}), InvalidArgument);
    REQUIRE_THROWS_AS(ShorthandProp::from_value(Value{ValueList{}}), InvalidArgument);
    REQUIRE_THROWS_AS(ShorthandProp::from_value(Value{Rgba{}}), InvalidArgument);
    REQUIRE_THROWS_AS(ShorthandProp{std::shared_ptr<const PropTypeConfig>{}}, InvalidArgument);
}

TEST_CASE("Builders - number validation", "[prop_types][types]") {
    const double inf = std::numeric_limits<double>::infinity();

    REQUIRE_NOTHROW(types::number(0.5, {.range = NumberRange{0.0, 1.0}}));
    REQUIRE_THROWS_AS(types::number(inf), InvalidArgument);
    REQUIRE_THROWS_AS(types::number(std::numeric_limits<double>::quiet_NaN()), InvalidArgument);
    REQUIRE_THROWS_AS(types::number(0.0, {.range = NumberRange{1.0, 0.0}}), InvalidArgument);
    REQUIRE_THROWS_AS(types::number(0.0, {.range = NumberRange{0.0, inf}}), InvalidArgument);
    REQUIRE_THROWS_AS(types::number(0.0, {.nudge_multiplier = inf}), InvalidArgument);
    REQUIRE_THROWS_AS(types::number(0.0, {.label = std::string(65, 'l')}), InvalidArgument);
}

TEST_CASE("Builders - string literal validation", "[prop_types][types]") {
    auto config = types::string_literal("a", {{"a", "Option A"}, {"b", "Option B"}});
    REQUIRE(config.as<StringLiteralConfig>().allows("b"));
    REQUIRE_FALSE(config.as<StringLiteralConfig>().allows("c"));

    REQUIRE_THROWS_AS(types::string_literal("a", {}), InvalidArgument);
    REQUIRE_THROWS_AS(types::string_literal("c", {{"a", "Option A"}}), InvalidArgument);
}

TEST_CASE("Builders - compound keys", "[prop_types][types]") {
    REQUIRE_THROWS_AS(types::compound({{"$case", 1.0}}), InvalidArgument);
    REQUIRE_THROWS_AS(types::compound({{"", 1.0}}), InvalidArgument);
    REQUIRE_THROWS_AS(types::compound({{" x", 1.0}}), InvalidArgument);
    REQUIRE_THROWS_AS(types::compound({{"x", 1.0}, {"x", 2.0}}), InvalidArgument);
}

TEST_CASE("Builders - enums", "[prop_types][types]") {
    auto shape = types::enumeration("circle", {{"circle", {{"radius", 1.0}}}, {"square", {{"side", 2.0}}}});
    REQUIRE(materialize_default(shape) ==
            Value{ValueMap{{std::string{ENUM_CASE_KEY}, "circle"}, {"circle", ValueMap{{"radius", 1.0}}}}});

    REQUIRE_THROWS_AS(types::enumeration("triangle", {{"circle", {{"radius", 1.0}}}}), InvalidArgument);
}

TEST_CASE("Configs - structural equality ignores functions", "[prop_types][types]") {
    auto a = types::number(1.0, {.range = NumberRange{0.0, 2.0}});
    auto b = types::number(1.0, {.range = NumberRange{0.0, 2.0},
                                 .interpolate = [](const double& l, const double&, double) { return l; }});
    auto c = types::number(1.5, {.range = NumberRange{0.0, 2.0}});

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
    REQUIRE_FALSE(a == types::boolean(true));

    ShorthandProp x = {{"x", 1.0}};
    ShorthandProp y = {{"x", 1.0}};
    ShorthandProp z = {{"x", 1.0}, {"y", 1.0}};
    REQUIRE(*x.config() == *y.config());
    REQUIRE_FALSE(*x.config() == *z.config());
}

TEST_CASE("Configs - lookup by path", "[prop_types][types]") {
    ShorthandProp props = {{"position", {{"x", 0.0}}}, {"name", "box"}};
    const auto& config = *props.config();

    REQUIRE(config_at_path(config, {}) == &config);
    REQUIRE(config_at_path(config, {"position", "x"})->kind() == PropTypeKind::number);
    REQUIRE(config_at_path(config, {"name"})->kind() == PropTypeKind::string);
    REQUIRE(config_at_path(config, {"position", "z"}) == nullptr);
    REQUIRE(config_at_path(config, {"name", "length"}) == nullptr);
    REQUIRE(config_at_path(config, {std::size_t{1}}) == nullptr);
}

TEST_CASE("Number nudging", "[prop_types][types]") {
    NumberNudgeParams params{.delta_x = 2.0, .delta_fraction = 0.1, .magnitude = 1.0};

    auto ranged = types::number(0.0, {.range = NumberRange{0.0, 10.0}});
    REQUIRE(nudge(ranged.as<NumberConfig>(), params) == 1.0);

    auto unbounded = types::number(0.0);
    REQUIRE(nudge(unbounded.as<NumberConfig>(), params) == 2.0);

    auto multiplied = types::number(0.0, {.range = NumberRange{0.0, 10.0}, .nudge_multiplier = 0.5});
    REQUIRE(nudge(multiplied.as<NumberConfig>(), params) == 1.0);

    auto custom = types::number(0.0, {.nudge_fn = [](const NumberNudgeParams& p, const NumberConfig&) {
        return p.delta_x * 100.0;
    }});
    REQUIRE(nudge(custom.as<NumberConfig>(), params) == 200.0);
}
