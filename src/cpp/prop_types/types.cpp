#include <stagehand/core/address.h>
#include <stagehand/prop_types/types.h>
#include <stagehand/util/errors.h>

#include <cmath>
#include <unordered_set>

namespace stagehand {

ShorthandProp::ShorthandProp(PropTypeConfig config) : _config(std::make_shared<const PropTypeConfig>(std::move(config))) {}

ShorthandProp::ShorthandProp(std::shared_ptr<const PropTypeConfig> config) : _config(std::move(config)) {
    if (!_config) {
        throw_error<InvalidArgument>("A prop type must not be null");
    }
}

ShorthandProp::ShorthandProp(double default_value) : ShorthandProp(types::number(default_value)) {}

ShorthandProp::ShorthandProp(int default_value) : ShorthandProp(types::number(static_cast<double>(default_value))) {}

ShorthandProp::ShorthandProp(bool default_value) : ShorthandProp(types::boolean(default_value)) {}

ShorthandProp::ShorthandProp(const char* default_value) : ShorthandProp(types::string(default_value)) {}

ShorthandProp::ShorthandProp(std::string default_value) : ShorthandProp(types::string(std::move(default_value))) {}

ShorthandProp::ShorthandProp(std::initializer_list<std::pair<std::string, ShorthandProp>> props)
    : ShorthandProp(types::compound(ShorthandProps{props})) {}

ShorthandProp ShorthandProp::from_value(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::number: return ShorthandProp{value.as_number()};
        case Value::Kind::boolean: return ShorthandProp{value.as_bool()};
        case Value::Kind::string: return ShorthandProp{value.as_string()};
        case Value::Kind::map: {
            ShorthandProps props;
            for (const auto& [key, child] : value.as_map()) {
                props.emplace_back(key, from_value(child));
            }
            return ShorthandProp{types::compound(std::move(props))};
        }
        default:
            throw_error<InvalidArgument>("Cannot infer a prop type from a value of kind {} ({})",
                                         to_string(value.kind()), value.to_string());
    }
}

namespace types {

namespace {

void validate_label(const std::optional<std::string>& label) {
    if (label && label->size() > MAX_NAME_LENGTH) {
        throw_error<InvalidArgument>("Prop label '{}' is longer than {} characters", *label, MAX_NAME_LENGTH);
    }
}

void require_finite(double value, std::string_view what) {
    if (!std::isfinite(value)) {
        throw_error<InvalidArgument>("{} must be a finite number, got {}", what, value);
    }
}

std::vector<NamedPropType> to_named(ShorthandProps props, std::string_view context) {
    std::vector<NamedPropType> named;
    named.reserve(props.size());
    std::unordered_set<std::string> seen;
    for (auto& [key, prop] : props) {
        validate_name(key, context);
        if (key.front() == '$') {
            throw_error<InvalidArgument>("{} '{}' must not start with '$'", context, key);
        }
        if (!seen.insert(key).second) {
            throw_error<InvalidArgument>("{} '{}' is declared more than once", context, key);
        }
        named.push_back(NamedPropType{std::move(key), prop.config()});
    }
    return named;
}

}  // namespace

PropTypeConfig number(double default_value, NumberOptions options) {
    require_finite(default_value, "The default value of a number prop");
    if (options.range) {
        require_finite(options.range->min, "The minimum of a number range");
        require_finite(options.range->max, "The maximum of a number range");
        if (options.range->min > options.range->max) {
            throw_error<InvalidArgument>("Number range [{}, {}] has its minimum above its maximum", options.range->min,
                                         options.range->max);
        }
    }
    if (options.nudge_multiplier) {
        require_finite(*options.nudge_multiplier, "The nudge multiplier of a number prop");
    }
    validate_label(options.label);
    return PropTypeConfig{NumberConfig{
        .default_value = default_value,
        .range = options.range,
        .nudge_fn = std::move(options.nudge_fn),
        .nudge_multiplier = options.nudge_multiplier,
        .interpolate = std::move(options.interpolate),
        .label = std::move(options.label),
    }};
}

PropTypeConfig boolean(bool default_value, LeafOptions<bool> options) {
    validate_label(options.label);
    return PropTypeConfig{BooleanConfig{default_value, std::move(options.interpolate), std::move(options.label)}};
}

PropTypeConfig string(std::string default_value, LeafOptions<std::string> options) {
    validate_label(options.label);
    return PropTypeConfig{
        StringConfig{std::move(default_value), std::move(options.interpolate), std::move(options.label)}};
}

PropTypeConfig string_literal(std::string default_value,
                              std::vector<std::pair<std::string, std::string>> values_and_labels,
                              StringLiteralOptions options) {
    validate_label(options.label);
    if (values_and_labels.empty()) {
        throw_error<InvalidArgument>("A string literal prop needs at least one allowed value");
    }
    StringLiteralConfig config{
        .default_value = std::move(default_value),
        .values_and_labels = std::move(values_and_labels),
        .as = options.as,
        .interpolate = std::move(options.interpolate),
        .label = std::move(options.label),
    };
    if (!config.allows(config.default_value)) {
        throw_error<InvalidArgument>("The default value '{}' of a string literal prop is not one of its values",
                                     config.default_value);
    }
    return PropTypeConfig{std::move(config)};
}

PropTypeConfig rgba(Rgba default_value, LeafOptions<Rgba> options) {
    require_finite(default_value.r, "The red channel of an rgba default");
    require_finite(default_value.g, "The green channel of an rgba default");
    require_finite(default_value.b, "The blue channel of an rgba default");
    require_finite(default_value.a, "The alpha channel of an rgba default");
    validate_label(options.label);
    return PropTypeConfig{RgbaConfig{default_value, std::move(options.interpolate), std::move(options.label)}};
}

PropTypeConfig image(std::optional<std::string> default_id, LeafOptions<Asset> options) {
    validate_label(options.label);
    return PropTypeConfig{ImageConfig{Asset{AssetKind::image, std::move(default_id)}, std::move(options.interpolate),
                                      std::move(options.label)}};
}

PropTypeConfig file(std::optional<std::string> default_id, LeafOptions<Asset> options) {
    validate_label(options.label);
    return PropTypeConfig{FileConfig{Asset{AssetKind::file, std::move(default_id)}, std::move(options.interpolate),
                                     std::move(options.label)}};
}

PropTypeConfig compound(ShorthandProps props, CompositeOptions options) {
    validate_label(options.label);
    return PropTypeConfig{CompoundConfig{to_named(std::move(props), "Compound prop key"), std::move(options.label)}};
}

PropTypeConfig enumeration(std::string default_case, ShorthandProps cases, CompositeOptions options) {
    validate_label(options.label);
    EnumConfig config{to_named(std::move(cases), "Enum case name"), std::move(default_case), std::move(options.label)};
    if (config.find(config.default_case) == nullptr) {
        throw_error<InvalidArgument>("The default case '{}' of an enum prop is not one of its cases",
                                     config.default_case);
    }
    return PropTypeConfig{std::move(config)};
}

}  // namespace types

}  // namespace stagehand
