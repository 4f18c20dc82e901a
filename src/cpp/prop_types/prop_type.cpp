#include <stagehand/prop_types/color.h>
#include <stagehand/prop_types/prop_type.h>
#include <stagehand/util/overloaded.h>

#include <algorithm>
#include <cmath>

namespace stagehand {

std::string_view to_string(PropTypeKind kind) {
    switch (kind) {
        case PropTypeKind::number: return "number";
        case PropTypeKind::boolean: return "boolean";
        case PropTypeKind::string: return "string";
        case PropTypeKind::string_literal: return "stringLiteral";
        case PropTypeKind::rgba: return "rgba";
        case PropTypeKind::image: return "image";
        case PropTypeKind::file: return "file";
        case PropTypeKind::compound: return "compound";
        case PropTypeKind::enumeration: return "enum";
    }
    return "unknown";
}

bool StringLiteralConfig::allows(std::string_view value) const {
    return std::any_of(values_and_labels.begin(), values_and_labels.end(),
                       [value](const auto& entry) { return entry.first == value; });
}

namespace {

const PropTypeConfig* find_named(const std::vector<NamedPropType>& entries, std::string_view name) {
    auto it = std::find_if(entries.begin(), entries.end(), [name](const NamedPropType& e) { return e.name == name; });
    return it == entries.end() ? nullptr : it->config.get();
}

bool same_children(const std::vector<NamedPropType>& a, const std::vector<NamedPropType>& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](const NamedPropType& x, const NamedPropType& y) {
        return x.name == y.name && (x.config == y.config || (x.config && y.config && *x.config == *y.config));
    });
}

}  // namespace

const PropTypeConfig* CompoundConfig::find(std::string_view name) const { return find_named(props, name); }

const PropTypeConfig* EnumConfig::find(std::string_view name) const { return find_named(cases, name); }

const std::optional<std::string>& PropTypeConfig::label() const {
    return std::visit([](const auto& config) -> const std::optional<std::string>& { return config.label; }, _config);
}

bool PropTypeConfig::operator==(const PropTypeConfig& other) const {
    if (_config.index() != other._config.index()) {
        return false;
    }
    return std::visit(
        overloaded{
            [&](const NumberConfig& a) {
                const auto& b = other.as<NumberConfig>();
                return a.default_value == b.default_value && a.range == b.range &&
                       a.nudge_multiplier == b.nudge_multiplier && a.label == b.label;
            },
            [&](const BooleanConfig& a) {
                const auto& b = other.as<BooleanConfig>();
                return a.default_value == b.default_value && a.label == b.label;
            },
            [&](const StringConfig& a) {
                const auto& b = other.as<StringConfig>();
                return a.default_value == b.default_value && a.label == b.label;
            },
            [&](const StringLiteralConfig& a) {
                const auto& b = other.as<StringLiteralConfig>();
                return a.default_value == b.default_value && a.values_and_labels == b.values_and_labels &&
                       a.as == b.as && a.label == b.label;
            },
            [&](const RgbaConfig& a) {
                const auto& b = other.as<RgbaConfig>();
                return a.default_value == b.default_value && a.label == b.label;
            },
            [&](const ImageConfig& a) {
                const auto& b = other.as<ImageConfig>();
                return a.default_value == b.default_value && a.label == b.label;
            },
            [&](const FileConfig& a) {
                const auto& b = other.as<FileConfig>();
                return a.default_value == b.default_value && a.label == b.label;
            },
            [&](const CompoundConfig& a) {
                const auto& b = other.as<CompoundConfig>();
                return a.label == b.label && same_children(a.props, b.props);
            },
            [&](const EnumConfig& a) {
                const auto& b = other.as<EnumConfig>();
                return a.label == b.label && a.default_case == b.default_case && same_children(a.cases, b.cases);
            },
        },
        _config);
}

// ============================================================================
// Defaults
// ============================================================================

Value materialize_default(const PropTypeConfig& config) {
    return std::visit(overloaded{
                          [](const CompoundConfig& c) {
                              ValueMap map;
                              for (const auto& prop : c.props) {
                                  map.set(prop.name, materialize_default(*prop.config));
                              }
                              return Value{std::move(map)};
                          },
                          [](const EnumConfig& c) {
                              ValueMap map;
                              map.set(std::string{ENUM_CASE_KEY}, c.default_case);
                              if (const auto* case_config = c.find(c.default_case)) {
                                  map.set(c.default_case, materialize_default(*case_config));
                              }
                              return Value{std::move(map)};
                          },
                          [](const auto& c) { return Value{c.default_value}; },
                      },
                      config.variant());
}

// ============================================================================
// Sanitize
// ============================================================================

namespace {

std::optional<double> finite_channel(const Value& value) {
    if (!value.is_number() || !std::isfinite(value.as_number())) {
        return std::nullopt;
    }
    return value.as_number();
}

std::optional<Value> sanitize_rgba(const Value& raw) {
    if (raw.is_rgba()) {
        const auto& c = raw.as_rgba();
        if (!std::isfinite(c.r) || !std::isfinite(c.g) || !std::isfinite(c.b) || !std::isfinite(c.a)) {
            return std::nullopt;
        }
        return Value{clamp_rgba(c)};
    }
    if (!raw.is_map()) {
        return std::nullopt;
    }
    std::optional<double> channels[4];
    const char* names[4] = {"r", "g", "b", "a"};
    for (int i = 0; i < 4; ++i) {
        const Value* channel = raw.find(names[i]);
        if (channel == nullptr || !(channels[i] = finite_channel(*channel))) {
            return std::nullopt;
        }
    }
    return Value{clamp_rgba(Rgba{*channels[0], *channels[1], *channels[2], *channels[3]})};
}

std::optional<Value> sanitize_asset(AssetKind kind, const Value& raw) {
    if (raw.is_asset() && raw.as_asset().kind == kind) {
        return raw;
    }
    return std::nullopt;
}

}  // namespace

std::optional<Value> sanitize(const PropTypeConfig& config, const Value& raw) {
    return std::visit(
        overloaded{
            [&](const NumberConfig&) -> std::optional<Value> {
                if (raw.is_number() && std::isfinite(raw.as_number())) return raw;
                return std::nullopt;
            },
            [&](const BooleanConfig&) -> std::optional<Value> {
                if (raw.is_bool()) return raw;
                return std::nullopt;
            },
            [&](const StringConfig&) -> std::optional<Value> {
                if (raw.is_string()) return raw;
                return std::nullopt;
            },
            [&](const StringLiteralConfig& c) -> std::optional<Value> {
                if (raw.is_string() && c.allows(raw.as_string())) return raw;
                return std::nullopt;
            },
            [&](const RgbaConfig&) { return sanitize_rgba(raw); },
            [&](const ImageConfig&) { return sanitize_asset(AssetKind::image, raw); },
            [&](const FileConfig&) { return sanitize_asset(AssetKind::file, raw); },
            [&](const CompoundConfig& c) -> std::optional<Value> {
                if (!raw.is_map()) return std::nullopt;
                ValueMap result;
                for (const auto& prop : c.props) {
                    const Value* field = raw.find(prop.name);
                    if (field == nullptr) continue;
                    if (auto sanitized = sanitize(*prop.config, *field)) {
                        result.set(prop.name, std::move(*sanitized));
                    }
                }
                return Value{std::move(result)};
            },
            [&](const EnumConfig& c) -> std::optional<Value> {
                const Value* case_name = raw.find(ENUM_CASE_KEY);
                if (case_name == nullptr || !case_name->is_string()) return std::nullopt;
                const auto* case_config = c.find(case_name->as_string());
                if (case_config == nullptr) return std::nullopt;

                Value payload = materialize_default(*case_config);
                if (const Value* raw_payload = raw.find(case_name->as_string())) {
                    if (auto sanitized = sanitize(*case_config, *raw_payload)) {
                        payload = deep_merge(payload, *sanitized);
                    }
                }
                ValueMap result;
                result.set(std::string{ENUM_CASE_KEY}, *case_name);
                result.set(case_name->as_string(), std::move(payload));
                return Value{std::move(result)};
            },
        },
        config.variant());
}

Value sanitize_or_default(const PropTypeConfig& config, const Value& raw) {
    auto sanitized = sanitize(config, raw);
    if (!sanitized) {
        return materialize_default(config);
    }
    if (config.is<CompoundConfig>()) {
        return deep_merge(materialize_default(config), *sanitized);
    }
    return std::move(*sanitized);
}

// ============================================================================
// Interpolate
// ============================================================================

double linear_interpolate(const double& left, const double& right, double progression) {
    return left + (right - left) * progression;
}

namespace {

template<typename T, typename Get>
Value interpolate_leaf(const Interpolator<T>& custom, const Value& left, const Value& right, double progression,
                       bool (Value::*is_kind)() const noexcept, Get get) {
    if (!(left.*is_kind)() || !(right.*is_kind)()) {
        return (left.*is_kind)() ? left : right;
    }
    if (!custom) {
        return left;
    }
    return Value{custom(get(left), get(right), progression)};
}

}  // namespace

Value interpolate(const PropTypeConfig& config, const Value& left, const Value& right, double progression) {
    return std::visit(
        overloaded{
            [&](const NumberConfig& c) {
                if (!left.is_number() || !right.is_number()) return left.is_number() ? left : right;
                const auto& fn = c.interpolate ? c.interpolate : Interpolator<double>{linear_interpolate};
                return Value{fn(left.as_number(), right.as_number(), progression)};
            },
            [&](const BooleanConfig& c) {
                return interpolate_leaf<bool>(c.interpolate, left, right, progression, &Value::is_bool,
                                              [](const Value& v) { return v.as_bool(); });
            },
            [&](const StringConfig& c) {
                return interpolate_leaf<std::string>(c.interpolate, left, right, progression, &Value::is_string,
                                                     [](const Value& v) { return v.as_string(); });
            },
            [&](const StringLiteralConfig& c) {
                return interpolate_leaf<std::string>(c.interpolate, left, right, progression, &Value::is_string,
                                                     [](const Value& v) { return v.as_string(); });
            },
            [&](const RgbaConfig& c) {
                if (!left.is_rgba() || !right.is_rgba()) return left.is_rgba() ? left : right;
                const auto& fn = c.interpolate ? c.interpolate : Interpolator<Rgba>{interpolate_rgba};
                return Value{fn(left.as_rgba(), right.as_rgba(), progression)};
            },
            [&](const ImageConfig& c) {
                return interpolate_leaf<Asset>(c.interpolate, left, right, progression, &Value::is_asset,
                                               [](const Value& v) { return v.as_asset(); });
            },
            [&](const FileConfig& c) {
                return interpolate_leaf<Asset>(c.interpolate, left, right, progression, &Value::is_asset,
                                               [](const Value& v) { return v.as_asset(); });
            },
            [&](const CompoundConfig& c) {
                if (!left.is_map() || !right.is_map()) return left.is_map() ? left : right;
                ValueMap result;
                for (const auto& prop : c.props) {
                    const Value* l = left.find(prop.name);
                    const Value* r = right.find(prop.name);
                    if (l != nullptr && r != nullptr) {
                        result.set(prop.name, interpolate(*prop.config, *l, *r, progression));
                    } else if (l != nullptr || r != nullptr) {
                        result.set(prop.name, l != nullptr ? *l : *r);
                    }
                }
                return Value{std::move(result)};
            },
            [&](const EnumConfig& c) {
                const Value* l_case = left.find(ENUM_CASE_KEY);
                const Value* r_case = right.find(ENUM_CASE_KEY);
                if (l_case == nullptr || r_case == nullptr || !(*l_case == *r_case) || !l_case->is_string()) {
                    return left;
                }
                const auto& name = l_case->as_string();
                const auto* case_config = c.find(name);
                const Value* l = left.find(name);
                const Value* r = right.find(name);
                if (case_config == nullptr || l == nullptr || r == nullptr) {
                    return left;
                }
                ValueMap result;
                result.set(std::string{ENUM_CASE_KEY}, name);
                result.set(name, interpolate(*case_config, *l, *r, progression));
                return Value{std::move(result)};
            },
        },
        config.variant());
}

// ============================================================================
// Paths and nudging
// ============================================================================

const PropTypeConfig* config_at_path(const PropTypeConfig& config, const PropPath& path) {
    const PropTypeConfig* current = &config;
    for (const auto& key : path) {
        if (!key.is_field()) {
            return nullptr;
        }
        if (current->is<CompoundConfig>()) {
            current = current->as<CompoundConfig>().find(key.name());
        } else if (current->is<EnumConfig>()) {
            current = current->as<EnumConfig>().find(key.name());
        } else {
            return nullptr;
        }
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

double default_number_nudge(const NumberNudgeParams& params, const NumberConfig& config) {
    if (config.range && !config.nudge_multiplier && std::isfinite(config.range->min) &&
        std::isfinite(config.range->max)) {
        return params.delta_fraction * (config.range->max - config.range->min) * params.magnitude;
    }
    return params.delta_x * params.magnitude * config.nudge_multiplier.value_or(1.0);
}

double nudge(const NumberConfig& config, const NumberNudgeParams& params) {
    return config.nudge_fn ? config.nudge_fn(params, config) : default_number_nudge(params, config);
}

}  // namespace stagehand
