#pragma once

/**
 * @file prop_type.h
 * @brief The closed set of property type configurations and the operations over them.
 *
 * A PropTypeConfig describes one position in a property tree. It is a sum type over the leaf kinds
 * (number, boolean, string, stringLiteral, rgba, image, file) and the two composite kinds (compound, enum).
 * Each operation (materialize_default, sanitize, interpolate) visits the variant exhaustively; adding a kind
 * fails to compile until every operation handles it.
 *
 * Configs are built with the functions in stagehand/prop_types/types.h, which validate their input. Once
 * built, a config is immutable and every operation on it degrades gracefully instead of throwing.
 */

#include <stagehand/stagehand_export.h>
#include <stagehand/value/path.h>
#include <stagehand/value/value.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace stagehand {

class PropTypeConfig;

template<typename T>
using Interpolator = std::function<T(const T& left, const T& right, double progression)>;

struct NumberRange {
    double min;
    double max;

    bool operator==(const NumberRange&) const = default;
};

struct NumberNudgeParams {
    double delta_x{0.0};
    double delta_fraction{0.0};
    double magnitude{1.0};
};

struct NumberConfig;

using NumberNudgeFn = std::function<double(const NumberNudgeParams&, const NumberConfig&)>;

struct NumberConfig {
    double default_value{0.0};
    std::optional<NumberRange> range;
    NumberNudgeFn nudge_fn;
    std::optional<double> nudge_multiplier;
    Interpolator<double> interpolate;
    std::optional<std::string> label;
};

struct BooleanConfig {
    bool default_value{false};
    Interpolator<bool> interpolate;
    std::optional<std::string> label;
};

struct StringConfig {
    std::string default_value;
    Interpolator<std::string> interpolate;
    std::optional<std::string> label;
};

enum class StringLiteralPresentation { menu, switch_control };

struct StringLiteralConfig {
    std::string default_value;
    std::vector<std::pair<std::string, std::string>> values_and_labels;
    StringLiteralPresentation as{StringLiteralPresentation::menu};
    Interpolator<std::string> interpolate;
    std::optional<std::string> label;

    [[nodiscard]] bool allows(std::string_view value) const;
};

struct RgbaConfig {
    Rgba default_value;
    Interpolator<Rgba> interpolate;
    std::optional<std::string> label;
};

struct ImageConfig {
    Asset default_value{AssetKind::image, std::nullopt};
    Interpolator<Asset> interpolate;
    std::optional<std::string> label;
};

struct FileConfig {
    Asset default_value{AssetKind::file, std::nullopt};
    Interpolator<Asset> interpolate;
    std::optional<std::string> label;
};

/**
 * @brief A named child of a compound or a case of an enum. Children are shared and immutable.
 */
struct NamedPropType {
    std::string name;
    std::shared_ptr<const PropTypeConfig> config;
};

struct CompoundConfig {
    std::vector<NamedPropType> props;
    std::optional<std::string> label;

    [[nodiscard]] const PropTypeConfig* find(std::string_view name) const;
};

inline constexpr std::string_view ENUM_CASE_KEY{"$case"};

/**
 * @brief Named alternatives. A value is a map {"$case": <case name>, <case name>: payload}.
 */
struct EnumConfig {
    std::vector<NamedPropType> cases;
    std::string default_case;
    std::optional<std::string> label;

    [[nodiscard]] const PropTypeConfig* find(std::string_view name) const;
};

enum class PropTypeKind { number, boolean, string, string_literal, rgba, image, file, compound, enumeration };

[[nodiscard]] STAGEHAND_EXPORT std::string_view to_string(PropTypeKind kind);

class STAGEHAND_EXPORT PropTypeConfig {
public:
    using variant_type = std::variant<NumberConfig, BooleanConfig, StringConfig, StringLiteralConfig, RgbaConfig,
                                      ImageConfig, FileConfig, CompoundConfig, EnumConfig>;

    explicit PropTypeConfig(variant_type config) : _config(std::move(config)) {}

    [[nodiscard]] PropTypeKind kind() const noexcept { return static_cast<PropTypeKind>(_config.index()); }

    [[nodiscard]] bool is_simple() const noexcept {
        return kind() != PropTypeKind::compound && kind() != PropTypeKind::enumeration;
    }

    template<typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(_config);
    }

    template<typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(_config);
    }

    [[nodiscard]] const variant_type& variant() const noexcept { return _config; }

    [[nodiscard]] const std::optional<std::string>& label() const;

    /**
     * @brief Structural equality: kinds, defaults, labels, ranges, value sets and children.
     * Function members (interpolators, nudge functions) do not take part.
     */
    bool operator==(const PropTypeConfig& other) const;

private:
    variant_type _config;
};

/**
 * @brief The default value tree. Compounds produce a map in declared order.
 */
[[nodiscard]] STAGEHAND_EXPORT Value materialize_default(const PropTypeConfig& config);

/**
 * @brief Validate and coerce an untrusted value.
 *
 * @return the accepted value, or nullopt meaning "use the default". Compounds return the fields that
 *         sanitized successfully, which may be an empty map. Never throws.
 */
[[nodiscard]] STAGEHAND_EXPORT std::optional<Value> sanitize(const PropTypeConfig& config, const Value& raw);

/**
 * @brief sanitize, with whatever fails replaced by the default. Compound results are complete trees.
 */
[[nodiscard]] STAGEHAND_EXPORT Value sanitize_or_default(const PropTypeConfig& config, const Value& raw);

/**
 * @brief Interpolate between two sanitized values. `progression` is not clamped; values outside [0, 1]
 * extrapolate for kinds that interpolate continuously.
 */
[[nodiscard]] STAGEHAND_EXPORT Value interpolate(const PropTypeConfig& config, const Value& left, const Value& right,
                                                 double progression);

/**
 * @brief The config that governs `path`, walking compound fields and enum case names.
 * @return nullptr when the path leaves the declared tree
 */
[[nodiscard]] STAGEHAND_EXPORT const PropTypeConfig* config_at_path(const PropTypeConfig& config, const PropPath& path);

/**
 * @brief Apply the config's nudge function (or the default one) to a drag gesture.
 */
[[nodiscard]] STAGEHAND_EXPORT double nudge(const NumberConfig& config, const NumberNudgeParams& params);

STAGEHAND_EXPORT double default_number_nudge(const NumberNudgeParams& params, const NumberConfig& config);

STAGEHAND_EXPORT double linear_interpolate(const double& left, const double& right, double progression);

}  // namespace stagehand
