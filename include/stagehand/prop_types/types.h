#pragma once

/**
 * @file types.h
 * @brief Builders for property type configurations.
 *
 * Every builder validates its input and throws InvalidArgument on a malformed declaration, so a config that
 * exists is always well formed.
 *
 * Usage:
 * @code
 * using namespace stagehand;
 * auto props = types::compound({
 *     {"x", 0.0},                                        // shorthand for types::number(0.0)
 *     {"visible", true},                                 // shorthand for types::boolean(true)
 *     {"position", {{"x", 0.0}, {"y", 0.0}}},            // nested shorthand compound
 *     {"opacity", types::number(1.0, {.range = NumberRange{0.0, 1.0}})},
 *     {"color", types::rgba({1.0, 0.0, 0.0, 1.0})},
 * });
 * @endcode
 */

#include <stagehand/prop_types/prop_type.h>
#include <stagehand/stagehand_export.h>

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stagehand {

class ShorthandProp;

using ShorthandProps = std::vector<std::pair<std::string, ShorthandProp>>;

/**
 * @brief Anything that can stand for a prop type inside a compound: an explicit config, a plain default value
 * (number, boolean, string) or a nested list of named shorthands, which becomes a nested compound.
 */
class STAGEHAND_EXPORT ShorthandProp {
public:
    ShorthandProp(PropTypeConfig config);

    ShorthandProp(std::shared_ptr<const PropTypeConfig> config);

    ShorthandProp(double default_value);

    ShorthandProp(int default_value);

    ShorthandProp(bool default_value);

    ShorthandProp(const char* default_value);

    ShorthandProp(std::string default_value);

    ShorthandProp(std::initializer_list<std::pair<std::string, ShorthandProp>> props);

    /**
     * @brief Shorthand from a raw value: numbers, booleans and strings become leaves, maps become compounds.
     * @throws InvalidArgument for undefined, list, rgba and asset values
     */
    static ShorthandProp from_value(const Value& value);

    [[nodiscard]] const std::shared_ptr<const PropTypeConfig>& config() const noexcept { return _config; }

private:
    std::shared_ptr<const PropTypeConfig> _config;
};

namespace types {

template<typename T>
struct LeafOptions {
    Interpolator<T> interpolate;
    std::optional<std::string> label;
};

struct NumberOptions {
    std::optional<NumberRange> range;
    NumberNudgeFn nudge_fn;
    std::optional<double> nudge_multiplier;
    Interpolator<double> interpolate;
    std::optional<std::string> label;
};

struct StringLiteralOptions {
    StringLiteralPresentation as{StringLiteralPresentation::menu};
    Interpolator<std::string> interpolate;
    std::optional<std::string> label;
};

struct CompositeOptions {
    std::optional<std::string> label;
};

/**
 * @throws InvalidArgument for a non-finite default, a non-finite or inverted range or a non-finite multiplier
 */
STAGEHAND_EXPORT PropTypeConfig number(double default_value, NumberOptions options = {});

STAGEHAND_EXPORT PropTypeConfig boolean(bool default_value, LeafOptions<bool> options = {});

STAGEHAND_EXPORT PropTypeConfig string(std::string default_value, LeafOptions<std::string> options = {});

/**
 * @param values_and_labels the allowed values, in display order, each with its label
 * @throws InvalidArgument when the set is empty or does not contain the default
 */
STAGEHAND_EXPORT PropTypeConfig string_literal(std::string default_value,
                                               std::vector<std::pair<std::string, std::string>> values_and_labels,
                                               StringLiteralOptions options = {});

STAGEHAND_EXPORT PropTypeConfig rgba(Rgba default_value = {}, LeafOptions<Rgba> options = {});

STAGEHAND_EXPORT PropTypeConfig image(std::optional<std::string> default_id = std::nullopt,
                                      LeafOptions<Asset> options = {});

STAGEHAND_EXPORT PropTypeConfig file(std::optional<std::string> default_id = std::nullopt,
                                     LeafOptions<Asset> options = {});

/**
 * @throws InvalidArgument for empty, duplicated or whitespace padded keys and keys starting with '$'
 */
STAGEHAND_EXPORT PropTypeConfig compound(ShorthandProps props, CompositeOptions options = {});

/**
 * @throws InvalidArgument when `default_case` is not one of `cases`, or a case name is malformed
 */
STAGEHAND_EXPORT PropTypeConfig enumeration(std::string default_case, ShorthandProps cases,
                                            CompositeOptions options = {});

}  // namespace types

}  // namespace stagehand
