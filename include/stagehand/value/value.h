#pragma once

/**
 * @file value.h
 * @brief Dynamic, immutable property values.
 *
 * Value is the runtime representation of every property in the graph and of every raw value found in a
 * snapshot. Scalars are held inline; maps and lists are immutable and shared between copies, so copying a
 * Value is cheap and writing produces a new tree that shares every untouched branch with the old one.
 *
 * Kinds:
 * - undefined (missing)
 * - boolean, number (double), string
 * - Rgba {r, g, b, a}
 * - Asset {kind: image|file, id?}
 * - map: ordered string → Value
 * - list: Value sequence
 *
 * Usage:
 * @code
 * Value v = ValueMap{{"position", ValueMap{{"x", 1.0}, {"y", 2.0}}}, {"label", "box"}};
 * double x = v.at_path({"position", "x"}).as_number();
 * Value moved = v.with_path({"position", "x"}, 5.0);   // v is unchanged
 * @endcode
 */

#include <stagehand/stagehand_export.h>
#include <stagehand/value/path.h>

#include <fmt/format.h>

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace stagehand {

struct Rgba {
    double r{0.0};
    double g{0.0};
    double b{0.0};
    double a{1.0};

    bool operator==(const Rgba&) const = default;
};

enum class AssetKind { image, file };

struct Asset {
    AssetKind kind{AssetKind::image};
    std::optional<std::string> id;

    bool operator==(const Asset&) const = default;
};

class ValueMap;
class Value;
using ValueList = std::vector<Value>;

class STAGEHAND_EXPORT Value {
public:
    enum class Kind { undefined, boolean, number, string, rgba, asset, map, list };

    Value() = default;

    Value(bool v) : _data(v) {}

    Value(double v) : _data(v) {}

    Value(int v) : _data(static_cast<double>(v)) {}

    Value(const char* v) : _data(std::string{v}) {}

    Value(std::string v) : _data(std::move(v)) {}

    Value(Rgba v) : _data(v) {}

    Value(Asset v) : _data(std::move(v)) {}

    Value(ValueMap map);

    Value(ValueList list);

    static Value undefined() { return Value{}; }

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(_data.index()); }

    [[nodiscard]] bool is_undefined() const noexcept { return kind() == Kind::undefined; }
    [[nodiscard]] bool is_bool() const noexcept { return kind() == Kind::boolean; }
    [[nodiscard]] bool is_number() const noexcept { return kind() == Kind::number; }
    [[nodiscard]] bool is_string() const noexcept { return kind() == Kind::string; }
    [[nodiscard]] bool is_rgba() const noexcept { return kind() == Kind::rgba; }
    [[nodiscard]] bool is_asset() const noexcept { return kind() == Kind::asset; }
    [[nodiscard]] bool is_map() const noexcept { return kind() == Kind::map; }
    [[nodiscard]] bool is_list() const noexcept { return kind() == Kind::list; }

    // Accessors throw InvalidArgument on kind mismatch.
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] double as_number() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const Rgba& as_rgba() const;
    [[nodiscard]] const Asset& as_asset() const;
    [[nodiscard]] const ValueMap& as_map() const;
    [[nodiscard]] const ValueList& as_list() const;

    /**
     * @brief Map field lookup; nullptr when this is not a map or the key is absent.
     */
    [[nodiscard]] const Value* find(std::string_view key) const;

    /**
     * @brief Resolve a path. Missing steps, or steps through non-containers, yield undefined.
     */
    [[nodiscard]] Value at_path(const PropPath& path) const;

    /**
     * @brief Copy-on-write update at a path.
     *
     * Missing or non-map intermediates on a field step are replaced with maps. An index step requires a list
     * with that index present (or equal to its size, which appends).
     *
     * @throws InvalidArgument for an index step into a non-list or past the end
     */
    [[nodiscard]] Value with_path(const PropPath& path, Value value) const;

    /**
     * @brief Reference identity for maps and lists, value equality for scalars.
     */
    [[nodiscard]] bool same(const Value& other) const noexcept;

    /**
     * @brief Structural equality; maps compare regardless of key order.
     */
    bool operator==(const Value& other) const;

    /**
     * @brief A JSON-like rendering used for logging and error messages.
     */
    [[nodiscard]] std::string to_string() const;

private:
    std::variant<std::monostate, bool, double, std::string, Rgba, Asset, std::shared_ptr<const ValueMap>,
                 std::shared_ptr<const ValueList>>
        _data;
};

/**
 * @brief An insertion-ordered string → Value map.
 *
 * Order is preserved because compound props materialize their defaults in declared order.
 */
class STAGEHAND_EXPORT ValueMap {
public:
    using entry_type = std::pair<std::string, Value>;
    using const_iterator = std::vector<entry_type>::const_iterator;

    ValueMap() = default;

    ValueMap(std::initializer_list<entry_type> entries);

    [[nodiscard]] const Value* find(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    /**
     * @brief Insert or replace, keeping the original position of an existing key.
     */
    void set(std::string key, Value value);

    bool erase(std::string_view key);

    [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

    [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return _entries.begin(); }

    [[nodiscard]] const_iterator end() const noexcept { return _entries.end(); }

    bool operator==(const ValueMap& other) const;

private:
    std::vector<entry_type> _entries;
};

/**
 * @brief Deep merge of `overlay` onto `base`: maps merge key by key, anything else in the overlay replaces
 * the base. An undefined overlay leaves the base unchanged.
 */
[[nodiscard]] STAGEHAND_EXPORT Value deep_merge(const Value& base, const Value& overlay);

[[nodiscard]] STAGEHAND_EXPORT std::string_view to_string(Value::Kind kind);

}  // namespace stagehand

template<>
struct fmt::formatter<stagehand::Value> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const stagehand::Value& value, FormatContext& ctx) const {
        auto text = value.to_string();
        return fmt::formatter<std::string_view>::format(std::string_view{text}, ctx);
    }
};
