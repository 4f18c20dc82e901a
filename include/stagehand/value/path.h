#pragma once

/**
 * @file path.h
 * @brief Paths into nested property values.
 *
 * A PropPath is a sequence of PathKeys, each either a field name (map access) or an index (list access).
 * Paths have two textual forms:
 * - the readable form, "position.x" or "points[2].y", produced by to_string and read by parse_prop_path
 * - the encoded form, a JSON array such as ["position","x"], used as the key of trackIdByPropPath in
 *   sequence snapshots (encode_path_to_prop / decode_path_to_prop)
 */

#include <stagehand/core/ids.h>
#include <stagehand/stagehand_export.h>

#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stagehand {

/**
 * @brief A single step in a property path.
 */
class STAGEHAND_EXPORT PathKey {
public:
    PathKey(std::string name) : _data(std::move(name)) {}

    PathKey(const char* name) : _data(std::string{name}) {}

    PathKey(std::size_t index) : _data(index) {}

    static PathKey field(std::string name) { return PathKey{std::move(name)}; }

    static PathKey index(std::size_t idx) { return PathKey{idx}; }

    [[nodiscard]] bool is_field() const noexcept { return std::holds_alternative<std::string>(_data); }

    [[nodiscard]] bool is_index() const noexcept { return std::holds_alternative<std::size_t>(_data); }

    /**
     * @throws InvalidArgument if this is an index key
     */
    [[nodiscard]] const std::string& name() const;

    /**
     * @throws InvalidArgument if this is a field key
     */
    [[nodiscard]] std::size_t get_index() const;

    /**
     * @brief "name" for fields, "[3]" for indices.
     */
    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const PathKey&) const = default;

    bool operator==(const PathKey&) const = default;

private:
    std::variant<std::string, std::size_t> _data;
};

using PropPath = std::vector<PathKey>;

/**
 * @brief True when `prefix` is equal to, or a leading part of, `path`.
 */
[[nodiscard]] STAGEHAND_EXPORT bool is_prefix(const PropPath& prefix, const PropPath& path);

/**
 * @brief True when either path is a prefix of the other, i.e. a write at one can change the value at the other.
 */
[[nodiscard]] STAGEHAND_EXPORT bool paths_intersect(const PropPath& a, const PropPath& b);

/**
 * @brief Readable form, e.g. "points[2].y". The empty path prints as "".
 */
[[nodiscard]] STAGEHAND_EXPORT std::string to_string(const PropPath& path);

/**
 * @brief Parse the readable form.
 *
 * Supports field access ("a.b"), index access ("a[0]") and quoted keys ("a[\"odd key\"]").
 *
 * @throws InvalidArgument on leading, trailing or doubled dots and unterminated brackets
 */
[[nodiscard]] STAGEHAND_EXPORT PropPath parse_prop_path(std::string_view text);

/**
 * @brief The JSON array encoding, e.g. ["points",2,"y"].
 */
[[nodiscard]] STAGEHAND_EXPORT PathToPropEncoded encode_path_to_prop(const PropPath& path);

/**
 * @throws InvalidArgument when the text is not a JSON array of strings and non-negative integers
 */
[[nodiscard]] STAGEHAND_EXPORT PropPath decode_path_to_prop(const PathToPropEncoded& encoded);

}  // namespace stagehand

template<>
struct fmt::formatter<stagehand::PropPath> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const stagehand::PropPath& path, FormatContext& ctx) const {
        auto text = stagehand::to_string(path);
        return fmt::formatter<std::string_view>::format(std::string_view{text}, ctx);
    }
};
