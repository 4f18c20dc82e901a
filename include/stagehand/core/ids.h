#pragma once

/**
 * @file ids.h
 * @brief Nominally typed string identifiers.
 *
 * Every identifier kind is a distinct type wrapping a std::string. Two ids with identical text but different
 * kinds cannot be substituted for one another at compile time, while the runtime representation stays a plain
 * string (the wrapper adds no storage).
 */

#include <fmt/format.h>

#include <compare>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace stagehand {

template<typename Tag>
class Nominal {
public:
    Nominal() = default;

    explicit Nominal(std::string value) : _value(std::move(value)) {}

    explicit Nominal(std::string_view value) : _value(value) {}

    explicit Nominal(const char* value) : _value(value) {}

    [[nodiscard]] const std::string& str() const noexcept { return _value; }

    [[nodiscard]] bool empty() const noexcept { return _value.empty(); }

    auto operator<=>(const Nominal&) const = default;

    bool operator==(const Nominal&) const = default;

private:
    std::string _value;
};

struct ProjectIdTag {};
struct SheetIdTag {};
struct SheetInstanceIdTag {};
struct ObjectAddressKeyTag {};
struct SequenceTrackIdTag {};
struct KeyframeIdTag {};
struct PathToPropEncodedTag {};

using ProjectId = Nominal<ProjectIdTag>;
using SheetId = Nominal<SheetIdTag>;
using SheetInstanceId = Nominal<SheetInstanceIdTag>;
using ObjectAddressKey = Nominal<ObjectAddressKeyTag>;
using SequenceTrackId = Nominal<SequenceTrackIdTag>;
using KeyframeId = Nominal<KeyframeIdTag>;
using PathToPropEncoded = Nominal<PathToPropEncodedTag>;

static_assert(sizeof(ProjectId) == sizeof(std::string));

}  // namespace stagehand

template<typename Tag>
struct std::hash<stagehand::Nominal<Tag>> {
    size_t operator()(const stagehand::Nominal<Tag>& id) const noexcept {
        return std::hash<std::string>{}(id.str());
    }
};

template<typename Tag>
struct fmt::formatter<stagehand::Nominal<Tag>> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const stagehand::Nominal<Tag>& id, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(std::string_view{id.str()}, ctx);
    }
};
