#pragma once

/**
 * @file address.h
 * @brief Scope addresses: project ⊂ sheet ⊂ sheet object ⊂ prop.
 *
 * Each narrower address derives from the broader one, so a function taking `const ProjectAddress&` accepts a
 * sheet, object or prop address as well.
 */

#include <stagehand/core/ids.h>
#include <stagehand/stagehand_export.h>
#include <stagehand/value/path.h>

#include <string>
#include <string_view>

namespace stagehand {

struct ProjectAddress {
    ProjectId project_id;

    bool operator==(const ProjectAddress&) const = default;
};

struct SheetAddress : ProjectAddress {
    SheetId sheet_id;
    SheetInstanceId sheet_instance_id;

    bool operator==(const SheetAddress&) const = default;
};

struct SheetObjectAddress : SheetAddress {
    ObjectAddressKey object_key;

    bool operator==(const SheetObjectAddress&) const = default;
};

struct PropAddress : SheetObjectAddress {
    PropPath path_to_prop;

    bool operator==(const PropAddress&) const = default;
};

inline constexpr std::size_t MAX_NAME_LENGTH = 64;
inline constexpr std::size_t MIN_PROJECT_ID_LENGTH = 3;

/**
 * @brief Validates a user supplied name (sheet id, instance id, object key, label).
 *
 * A name must be non-empty, carry no surrounding whitespace and be at most 64 characters long.
 *
 * @param name the candidate
 * @param context where the name came from, quoted in the error message
 * @throws InvalidArgument
 */
STAGEHAND_EXPORT void validate_name(std::string_view name, std::string_view context);

/**
 * @brief Project ids follow the name rules and must be at least three characters long.
 * @throws InvalidArgument
 */
STAGEHAND_EXPORT void validate_project_id(std::string_view id);

[[nodiscard]] STAGEHAND_EXPORT std::string to_string(const ProjectAddress& address);
[[nodiscard]] STAGEHAND_EXPORT std::string to_string(const SheetAddress& address);
[[nodiscard]] STAGEHAND_EXPORT std::string to_string(const SheetObjectAddress& address);
[[nodiscard]] STAGEHAND_EXPORT std::string to_string(const PropAddress& address);

}  // namespace stagehand
