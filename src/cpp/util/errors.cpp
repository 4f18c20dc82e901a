#include <stagehand/util/errors.h>

namespace stagehand {
    SchemaVersionMismatch::SchemaVersionMismatch(std::string expected_version, std::string found_version)
        : std::runtime_error{fmt::format(
              "Project state has definitionVersion '{}' but this runtime reads '{}'. "
              "The state seems to be formatted in a way that is unreadable; refusing to guess a migration.",
              found_version, expected_version)},
          _expected{std::move(expected_version)}, _found{std::move(found_version)} {
    }
} // namespace stagehand
