#ifndef STAGEHAND_UTIL_ERRORS
#define STAGEHAND_UTIL_ERRORS

#include <stagehand/stagehand_export.h>

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace stagehand {

    /**
     * Raised synchronously when the caller misuses the API: malformed identifiers, malformed snapshot shape,
     * bad playback options, observing something that is not observable, using a detached object.
     */
    struct STAGEHAND_EXPORT InvalidArgument : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    /**
     * Raised when a snapshot declares a definition version other than the one this library reads.
     * Ingestion does not attempt a migration.
     */
    struct STAGEHAND_EXPORT SchemaVersionMismatch : std::runtime_error {
        SchemaVersionMismatch(std::string expected_version, std::string found_version);

        [[nodiscard]] const std::string &expected_version() const noexcept { return _expected; }
        [[nodiscard]] const std::string &found_version() const noexcept { return _found; }

    private:
        std::string _expected;
        std::string _found;
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends the source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace stagehand

#endif // STAGEHAND_UTIL_ERRORS
