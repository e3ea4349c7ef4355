#ifndef SYNCDL_UTIL_ERRORS
#define SYNCDL_UTIL_ERRORS

#include <syncdl/syncdl_export.h>

#include <fmt/format.h>

#include <concepts>
#include <exception>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace syncdl {

    /**
     * Base of all the library's contract errors. Field level application errors are arbitrary exceptions
     * and are never required to derive from this.
     */
    struct SYNCDL_EXPORT SyncdlError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * An operation on a Deferred in the wrong state: settling twice, reading before settlement, or settling
     * a Deferred with itself (directly or through a chain of Deferreds it is waiting on). Also the error of a load
     * whose batch scope closed before the key was dispatched.
     */
    struct SYNCDL_EXPORT InvalidStateError : SyncdlError {
        using SyncdlError::SyncdlError;
    };

    /**
     * A batch was requested while no BatchScope is active, or a BatchScope was activated twice.
     */
    struct SYNCDL_EXPORT ConfigurationError : SyncdlError {
        using SyncdlError::SyncdlError;
    };

    /**
     * The batch fetch function returned a result that does not line up with the keys it was given.
     */
    struct SYNCDL_EXPORT BatchContractError : SyncdlError {
        using SyncdlError::SyncdlError;
    };

    /**
     * Execution finished with deferred work that can no longer be settled.
     */
    struct SYNCDL_EXPORT IncompleteExecutionError : SyncdlError {
        using SyncdlError::SyncdlError;
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format("{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(),
                                loc.function_name())};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

    /**
     * Best effort extraction of a message from an exception_ptr, used when an error has to be reported
     * rather than rethrown.
     */
    SYNCDL_EXPORT std::string describe_exception(const std::exception_ptr &error);

} // namespace syncdl

#endif // SYNCDL_UTIL_ERRORS
