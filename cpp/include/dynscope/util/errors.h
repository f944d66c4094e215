#ifndef DYNSCOPE_UTIL_ERRORS
#define DYNSCOPE_UTIL_ERRORS

#include <dynscope/dynscope_export.h>

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dynscope {

    /**
     * Root of the error hierarchy raised by the scoping mechanism. Errors raised by bound bodies are
     * never wrapped in these types, they propagate unchanged.
     */
    struct DYNSCOPE_EXPORT DynscopeError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    /**
     * A value is not assignable to the declared type of the key it is being bound to, or a value is
     * read back as a type other than the one it holds.
     */
    struct DYNSCOPE_EXPORT TypeMismatchError : DynscopeError {
        using DynscopeError::DynscopeError;
    };

    /**
     * No frame in the chain being resolved binds the requested key.
     */
    struct DYNSCOPE_EXPORT UnboundKeyError : DynscopeError {
        using DynscopeError::DynscopeError;
    };

    /**
     * Raised at a cancellation point once cancellation has been requested.
     */
    struct DYNSCOPE_EXPORT CancelledError : DynscopeError {
        using DynscopeError::DynscopeError;
    };

    template<typename Error = DynscopeError, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends source location
    template<typename Error = DynscopeError>
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
    template<typename Error = DynscopeError, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace dynscope

#endif // DYNSCOPE_UTIL_ERRORS
