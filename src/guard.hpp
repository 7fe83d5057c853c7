#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace ptndle::guard {

// Malformed hint rows and seed lists
struct ParseError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// A name that is not in the roster
struct LookupError : std::out_of_range {
    using std::out_of_range::out_of_range;
};

// Roster JSON that cannot be turned into sinners
struct RosterError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct FetchError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A target that does not match its own hint. Always a bug in the inverse predicates.
struct ConsistencyError : std::logic_error {
    using std::logic_error::logic_error;
};

// Thrown when the user leaves an interactive session
struct SessionEnded : std::runtime_error {
    int exitCode;

    SessionEnded(int code, const std::string& msg) : std::runtime_error(msg), exitCode{code} {}
};

// Throws RuntimeException using fmt and ...args
template <typename RuntimeException = std::runtime_error, typename ...Args>
[[noreturn]] inline void formatError(std::format_string<Args...> fmt, Args&&... args) {
    throw RuntimeException(std::format(fmt, std::forward<Args>(args)...));
}

// Throws staticMsg at compile time, otherwise Exception(staticMsg) at compile time
template <typename Exception = std::runtime_error>
[[noreturn]] constexpr inline void hybridError(std::string_view staticMsg) {
    if (std::is_constant_evaluated()) {
        throw staticMsg;
    } else {
        throw Exception(std::string{staticMsg});
    }
}

/*
Guard noExceptCond at compile time (if possible) otherwise runtime
*/
template <typename Exception = std::runtime_error>
constexpr inline void hybridGuard(bool noExceptCond, std::string_view staticMsg) {
    if (!noExceptCond) hybridError<Exception>(staticMsg);
}

// Guard noExceptCond at runtime
template <typename Exception = std::runtime_error, typename ...Args>
inline void runtimeGuard(bool noExceptCond, std::format_string<Args...> fmt, Args&&... args) {
    if (!noExceptCond) formatError<Exception>(fmt, std::forward<Args>(args)...);
}

} // end namespace ptndle::guard
