#ifndef FLUENTMATCH_TYPES_H
#define FLUENTMATCH_TYPES_H

#include <string>
#include <stdint.h>
#include <functional>
#include <vector>
#include <memory>
#include <exception>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <experimental/optional>
using std::experimental::optional;
using std::experimental::nullopt;

// FLUENTMATCH_DEBUG_LOG echoes every log entry of a matcher
// to the matcher's output as it is appended.

#ifndef FLUENTMATCH_DEBUG_LOG
#define FLUENTMATCH_DEBUG_LOG 0
#endif

// what happens to a clause error that neither the clause's
// handler nor the matcher's handler accepted.

enum ErrorPolicy {
    SwallowErrors,
    RethrowErrors
};

const char *error_policy_name(ErrorPolicy policy);

// an error handler returns true if it considers the error handled.

template<typename T>
using ErrorHandler = std::function<bool(const std::exception_ptr &error, const T &subject)>;

class UnmatchedValueError : public std::runtime_error {
public:
    inline UnmatchedValueError() : std::runtime_error("No match found.") {
    }
};

class PatternError : public std::runtime_error {
public:
    inline PatternError(const std::string &what) : std::runtime_error(what) {
    }
};

std::string describe_exception(const std::exception_ptr &error);

template<typename P, typename T, typename = void>
struct is_predicate : std::false_type {
};

template<typename P, typename T>
struct is_predicate<P, T, decltype(void(bool(std::declval<const P&>()(std::declval<const T&>()))))> :
    std::true_type {
};

template<typename P, typename = void>
struct has_name : std::false_type {
};

template<typename P>
struct has_name<P, decltype(void(std::string(std::declval<const P&>().name())))> : std::true_type {
};

template<typename A, typename B>
inline auto coalesce(const A &a, const B &b) {
    if (!a.empty()) {
        return a;
    } else {
        return A(b);
    }
}

#endif // FLUENTMATCH_TYPES_H
