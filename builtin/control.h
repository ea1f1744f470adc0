#ifndef FLUENTMATCH_CONTROL_H
#define FLUENTMATCH_CONTROL_H

#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "../core/types.h"
#include "../core/matcher.h"
#include "logic.h"

namespace Builtins {

template<typename R, typename T>
inline Matcher<T, R> switch_on(
    const T &value,
    bool short_circuit = true,
    const ErrorHandler<T> &handler = ErrorHandler<T>()) {

    return Matcher<T, R>(value, short_circuit, handler);
}

template<typename R>
inline Matcher<std::string, R> switch_string(
    const std::string &value,
    bool short_circuit = true,
    const ErrorHandler<std::string> &handler = ErrorHandler<std::string>()) {

    return Matcher<std::string, R>(value, short_circuit, handler);
}

template<typename R>
inline Matcher<std::string, R> switch_string(
    const char *value,
    bool short_circuit = true,
    const ErrorHandler<std::string> &handler = ErrorHandler<std::string>()) {

    return Matcher<std::string, R>(value, short_circuit, handler);
}

// a string that may be absent; the string builtins never match it then.
template<typename R>
inline Matcher<optional<std::string>, R> switch_string(
    const optional<std::string> &value,
    bool short_circuit = true,
    const ErrorHandler<optional<std::string>> &handler = ErrorHandler<optional<std::string>>()) {

    return Matcher<optional<std::string>, R>(value, short_circuit, handler);
}

// single expression matches. each returns the result of the first
// matching case and throws UnmatchedValueError if no case matched.

template<typename R, typename T>
inline R match(const T &value, std::initializer_list<std::pair<T, std::function<R()>>> cases) {
    Matcher<T, R> matcher(value);
    for (const auto &c : cases) {
        matcher.when(c.first, c.second);
    }
    if (!matcher.matched()) {
        throw UnmatchedValueError();
    }
    return *matcher.result();
}

template<typename R, typename T>
inline R match_if(
    const T &value,
    std::initializer_list<std::pair<std::function<bool(const T&)>, std::function<R()>>> cases) {

    Matcher<T, R> matcher(value);
    for (const auto &c : cases) {
        matcher.when(c.first, c.second);
    }
    if (!matcher.matched()) {
        throw UnmatchedValueError();
    }
    return *matcher.result();
}

template<typename TCase, typename F>
struct TypeCase {
    const F f;
};

template<typename TCase, typename F>
inline TypeCase<TCase, typename std::decay<F>::type> type_case(const F &f) {
    return TypeCase<TCase, typename std::decay<F>::type>{f};
}

template<typename T, typename R, typename TCase, typename F>
inline void add_type_case(Matcher<T, R> &matcher, const TypeCase<TCase, F> &c) {
    matcher.template when_type<TCase>(c.f);
}

// match_type<R>(subject, type_case<A>(f), type_case<B>(g), ...)
template<typename R, typename T, typename... Cases>
inline R match_type(const T &subject, const Cases&... cases) {
    Matcher<T, R> matcher(subject);

    using expand = int[];
    (void)expand{0, (add_type_case(matcher, cases), 0)...};

    if (!matcher.matched()) {
        throw UnmatchedValueError();
    }
    return *matcher.result();
}

template<typename R, typename P, typename FNull, typename FValue>
inline R match_nullable(const P &value, const FNull &when_null, const FValue &when_not_null) {
    // errors of either body reach the caller; they are not logged
    // anywhere else.
    MatchOptions<P> options;
    options.error_policy = RethrowErrors;
    options.output = std::make_shared<NoOutput>();

    Matcher<P, R> matcher(value, options);

    matcher.when(is_not_null(), [&value, &when_not_null] () {
        return when_not_null(*value);
    });

    return *matcher.otherwise(when_null, "Null");
}

template<typename R, typename U, typename FNull, typename FValue>
inline R match_null(const U *value, const FNull &when_null, const FValue &when_not_null) {
    return match_nullable<R>(value, when_null, when_not_null);
}

// a C string is a nullable string, as in the string builtins.
template<typename R, typename FNull, typename FValue>
inline R match_null(const char *value, const FNull &when_null, const FValue &when_not_null) {
    const optional<std::string> text = value ? optional<std::string>(std::string(value)) : nullopt;
    return match_nullable<R>(text, when_null, when_not_null);
}

template<typename R, typename U, typename FNull, typename FValue>
inline R match_null(const std::shared_ptr<U> &value, const FNull &when_null, const FValue &when_not_null) {
    return match_nullable<R>(value, when_null, when_not_null);
}

template<typename R, typename U, typename FNull, typename FValue>
inline R match_null(const optional<U> &value, const FNull &when_null, const FValue &when_not_null) {
    return match_nullable<R>(value, when_null, when_not_null);
}

// a lazy sequence of all results of matching each item of a container
// in non short circuit mode. configure declares the clauses on each
// item's matcher. items are matched as the sequence is iterated; the
// container must outlive the sequence.

template<typename Container, typename R, typename Configure>
class SwitchMany {
public:
    using T = typename Container::value_type;

private:
    using Source = typename Container::const_iterator;

    const Container &m_source;
    const Configure m_configure;

public:
    class iterator {
    private:
        const SwitchMany *m_owner;
        Source m_item;
        std::vector<R> m_results;
        size_t m_index;

        // moves to the first item at or after m_item that has results.
        void fill() {
            m_index = 0;

            while (m_item != m_owner->m_source.end()) {
                Matcher<T, R> matcher(*m_item, false);
                m_owner->m_configure(matcher);
                m_results = matcher.all_results();
                if (!m_results.empty()) {
                    return;
                }
                ++m_item;
            }

            m_results.clear();
        }

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = R;
        using difference_type = std::ptrdiff_t;
        using pointer = const R*;
        using reference = const R&;

        inline iterator(const SwitchMany *owner, const Source &item) : m_owner(owner), m_item(item) {
            fill();
        }

        inline const R &operator*() const {
            return m_results[m_index];
        }

        inline const R *operator->() const {
            return &m_results[m_index];
        }

        inline iterator &operator++() {
            if (++m_index >= m_results.size()) {
                ++m_item;
                fill();
            }
            return *this;
        }

        inline bool operator==(const iterator &other) const {
            return m_item == other.m_item && m_index == other.m_index;
        }

        inline bool operator!=(const iterator &other) const {
            return !(*this == other);
        }
    };

    inline SwitchMany(const Container &source, const Configure &configure) :
        m_source(source), m_configure(configure) {
    }

    inline iterator begin() const {
        return iterator(this, m_source.begin());
    }

    inline iterator end() const {
        return iterator(this, m_source.end());
    }

    inline std::vector<R> to_vector() const {
        return std::vector<R>(begin(), end());
    }
};

template<typename R, typename Container, typename Configure>
inline SwitchMany<Container, R, typename std::decay<Configure>::type> switch_many(
    const Container &source, const Configure &configure) {

    return SwitchMany<Container, R, typename std::decay<Configure>::type>(source, configure);
}

// the sequence refers to its container, so a temporary is rejected.
template<typename R, typename Container, typename Configure>
void switch_many(const Container &&source, const Configure &configure) = delete;

} // end namespace Builtins

#endif // FLUENTMATCH_CONTROL_H
