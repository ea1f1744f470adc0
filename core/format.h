#pragma once

#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>

#include "types.h"
#include "typename.h"

// printable forms of subjects and results, as shown in match logs
// and clause labels. values without an operator<< print as their
// type name.

template<typename T, typename = void>
struct is_streamable : std::false_type {
};

template<typename T>
struct is_streamable<T, decltype(void(std::declval<std::ostream&>() << std::declval<const T&>()))> :
    std::true_type {
};

template<typename T, typename Enable = void>
struct Formatter {
    static inline void write(std::ostream &s, const T &value) {
        write(s, value, is_streamable<T>());
    }

private:
    static inline void write(std::ostream &s, const T &value, std::true_type) {
        s << value;
    }

    static inline void write(std::ostream &s, const T &value, std::false_type) {
        s << "<" << short_type_name<T>() << ">";
    }
};

// unscoped enums would stream as plain integers.
template<typename T>
struct Formatter<T, typename std::enable_if<std::is_enum<T>::value>::type> {
    static inline void write(std::ostream &s, const T &value) {
        s << short_type_name<T>() << "(" << static_cast<long long>(value) << ")";
    }
};

template<>
struct Formatter<bool> {
    static inline void write(std::ostream &s, bool value) {
        s << (value ? "true" : "false");
    }
};

template<>
struct Formatter<std::string> {
    static inline void write(std::ostream &s, const std::string &value) {
        s << '"' << value << '"';
    }
};

template<>
struct Formatter<const char*> {
    static inline void write(std::ostream &s, const char *value) {
        if (value) {
            s << '"' << value << '"';
        } else {
            s << "null";
        }
    }
};

template<typename U>
struct Formatter<optional<U>> {
    static inline void write(std::ostream &s, const optional<U> &value) {
        if (value) {
            Formatter<U>::write(s, *value);
        } else {
            s << "null";
        }
    }
};

template<typename U>
struct Formatter<U*> {
    static inline void write(std::ostream &s, const U *value) {
        if (value) {
            s << "<" << unqualified_name(demangle(typeid(*value).name())) << ">";
        } else {
            s << "null";
        }
    }
};

template<typename U>
struct Formatter<std::shared_ptr<U>> {
    static inline void write(std::ostream &s, const std::shared_ptr<U> &value) {
        Formatter<U*>::write(s, value.get());
    }
};

template<typename T>
inline std::string format_value(const T &value) {
    std::ostringstream s;
    Formatter<T>::write(s, value);
    return s.str();
}
