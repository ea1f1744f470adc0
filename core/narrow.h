#pragma once

#include <memory>
#include <type_traits>

#include "types.h"

// narrow<TCase>(subject) answers "is the subject a TCase" and, if so,
// returns a pointer to it as a TCase, or nullptr otherwise.
//
// classes that carry a type tag (a static TCase::Type, compared against
// the subject's type()) are tested by exact tag. all other classes are
// tested with dynamic_cast, i.e. a subject of a class derived from TCase
// is a TCase.

template<typename TCase, typename = void>
struct has_type_tag : std::false_type {
};

template<typename TCase>
struct has_type_tag<TCase, decltype(void(TCase::Type))> : std::true_type {
};

template<typename TCase, typename Base>
inline const TCase *narrow_pointer(const Base *p, std::true_type) {
    if (p && p->type() == TCase::Type) {
        return static_cast<const TCase*>(p);
    } else {
        return nullptr;
    }
}

template<typename TCase, typename Base>
inline const TCase *narrow_pointer(const Base *p, std::false_type) {
    return dynamic_cast<const TCase*>(p);
}

template<typename TCase>
inline const TCase *narrow(const TCase &value) {
    return &value;
}

template<typename TCase, typename Base>
inline const TCase *narrow(const Base *p) {
    return narrow_pointer<TCase>(p, has_type_tag<TCase>());
}

template<typename TCase, typename Base>
inline const TCase *narrow(const std::shared_ptr<Base> &p) {
    return narrow<TCase>(static_cast<const Base*>(p.get()));
}

template<typename TCase, typename Base>
inline const TCase *narrow(const std::unique_ptr<Base> &p) {
    return narrow<TCase>(static_cast<const Base*>(p.get()));
}

template<typename TCase, typename U>
inline const TCase *narrow(const optional<U> &value) {
    if (value) {
        return narrow<TCase>(*value);
    } else {
        return nullptr;
    }
}
