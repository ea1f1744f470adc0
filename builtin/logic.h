#ifndef FLUENTMATCH_LOGIC_H
#define FLUENTMATCH_LOGIC_H

#include <memory>
#include <type_traits>

#include "../core/types.h"
#include "../core/format.h"

namespace Builtins {

class IsTrue {
public:
    inline bool operator()(bool x) const {
        return x;
    }

    inline std::string name() const {
        return "True";
    }
};

class IsFalse {
public:
    inline bool operator()(bool x) const {
        return !x;
    }

    inline std::string name() const {
        return "False";
    }
};

// matches an enum bitmask that has all bits of flag set.
template<typename E>
class HasFlag {
private:
    using Bits = typename std::underlying_type<E>::type;

    const E m_flag;

public:
    inline explicit HasFlag(E flag) : m_flag(flag) {
    }

    inline bool operator()(E x) const {
        const Bits bits = static_cast<Bits>(m_flag);
        return (static_cast<Bits>(x) & bits) == bits;
    }

    inline std::string name() const {
        return "HasFlag: " + format_value(m_flag);
    }
};

class IsNull {
public:
    template<typename U>
    inline bool operator()(const U *p) const {
        return p == nullptr;
    }

    template<typename U>
    inline bool operator()(const std::shared_ptr<U> &p) const {
        return !p;
    }

    template<typename U>
    inline bool operator()(const optional<U> &x) const {
        return !x;
    }

    inline std::string name() const {
        return "Null";
    }
};

class IsNotNull {
public:
    template<typename U>
    inline bool operator()(const U *p) const {
        return p != nullptr;
    }

    template<typename U>
    inline bool operator()(const std::shared_ptr<U> &p) const {
        return bool(p);
    }

    template<typename U>
    inline bool operator()(const optional<U> &x) const {
        return bool(x);
    }

    inline std::string name() const {
        return "NotNull";
    }
};

inline IsTrue is_true() {
    return IsTrue();
}

inline IsFalse is_false() {
    return IsFalse();
}

template<typename E>
inline HasFlag<E> has_flag(E flag) {
    return HasFlag<E>(flag);
}

inline IsNull is_null() {
    return IsNull();
}

inline IsNotNull is_not_null() {
    return IsNotNull();
}

} // end namespace Builtins

#endif // FLUENTMATCH_LOGIC_H
