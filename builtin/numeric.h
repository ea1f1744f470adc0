#ifndef FLUENTMATCH_NUMERIC_H
#define FLUENTMATCH_NUMERIC_H

#include <gmpxx.h>
#include <sstream>
#include <string>
#include <type_traits>

#include "../core/types.h"

namespace Builtins {

// integer tests convert their subject to an mpz_class, so that machine
// integers and big integers are handled alike.

template<typename N>
inline typename std::enable_if<std::is_integral<N>::value && std::is_signed<N>::value, mpz_class>::type
to_mpz(N value) {
    return mpz_class(static_cast<long>(value));
}

template<typename N>
inline typename std::enable_if<std::is_integral<N>::value && std::is_unsigned<N>::value, mpz_class>::type
to_mpz(N value) {
    return mpz_class(static_cast<unsigned long>(value));
}

inline const mpz_class &to_mpz(const mpz_class &value) {
    return value;
}

// min <= x <= max
template<typename N>
class InRange {
private:
    const N m_min;
    const N m_max;

public:
    inline InRange(const N &min, const N &max) : m_min(min), m_max(max) {
    }

    template<typename T>
    inline bool operator()(const T &x) const {
        return !(x < m_min) && !(m_max < x);
    }

    std::string name() const {
        std::ostringstream s;
        s << "InRange: [" << m_min << ", " << m_max << "]";
        return s.str();
    }
};

template<typename N>
class Bound {
protected:
    const N m_value;

    std::string describe(const char *op) const {
        std::ostringstream s;
        s << op << m_value;
        return s.str();
    }

public:
    inline explicit Bound(const N &value) : m_value(value) {
    }
};

template<typename N>
class GreaterThan : public Bound<N> {
public:
    using Bound<N>::Bound;

    template<typename T>
    inline bool operator()(const T &x) const {
        return this->m_value < x;
    }

    inline std::string name() const {
        return this->describe(">");
    }
};

template<typename N>
class LessThan : public Bound<N> {
public:
    using Bound<N>::Bound;

    template<typename T>
    inline bool operator()(const T &x) const {
        return x < this->m_value;
    }

    inline std::string name() const {
        return this->describe("<");
    }
};

template<typename N>
class EqualTo : public Bound<N> {
public:
    using Bound<N>::Bound;

    template<typename T>
    inline bool operator()(const T &x) const {
        return x == this->m_value;
    }

    inline std::string name() const {
        return this->describe("==");
    }
};

class IsEven {
public:
    template<typename T>
    inline bool operator()(const T &x) const {
        const mpz_class &z = to_mpz(x);
        return mpz_even_p(z.get_mpz_t()) != 0;
    }

    std::string name() const;
};

class IsOdd {
public:
    template<typename T>
    inline bool operator()(const T &x) const {
        const mpz_class &z = to_mpz(x);
        return mpz_odd_p(z.get_mpz_t()) != 0;
    }

    std::string name() const;
};

class DivisibleBy {
private:
    const mpz_class m_divisor;

public:
    DivisibleBy(const mpz_class &divisor);

    template<typename T>
    inline bool operator()(const T &x) const {
        const mpz_class &z = to_mpz(x);
        return mpz_divisible_p(z.get_mpz_t(), m_divisor.get_mpz_t()) != 0;
    }

    std::string name() const;
};

// true if x is representable as a signed long.
class FitsMachineInteger {
public:
    template<typename T>
    inline bool operator()(const T &x) const {
        const mpz_class &z = to_mpz(x);
        return z.fits_slong_p();
    }

    std::string name() const;
};

template<typename N>
inline InRange<N> in_range(const N &min, const N &max) {
    return InRange<N>(min, max);
}

template<typename N>
inline GreaterThan<N> greater_than(const N &value) {
    return GreaterThan<N>(value);
}

template<typename N>
inline LessThan<N> less_than(const N &value) {
    return LessThan<N>(value);
}

template<typename N>
inline EqualTo<N> equal_to(const N &value) {
    return EqualTo<N>(value);
}

inline IsEven is_even() {
    return IsEven();
}

inline IsOdd is_odd() {
    return IsOdd();
}

template<typename N>
inline DivisibleBy divisible_by(const N &divisor) {
    return DivisibleBy(to_mpz(divisor));
}

inline FitsMachineInteger fits_machine_integer() {
    return FitsMachineInteger();
}

} // end namespace Builtins

#endif // FLUENTMATCH_NUMERIC_H
