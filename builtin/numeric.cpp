#include "numeric.h"

namespace Builtins {

std::string IsEven::name() const {
    return "Even";
}

std::string IsOdd::name() const {
    return "Odd";
}

DivisibleBy::DivisibleBy(const mpz_class &divisor) : m_divisor(divisor) {
    if (m_divisor == 0) {
        throw std::invalid_argument("divisor must not be zero");
    }
}

std::string DivisibleBy::name() const {
    return "DivisibleBy: " + m_divisor.get_str();
}

std::string FitsMachineInteger::name() const {
    return "MachineInteger";
}

} // end namespace Builtins
