#ifndef FLUENTMATCH_SETS_H
#define FLUENTMATCH_SETS_H

#include <algorithm>
#include <initializer_list>
#include <sstream>
#include <vector>

#include "../core/types.h"
#include "../core/format.h"

namespace Builtins {

template<typename V>
class OneOf {
private:
    const std::vector<V> m_values;

public:
    inline explicit OneOf(std::vector<V> &&values) : m_values(std::move(values)) {
    }

    template<typename T>
    inline bool operator()(const T &x) const {
        return std::find(m_values.begin(), m_values.end(), x) != m_values.end();
    }

    inline size_t size() const {
        return m_values.size();
    }

    std::string name() const {
        std::ostringstream s;
        s << "OneOf[";
        for (size_t i = 0; i < m_values.size(); i++) {
            if (i > 0) {
                s << ", ";
            }
            s << format_value(m_values[i]);
        }
        s << "]";
        return s.str();
    }
};

template<typename V>
inline OneOf<V> is_one_of(std::initializer_list<V> values) {
    return OneOf<V>(std::vector<V>(values));
}

template<typename Container>
inline OneOf<typename Container::value_type> is_one_of(const Container &values) {
    return OneOf<typename Container::value_type>(
        std::vector<typename Container::value_type>(values.begin(), values.end()));
}

} // end namespace Builtins

#endif // FLUENTMATCH_SETS_H
