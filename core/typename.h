#pragma once

#include <string>
#include <typeinfo>

std::string demangle(const char *name);

// strips namespaces and enclosing classes, keeping template arguments.
std::string unqualified_name(const std::string &name);

template<typename T>
inline std::string type_name() {
    return demangle(typeid(T).name());
}

template<typename T>
inline std::string short_type_name() {
    return unqualified_name(type_name<T>());
}
