#include "typename.h"

#include <cxxabi.h>
#include <cstdlib>

std::string demangle(const char *name) {
    int status;
    char *cxx_name = abi::__cxa_demangle(name, 0, 0, &status);
    if (cxx_name) {
        std::string s(cxx_name);
        std::free(cxx_name);
        return s;
    } else {
        return name;
    }
}

std::string unqualified_name(const std::string &name) {
    size_t begin = 0;
    int depth = 0;

    for (size_t i = 0; i < name.size(); i++) {
        switch (name[i]) {
            case '<':
            case '(':
                depth++;
                break;
            case '>':
            case ')':
                depth--;
                break;
            case ':':
                if (depth == 0 && i + 1 < name.size() && name[i + 1] == ':') {
                    begin = i + 2;
                    i++;
                }
                break;
        }
    }

    return name.substr(begin);
}
