#include "types.h"

const char *error_policy_name(ErrorPolicy policy) {
    switch (policy) {
        case SwallowErrors:
            return "SwallowErrors";
        case RethrowErrors:
            return "RethrowErrors";
        default:
            throw std::runtime_error("unknown error policy");
    }
}

std::string describe_exception(const std::exception_ptr &error) {
    if (!error) {
        return std::string();
    }

    try {
        std::rethrow_exception(error);
    } catch (const std::exception &e) {
        return e.what();
    } catch (const std::string &s) {
        return s;
    } catch (const char *s) {
        return s;
    } catch (...) {
        return "unknown exception";
    }
}
