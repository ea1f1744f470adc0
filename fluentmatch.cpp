#include <chrono>
#include <future>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

#include "core/types.h"
#include "core/matcher.h"
#include "core/async.h"
#include "builtin/control.h"
#include "builtin/numeric.h"
#include "builtin/sets.h"
#include "builtin/strings.h"

using namespace Builtins;

class MyUnion {
public:
    virtual ~MyUnion() {
    }
};

class CaseA : public MyUnion {
public:
    const int num;

    inline CaseA(int num_) : num(num_) {
    }
};

class CaseB : public MyUnion {
public:
    const std::string text;

    inline CaseB(const std::string &text_) : text(text_) {
    }
};

int main(int argc, char **argv) {
    const int n = 42;

    const auto txt = switch_on<std::string>(n)
        .when(1, [] () {
            return std::string("One");
        })
        .when(in_range(10, 100), [] () {
            return std::string("Big range");
        })
        .otherwise([] () {
            return std::string("Other");
        });
    std::cout << "Switch: " << *txt << std::endl;

    const auto simple = match_if<std::string>(n, {
        {[] (const int &x) { return x == 1; }, [] () { return std::string("One"); }},
        {[] (const int &x) { return x == 2; }, [] () { return std::string("Two"); }},
        {[] (const int &) { return true; }, [] () { return std::string("Other"); }}
    });
    std::cout << "Match: " << simple << std::endl;

    const std::shared_ptr<const MyUnion> o = std::make_shared<CaseB>("hello!");
    const auto union_result = match_type<std::string>(o,
        type_case<CaseA>([] (const CaseA &) {
            return std::string("Type A");
        }),
        type_case<CaseB>([] (const CaseB &) {
            return std::string("Type B");
        }));
    std::cout << "Type match: " << union_result << std::endl;

    const optional<std::string> nullable = nullopt;
    const auto null_result = match_null<std::string>(nullable, [] () {
        return std::string("Is null");
    }, [] (const std::string &s) {
        return "Value: " + s;
    });
    std::cout << "Null: " << null_result << std::endl;

    const auto sresult = switch_string<std::string>("foobar")
        .when(contains("foo"), [] () {
            return std::string("Contains foo");
        })
        .when(starts_with("bar"), [] () {
            return std::string("Starts with bar");
        })
        .when(ends_with("ar"), [] () {
            return std::string("Ends with ar");
        })
        .otherwise([] () {
            return std::string("No match");
        });
    std::cout << "String helpers: " << *sresult << std::endl;

    Matcher<std::string, bool> hello("Hello");
    auto pending = hello.when_async([] (const std::string &s) {
        return !s.empty() && s[0] == 'H';
    }, [] () {
        return std::async(std::launch::async, [] () {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            return true;
        });
    }, "StartsWith H");
    const auto async_result = otherwise_async(std::move(pending), [] () {
        std::promise<bool> promise;
        promise.set_value(false);
        return promise.get_future();
    }).get();
    std::cout << "Async: " << std::boolalpha << *async_result << std::endl;

    const std::vector<int> nums = {1, 2, 3, 4};
    const auto bulk = switch_many<std::string>(nums, [] (Matcher<int, std::string> &m) {
        m.when(is_one_of({2, 4}), [] () {
            return std::string("Even");
        })
        .when(in_range(1, 3), [] () {
            return std::string("Low");
        })
        .otherwise([] () {
            return std::string("Other");
        });
    });

    std::ostringstream s;
    bool first = true;
    for (const std::string &result : bulk) {
        if (!first) {
            s << ", ";
        }
        s << result;
        first = false;
    }
    std::cout << "Bulk: " << s.str() << std::endl;

    for (const auto &entry : hello.log()) {
        std::cout << entry << std::endl;
    }

    return 0;
}
