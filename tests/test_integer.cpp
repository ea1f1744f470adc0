#include <stdlib.h>
#include <gmpxx.h>
#include <gtest/gtest.h>


#include "core/types.h"
#include "core/matcher.h"
#include "builtin/numeric.h"
#include "builtin/sets.h"
#include "builtin/logic.h"


using namespace Builtins;


namespace {

enum Permission {
    Read = 1,
    Write = 2,
    Execute = 4
};

mpz_class big(const char *digits) {
    return mpz_class(digits, 10);
}

} // end namespace


TEST(Numeric, Numeric_in_range) {
    const auto low = in_range(1, 3);
    EXPECT_TRUE(low(1));
    EXPECT_TRUE(low(3));
    EXPECT_FALSE(low(0));
    EXPECT_FALSE(low(4));
    EXPECT_EQ(low.name(), "InRange: [1, 3]");

    const auto unit = in_range(0.0, 1.0);
    EXPECT_TRUE(unit(0.5));
    EXPECT_FALSE(unit(1.5));
}


TEST(Numeric, Numeric_in_range_big_integers) {
    const auto range = in_range(big("100000000000000000000"), big("100000000000000000010"));
    EXPECT_TRUE(range(big("100000000000000000005")));
    EXPECT_FALSE(range(big("99999999999999999999")));
    EXPECT_FALSE(range(5));
}


TEST(Numeric, Numeric_comparisons) {
    EXPECT_TRUE(greater_than(10)(11));
    EXPECT_FALSE(greater_than(10)(10));
    EXPECT_TRUE(less_than(10)(9));
    EXPECT_FALSE(less_than(10)(10));
    EXPECT_TRUE(equal_to(10)(10));
    EXPECT_FALSE(equal_to(10)(11));

    EXPECT_EQ(greater_than(10).name(), ">10");
    EXPECT_EQ(less_than(10).name(), "<10");
    EXPECT_EQ(equal_to(10).name(), "==10");

    EXPECT_TRUE(greater_than(big("18446744073709551616"))(big("18446744073709551617")));
}


TEST(Numeric, Numeric_parity_and_divisibility) {
    EXPECT_TRUE(is_even()(4));
    EXPECT_FALSE(is_even()(-3));
    EXPECT_TRUE(is_odd()(-3));
    EXPECT_TRUE(is_odd()(big("123456789012345678901")));
    EXPECT_TRUE(is_even()(0u));

    EXPECT_TRUE(divisible_by(3)(9));
    EXPECT_FALSE(divisible_by(3)(10));
    EXPECT_TRUE(divisible_by(7)(big("700000000000000000000")));
    EXPECT_EQ(divisible_by(7).name(), "DivisibleBy: 7");

    EXPECT_THROW(divisible_by(0), std::invalid_argument);
}


TEST(Numeric, Numeric_fits_machine_integer) {
    EXPECT_TRUE(fits_machine_integer()(42));
    EXPECT_TRUE(fits_machine_integer()(big("-9223372036854775808")));
    EXPECT_FALSE(fits_machine_integer()(big("9223372036854775808")));
    EXPECT_FALSE(fits_machine_integer()(18446744073709551615ul));
}


TEST(Numeric, Numeric_clauses) {
    Matcher<mpz_class, std::string> matcher(big("340282366920938463463374607431768211456"));

    const auto result = matcher
        .when(fits_machine_integer(), [] () {
            return std::string("machine");
        })
        .when(is_even(), [] () {
            return std::string("big and even");
        })
        .otherwise([] () {
            return std::string("other");
        });

    EXPECT_EQ(*result, "big and even");
    EXPECT_EQ(matcher.log()[0].label, "Even");
}


TEST(Sets, Sets_is_one_of) {
    const auto even = is_one_of({2, 4});
    EXPECT_TRUE(even(2));
    EXPECT_FALSE(even(3));
    EXPECT_EQ(even.name(), "OneOf[2, 4]");

    const std::vector<std::string> names = {"ann", "bob"};
    const auto known = is_one_of(names);
    EXPECT_TRUE(known(std::string("bob")));
    EXPECT_FALSE(known(std::string("eve")));
    EXPECT_EQ(known.size(), 2);
    EXPECT_EQ(known.name(), "OneOf[\"ann\", \"bob\"]");
}


TEST(Logic, Logic_booleans) {
    Matcher<bool, std::string> matcher(false);

    const auto result = matcher
        .when(is_true(), [] () {
            return std::string("yes");
        })
        .when(is_false(), [] () {
            return std::string("no");
        })
        .otherwise([] () {
            return std::string("?");
        });

    EXPECT_EQ(*result, "no");
    EXPECT_EQ(matcher.log()[0].label, "False");
}


TEST(Logic, Logic_has_flag) {
    const Permission rw = Permission(Read | Write);

    EXPECT_TRUE(has_flag(Read)(rw));
    EXPECT_TRUE(has_flag(Write)(rw));
    EXPECT_FALSE(has_flag(Execute)(rw));
    EXPECT_TRUE(has_flag(Permission(Read | Write))(Permission(Read | Write | Execute)));
    EXPECT_EQ(has_flag(Write).name(), "HasFlag: Permission(2)");
}


TEST(Logic, Logic_null_tests) {
    const int x = 1;
    const int *p = &x;
    const int *none = nullptr;

    EXPECT_FALSE(is_null()(p));
    EXPECT_TRUE(is_null()(none));
    EXPECT_TRUE(is_not_null()(p));

    EXPECT_TRUE(is_null()(std::shared_ptr<int>()));
    EXPECT_TRUE(is_not_null()(std::make_shared<int>(2)));
    EXPECT_TRUE(is_null()(optional<int>()));
    EXPECT_TRUE(is_not_null()(optional<int>(0)));
}
