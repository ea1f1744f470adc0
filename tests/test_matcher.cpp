#include <stdlib.h>
#include <gtest/gtest.h>


#include "core/types.h"
#include "core/matcher.h"


namespace {

std::function<std::string()> text(const char *s) {
    return [s] () {
        return std::string(s);
    };
}

class Positive {
public:
    bool operator()(int x) const {
        return x > 0;
    }

    std::string name() const {
        return "Positive";
    }
};

MatchOptions<int> quiet(bool short_circuit) {
    MatchOptions<int> options;
    options.short_circuit = short_circuit;
    options.output = std::make_shared<TestOutput>();
    return options;
}

} // end namespace


TEST(Matcher, Matcher_value_case) {
    Matcher<int, std::string> matcher(5);

    const auto result = matcher
        .when(3, text("Three"))
        .when(5, text("Five"))
        .otherwise(text("Other"));

    ASSERT_TRUE(bool(result));
    EXPECT_EQ(*result, "Five");
    EXPECT_TRUE(matcher.matched());
    EXPECT_FALSE(matcher.defaulted());
    ASSERT_EQ(matcher.log().size(), 1);
    EXPECT_EQ(matcher.log()[0].label, "Case");
    EXPECT_EQ(matcher.log()[0].kind, MatchedEntry);
    EXPECT_EQ(*matcher.log()[0].result, "Five");
    EXPECT_EQ(matcher.log()[0].subject, 5);
}


TEST(Matcher, Matcher_predicate_label) {
    Matcher<int, std::string> matcher(42);

    matcher.when([] (const int &x) {
        return x > 10;
    }, text("Big"), "BigMatch");
    matcher.otherwise(text("Small"), "SmallMatch");

    ASSERT_EQ(matcher.log().size(), 1);
    EXPECT_EQ(matcher.log()[0].label, "BigMatch");
    EXPECT_EQ(*matcher.result(), "Big");
}


TEST(Matcher, Matcher_predicate_name_is_label) {
    Matcher<int, std::string> matcher(3);
    matcher.when(Positive(), text("positive"));

    ASSERT_EQ(matcher.log().size(), 1);
    EXPECT_EQ(matcher.log()[0].label, "Positive");

    Matcher<int, std::string> labelled(3);
    labelled.when(Positive(), text("positive"), "explicit");
    EXPECT_EQ(labelled.log()[0].label, "explicit");
}


TEST(Matcher, Matcher_short_circuit_skips_later_clauses) {
    Matcher<int, std::string> matcher(1);

    int evaluated = 0;
    int ran = 0;

    matcher.when(1, text("first"));
    matcher.when([&evaluated] (const int &) {
        evaluated++;
        return true;
    }, [&ran] () {
        ran++;
        return std::string("second");
    });

    EXPECT_EQ(evaluated, 0);
    EXPECT_EQ(ran, 0);
    EXPECT_EQ(*matcher.result(), "first");
    EXPECT_EQ(matcher.all_results().size(), 1);
    EXPECT_EQ(matcher.log().size(), 1);
}


TEST(Matcher, Matcher_no_short_circuit_collects_all) {
    Matcher<int, std::string> matcher(4, false);

    matcher
        .when([] (const int &x) { return x % 2 == 0; }, text("even"))
        .when([] (const int &x) { return x > 10; }, text("big"))
        .when([] (const int &x) { return x < 5; }, text("small"))
        .when(4, text("four"));

    const std::vector<std::string> expected = {"even", "small", "four"};
    EXPECT_EQ(matcher.all_results(), expected);
    EXPECT_EQ(*matcher.result(), "four");

    ASSERT_EQ(matcher.log().size(), 3);
    for (size_t i = 0; i < matcher.log().size(); i++) {
        EXPECT_EQ(matcher.log()[i].index, i);
        EXPECT_EQ(*matcher.log()[i].result, expected[i]);
    }
}


TEST(Matcher, Matcher_predicate_false_leaves_no_entry) {
    Matcher<int, std::string> matcher(7);
    matcher.when(1, text("one")).when(2, text("two"));

    EXPECT_FALSE(matcher.matched());
    EXPECT_FALSE(bool(matcher.result()));
    EXPECT_TRUE(matcher.log().empty());
    EXPECT_TRUE(matcher.all_results().empty());
}


TEST(Matcher, Matcher_default) {
    Matcher<int, std::string> matcher(7);

    int ran = 0;
    const auto f = [&ran] () {
        ran++;
        return std::string("Other");
    };

    const auto result = matcher.when(1, text("one")).otherwise(f);
    ASSERT_TRUE(bool(result));
    EXPECT_EQ(*result, "Other");
    EXPECT_TRUE(matcher.defaulted());
    EXPECT_FALSE(matcher.matched());

    // a second default does not run again.
    matcher.otherwise(f, "again");
    EXPECT_EQ(ran, 1);

    ASSERT_EQ(matcher.log().size(), 1);
    EXPECT_EQ(matcher.log()[0].label, "Default");
    EXPECT_EQ(matcher.log()[0].kind, DefaultEntry);
    EXPECT_FALSE(matcher.log()[0].has_error());
}


TEST(Matcher, Matcher_default_after_match_is_noop) {
    Matcher<int, std::string> matcher(1);

    int ran = 0;
    const auto result = matcher.when(1, text("one")).otherwise([&ran] () {
        ran++;
        return std::string("Other");
    });

    EXPECT_EQ(ran, 0);
    EXPECT_EQ(*result, "one");
    EXPECT_EQ(matcher.log().size(), 1);
}


TEST(Matcher, Matcher_case_after_default_is_skipped) {
    Matcher<int, std::string> matcher(7);

    int evaluated = 0;
    matcher.otherwise(text("Other"));
    matcher.when([&evaluated] (const int &) {
        evaluated++;
        return true;
    }, text("late"));

    EXPECT_EQ(evaluated, 0);
    EXPECT_FALSE(matcher.matched());
    EXPECT_EQ(*matcher.result(), "Other");

    const std::vector<std::string> expected = {"Other"};
    EXPECT_EQ(matcher.all_results(), expected);
    ASSERT_EQ(matcher.log().size(), 1);
    EXPECT_EQ(matcher.log()[0].kind, DefaultEntry);
}


TEST(Matcher, Matcher_side_effect_bodies) {
    Matcher<int, std::string> matcher(2);

    int hits = 0;
    matcher.when(2, [&hits] () {
        hits++;
    });

    EXPECT_EQ(hits, 1);
    EXPECT_TRUE(matcher.matched());
    EXPECT_FALSE(bool(matcher.result()));
    EXPECT_TRUE(matcher.all_results().empty());
    ASSERT_EQ(matcher.log().size(), 1);
    EXPECT_FALSE(matcher.log()[0].has_result());
    EXPECT_FALSE(matcher.log()[0].has_error());

    Matcher<int, std::string> other(3);
    bool defaulted = false;
    other.when(2, [&hits] () {
        hits++;
    }).otherwise([&defaulted] () {
        defaulted = true;
    });

    EXPECT_EQ(hits, 1);
    EXPECT_TRUE(defaulted);
    EXPECT_TRUE(other.defaulted());
    ASSERT_EQ(other.log().size(), 1);
    EXPECT_EQ(other.log()[0].kind, DefaultEntry);
}


TEST(Matcher, Matcher_empty_result_still_matches) {
    Matcher<int, std::string> matcher(0);

    matcher.when(0, text(""));

    EXPECT_TRUE(matcher.matched());
    ASSERT_TRUE(bool(matcher.result()));
    EXPECT_EQ(*matcher.result(), "");
}


TEST(Matcher, Matcher_extract) {
    Matcher<std::string, int> matcher("n=17");

    matcher.when_extract([] (const std::string &s) -> optional<int> {
        if (s.compare(0, 2, "n=") == 0) {
            return std::atoi(s.c_str() + 2);
        } else {
            return nullopt;
        }
    }, [] (int n) {
        return n * 2;
    }, "Assignment");

    EXPECT_EQ(*matcher.result(), 34);
    EXPECT_EQ(matcher.log()[0].label, "Assignment");
}


TEST(Matcher, Matcher_default_error_propagates) {
    Matcher<int, std::string> matcher(1, quiet(true));

    EXPECT_THROW(matcher.otherwise([] () -> std::string {
        throw std::runtime_error("default failed");
    }), std::runtime_error);

    EXPECT_TRUE(matcher.log().empty());
    EXPECT_FALSE(matcher.defaulted());
}


TEST(Matcher, Matcher_options) {
    MatchOptions<int> options = quiet(false);
    options.error_policy = RethrowErrors;

    Matcher<int, std::string> matcher(9, options);
    EXPECT_EQ(matcher.subject(), 9);
    EXPECT_FALSE(matcher.short_circuit());
    EXPECT_EQ(matcher.error_policy(), RethrowErrors);

    Matcher<int, std::string> plain(9);
    EXPECT_TRUE(plain.short_circuit());
    EXPECT_EQ(plain.error_policy(), SwallowErrors);
}
