#ifndef FLUENTMATCH_STRINGS_H
#define FLUENTMATCH_STRINGS_H

#include <memory>
#include <string>
#include <vector>

#include "unicode/unistr.h"
#include "unicode/regex.h"

#include "../core/types.h"
#include "../core/matcher.h"

namespace Builtins {

struct StringMatchOptions {
    bool ignore_case = false;
};

// base of the string predicates. subjects are compared in NFC normal
// form; a null const char* or an empty optional never matches.

class StringPredicate {
protected:
    const StringMatchOptions m_options;

    virtual icu::UnicodeString prepare(const std::string &utf8) const;

    virtual bool test(const icu::UnicodeString &text) const = 0;

public:
    inline StringPredicate(const StringMatchOptions &options) : m_options(options) {
    }

    virtual inline ~StringPredicate() {
    }

    inline bool operator()(const std::string &s) const {
        return test(prepare(s));
    }

    inline bool operator()(const char *s) const {
        return s != nullptr && test(prepare(s));
    }

    inline bool operator()(const optional<std::string> &s) const {
        return bool(s) && test(prepare(*s));
    }

    virtual std::string name() const = 0;
};

class SubstringPredicate : public StringPredicate {
protected:
    const std::string m_text;
    const icu::UnicodeString m_needle;

public:
    SubstringPredicate(const std::string &text, const StringMatchOptions &options);
};

class Contains : public SubstringPredicate {
protected:
    virtual bool test(const icu::UnicodeString &text) const;

public:
    using SubstringPredicate::SubstringPredicate;

    virtual std::string name() const;
};

class StartsWith : public SubstringPredicate {
protected:
    virtual bool test(const icu::UnicodeString &text) const;

public:
    using SubstringPredicate::SubstringPredicate;

    virtual std::string name() const;
};

class EndsWith : public SubstringPredicate {
protected:
    virtual bool test(const icu::UnicodeString &text) const;

public:
    using SubstringPredicate::SubstringPredicate;

    virtual std::string name() const;
};

class EqualsString : public SubstringPredicate {
protected:
    virtual bool test(const icu::UnicodeString &text) const;

public:
    using SubstringPredicate::SubstringPredicate;

    virtual std::string name() const;
};

struct RegexMatch {
    // groups[0] is the whole match; start and end are byte offsets
    // of it in the NFC normalized subject.
    std::vector<std::string> groups;
    size_t start;
    size_t end;

    inline const std::string &str() const {
        return groups.at(0);
    }

    inline const std::string &group(size_t i) const {
        return groups.at(i);
    }
};

// the pattern is compiled on first use, so an invalid pattern is
// reported as an error of the clause that uses it.

class Regex : public StringPredicate {
private:
    const std::string m_pattern;
    mutable std::shared_ptr<icu::RegexPattern> m_compiled;

    const icu::RegexPattern &compiled() const;

    optional<RegexMatch> find(const icu::UnicodeString &text) const;

protected:
    virtual icu::UnicodeString prepare(const std::string &utf8) const;

    virtual bool test(const icu::UnicodeString &text) const;

public:
    Regex(const std::string &pattern, const StringMatchOptions &options);

    optional<RegexMatch> search(const std::string &s) const;

    optional<RegexMatch> search(const char *s) const;

    optional<RegexMatch> search(const optional<std::string> &s) const;

    virtual std::string name() const;
};

inline Contains contains(
    const std::string &text, const StringMatchOptions &options = StringMatchOptions()) {
    return Contains(text, options);
}

inline StartsWith starts_with(
    const std::string &text, const StringMatchOptions &options = StringMatchOptions()) {
    return StartsWith(text, options);
}

inline EndsWith ends_with(
    const std::string &text, const StringMatchOptions &options = StringMatchOptions()) {
    return EndsWith(text, options);
}

inline EqualsString equals_string(
    const std::string &text, const StringMatchOptions &options = StringMatchOptions()) {
    return EqualsString(text, options);
}

inline Regex matches_regex(
    const std::string &pattern, const StringMatchOptions &options = StringMatchOptions()) {
    return Regex(pattern, options);
}

inline optional<RegexMatch> regex_search(
    const std::string &s,
    const std::string &pattern,
    const StringMatchOptions &options = StringMatchOptions()) {

    return Regex(pattern, options).search(s);
}

// a clause that matches if pattern is found in the subject; f receives
// the RegexMatch.
template<typename T, typename R, typename F>
inline Matcher<T, R> &when_regex(
    Matcher<T, R> &matcher,
    const std::string &pattern,
    const F &f,
    const std::string &label = std::string(),
    const StringMatchOptions &options = StringMatchOptions()) {

    const Regex regex(pattern, options);

    return matcher.when_extract([&regex] (const T &subject) {
        return regex.search(subject);
    }, f, coalesce(label, regex.name()));
}

} // end namespace Builtins

#endif // FLUENTMATCH_STRINGS_H
