#include "strings.h"
#include "../core/string.h"

#include "unicode/uchar.h"

#include <sstream>

namespace Builtins {

icu::UnicodeString StringPredicate::prepare(const std::string &utf8) const {
    icu::UnicodeString text = normalized_unicode(utf8);
    if (m_options.ignore_case) {
        text.foldCase(U_FOLD_CASE_DEFAULT);
    }
    return text;
}

SubstringPredicate::SubstringPredicate(const std::string &text, const StringMatchOptions &options) :

    StringPredicate(options),
    m_text(text),
    m_needle(prepare(text)) {
}

bool Contains::test(const icu::UnicodeString &text) const {
    // UnicodeString::indexOf never finds an empty string.
    return m_needle.isEmpty() || text.indexOf(m_needle) >= 0;
}

std::string Contains::name() const {
    return "Contains: " + m_text;
}

bool StartsWith::test(const icu::UnicodeString &text) const {
    return text.startsWith(m_needle);
}

std::string StartsWith::name() const {
    return "StartsWith: " + m_text;
}

bool EndsWith::test(const icu::UnicodeString &text) const {
    return text.endsWith(m_needle);
}

std::string EndsWith::name() const {
    return "EndsWith: " + m_text;
}

bool EqualsString::test(const icu::UnicodeString &text) const {
    return text == m_needle;
}

std::string EqualsString::name() const {
    return "Equals: " + m_text;
}

Regex::Regex(const std::string &pattern, const StringMatchOptions &options) :

    StringPredicate(options),
    m_pattern(pattern) {
}

icu::UnicodeString Regex::prepare(const std::string &utf8) const {
    // case is left to the pattern's UREGEX_CASE_INSENSITIVE flag.
    return normalized_unicode(utf8);
}

const icu::RegexPattern &Regex::compiled() const {
    if (!m_compiled) {
        UParseError error;
        UErrorCode status = U_ZERO_ERROR;

        const uint32_t flags = m_options.ignore_case ? UREGEX_CASE_INSENSITIVE : 0;

        std::unique_ptr<icu::RegexPattern> pattern(icu::RegexPattern::compile(
            normalized_unicode(m_pattern), flags, error, status));

        if (U_FAILURE(status)) {
            std::ostringstream s;
            s << "invalid regular expression \"" << m_pattern << "\" at offset " << error.offset;
            check_status(status, s.str().c_str());
        }

        m_compiled = std::shared_ptr<icu::RegexPattern>(pattern.release());
    }

    return *m_compiled;
}

optional<RegexMatch> Regex::find(const icu::UnicodeString &text) const {
    UErrorCode status = U_ZERO_ERROR;

    // the matcher refers to text, which outlives it.
    std::unique_ptr<icu::RegexMatcher> matcher(compiled().matcher(text, status));
    check_status(status, "RegexPattern::matcher failed");

    const bool found = matcher->find(status);
    check_status(status, "RegexMatcher::find failed");

    if (!found) {
        return optional<RegexMatch>();
    }

    RegexMatch match;

    const int32_t n = matcher->groupCount();
    for (int32_t i = 0; i <= n; i++) {
        const icu::UnicodeString group = matcher->group(i, status);
        check_status(status, "RegexMatcher::group failed");
        match.groups.push_back(to_utf8(group));
    }

    const int32_t start = matcher->start(status);
    const int32_t end = matcher->end(status);
    check_status(status, "RegexMatcher::start failed");

    match.start = utf8_offset(text, start);
    match.end = utf8_offset(text, end);

    return match;
}

bool Regex::test(const icu::UnicodeString &text) const {
    return bool(find(text));
}

optional<RegexMatch> Regex::search(const std::string &s) const {
    return find(prepare(s));
}

optional<RegexMatch> Regex::search(const char *s) const {
    if (s) {
        return find(prepare(s));
    } else {
        return optional<RegexMatch>();
    }
}

optional<RegexMatch> Regex::search(const optional<std::string> &s) const {
    if (s) {
        return find(prepare(*s));
    } else {
        return optional<RegexMatch>();
    }
}

std::string Regex::name() const {
    return "Regex: " + m_pattern;
}

} // end namespace Builtins
