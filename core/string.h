#ifndef FLUENTMATCH_STRING_H
#define FLUENTMATCH_STRING_H

#include <string>

#include "unicode/utypes.h"
#include "unicode/unistr.h"

// throws a PatternError naming err if status is a failure.
void check_status(const UErrorCode &status, const char *err);

// the NFC normalized form of a UTF-8 string.
icu::UnicodeString normalized_unicode(const std::string &utf8);

std::string to_utf8(const icu::UnicodeString &s);

// the byte offset in the UTF-8 form of s that corresponds to the
// UTF-16 offset.
size_t utf8_offset(const icu::UnicodeString &s, int32_t offset);

#endif // FLUENTMATCH_STRING_H
