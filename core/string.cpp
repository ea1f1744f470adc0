#include "core/types.h"
#include "core/string.h"

#include <sstream>

#include "unicode/errorcode.h"
#include "unicode/normalizer2.h"

void check_status(const UErrorCode &status, const char *err) {
	if (U_FAILURE(status)) {
		icu::ErrorCode code;
		code.set(status);
		std::ostringstream s;
		s << err << ": " << code.errorName();
		throw PatternError(s.str());
	}
}

icu::UnicodeString normalized_unicode(const std::string &utf8) {
    bool is_ascii = true;
	const size_t size = utf8.size();

    for (size_t i = 0; i < size; i++) {
        if (utf8[i] & 0x80) {
			is_ascii = false;
            break;
        }
    }

    if (is_ascii) {
        return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8));
    }

    UErrorCode status = U_ZERO_ERROR;

    const icu::Normalizer2 *norm = icu::Normalizer2::getNFCInstance(status);
	check_status(status, "Normalizer2::getNFCInstance failed");

    icu::UnicodeString normalized = norm->normalize(
        icu::UnicodeString::fromUTF8(icu::StringPiece(utf8)), status);
	check_status(status, "Normalizer2::normalize failed");

	return normalized;
}

std::string to_utf8(const icu::UnicodeString &s) {
    std::string utf8;
    s.toUTF8String(utf8);
    return utf8;
}

size_t utf8_offset(const icu::UnicodeString &s, int32_t offset) {
    return to_utf8(s.tempSubString(0, offset)).size();
}
