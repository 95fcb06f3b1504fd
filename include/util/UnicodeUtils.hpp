#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <unicode/unistr.h>
#include <unicode/translit.h>

namespace colpick::util {

namespace detail {

/// Shared, immutable search transliterator. Created on first use;
/// nullptr if ICU lacks the transform data.
inline const icu::Transliterator* search_transliterator() {
    static const std::unique_ptr<icu::Transliterator> trans = [] {
        UErrorCode status = U_ZERO_ERROR;
        // NFD splits ö into o + combining diaeresis, the marks are dropped,
        // NFC recomposes and Latin-ASCII flattens the rest.
        std::unique_ptr<icu::Transliterator> t(
            icu::Transliterator::createInstance(
                "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
                UTRANS_FORWARD,
                status
            )
        );
        if (U_FAILURE(status)) {
            t.reset();
        }
        return t;
    }();
    return trans.get();
}

}  // namespace detail

/// Normalize text for Unicode-aware case-insensitive filtering
/// (Björk → bjork, José → jose).
inline std::string normalize_for_search(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    if (const auto* trans = detail::search_transliterator()) {
        trans->transliterate(unicode_text);
    }

    // foldCase is more robust than toLower for matching
    std::string result;
    unicode_text.foldCase().toUTF8String(result);
    return result;
}

/// Terminal cell width of one code point: 0 for controls, combining marks
/// and format characters, 2 for East Asian wide/fullwidth, 1 otherwise.
inline int codepoint_width(UChar32 c) {
    if (c == 0 || c < 0x20 || (c >= 0x7F && c < 0xA0)) {
        return 0;
    }

    int8_t category = u_charType(c);
    if (category == U_NON_SPACING_MARK || category == U_ENCLOSING_MARK || category == U_FORMAT_CHAR) {
        return 0;
    }

    // Hangul medial vowels and final consonants combine with the leading jamo
    int hangul = u_getIntPropertyValue(c, UCHAR_HANGUL_SYLLABLE_TYPE);
    if (hangul == U_HST_VOWEL_JAMO || hangul == U_HST_TRAILING_JAMO) {
        return 0;
    }

    int eaw = u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH);
    if (eaw == U_EA_WIDE || eaw == U_EA_FULLWIDTH) {
        return 2;
    }
    return 1;
}

/// Display width of a UTF-8 string. Invalid bytes count as one cell each.
inline int display_width(std::string_view text) {
    int width = 0;
    int32_t i = 0;
    const auto length = static_cast<int32_t>(text.size());
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    while (i < length) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        width += (c < 0) ? 1 : codepoint_width(c);
    }
    return width;
}

}  // namespace colpick::util
