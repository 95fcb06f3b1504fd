#include "util/TextMatcher.hpp"

namespace colpick::util {

TextMatcher::TextMatcher(std::string_view pattern, bool case_sensitive)
    : pattern_(pattern),
      case_sensitive_(case_sensitive) {
    const int m = length();
    skip_.fill(m);

    // Only the last occurrence of each byte (excluding the final one) matters
    for (int i = 0; i < m - 1; ++i) {
        skip_[fold(static_cast<unsigned char>(pattern_[i]))] = m - 1 - i;
    }
}

int TextMatcher::search(std::string_view text, int start_pos) const {
    const int m = length();
    const int n = static_cast<int>(text.size());

    if (m == 0 || start_pos < 0 || start_pos >= n || m > n) {
        return -1;
    }

    int i = start_pos;
    while (i <= n - m) {
        int j = m - 1;
        while (j >= 0 &&
               fold(static_cast<unsigned char>(text[i + j])) ==
               fold(static_cast<unsigned char>(pattern_[j]))) {
            --j;
        }
        if (j < 0) {
            return i;
        }

        int shift = skip_[fold(static_cast<unsigned char>(text[i + m - 1]))];
        i += shift > 0 ? shift : 1;
    }

    return -1;
}

TextMatcher::Match TextMatcher::find(std::string_view text) const {
    int pos = search(text);
    if (pos < 0) return {};
    return Match{pos, length()};
}

}  // namespace colpick::util
