#pragma once

#include <array>
#include <string>
#include <string_view>

namespace colpick::util {

/**
 * Substring matcher used by column filtering.
 *
 * Boyer-Moore-Horspool over bytes with a fixed 256-entry skip table.
 * Case folding here is ASCII-only; callers that need Unicode-insensitive
 * matching normalize both sides with normalize_for_search() first.
 */
class TextMatcher {
public:
    struct Match {
        int pos = -1;
        int length = 0;

        bool found() const { return pos >= 0; }
    };

    explicit TextMatcher(std::string_view pattern, bool case_sensitive = false);

    /// Position of the first occurrence at or after start_pos, or -1.
    int search(std::string_view text, int start_pos = 0) const;

    Match find(std::string_view text) const;

    /// An empty pattern matches everything.
    bool matches(std::string_view text) const {
        return pattern_.empty() || search(text) != -1;
    }

    bool empty() const { return pattern_.empty(); }
    int length() const { return static_cast<int>(pattern_.size()); }

private:
    static constexpr int ALPHABET_SIZE = 256;

    std::string pattern_;
    bool case_sensitive_;
    std::array<int, ALPHABET_SIZE> skip_{};

    unsigned char fold(unsigned char c) const {
        if (case_sensitive_ || c < 'A' || c > 'Z') return c;
        return static_cast<unsigned char>(c - 'A' + 'a');
    }
};

}  // namespace colpick::util
