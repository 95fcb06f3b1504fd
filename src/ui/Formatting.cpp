#include "ui/Formatting.hpp"
#include "util/UnicodeUtils.hpp"

namespace colpick::ui {

namespace {

// Length of the CSI sequence starting at i, 0 if there is none
size_t csi_length(const std::string& s, size_t i) {
    if (s[i] != '\x1B' || i + 1 >= s.size() || s[i + 1] != '[') return 0;
    size_t j = i + 2;
    while (j < s.size() && (s[j] < '@' || s[j] > '~')) {
        j++;
    }
    if (j < s.size()) j++; // Final byte
    return j - i;
}

}  // namespace

int display_cols(const std::string& s) {
    int cols = 0;
    const auto length = static_cast<int32_t>(s.size());
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t i = 0;
    while (i < length) {
        if (size_t esc = csi_length(s, static_cast<size_t>(i))) {
            i += static_cast<int32_t>(esc);
            continue;
        }
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        cols += (c < 0) ? 1 : util::codepoint_width(c);
    }
    return cols;
}

std::string take_cols(const std::string& s, int cols) {
    if (cols <= 0) return "";

    std::string out;
    out.reserve(s.size());
    int seen = 0;
    const auto length = static_cast<int32_t>(s.size());
    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    int32_t i = 0;

    while (i < length) {
        if (size_t esc = csi_length(s, static_cast<size_t>(i))) {
            out.append(s, i, esc);
            i += static_cast<int32_t>(esc);
            continue;
        }

        int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        int w = (c < 0) ? 1 : util::codepoint_width(c);
        if (seen + w > cols) break;

        out.append(s, start, i - start);
        seen += w;
    }

    return out;
}

std::string trunc_pad(const std::string& s, int w) {
    if (w <= 0) return "";

    int cols = display_cols(s);
    if (cols == w) {
        return s;
    }
    if (cols < w) {
        return s + std::string(w - cols, ' ');
    }

    // Truncate with ellipsis; a dropped wide char may leave one cell short
    std::string head = take_cols(s, w - 1) + "…";
    int head_cols = display_cols(head);
    if (head_cols < w) head += std::string(w - head_cols, ' ');
    return head;
}

std::string truncate_cols(const std::string& s, int w) {
    if (w <= 0) return "";
    if (display_cols(s) <= w) return s;
    return take_cols(s, w - 1) + "…";
}

} // namespace colpick::ui
