#include "ui/Canvas.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>

namespace colpick::ui {

std::string to_sgr(const Style& style) {
    if (style.is_plain()) return "";

    std::string output;
    if (style.fg != Color::Default) {
        int fg_code = 30 + (static_cast<int>(style.fg) - 1) % 8;
        if (static_cast<int>(style.fg) > 8) {
            fg_code += 60;  // Bright colors
        }
        output += "\033[" + std::to_string(fg_code) + "m";
    }
    if (style.bg != Color::Default) {
        int bg_code = 40 + (static_cast<int>(style.bg) - 1) % 8;
        if (static_cast<int>(style.bg) > 8) {
            bg_code += 60;
        }
        output += "\033[" + std::to_string(bg_code) + "m";
    }
    if (has_attribute(style.attr, Attribute::Bold)) output += "\033[1m";
    if (has_attribute(style.attr, Attribute::Dim)) output += "\033[2m";
    if (has_attribute(style.attr, Attribute::Underline)) output += "\033[4m";
    if (has_attribute(style.attr, Attribute::Blink)) output += "\033[5m";
    if (has_attribute(style.attr, Attribute::Reverse)) output += "\033[7m";
    if (has_attribute(style.attr, Attribute::Hidden)) output += "\033[8m";
    return output;
}

Canvas::Canvas(int width, int height)
    : width_(std::max(0, width)), height_(std::max(0, height)) {
    buffer_.resize(static_cast<size_t>(width_) * height_);
}

Cell& Canvas::at(int x, int y) {
    if (!is_in_bounds(x, y)) {
        static Cell dummy;
        dummy = Cell{};
        return dummy;
    }
    return buffer_[y * width_ + x];
}

const Cell& Canvas::at(int x, int y) const {
    if (!is_in_bounds(x, y)) {
        static const Cell dummy;
        return dummy;
    }
    return buffer_[y * width_ + x];
}

void Canvas::clear(const Cell& fill_cell) {
    std::fill(buffer_.begin(), buffer_.end(), fill_cell);
}

void Canvas::put(int x, int y, const std::string& grapheme, Style style) {
    if (is_in_bounds(x, y)) {
        buffer_[y * width_ + x] = Cell{grapheme, style};
    }
}

int Canvas::draw_text(int x, int y, std::string_view text, Style style, int max_x) {
    if (y < 0 || y >= height_) return x;

    const int limit = (max_x < 0) ? width_ : std::min(max_x, width_);
    const auto length = static_cast<int32_t>(text.size());
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());

    int current_x = x;
    int32_t i = 0;
    while (i < length) {
        int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);

        int char_width = (c < 0) ? 1 : util::codepoint_width(c);
        if (char_width == 0) {
            // Combining mark: attach to the previous cell
            if (current_x > x && is_in_bounds(current_x - 1, y)) {
                Cell& prev = buffer_[y * width_ + current_x - 1];
                if (prev.content.empty() && current_x - 2 >= 0) {
                    buffer_[y * width_ + current_x - 2].content.append(text.substr(start, i - start));
                } else {
                    prev.content.append(text.substr(start, i - start));
                }
            }
            continue;
        }

        // A wide character that does not fit entirely is not drawn
        if (current_x + char_width > limit) break;

        std::string grapheme = (c < 0) ? std::string("?") : std::string(text.substr(start, i - start));
        put(current_x, y, grapheme, style);
        if (char_width == 2) {
            put(current_x + 1, y, "", style);  // Continuation cell
        }
        current_x += char_width;
    }
    return current_x;
}

void Canvas::draw_hline(int x, int y, int w, Style style, const std::string& glyph) {
    for (int i = 0; i < w; ++i) {
        put(x + i, y, glyph, style);
    }
}

void Canvas::draw_rounded_rect(int x, int y, int w, int h, Style style) {
    if (w < 2 || h < 2) return;

    put(x, y, "╭", style);
    put(x + w - 1, y, "╮", style);
    put(x, y + h - 1, "╰", style);
    put(x + w - 1, y + h - 1, "╯", style);

    draw_hline(x + 1, y, w - 2, style);
    draw_hline(x + 1, y + h - 1, w - 2, style);

    for (int i = 1; i < h - 1; ++i) {
        put(x, y + i, "│", style);
        put(x + w - 1, y + i, "│", style);
    }
}

void Canvas::fill_rect(int x, int y, int w, int h, const Cell& cell) {
    for (int cy = y; cy < y + h; ++cy) {
        for (int cx = x; cx < x + w; ++cx) {
            if (is_in_bounds(cx, cy)) {
                buffer_[cy * width_ + cx] = cell;
            }
        }
    }
}

std::string Canvas::row_text(int y) const {
    std::string out;
    if (y < 0 || y >= height_) return out;
    for (int x = 0; x < width_; ++x) {
        out += buffer_[y * width_ + x].content;
    }
    return out;
}

std::string Canvas::to_string(bool ansi) const {
    std::string out;
    for (int y = 0; y < height_; ++y) {
        if (y > 0) out += '\n';
        if (!ansi) {
            out += row_text(y);
            continue;
        }

        // Emit SGR only when the style changes along the row
        Style current;
        for (int x = 0; x < width_; ++x) {
            const Cell& cell = buffer_[y * width_ + x];
            if (cell.content.empty()) continue;
            if (cell.style != current) {
                if (!current.is_plain()) out += "\033[0m";
                out += to_sgr(cell.style);
                current = cell.style;
            }
            out += cell.content;
        }
        if (!current.is_plain()) out += "\033[0m";
    }
    return out;
}

} // namespace colpick::ui
