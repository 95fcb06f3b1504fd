#pragma once

#include "ui/Color.hpp"
#include <vector>
#include <string>
#include <string_view>

namespace colpick::ui {

/**
 * A single cell on the terminal grid.
 * Continuation cells of double-width characters have empty content.
 */
struct Cell {
    std::string content = " "; // UTF-8 grapheme (usually 1-4 bytes)
    Style style;

    bool operator==(const Cell& other) const = default;
};

/**
 * A 2D grid of Cells representing a rendering surface.
 * Origin (0,0) is top-left. Writes outside the grid are dropped.
 */
class Canvas {
public:
    Canvas(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    Cell& at(int x, int y);
    const Cell& at(int x, int y) const;

    void clear(const Cell& fill_cell = Cell{" ", {}});
    void put(int x, int y, const std::string& grapheme, Style style = {});

    // Returns the x-coordinate after the last cell drawn.
    // Text is clipped at max_x (exclusive) when max_x >= 0.
    int draw_text(int x, int y, std::string_view text, Style style = {}, int max_x = -1);

    void draw_hline(int x, int y, int w, Style style = {}, const std::string& glyph = "─");
    void draw_rounded_rect(int x, int y, int w, int h, Style style = {});
    void fill_rect(int x, int y, int w, int h, const Cell& cell);

    /// One row as plain text (no escape sequences).
    std::string row_text(int y) const;

    /// Whole canvas, rows joined by '\n'. With ansi, style changes are
    /// emitted as SGR sequences and every styled row ends with a reset.
    std::string to_string(bool ansi = true) const;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Cell> buffer_;

    bool is_in_bounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
};

} // namespace colpick::ui
