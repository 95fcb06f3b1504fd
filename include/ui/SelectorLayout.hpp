#pragma once

#include "config/Config.hpp"
#include "ui/LayoutConstraints.hpp"
#include <vector>

namespace colpick::ui {

/**
 * Height and width budgeting for the selector.
 *
 * The selector's height covers the column area plus exactly one
 * description row. The drawn block adds a frame around that: a top
 * border, a separator above the description and a bottom border.
 *
 *   ╭──────────────────────────╮
 *   │ Tables     Columns       │  ┐
 *   │ users      id            │  │ column area (height - 1)
 *   │ orders     name          │  │
 *   │            1/2           │  ┘
 *   │ ──────────────────────── │    separator
 *   │   registered accounts    │    description (1 row)
 *   ╰──────────────────────────╯
 */
class SelectorLayout {
public:
    static constexpr int MIN_WIDTH = 10;
    static constexpr int MIN_HEIGHT = 2;
    static constexpr int DESCRIPTION_ROWS = 1;
    static constexpr int FRAME_ROWS = 3;     // Top border, separator, bottom border
    static constexpr int FRAME_PADDING = 1;  // Blank cell inside each side border
    static constexpr int COLUMN_GUTTER = 1;

    struct Frame {
        LayoutRect outer;
        LayoutRect columns;
        LayoutRect separator;
        LayoutRect description;
    };

    explicit SelectorLayout(const config::LayoutConfig& config);

    const config::LayoutConfig& config() const { return config_; }
    int page_size() const { return config_.page_size; }

    /// decoration + min(largest category, cap) * item rows + description.
    int compute_max_height(const std::vector<int>& category_sizes) const;

    /// Clamp into [MIN_HEIGHT, max_height]; inverted bounds are swapped.
    int clamp_height(int requested, int max_height) const;

    int column_height(int selector_height) const;
    int column_width(int selector_width) const;
    bool renderable(int width, int height) const;

    int frame_height(int selector_height) const { return selector_height + FRAME_ROWS; }
    Frame frame(int width, int height) const;

    /**
     * Place columns side by side inside `area`, starting with column
     * `first`. Columns before `first` or past the right edge get an empty
     * rectangle.
     */
    std::vector<LayoutRect> arrange_columns(
        const std::vector<int>& preferred_widths,
        const LayoutRect& area,
        size_t first = 0
    ) const;

    /// Smallest first column index that keeps column `active` fully visible.
    size_t first_visible_column(
        const std::vector<int>& preferred_widths,
        const LayoutRect& area,
        size_t active
    ) const;

private:
    config::LayoutConfig config_;
};

}  // namespace colpick::ui
