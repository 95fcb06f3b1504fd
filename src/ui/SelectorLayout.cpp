#include "ui/SelectorLayout.hpp"
#include "ui/FlexLayout.hpp"
#include <algorithm>

namespace colpick::ui {

SelectorLayout::SelectorLayout(const config::LayoutConfig& config)
    : config_(config) {}

int SelectorLayout::compute_max_height(const std::vector<int>& category_sizes) const {
    int largest = 0;
    for (int size : category_sizes) {
        largest = std::max(largest, size);
    }
    int items_counted = std::min(largest, config_.height_item_cap);
    return config_.decoration_rows() + items_counted * config_.item_rows + DESCRIPTION_ROWS;
}

int SelectorLayout::clamp_height(int requested, int max_height) const {
    int low = MIN_HEIGHT;
    int high = max_height;
    if (high < low) std::swap(low, high);
    return std::clamp(requested, low, high);
}

int SelectorLayout::column_height(int selector_height) const {
    return std::max(0, selector_height - DESCRIPTION_ROWS);
}

int SelectorLayout::column_width(int selector_width) const {
    return std::max(selector_width, MIN_WIDTH);
}

bool SelectorLayout::renderable(int width, int height) const {
    return width >= MIN_WIDTH && height >= MIN_HEIGHT;
}

SelectorLayout::Frame SelectorLayout::frame(int width, int height) const {
    Frame f;
    f.outer = LayoutRect{0, 0, width, frame_height(height)};

    const int inset = 1 + FRAME_PADDING;
    const int inner_width = std::max(0, width - 2 * inset);

    // Inside the borders: column area, separator, description
    FlexLayout vertical(FlexDirection::Column);
    LayoutConstraints columns_c;
    columns_c.size.preferred_height = column_height(height);
    columns_c.flex.flex_shrink = 1.0f;
    LayoutConstraints separator_c;
    separator_c.size.min_height = 1;
    separator_c.size.preferred_height = 1;
    separator_c.flex.flex_shrink = 0.0f;
    LayoutConstraints description_c;
    description_c.size.min_height = DESCRIPTION_ROWS;
    description_c.size.preferred_height = DESCRIPTION_ROWS;
    description_c.flex.flex_shrink = 0.0f;

    vertical.add_item(columns_c);
    vertical.add_item(separator_c);
    vertical.add_item(description_c);

    auto rects = vertical.compute_layout(inner_width, f.outer.height - 2);
    auto place = [&](const LayoutRect& r) {
        return LayoutRect{r.x + inset, r.y + 1, inner_width, r.height};
    };
    f.columns = place(rects[0]);
    f.separator = place(rects[1]);
    f.description = place(rects[2]);
    return f;
}

std::vector<LayoutRect> SelectorLayout::arrange_columns(
    const std::vector<int>& preferred_widths,
    const LayoutRect& area,
    size_t first
) const {
    std::vector<LayoutRect> result(preferred_widths.size(), LayoutRect{area.x, area.y, 0, 0});
    if (first >= preferred_widths.size()) return result;

    FlexLayout row(FlexDirection::Row, COLUMN_GUTTER);
    for (size_t i = first; i < preferred_widths.size(); ++i) {
        int preferred = preferred_widths[i];
        row.add_item(LayoutConstraints::content(preferred, std::min(preferred, MIN_WIDTH)));
    }

    auto rects = row.compute_layout(area.width, area.height);
    for (size_t i = 0; i < rects.size(); ++i) {
        LayoutRect r = rects[i];
        r.x += area.x;
        r.y += area.y;
        // Clip to the area; columns entirely past the edge collapse
        int visible = std::min(r.right(), area.right()) - r.x;
        r.width = std::max(0, visible);
        if (r.width == 0) r.height = 0;
        result[first + i] = r;
    }
    return result;
}

size_t SelectorLayout::first_visible_column(
    const std::vector<int>& preferred_widths,
    const LayoutRect& area,
    size_t active
) const {
    for (size_t first = 0; first < active; ++first) {
        auto rects = arrange_columns(preferred_widths, area, first);
        const auto& r = rects[active];
        int needed = std::min(preferred_widths[active], MIN_WIDTH);
        if (r.width >= needed && r.right() <= area.right()) {
            return first;
        }
    }
    return active;
}

}  // namespace colpick::ui
