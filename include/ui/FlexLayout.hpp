#pragma once

#include "ui/LayoutConstraints.hpp"
#include <vector>

namespace colpick::ui {

enum class FlexDirection {
    Row,     // Left to right
    Column   // Top to bottom
};

/**
 * Flexbox-inspired layout container.
 *
 * Items start at their basis (preferred size, else min size). Leftover
 * space is handed out by flex_grow, missing space taken back by
 * flex_shrink; an item that hits its min/max is frozen and the rest is
 * redistributed among the others.
 */
class FlexLayout {
public:
    FlexLayout() = default;
    explicit FlexLayout(FlexDirection dir, int spacing = 0)
        : direction_(dir), spacing_(spacing) {}

    /// Returns the index of the new item.
    size_t add_item(const LayoutConstraints& constraints);

    void set_direction(FlexDirection dir) { direction_ = dir; }
    void set_spacing(int spacing) { spacing_ = spacing; }

    /// One rectangle per item, relative to the container origin.
    std::vector<LayoutRect> compute_layout(int available_width, int available_height) const;

    void clear() { items_.clear(); }
    size_t item_count() const { return items_.size(); }

private:
    std::vector<LayoutConstraints> items_;
    FlexDirection direction_ = FlexDirection::Row;
    int spacing_ = 0;

    std::vector<int> compute_main_axis_sizes(int available_space) const;
    std::vector<int> compute_cross_axis_sizes(int available_space) const;

    int used_space(const std::vector<int>& sizes) const;
    int get_min_size(const SizeConstraints& constraints, bool is_width) const;
    int get_max_size(const SizeConstraints& constraints, bool is_width) const;
};

}  // namespace colpick::ui
