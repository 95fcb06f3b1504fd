#include "ui/FlexLayout.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace colpick::ui {

size_t FlexLayout::add_item(const LayoutConstraints& constraints) {
    items_.push_back(constraints);
    return items_.size() - 1;
}

std::vector<LayoutRect> FlexLayout::compute_layout(int available_width, int available_height) const {
    if (items_.empty()) {
        return {};
    }

    const bool row = (direction_ == FlexDirection::Row);
    std::vector<int> main_sizes = compute_main_axis_sizes(row ? available_width : available_height);
    std::vector<int> cross_sizes = compute_cross_axis_sizes(row ? available_height : available_width);

    std::vector<LayoutRect> result;
    result.reserve(items_.size());

    int main_pos = 0;
    for (size_t i = 0; i < items_.size(); ++i) {
        LayoutRect rect;
        if (row) {
            rect = LayoutRect{main_pos, 0, main_sizes[i], cross_sizes[i]};
        } else {
            rect = LayoutRect{0, main_pos, cross_sizes[i], main_sizes[i]};
        }
        main_pos += main_sizes[i] + spacing_;
        result.push_back(rect);
    }

    return result;
}

int FlexLayout::used_space(const std::vector<int>& sizes) const {
    int used = 0;
    for (int s : sizes) used += s;
    if (sizes.size() > 1) {
        used += spacing_ * static_cast<int>(sizes.size() - 1);
    }
    return used;
}

std::vector<int> FlexLayout::compute_main_axis_sizes(int available_space) const {
    const size_t n = items_.size();
    const bool is_width = (direction_ == FlexDirection::Row);
    std::vector<int> sizes(n, 0);
    std::vector<bool> frozen(n, false);

    // Basis: preferred size, else min size
    for (size_t i = 0; i < n; ++i) {
        const auto& size = items_[i].size;
        sizes[i] = is_width
            ? size.preferred_width.value_or(size.min_width.value_or(0))
            : size.preferred_height.value_or(size.min_height.value_or(0));
    }

    // Each pass either finishes or freezes one item, so n + 1 passes suffice
    for (size_t pass = 0; pass <= n; ++pass) {
        const int free_space = available_space - used_space(sizes);
        if (free_space == 0) break;
        const bool growing = free_space > 0;

        float total_flex = 0.0f;
        for (size_t i = 0; i < n; ++i) {
            if (frozen[i]) continue;
            total_flex += growing ? items_[i].flex.flex_grow : items_[i].flex.flex_shrink;
        }
        if (total_flex <= 0.0f) break;

        bool violation_found = false;
        std::vector<int> proposed = sizes;

        for (size_t i = 0; i < n; ++i) {
            if (frozen[i]) continue;
            float flex = growing ? items_[i].flex.flex_grow : items_[i].flex.flex_shrink;
            if (flex <= 0.0f) continue;

            int delta = static_cast<int>(std::round(free_space * (flex / total_flex)));
            int tentative = sizes[i] + delta;
            int min_s = get_min_size(items_[i].size, is_width);
            int max_s = get_max_size(items_[i].size, is_width);

            if (tentative < min_s || tentative > max_s) {
                sizes[i] = std::clamp(tentative, min_s, max_s);
                frozen[i] = true;
                violation_found = true;
                break;
            }
            proposed[i] = tentative;
        }

        if (violation_found) continue;

        sizes = proposed;

        // Rounding leftovers go to the last flexible item
        int remainder = available_space - used_space(sizes);
        if (remainder != 0) {
            for (int i = static_cast<int>(n) - 1; i >= 0; --i) {
                if (frozen[i]) continue;
                float flex = growing ? items_[i].flex.flex_grow : items_[i].flex.flex_shrink;
                if (flex > 0.0f) {
                    sizes[i] = std::clamp(sizes[i] + remainder,
                                          get_min_size(items_[i].size, is_width),
                                          get_max_size(items_[i].size, is_width));
                    break;
                }
            }
        }
        break;
    }

    return sizes;
}

std::vector<int> FlexLayout::compute_cross_axis_sizes(int available_space) const {
    std::vector<int> sizes(items_.size(), 0);
    const bool is_width = (direction_ == FlexDirection::Column);  // Opposite of main axis

    for (size_t i = 0; i < items_.size(); ++i) {
        const auto& constraints = items_[i].size;
        int size = available_space;  // Stretch
        if (is_width && constraints.preferred_width) {
            size = *constraints.preferred_width;
        } else if (!is_width && constraints.preferred_height) {
            size = *constraints.preferred_height;
        }
        sizes[i] = std::clamp(size,
                              get_min_size(constraints, is_width),
                              std::max(get_min_size(constraints, is_width), get_max_size(constraints, is_width)));
    }

    return sizes;
}

int FlexLayout::get_min_size(const SizeConstraints& constraints, bool is_width) const {
    if (is_width && constraints.min_width) return *constraints.min_width;
    if (!is_width && constraints.min_height) return *constraints.min_height;
    return 0;
}

int FlexLayout::get_max_size(const SizeConstraints& constraints, bool is_width) const {
    if (is_width && constraints.max_width) return *constraints.max_width;
    if (!is_width && constraints.max_height) return *constraints.max_height;
    return std::numeric_limits<int>::max();
}

}  // namespace colpick::ui
