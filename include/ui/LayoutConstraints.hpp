#pragma once

#include <optional>

namespace colpick::ui {

/**
 * Size constraints for a widget
 * Defines minimum, maximum, and preferred dimensions
 */
struct SizeConstraints {
    std::optional<int> min_width;
    std::optional<int> max_width;
    std::optional<int> min_height;
    std::optional<int> max_height;

    std::optional<int> preferred_width;
    std::optional<int> preferred_height;
};

/**
 * Flexbox-style growth and shrink properties
 */
struct FlexProperties {
    float flex_grow = 0.0f;     // Share of extra space (0 = keep basis)
    float flex_shrink = 1.0f;   // Share of missing space (0 = never shrink)
};

struct LayoutConstraints {
    SizeConstraints size;
    FlexProperties flex;

    /// Content-sized item: prefers `preferred`, may shrink down to `min`.
    static LayoutConstraints content(int preferred, int min) {
        LayoutConstraints c;
        c.size.preferred_width = preferred;
        c.size.min_width = min;
        c.size.max_width = preferred;
        c.flex.flex_grow = 0.0f;
        c.flex.flex_shrink = 1.0f;
        return c;
    }

    static LayoutConstraints fill(float grow = 1.0f) {
        LayoutConstraints c;
        c.flex.flex_grow = grow;
        return c;
    }
};

struct LayoutRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const LayoutRect& other) const = default;

    int bottom() const { return y + height; }
    int right() const { return x + width; }
};

}  // namespace colpick::ui
