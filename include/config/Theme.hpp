#pragma once

#include "ui/Color.hpp"
#include <optional>
#include <string>
#include <vector>

namespace colpick::config {

/**
 * Visual styles of the selector. Every state has its own record; the
 * blurred title is not derived from the focused one.
 */
struct Theme {
    std::string name;

    ui::Style focused_title;
    ui::Style blurred_title;
    ui::Style item;
    ui::Style selected_item;
    ui::Style filter_prompt;
    ui::Style filter_cursor;
    ui::Style filter_match;
    ui::Style pagination;
    ui::Style empty_placeholder;
    ui::Style description;
    ui::Style placeholder_description;
    ui::Style border;
    ui::Style separator;
    ui::Style help_key;
    ui::Style help_desc;
    ui::Style help_separator;
};

class ThemeManager {
public:
    static Theme terminal();  // 16-color default
    static Theme plain();     // No colors or attributes

    static std::optional<Theme> get_theme(const std::string& name);
    static std::vector<std::string> theme_names();
};

}  // namespace colpick::config
