#include "config/Theme.hpp"

namespace colpick::config {

using ui::Attribute;
using ui::Color;
using ui::Style;

Theme ThemeManager::terminal() {
    Theme t;
    t.name = "terminal";
    t.focused_title = Style{Color::BrightGreen, Color::Default, Attribute::Underline};
    t.blurred_title = Style{Color::BrightBlack, Color::Default, Attribute::Underline};
    t.item = Style{};
    t.selected_item = Style{Color::Green, Color::Default, Attribute::Bold};
    t.filter_prompt = Style{Color::Yellow, Color::Default, Attribute::None};
    t.filter_cursor = Style{Color::Default, Color::Default, Attribute::Reverse};
    t.filter_match = Style{Color::Default, Color::Default, Attribute::Underline};
    t.pagination = Style{Color::BrightBlack, Color::Default, Attribute::None};
    t.empty_placeholder = Style{Color::BrightBlack, Color::Default, Attribute::Dim};
    t.description = Style{Color::White, Color::Default, Attribute::None};
    t.placeholder_description = Style{Color::BrightBlack, Color::Default, Attribute::None};
    t.border = Style{Color::BrightBlack, Color::Default, Attribute::None};
    t.separator = Style{Color::BrightBlack, Color::Default, Attribute::None};
    t.help_key = Style{Color::White, Color::Default, Attribute::Bold};
    t.help_desc = Style{Color::BrightBlack, Color::Default, Attribute::None};
    t.help_separator = Style{Color::BrightBlack, Color::Default, Attribute::Dim};
    return t;
}

Theme ThemeManager::plain() {
    // Everything default except the markers needed to tell states apart
    Theme t;
    t.name = "plain";
    t.selected_item = Style{Color::Default, Color::Default, Attribute::Reverse};
    t.filter_cursor = Style{Color::Default, Color::Default, Attribute::Reverse};
    return t;
}

std::optional<Theme> ThemeManager::get_theme(const std::string& name) {
    if (name == "terminal") return terminal();
    if (name == "plain") return plain();
    return std::nullopt;
}

std::vector<std::string> ThemeManager::theme_names() {
    return {"terminal", "plain"};
}

}  // namespace colpick::config
