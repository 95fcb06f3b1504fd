#include "ui/widgets/HelpBar.hpp"
#include "ui/Formatting.hpp"
#include "config/Theme.hpp"
#include <algorithm>

namespace colpick::ui::widgets {

namespace {

std::vector<config::KeyBinding> enabled_only(const std::vector<config::KeyBinding>& bindings) {
    std::vector<config::KeyBinding> out;
    for (const auto& b : bindings) {
        if (b.enabled) out.push_back(b);
    }
    return out;
}

std::string rtrim_lines(const std::string& text) {
    std::string out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) nl = text.size();
        std::string line = text.substr(start, nl - start);
        line.erase(line.find_last_not_of(' ') + 1);
        if (start > 0) out += "\n";
        out += line;
        start = nl + 1;
    }
    return out;
}

}  // namespace

void HelpBar::set_bindings(std::vector<config::KeyBinding> bindings) {
    bindings_ = enabled_only(bindings);
    groups_.clear();
    full_ = false;
}

void HelpBar::set_groups(std::vector<std::vector<config::KeyBinding>> groups) {
    groups_.clear();
    for (const auto& group : groups) {
        auto kept = enabled_only(group);
        if (!kept.empty()) groups_.push_back(std::move(kept));
    }
    bindings_.clear();
    full_ = true;
}

int HelpBar::rows() const {
    if (!full_) return 1;
    size_t tallest = 1;
    for (const auto& group : groups_) {
        tallest = std::max(tallest, group.size());
    }
    return static_cast<int>(tallest);
}

void HelpBar::render(Canvas& canvas, const LayoutRect& rect, const RenderContext& ctx) const {
    if (rect.width <= 0 || rect.height <= 0) return;
    if (full_) {
        render_groups(canvas, rect, ctx.theme);
    } else {
        render_short_row(canvas, rect, ctx.theme);
    }
}

void HelpBar::render_short_row(Canvas& canvas, const LayoutRect& rect, const config::Theme& theme) const {
    const int limit = rect.right();
    const int sep_cols = display_cols(SEPARATOR);
    int x = rect.x;

    for (size_t i = 0; i < bindings_.size(); ++i) {
        const auto& b = bindings_[i];
        int piece = display_cols(b.help_key) + 1 + display_cols(b.help_desc);
        int needed = piece + (i > 0 ? sep_cols : 0);

        if (x + needed > limit) {
            // No room for this one: mark the cut if the ellipsis fits
            int tail = (i > 0 ? 1 : 0) + display_cols(ELLIPSIS);
            if (x + tail <= limit) {
                canvas.draw_text(x, rect.y, i > 0 ? std::string(" ") + ELLIPSIS : ELLIPSIS,
                                 theme.help_separator, limit);
            }
            return;
        }

        if (i > 0) x = canvas.draw_text(x, rect.y, SEPARATOR, theme.help_separator, limit);
        x = canvas.draw_text(x, rect.y, b.help_key, theme.help_key, limit);
        x = canvas.draw_text(x, rect.y, " ", theme.help_desc, limit);
        x = canvas.draw_text(x, rect.y, b.help_desc, theme.help_desc, limit);
    }
}

void HelpBar::render_groups(Canvas& canvas, const LayoutRect& rect, const config::Theme& theme) const {
    const int limit = rect.right();
    int x = rect.x;

    for (const auto& group : groups_) {
        int key_cols = 0;
        int desc_cols = 0;
        for (const auto& b : group) {
            key_cols = std::max(key_cols, display_cols(b.help_key));
            desc_cols = std::max(desc_cols, display_cols(b.help_desc));
        }
        if (x + key_cols + 1 + desc_cols > limit) break;

        int y = rect.y;
        for (const auto& b : group) {
            if (y >= rect.bottom()) break;
            canvas.draw_text(x, y, b.help_key, theme.help_key, limit);
            canvas.draw_text(x + key_cols + 1, y, b.help_desc, theme.help_desc, limit);
            ++y;
        }
        x += key_cols + 1 + desc_cols + GROUP_GAP;
    }
}

std::string HelpBar::view(int width, const config::Theme& theme, bool ansi) const {
    if (width <= 0) return "";
    Canvas canvas(width, rows());
    RenderContext ctx{theme};
    render(canvas, LayoutRect{0, 0, width, rows()}, ctx);
    return canvas.to_string(ansi);
}

std::string HelpBar::render_short(const std::vector<config::KeyBinding>& bindings, int width) {
    HelpBar bar;
    bar.set_bindings(bindings);
    return rtrim_lines(bar.view(width, config::ThemeManager::plain(), false));
}

std::string HelpBar::render_full(const std::vector<std::vector<config::KeyBinding>>& groups, int width) {
    HelpBar bar;
    bar.set_groups(groups);
    return rtrim_lines(bar.view(width, config::ThemeManager::plain(), false));
}

}  // namespace colpick::ui::widgets
