#pragma once

#include "ui/Component.hpp"
#include "config/KeyMap.hpp"
#include <string>
#include <vector>

namespace colpick::ui::widgets {

/**
 * Key help shown under the selector.
 *
 * Short form is one line: "C-j/enter accept • C-c/esc close/cancel • …".
 * Full form lays groups out side by side, one binding per row.
 * Disabled bindings are never shown.
 */
class HelpBar : public Component {
public:
    static constexpr const char* SEPARATOR = " • ";
    static constexpr const char* ELLIPSIS = "…";
    static constexpr int GROUP_GAP = 4;

    void set_bindings(std::vector<config::KeyBinding> bindings);
    void set_groups(std::vector<std::vector<config::KeyBinding>> groups);
    bool is_full() const { return full_; }

    /// Rows needed to draw the current content.
    int rows() const;

    void render(Canvas& canvas, const LayoutRect& rect, const RenderContext& ctx) const override;

    std::string view(int width, const config::Theme& theme, bool ansi = true) const;

    // Plain-text renderings, trailing blanks trimmed
    static std::string render_short(const std::vector<config::KeyBinding>& bindings, int width);
    static std::string render_full(const std::vector<std::vector<config::KeyBinding>>& groups, int width);

private:
    std::vector<config::KeyBinding> bindings_;
    std::vector<std::vector<config::KeyBinding>> groups_;
    bool full_ = false;

    void render_short_row(Canvas& canvas, const LayoutRect& rect, const config::Theme& theme) const;
    void render_groups(Canvas& canvas, const LayoutRect& rect, const config::Theme& theme) const;
};

}  // namespace colpick::ui::widgets
