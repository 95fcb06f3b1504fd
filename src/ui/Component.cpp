#include "ui/Component.hpp"
#include "ui/Formatting.hpp"

namespace colpick::ui {

int Component::draw_cell_text(
    Canvas& canvas,
    int x,
    int y,
    int width,
    const std::string& text,
    Style style
) const {
    if (width <= 0) return x;
    return canvas.draw_text(x, y, trunc_pad(text, width), style, x + width);
}

}  // namespace colpick::ui
