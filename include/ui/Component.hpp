#pragma once

#include "ui/Canvas.hpp"
#include "ui/LayoutConstraints.hpp"
#include "ui/InputEvent.hpp"
#include "config/Theme.hpp"
#include <string>

namespace colpick::ui {

/**
 * Per-frame rendering inputs that are not part of a component's own state.
 */
struct RenderContext {
    const config::Theme& theme;
    bool focused = false;  // Owning widget has keyboard focus
    bool active = false;   // Component is the one receiving input
};

/**
 * Base class for the selector's visual parts.
 *
 * Components draw into a Canvas rectangle computed by the layout code.
 * Rendering is a pure read of the component's state and may be repeated
 * any number of times between mutations.
 */
class Component {
public:
    virtual ~Component() = default;

    /**
     * Render this component into `rect` of the canvas.
     *
     * Implementations must not draw outside `rect`.
     */
    virtual void render(
        Canvas& canvas,
        const LayoutRect& rect,
        const RenderContext& ctx
    ) const = 0;

    /**
     * Handle an input event already routed to this component.
     * Unrecognized events are ignored.
     */
    virtual void handle_input(const InputEvent& event) {
        (void)event;
    }

protected:
    /**
     * Draw `text` on one row, truncated with "…" and padded with spaces so
     * it covers exactly `width` cells. Returns the x after the row.
     */
    int draw_cell_text(
        Canvas& canvas,
        int x,
        int y,
        int width,
        const std::string& text,
        Style style
    ) const;
};

}  // namespace colpick::ui
