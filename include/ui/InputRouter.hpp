#pragma once

#include "config/KeyMap.hpp"
#include "ui/InputEvent.hpp"

namespace colpick::ui {

/**
 * Decides who handles an input event.
 *
 * Outside filter mode the selector-level bindings are tried first (abort,
 * help, column switching, page-or-column, accept), then the in-column
 * ones. While a column is filtering only abort, cancel and apply are
 * bindings; every other key edits the filter prompt.
 */
class InputRouter {
public:
    struct Route {
        enum class Target {
            Ignore,
            Selector,   // Handled by the selector state machine
            Column,     // Forwarded to the active column as an action
            FilterEdit  // Raw key for the active column's filter prompt
        };

        Target target = Target::Ignore;
        config::Action action = config::Action::Abort;  // Unused for Ignore/FilterEdit
    };

    static Route classify(const InputEvent& event, const config::KeyMap& keymap, bool filtering);
};

}  // namespace colpick::ui
