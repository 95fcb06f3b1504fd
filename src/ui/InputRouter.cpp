#include "ui/InputRouter.hpp"
#include <array>

namespace colpick::ui {

using config::Action;
using Target = InputRouter::Route::Target;

namespace {

// Order matters: enter is both Accept and AcceptWhileFiltering, ctrl+a is
// both GoToStart and a prompt edit key.
constexpr std::array SELECTOR_ACTIONS = {
    Action::Abort,
    Action::ToggleHelp,
    Action::PrevColumn,
    Action::NextColumn,
    Action::NextPage,
    Action::PrevPage,
    Action::Accept,
};

constexpr std::array COLUMN_ACTIONS = {
    Action::CursorUp,
    Action::CursorDown,
    Action::GoToStart,
    Action::GoToEnd,
    Action::Filter,
    Action::ClearFilter,
};

}  // namespace

InputRouter::Route InputRouter::classify(const InputEvent& event, const config::KeyMap& keymap, bool filtering) {
    if (event.type != InputEvent::Type::KeyPress) {
        return Route{};
    }

    if (filtering) {
        if (keymap.matches(event, Action::Abort)) return Route{Target::Selector, Action::Abort};
        if (keymap.matches(event, Action::CancelWhileFiltering)) {
            return Route{Target::Column, Action::CancelWhileFiltering};
        }
        if (keymap.matches(event, Action::AcceptWhileFiltering)) {
            return Route{Target::Column, Action::AcceptWhileFiltering};
        }
        return Route{Target::FilterEdit, Action::Abort};
    }

    for (Action action : SELECTOR_ACTIONS) {
        if (keymap.matches(event, action)) return Route{Target::Selector, action};
    }
    for (Action action : COLUMN_ACTIONS) {
        if (keymap.matches(event, action)) return Route{Target::Column, action};
    }
    return Route{};
}

}  // namespace colpick::ui
