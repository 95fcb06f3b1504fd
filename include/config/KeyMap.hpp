#pragma once

#include "ui/InputEvent.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace colpick::config {

enum class Action {
    CursorUp,
    CursorDown,
    NextPage,
    PrevPage,
    GoToStart,
    GoToEnd,
    Filter,
    ClearFilter,
    CancelWhileFiltering,
    AcceptWhileFiltering,
    NextColumn,
    PrevColumn,
    Accept,
    Abort,
    ToggleHelp,
};

inline constexpr size_t ACTION_COUNT = static_cast<size_t>(Action::ToggleHelp) + 1;

struct KeyBinding {
    std::vector<std::string> keys;
    std::string help_key;   // e.g. "C-p/↑"
    std::string help_desc;  // e.g. "prev entry"
    bool enabled = true;

    bool matches(const std::string& key_name) const;
};

/**
 * Action → key binding table. A key may be bound to several actions
 * (enter accepts an entry and also applies a filter); the input router
 * decides which one applies in the current state.
 */
class KeyMap {
public:
    KeyMap();

    void load_default_keybinds();
    void rebind(Action action, std::vector<std::string> keys);
    void set_enabled(Action action, bool enabled);

    const KeyBinding& binding(Action action) const;
    bool matches(const ui::InputEvent& event, Action action) const;
    std::vector<Action> lookup_actions(const std::string& key_sequence) const;

    static std::string_view action_name(Action action);
    static std::optional<Action> action_from_name(std::string_view name);

    /// Split "ctrl+p, up" into {"ctrl+p", "up"}.
    static std::vector<std::string> parse_key_list(const std::string& value);

private:
    std::array<KeyBinding, ACTION_COUNT> bindings_;
};

}  // namespace colpick::config
