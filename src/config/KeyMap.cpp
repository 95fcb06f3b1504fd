#include "config/KeyMap.hpp"
#include <algorithm>

namespace colpick::config {

namespace {

constexpr std::array<std::string_view, ACTION_COUNT> ACTION_NAMES = {
    "cursor_up",
    "cursor_down",
    "next_page",
    "prev_page",
    "go_to_start",
    "go_to_end",
    "filter",
    "clear_filter",
    "cancel_while_filtering",
    "accept_while_filtering",
    "next_column",
    "prev_column",
    "accept",
    "abort",
    "toggle_help",
};

size_t index_of(Action action) {
    return static_cast<size_t>(action);
}

}  // namespace

bool KeyBinding::matches(const std::string& key_name) const {
    if (!enabled || key_name.empty()) return false;
    return std::find(keys.begin(), keys.end(), key_name) != keys.end();
}

KeyMap::KeyMap() {
    load_default_keybinds();
}

void KeyMap::load_default_keybinds() {
    auto set = [this](Action a, std::vector<std::string> keys, std::string help_key, std::string help_desc) {
        bindings_[index_of(a)] = KeyBinding{std::move(keys), std::move(help_key), std::move(help_desc), true};
    };

    set(Action::CursorUp, {"up", "ctrl+p", "shift+tab"}, "C-p/↑", "prev entry");
    set(Action::CursorDown, {"down", "ctrl+n", "tab"}, "C-n/↓", "next entry");
    set(Action::NextPage, {"pgdown"}, "pgdown", "next page/column");
    set(Action::PrevPage, {"pgup"}, "pgup", "prev page/column");
    set(Action::GoToStart, {"ctrl+a", "home"}, "C-a/home", "start of column");
    set(Action::GoToEnd, {"ctrl+e", "end"}, "C-e/end", "end of column");
    set(Action::Filter, {"/"}, "/", "filter");
    set(Action::ClearFilter, {"ctrl+g"}, "C-g", "clear filter");
    set(Action::CancelWhileFiltering, {"ctrl+g"}, "C-g", "cancel filter");
    set(Action::AcceptWhileFiltering, {"enter", "ctrl+j"}, "C-j/enter", "apply filter");
    set(Action::NextColumn, {"right", "alt+n"}, "→/M-n", "next column");
    set(Action::PrevColumn, {"left", "alt+p"}, "←/M-p", "prev column");
    set(Action::Accept, {"enter", "ctrl+j"}, "C-j/enter", "accept");
    set(Action::Abort, {"ctrl+c", "esc"}, "C-c/esc", "close/cancel");
    set(Action::ToggleHelp, {"alt+?"}, "M-?", "toggle key help");
}

void KeyMap::rebind(Action action, std::vector<std::string> keys) {
    auto& binding = bindings_[index_of(action)];
    binding.keys = std::move(keys);
    // Custom keys: the help label lists them verbatim
    std::string label;
    for (const auto& k : binding.keys) {
        if (!label.empty()) label += "/";
        label += k;
    }
    binding.help_key = label;
}

void KeyMap::set_enabled(Action action, bool enabled) {
    bindings_[index_of(action)].enabled = enabled;
}

const KeyBinding& KeyMap::binding(Action action) const {
    return bindings_[index_of(action)];
}

bool KeyMap::matches(const ui::InputEvent& event, Action action) const {
    if (event.type != ui::InputEvent::Type::KeyPress) return false;
    return binding(action).matches(event.key_name);
}

std::vector<Action> KeyMap::lookup_actions(const std::string& key_sequence) const {
    std::vector<Action> result;
    for (size_t i = 0; i < ACTION_COUNT; ++i) {
        if (bindings_[i].matches(key_sequence)) {
            result.push_back(static_cast<Action>(i));
        }
    }
    return result;
}

std::string_view KeyMap::action_name(Action action) {
    return ACTION_NAMES[index_of(action)];
}

std::optional<Action> KeyMap::action_from_name(std::string_view name) {
    for (size_t i = 0; i < ACTION_COUNT; ++i) {
        if (ACTION_NAMES[i] == name) return static_cast<Action>(i);
    }
    return std::nullopt;
}

std::vector<std::string> KeyMap::parse_key_list(const std::string& value) {
    std::vector<std::string> keys;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string key = value.substr(start, comma - start);
        auto first = key.find_first_not_of(" \t");
        if (first != std::string::npos) {
            auto last = key.find_last_not_of(" \t");
            keys.push_back(key.substr(first, last - first + 1));
        }
        start = comma + 1;
    }
    return keys;
}

}  // namespace colpick::config
