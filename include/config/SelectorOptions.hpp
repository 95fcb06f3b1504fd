#pragma once

#include "config/Config.hpp"
#include "config/KeyMap.hpp"
#include "config/Theme.hpp"

namespace colpick::config {

/// Immutable per-instance configuration handed to the Selector constructor.
struct SelectorOptions {
    KeyMap keymap;
    Theme theme = ThemeManager::terminal();
    LayoutConfig layout;
};

SelectorOptions default_options();

/// Applies theme, layout and key overrides from a loaded Config.
/// Unknown themes fall back to "terminal"; empty key lists are ignored.
SelectorOptions make_options(const Config& cfg);

}  // namespace colpick::config
