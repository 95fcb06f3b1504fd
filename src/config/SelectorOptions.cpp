#include "config/SelectorOptions.hpp"
#include "util/Logger.hpp"

namespace colpick::config {

SelectorOptions default_options() {
    return SelectorOptions{};
}

SelectorOptions make_options(const Config& cfg) {
    SelectorOptions options;
    options.layout = cfg.layout;

    if (auto theme = ThemeManager::get_theme(cfg.theme)) {
        options.theme = *theme;
    } else {
        util::Logger::warn("Config: unknown theme '" + cfg.theme + "', using terminal");
    }

    for (const auto& [name, value] : cfg.keybinds) {
        auto action = KeyMap::action_from_name(name);
        if (!action) continue;  // Already reported by the loader

        auto keys = KeyMap::parse_key_list(value);
        if (keys.empty()) {
            util::Logger::warn("Config: empty key list for '" + name + "', keeping defaults");
            continue;
        }
        options.keymap.rebind(*action, std::move(keys));
    }

    return options;
}

}  // namespace colpick::config
