#include "config/Config.hpp"
#include "config/KeyMap.hpp"
#include <cstdlib>
#include <fstream>
#include <string>

namespace colpick::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Keeps `target` on malformed or out-of-range input
void parse_int(const std::string& key, const std::string& value, int min_value, int& target) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size() || parsed < min_value) {
            util::Logger::warn("Config: ignoring " + key + " = '" + value + "' (expected integer >= " +
                               std::to_string(min_value) + ")");
            return;
        }
        target = parsed;
    } catch (const std::exception&) {
        util::Logger::warn("Config: ignoring " + key + " = '" + value + "' (not a number)");
    }
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "yes" || value == "1";
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }
    util::Logger::debug("Config: no file at " + config_file.string() + ", using defaults");
    return Config{};
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: cannot read " + path.string() + ", using defaults");
        return Config{};
    }
    return parse(file);
}

Config ConfigLoader::parse(std::istream& in) {
    Config cfg;
    std::string line, current_section;

    while (std::getline(in, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: ignoring line without '=': " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "layout") {
            if (key == "page_size") parse_int(key, value, 1, cfg.layout.page_size);
            else if (key == "height_item_cap") parse_int(key, value, 1, cfg.layout.height_item_cap);
            else if (key == "item_rows") parse_int(key, value, 1, cfg.layout.item_rows);
            else if (key == "title_rows") parse_int(key, value, 1, cfg.layout.title_rows);
            else if (key == "pagination_rows") parse_int(key, value, 0, cfg.layout.pagination_rows);
            else util::Logger::warn("Config: unknown layout key '" + key + "'");
        }
        else if (current_section == "ui") {
            if (key == "theme") cfg.theme = value;
            else if (key == "show_help") cfg.show_help = parse_bool(value);
            else util::Logger::warn("Config: unknown ui key '" + key + "'");
        }
        else if (current_section == "keybinds") {
            if (KeyMap::action_from_name(key)) {
                cfg.keybinds[key] = value;
            } else {
                util::Logger::warn("Config: unknown action '" + key + "' in [keybinds]");
            }
        }
        else if (current_section == "logging") {
            if (key == "file") cfg.log_file = value;
            else if (key == "level") cfg.log_level = value;
            else util::Logger::warn("Config: unknown logging key '" + key + "'");
        }
        else {
            util::Logger::warn("Config: key '" + key + "' outside a known section");
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            util::Logger::error("Config: cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: cannot write " + path.string());
        return false;
    }

    file << "# colpick config\n\n";

    file << "[layout]\n";
    file << "# Entries shown per page in every column\n";
    file << "page_size = " << cfg.layout.page_size << "\n";
    file << "# Entries of the largest category counted toward the maximum height\n";
    file << "height_item_cap = " << cfg.layout.height_item_cap << "\n";
    file << "item_rows = " << cfg.layout.item_rows << "\n";
    file << "title_rows = " << cfg.layout.title_rows << "\n";
    file << "pagination_rows = " << cfg.layout.pagination_rows << "\n\n";

    file << "[ui]\n";
    file << "# Theme: \"terminal\", \"plain\"\n";
    file << "theme = \"" << cfg.theme << "\"\n";
    file << "show_help = " << (cfg.show_help ? "true" : "false") << "\n\n";

    file << "[keybinds]\n";
    file << "# action = \"key1,key2\"\n";
    KeyMap defaults;
    for (size_t i = 0; i < ACTION_COUNT; ++i) {
        auto action = static_cast<Action>(i);
        std::string name(KeyMap::action_name(action));
        std::string keys;
        if (auto it = cfg.keybinds.find(name); it != cfg.keybinds.end()) {
            keys = it->second;
        } else {
            for (const auto& k : defaults.binding(action).keys) {
                if (!keys.empty()) keys += ",";
                keys += k;
            }
        }
        file << name << " = \"" << keys << "\"\n";
    }
    file << "\n";

    file << "[logging]\n";
    file << "file = \"" << cfg.log_file << "\"\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n";

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    if (auto home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "colpick" / "config.toml";
    }
    return ".config/colpick/config.toml";
}

}  // namespace colpick::config
