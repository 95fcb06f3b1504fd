#pragma once

#include "util/Logger.hpp"
#include <filesystem>
#include <istream>
#include <string>
#include <unordered_map>

namespace colpick::config {

/**
 * Fixed layout costs of the selector. page_size and height_item_cap are
 * deliberately separate: the first controls pagination, the second how
 * many items of the largest category count toward the maximum height.
 */
struct LayoutConfig {
    int page_size = 4;
    int height_item_cap = 5;
    int item_rows = 1;        // Rows per entry
    int title_rows = 1;       // Column title bar
    int pagination_rows = 1;  // Page indicator under the entries

    int decoration_rows() const { return title_rows + pagination_rows; }
};

struct Config {
    LayoutConfig layout;

    // UI settings
    std::string theme = "terminal";
    bool show_help = true;

    // Action name → comma-separated key list
    std::unordered_map<std::string, std::string> keybinds;

    // Logging
    std::string log_file = util::Logger::DEFAULT_LOG_FILE;
    std::string log_level = "info";
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static Config parse(std::istream& in);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
};

}  // namespace colpick::config
