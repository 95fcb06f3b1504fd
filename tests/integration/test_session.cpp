#include "../framework/SimpleTest.hpp"
#include "config/Config.hpp"
#include "config/SelectorOptions.hpp"
#include "model/Candidates.hpp"
#include "ui/widgets/HelpBar.hpp"
#include "ui/widgets/Selector.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace colpick;
using ui::InputEvent;
using ui::widgets::HelpBar;
using ui::widgets::Selector;

namespace {

const char* SCHEMA_FILE =
    "# tables and their columns\n"
    "[Tables]\n"
    "users\tregistered accounts\n"
    "orders\tpurchases\n"
    "items\n"
    "[Columns]\n"
    "id\tprimary key\n"
    "name\tdisplay name\n"
    "email\tcontact address\n"
    "created_at\tinsertion time\n"
    "updated_at\tlast change\n";

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

Selector plain_selector() {
    std::istringstream in("[ui]\ntheme = plain\n");
    return Selector(config::make_options(config::ConfigLoader::parse(in)));
}

void press(Selector& selector, const std::string& key) {
    selector.update(InputEvent::key_press(key));
}

}  // namespace

TEST_CASE(test_session_view_layout) {
    std::istringstream in(SCHEMA_FILE);
    auto source = model::parse_candidates(in);

    Selector selector = plain_selector();
    selector.set_values(source);
    selector.set_width(30);

    auto lines = lines_of(selector.view(false));
    ASSERT_EQ(lines.size(), 11u);  // height 8 plus three frame rows
    ASSERT_EQ(lines[0], std::string("╭────────────────────────────╮"));
    ASSERT_EQ(lines[1], std::string("│ Tables      Columns        │"));
    ASSERT_EQ(lines[2], std::string("│  users       id            │"));
    ASSERT_TRUE(lines[7].find(" 1/2") != std::string::npos);
    ASSERT_EQ(lines[8], std::string("│ ────────────────────────── │"));
    ASSERT_EQ(lines[9], std::string("│   registered accounts      │"));
    ASSERT_EQ(lines[10], std::string("╰────────────────────────────╯"));
}

TEST_CASE(test_session_view_follows_navigation) {
    std::istringstream in(SCHEMA_FILE);
    Selector selector = plain_selector();
    selector.set_values(model::parse_candidates(in));
    selector.set_width(30);

    press(selector, "down");
    press(selector, "down");
    auto lines = lines_of(selector.view(false));
    // "items" has no description: blank row
    ASSERT_EQ(lines[9], std::string("│                            │"));

    press(selector, "right");
    lines = lines_of(selector.view(false));
    ASSERT_TRUE(lines[9].find("  primary key") != std::string::npos);

    press(selector, "/");
    for (char c : std::string("zzz")) press(selector, std::string(1, c));
    lines = lines_of(selector.view(false));
    ASSERT_TRUE(lines[1].find("/zzz") != std::string::npos);
    ASSERT_TRUE(lines[2].find(" (no match…") != std::string::npos);  // Cut to the column width
    ASSERT_TRUE(lines[9].find("(no entry selected)") != std::string::npos);
}

TEST_CASE(test_session_view_degenerate_sizes) {
    std::istringstream in(SCHEMA_FILE);
    Selector selector = plain_selector();
    selector.set_values(model::parse_candidates(in));

    selector.set_width(9);
    ASSERT_EQ(selector.view(), std::string(""));

    selector.set_width(10);
    selector.set_height(0);
    ASSERT_EQ(selector.height(), 2);
    auto lines = lines_of(selector.view(false));
    ASSERT_EQ(lines.size(), 5u);
}

TEST_CASE(test_session_ansi_view_styles_active_title) {
    std::istringstream in(SCHEMA_FILE);
    Selector selector;  // Terminal theme
    selector.set_values(model::parse_candidates(in));
    selector.set_width(30);

    std::string focused = selector.view(true);
    ASSERT_TRUE(focused.find("\033[92m\033[4mTables") != std::string::npos);

    selector.blur();
    std::string blurred = selector.view(true);
    ASSERT_TRUE(blurred.find("\033[92m") == std::string::npos);
    ASSERT_TRUE(blurred.find("\033[90m\033[4mTables") != std::string::npos);
}

TEST_CASE(test_session_help_rendering) {
    std::istringstream in(SCHEMA_FILE);
    Selector selector = plain_selector();
    selector.set_values(model::parse_candidates(in));

    ASSERT_EQ(HelpBar::render_short(selector.short_help(), 30), std::string("C-j/enter accept …"));
    ASSERT_EQ(HelpBar::render_short(selector.short_help(), 200),
              std::string("C-j/enter accept • C-c/esc close/cancel • C-p/↑ prev entry • C-n/↓ next entry"
                          " • / filter • →/M-n next column • M-? toggle key help"));

    auto full = lines_of(HelpBar::render_full(selector.full_help(), 100));
    ASSERT_EQ(full.size(), 5u);
    ASSERT_EQ(full[0], std::string("C-p/↑  prev entry          C-a/home start of column    / filter    C-j/enter accept"));

    // Disabled bindings disappear
    auto bindings = selector.short_help();
    bindings[0].enabled = false;
    ASSERT_EQ(HelpBar::render_short(bindings, 40).rfind("C-c/esc close/cancel", 0), 0u);
}

TEST_CASE(test_session_help_view_follows_toggle) {
    std::istringstream in(SCHEMA_FILE);
    Selector selector = plain_selector();
    selector.set_values(model::parse_candidates(in));
    selector.set_width(100);

    ASSERT_EQ(lines_of(selector.help_view(false)).size(), 1u);
    press(selector, "alt+?");
    ASSERT_EQ(lines_of(selector.help_view(false)).size(), 5u);
}

TEST_CASE(test_session_from_file_with_logging) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "colpick_session_test";
    fs::create_directories(dir);
    fs::path candidates_path = dir / "schema.txt";
    fs::path log_path = dir / "colpick.log";
    {
        std::ofstream out(candidates_path);
        out << SCHEMA_FILE;
    }

    util::Logger::init(log_path.string(), util::Logger::Level::Debug);

    auto source = model::load_candidates(candidates_path);
    ASSERT_TRUE(source.has_value());

    Selector selector = plain_selector();
    selector.set_values(*source);
    press(selector, "right");
    press(selector, "/");
    for (char c : std::string("mail")) press(selector, std::string(1, c));
    press(selector, "enter");
    press(selector, "enter");

    ASSERT_TRUE(selector.done());
    ASSERT_EQ(selector.accepted_entry()->title, std::string("email"));
    ASSERT_EQ(selector.accepted_entry()->description, std::string("contact address"));

    std::ifstream log(log_path);
    std::stringstream contents;
    contents << log.rdbuf();
    std::string text = contents.str();
    util::Logger::init();
    fs::remove_all(dir);

    ASSERT_TRUE(text.find("[INFO]  Selector: 2 categories, 8 entries, max height 8") != std::string::npos);
    ASSERT_TRUE(text.find("[DEBUG] Selector: active column 1 (Columns)") != std::string::npos);
    ASSERT_TRUE(text.find("Selector: accepted 'email'") != std::string::npos);
}

int main(int argc, char** argv) {
    return colpick::test::TestRunner::instance().run_main(argc, argv);
}
