#include "../framework/SimpleTest.hpp"
#include "ui/widgets/Selector.hpp"
#include "ui/widgets/HelpBar.hpp"
#include "config/SelectorOptions.hpp"
#include "model/Candidates.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace colpick::ui;
using namespace colpick::ui::widgets;
using colpick::model::Entry;
using colpick::model::StaticCandidates;

namespace {

StaticCandidates schema() {
    StaticCandidates source;
    source.add_category("Tables", {
        {"users", "registered accounts"},
        {"orders", "purchases"},
        {"items", ""},
    });
    source.add_category("Columns", {
        {"id", "primary key"},
        {"name", "display name"},
        {"email", "contact address"},
        {"created_at", "insertion time"},
        {"updated_at", "last change"},
    });
    return source;
}

StaticCandidates categories(int count, int entries_each) {
    StaticCandidates source;
    for (int c = 0; c < count; ++c) {
        std::vector<Entry> entries;
        for (int e = 0; e < entries_each; ++e) {
            entries.push_back({"c" + std::to_string(c) + "e" + std::to_string(e), ""});
        }
        source.add_category("Category" + std::to_string(c), entries);
    }
    return source;
}

Selector::Status press(Selector& selector, const std::string& key) {
    return selector.update(InputEvent::key_press(key));
}

void type(Selector& selector, const std::string& text) {
    for (char c : text) press(selector, std::string(1, c));
}

}  // namespace

TEST_CASE(test_set_values_builds_columns) {
    Selector selector;
    selector.set_values(schema());

    ASSERT_EQ(selector.column_count(), 2);
    ASSERT_EQ(selector.active_column_index(), 0);
    ASSERT_EQ(selector.column(0).name(), std::string("Tables"));
    ASSERT_EQ(selector.column(1).size(), 5);
    ASSERT_EQ(selector.max_height(), 8);
    ASSERT_EQ(selector.height(), 8);
    ASSERT_TRUE(selector.status() == Selector::Status::Active);
    ASSERT_FALSE(selector.accepted_entry().has_value());
}

TEST_CASE(test_set_values_focuses_active_column) {
    Selector selector;
    ASSERT_TRUE(selector.focused());
    selector.set_values(schema());
    ASSERT_TRUE(selector.column(0).focused());
    ASSERT_FALSE(selector.column(1).focused());

    selector.blur();
    selector.set_values(schema());
    ASSERT_FALSE(selector.column(0).focused());
}

TEST_CASE(test_next_column_cycles_and_resets_cursor) {
    for (int n = 1; n <= 5; ++n) {
        Selector selector;
        selector.set_values(categories(n, 3));
        for (int step = 1; step <= n; ++step) {
            press(selector, "down");
            press(selector, "right");
            ASSERT_EQ(selector.active_column_index(), step % n);
            ASSERT_EQ(selector.active_column().cursor(), 0);
        }
        ASSERT_EQ(selector.active_column_index(), 0);
    }
}

TEST_CASE(test_tables_columns_scenario) {
    Selector selector;
    selector.set_values(schema());

    press(selector, "right");
    ASSERT_EQ(selector.active_column_index(), 1);
    ASSERT_EQ(selector.active_column().name(), std::string("Columns"));
    ASSERT_EQ(selector.active_column().cursor(), 0);

    press(selector, "left");
    ASSERT_EQ(selector.active_column_index(), 0);
    ASSERT_EQ(selector.active_column().cursor(), 0);

    // And backwards past the first column
    press(selector, "alt+p");
    ASSERT_EQ(selector.active_column_index(), 1);
}

TEST_CASE(test_column_switch_moves_focus) {
    Selector selector;
    selector.set_values(schema());
    press(selector, "right");
    ASSERT_FALSE(selector.column(0).focused());
    ASSERT_TRUE(selector.column(1).focused());

    selector.blur();
    press(selector, "left");
    ASSERT_FALSE(selector.column(0).focused());
    ASSERT_FALSE(selector.column(1).focused());
}

TEST_CASE(test_accept_returns_current_item) {
    Selector selector;
    selector.set_values(schema());
    press(selector, "down");
    auto expected = selector.active_column().current_item();

    auto status = press(selector, "enter");
    ASSERT_TRUE(status == Selector::Status::Done);
    ASSERT_TRUE(selector.done());
    ASSERT_FALSE(selector.cancelled());
    ASSERT_TRUE(selector.accepted_entry() == expected);
    ASSERT_EQ(selector.accepted_entry()->title, std::string("orders"));
}

TEST_CASE(test_abort_from_any_state) {
    // Plain
    Selector plain;
    plain.set_values(schema());
    press(plain, "down");
    ASSERT_TRUE(press(plain, "esc") == Selector::Status::Done);
    ASSERT_TRUE(plain.cancelled());
    ASSERT_FALSE(plain.accepted_entry().has_value());

    // Mid-filter
    Selector filtering;
    filtering.set_values(schema());
    press(filtering, "/");
    type(filtering, "us");
    ASSERT_TRUE(filtering.active_column().is_filtering());
    press(filtering, "ctrl+c");
    ASSERT_TRUE(filtering.cancelled());

    // Filter applied, other column
    Selector applied;
    applied.set_values(schema());
    press(applied, "right");
    press(applied, "/");
    type(applied, "at");
    press(applied, "enter");
    ASSERT_FALSE(applied.done());
    press(applied, "esc");
    ASSERT_TRUE(applied.cancelled());
}

TEST_CASE(test_no_categories_is_cancellation) {
    Selector selector;
    selector.set_values(StaticCandidates{});
    ASSERT_EQ(selector.column_count(), 0);
    ASSERT_TRUE(selector.done());
    ASSERT_TRUE(selector.cancelled());
    ASSERT_FALSE(selector.accepted_entry().has_value());
    ASSERT_TRUE(press(selector, "enter") == Selector::Status::Done);
    ASSERT_EQ(selector.view(), std::string(""));
}

TEST_CASE(test_update_before_values_is_done) {
    Selector selector;
    ASSERT_TRUE(press(selector, "down") == Selector::Status::Done);
    ASSERT_TRUE(selector.cancelled());
}

TEST_CASE(test_set_height_clamps) {
    Selector selector;
    selector.set_values(schema());

    selector.set_height(1);
    ASSERT_EQ(selector.height(), 2);
    ASSERT_EQ(selector.column(0).height(), 1);

    selector.set_height(100);
    ASSERT_EQ(selector.height(), 8);

    selector.set_height(5);
    ASSERT_EQ(selector.height(), 5);
    ASSERT_EQ(selector.column(1).height(), 4);
    ASSERT_EQ(selector.max_height(), 8);
}

TEST_CASE(test_set_width_floor) {
    Selector selector;
    selector.set_values(schema());
    selector.set_width(3);
    ASSERT_EQ(selector.width(), 3);
    ASSERT_EQ(selector.column(0).width(), 10);
    ASSERT_EQ(selector.view(), std::string(""));

    selector.set_width(40);
    ASSERT_EQ(selector.column(1).width(), 40);
}

TEST_CASE(test_next_page_at_last_page_switches_column) {
    Selector selector;
    selector.set_values(schema());

    // Tables fits on one page
    press(selector, "pgdown");
    ASSERT_EQ(selector.active_column_index(), 1);

    // Columns has two pages: first pgdown pages, second switches
    press(selector, "pgdown");
    ASSERT_EQ(selector.active_column_index(), 1);
    ASSERT_EQ(selector.active_column().cursor(), 4);
    press(selector, "pgdown");
    ASSERT_EQ(selector.active_column_index(), 0);
    ASSERT_EQ(selector.active_column().cursor(), 0);
}

TEST_CASE(test_prev_page_at_first_page_switches_column) {
    Selector selector;
    selector.set_values(schema());
    press(selector, "right");
    press(selector, "end");
    ASSERT_EQ(selector.active_column().cursor(), 4);

    press(selector, "pgup");
    ASSERT_EQ(selector.active_column_index(), 1);
    ASSERT_EQ(selector.active_column().cursor(), 0);

    press(selector, "pgup");
    ASSERT_EQ(selector.active_column_index(), 0);
}

TEST_CASE(test_single_entry_accept_and_abort) {
    StaticCandidates source;
    source.add_category("Only", {{"alone", "the only one"}});

    Selector accepting;
    accepting.set_values(source);
    press(accepting, "enter");
    ASSERT_TRUE(accepting.accepted_entry() == (Entry{"alone", "the only one"}));

    Selector aborting;
    aborting.set_values(source);
    press(aborting, "esc");
    ASSERT_TRUE(aborting.cancelled());
    ASSERT_FALSE(aborting.accepted_entry().has_value());
}

TEST_CASE(test_empty_filter_accept_commits_top_item) {
    Selector selector;
    selector.set_values(schema());
    press(selector, "/");
    ASSERT_TRUE(selector.active_column().is_filtering());

    ASSERT_TRUE(press(selector, "enter") == Selector::Status::Active);
    ASSERT_FALSE(selector.active_column().is_filtering());
    ASSERT_EQ(selector.active_column().current_item()->title, std::string("users"));

    press(selector, "enter");
    ASSERT_EQ(selector.accepted_entry()->title, std::string("users"));
}

TEST_CASE(test_filter_then_accept) {
    Selector selector;
    selector.set_values(schema());
    press(selector, "right");
    press(selector, "/");
    type(selector, "time");  // created_at's description
    press(selector, "enter");
    ASSERT_FALSE(selector.done());
    ASSERT_EQ(selector.active_column().visible_count(), 1);

    press(selector, "enter");
    ASSERT_EQ(selector.accepted_entry()->title, std::string("created_at"));
}

TEST_CASE(test_filtering_suppresses_column_keys) {
    Selector selector;
    selector.set_values(schema());
    press(selector, "/");
    press(selector, "right");
    press(selector, "pgdown");
    press(selector, "alt+n");
    ASSERT_EQ(selector.active_column_index(), 0);
    ASSERT_TRUE(selector.active_column().is_filtering());

    press(selector, "o");
    ASSERT_EQ(selector.active_column().filter_text(), std::string("o"));

    press(selector, "ctrl+g");
    ASSERT_FALSE(selector.active_column().is_filtering());
    press(selector, "right");
    ASSERT_EQ(selector.active_column_index(), 1);
}

TEST_CASE(test_done_is_absorbing) {
    Selector selector;
    selector.set_values(schema());
    press(selector, "enter");
    auto accepted = selector.accepted_entry();

    press(selector, "right");
    press(selector, "esc");
    press(selector, "down");
    ASSERT_EQ(selector.active_column_index(), 0);
    ASSERT_EQ(selector.active_column().cursor(), 0);
    ASSERT_TRUE(selector.accepted_entry() == accepted);
    ASSERT_FALSE(selector.cancelled());
}

TEST_CASE(test_set_values_restarts_session) {
    Selector selector;
    selector.set_values(schema());
    press(selector, "right");
    press(selector, "down");
    press(selector, "enter");
    ASSERT_TRUE(selector.done());

    selector.set_values(schema());
    ASSERT_FALSE(selector.done());
    ASSERT_FALSE(selector.accepted_entry().has_value());
    ASSERT_EQ(selector.active_column_index(), 0);
    ASSERT_EQ(selector.column(1).cursor(), 0);
    ASSERT_TRUE(selector.column(0).focused());
}

TEST_CASE(test_accept_on_empty_category_cancels) {
    StaticCandidates source;
    source.add_category("Empty");
    source.add_category("Full", {{"x", ""}});

    Selector selector;
    selector.set_values(source);
    ASSERT_EQ(selector.column_count(), 2);
    ASSERT_FALSE(selector.done());

    press(selector, "down");
    press(selector, "/");
    ASSERT_FALSE(selector.active_column().is_filtering());
    press(selector, "enter");
    ASSERT_TRUE(selector.cancelled());
}

TEST_CASE(test_matches_key) {
    Selector selector;
    selector.set_values(schema());
    ASSERT_TRUE(selector.matches_key(InputEvent::key_press("enter")));
    ASSERT_TRUE(selector.matches_key(InputEvent::key_press("down")));
    ASSERT_FALSE(selector.matches_key(InputEvent::key_press("x")));

    press(selector, "/");
    ASSERT_TRUE(selector.matches_key(InputEvent::key_press("x")));

    selector.blur();
    ASSERT_FALSE(selector.matches_key(InputEvent::key_press("enter")));

    Selector empty;
    ASSERT_FALSE(empty.matches_key(InputEvent::key_press("enter")));
}

TEST_CASE(test_toggle_help_keeps_navigation) {
    Selector selector;
    selector.set_values(schema());
    press(selector, "down");
    ASSERT_FALSE(selector.show_full_help());

    press(selector, "alt+?");
    ASSERT_TRUE(selector.show_full_help());
    ASSERT_EQ(selector.active_column().cursor(), 1);
    ASSERT_EQ(selector.active_column_index(), 0);

    press(selector, "alt+?");
    ASSERT_FALSE(selector.show_full_help());
}

TEST_CASE(test_short_help_depends_on_state) {
    Selector selector;
    selector.set_values(schema());

    auto normal = selector.short_help();
    ASSERT_EQ(normal.front().help_desc, std::string("accept"));
    bool has_next_column = false;
    for (const auto& b : normal) {
        if (b.help_desc == "next column") has_next_column = true;
    }
    ASSERT_TRUE(has_next_column);

    press(selector, "/");
    auto filtering = selector.short_help();
    ASSERT_EQ(filtering.size(), 3u);
    ASSERT_EQ(filtering[0].help_desc, std::string("apply filter"));
    ASSERT_EQ(filtering[2].help_desc, std::string("close/cancel"));

    Selector single;
    single.set_values(categories(1, 2));
    for (const auto& b : single.short_help()) {
        ASSERT_NE(b.help_desc, std::string("next column"));
    }
}

TEST_CASE(test_full_help_groups) {
    Selector selector;
    selector.set_values(schema());
    auto groups = selector.full_help();
    ASSERT_EQ(groups.size(), 4u);
    ASSERT_EQ(groups.back().back().help_desc, std::string("toggle key help"));
}

TEST_CASE(test_resize_event) {
    Selector selector;
    selector.set_values(schema());
    selector.update(InputEvent::resize(50, 4));
    ASSERT_EQ(selector.width(), 50);
    ASSERT_EQ(selector.height(), 4);
}

TEST_CASE(test_selectors_do_not_share_options) {
    auto options = colpick::config::default_options();
    options.keymap.rebind(colpick::config::Action::Accept, {"ctrl+y"});
    Selector custom(options);
    Selector standard;
    custom.set_values(schema());
    standard.set_values(schema());

    press(custom, "enter");
    press(standard, "enter");
    ASSERT_FALSE(custom.done());
    ASSERT_TRUE(standard.done());

    press(custom, "ctrl+y");
    ASSERT_TRUE(custom.done());
}

TEST_CASE(test_debug_dump) {
    Selector selector;
    selector.set_values(schema());
    selector.set_width(40);
    std::string dump = selector.debug();
    ASSERT_TRUE(dump.find("active: 0/2") != std::string::npos);
    ASSERT_TRUE(dump.find("column 1 'Columns': 5 entries") != std::string::npos);
    ASSERT_TRUE(dump.find("done: false") != std::string::npos);
}

TEST_CASE(test_debug_records_follow_log_level) {
    namespace fs = std::filesystem;
    using colpick::util::Logger;
    fs::path log_path = fs::temp_directory_path() / "colpick_selector_level_test.log";

    auto debug_lines = [&](Logger::Level level) {
        Logger::init(log_path.string(), level);
        Selector selector;
        selector.set_values(schema());
        press(selector, "f12");
        press(selector, "right");
        press(selector, "f13");

        std::ifstream log(log_path);
        std::string line;
        int count = 0;
        while (std::getline(log, line)) {
            if (line.find("[DEBUG]") != std::string::npos) ++count;
        }
        return count;
    };

    int at_info = debug_lines(Logger::Level::Info);
    int at_debug = debug_lines(Logger::Level::Debug);
    Logger::init();
    fs::remove(log_path);

    ASSERT_EQ(at_info, 0);
    ASSERT_TRUE(at_debug >= 3);
}

int main(int argc, char** argv) {
    return colpick::test::TestRunner::instance().run_main(argc, argv);
}
