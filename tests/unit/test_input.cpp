#include "../framework/SimpleTest.hpp"
#include "ui/InputRouter.hpp"
#include "ui/Terminal.hpp"
#include "config/KeyMap.hpp"
#include "model/Candidates.hpp"
#include "ui/widgets/Selector.hpp"
#include <string>
#include <vector>

using namespace colpick::ui;
using colpick::config::Action;
using colpick::config::KeyMap;
using Target = InputRouter::Route::Target;

namespace {

InputRouter::Route route(const std::string& key, bool filtering) {
    static const KeyMap keymap;
    return InputRouter::classify(InputEvent::key_press(key), keymap, filtering);
}

std::vector<std::string> key_names(const std::string& bytes) {
    std::vector<std::string> names;
    for (const auto& event : Terminal::decode(bytes)) {
        names.push_back(event.key_name);
    }
    return names;
}

}  // namespace

TEST_CASE(test_router_selector_actions) {
    auto abort = route("esc", false);
    ASSERT_TRUE(abort.target == Target::Selector);
    ASSERT_TRUE(abort.action == Action::Abort);

    ASSERT_TRUE(route("right", false).action == Action::NextColumn);
    ASSERT_TRUE(route("alt+p", false).action == Action::PrevColumn);
    ASSERT_TRUE(route("pgdown", false).action == Action::NextPage);
    ASSERT_TRUE(route("alt+?", false).action == Action::ToggleHelp);

    auto accept = route("enter", false);
    ASSERT_TRUE(accept.target == Target::Selector);
    ASSERT_TRUE(accept.action == Action::Accept);
}

TEST_CASE(test_router_column_actions) {
    auto down = route("ctrl+n", false);
    ASSERT_TRUE(down.target == Target::Column);
    ASSERT_TRUE(down.action == Action::CursorDown);

    ASSERT_TRUE(route("home", false).action == Action::GoToStart);
    ASSERT_TRUE(route("/", false).action == Action::Filter);
    ASSERT_TRUE(route("ctrl+g", false).action == Action::ClearFilter);
}

TEST_CASE(test_router_ignores_unbound) {
    ASSERT_TRUE(route("x", false).target == Target::Ignore);
    ASSERT_TRUE(route("", false).target == Target::Ignore);

    KeyMap keymap;
    auto resize = InputRouter::classify(InputEvent::resize(80, 24), keymap, false);
    ASSERT_TRUE(resize.target == Target::Ignore);
    resize = InputRouter::classify(InputEvent::resize(80, 24), keymap, true);
    ASSERT_TRUE(resize.target == Target::Ignore);
}

TEST_CASE(test_router_filter_mode) {
    auto apply = route("enter", true);
    ASSERT_TRUE(apply.target == Target::Column);
    ASSERT_TRUE(apply.action == Action::AcceptWhileFiltering);

    auto cancel = route("ctrl+g", true);
    ASSERT_TRUE(cancel.target == Target::Column);
    ASSERT_TRUE(cancel.action == Action::CancelWhileFiltering);

    auto abort = route("ctrl+c", true);
    ASSERT_TRUE(abort.target == Target::Selector);
    ASSERT_TRUE(abort.action == Action::Abort);

    // Cross-column keys edit the prompt instead
    ASSERT_TRUE(route("right", true).target == Target::FilterEdit);
    ASSERT_TRUE(route("pgdown", true).target == Target::FilterEdit);
    ASSERT_TRUE(route("ctrl+a", true).target == Target::FilterEdit);
    ASSERT_TRUE(route("x", true).target == Target::FilterEdit);
}

TEST_CASE(test_decode_plain_keys) {
    auto names = key_names("ab\r\t\x7f ");
    std::vector<std::string> expected = {"a", "b", "enter", "tab", "backspace", "space"};
    ASSERT_TRUE(names == expected);
}

TEST_CASE(test_decode_control_keys) {
    auto names = key_names("\x03\x0e\x10\x0a");
    std::vector<std::string> expected = {"ctrl+c", "ctrl+n", "ctrl+p", "ctrl+j"};
    ASSERT_TRUE(names == expected);
}

TEST_CASE(test_decode_escape_sequences) {
    auto names = key_names("\033[A\033[B\033[C\033[D\033[5~\033[6~\033[H\033[4~\033[3~\033[Z\033OA");
    std::vector<std::string> expected = {
        "up", "down", "right", "left", "pgup", "pgdown", "home", "end", "delete", "shift+tab", "up"
    };
    ASSERT_TRUE(names == expected);
}

TEST_CASE(test_decode_alt_and_escape) {
    auto names = key_names("\033n\033?\033");
    std::vector<std::string> expected = {"alt+n", "alt+?", "esc"};
    ASSERT_TRUE(names == expected);

    auto double_escape = key_names("\033\033");
    ASSERT_EQ(double_escape.size(), 2u);
    ASSERT_EQ(double_escape[0], std::string("esc"));
}

TEST_CASE(test_decode_modified_arrow) {
    // ctrl+right reports as plain right
    auto names = key_names("\033[1;5C");
    ASSERT_EQ(names.size(), 1u);
    ASSERT_EQ(names[0], std::string("right"));
}

TEST_CASE(test_decode_utf8) {
    auto events = Terminal::decode("é日");
    ASSERT_EQ(events.size(), 2u);
    ASSERT_EQ(events[0].key_name, std::string("é"));
    ASSERT_EQ(events[0].text(), std::string("é"));
    ASSERT_EQ(events[1].key_name, std::string("日"));
}

TEST_CASE(test_decode_escape_split_across_reads) {
    std::string carry;
    auto first = Terminal::decode("\033", carry);
    ASSERT_TRUE(first.empty());
    ASSERT_EQ(carry, std::string("\033"));

    auto second = Terminal::decode("[C", carry);
    ASSERT_EQ(second.size(), 1u);
    ASSERT_EQ(second[0].key_name, std::string("right"));
    ASSERT_TRUE(carry.empty());
}

TEST_CASE(test_decode_csi_split_mid_parameters) {
    std::string carry;
    auto first = Terminal::decode("a\033[1;", carry);
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(first[0].key_name, std::string("a"));

    auto second = Terminal::decode("5C\033[6~", carry);
    ASSERT_EQ(second.size(), 2u);
    ASSERT_EQ(second[0].key_name, std::string("right"));
    ASSERT_EQ(second[1].key_name, std::string("pgdown"));
    ASSERT_TRUE(carry.empty());
}

TEST_CASE(test_decode_utf8_split_across_reads) {
    std::string carry;
    std::string word = "日";
    auto first = Terminal::decode(word.substr(0, 1), carry);
    ASSERT_TRUE(first.empty());

    auto second = Terminal::decode(word.substr(1), carry);
    ASSERT_EQ(second.size(), 1u);
    ASSERT_EQ(second[0].key_name, word);
}

TEST_CASE(test_flush_incomplete_escape) {
    std::string carry;
    ASSERT_TRUE(Terminal::decode("\033", carry).empty());
    auto events = Terminal::flush_incomplete(carry);
    ASSERT_EQ(events.size(), 1u);
    ASSERT_EQ(events[0].key_name, std::string("esc"));
    ASSERT_TRUE(carry.empty());

    ASSERT_TRUE(Terminal::decode("\033[1", carry).empty());
    auto truncated = Terminal::flush_incomplete(carry);
    ASSERT_EQ(truncated.size(), 1u);
    ASSERT_EQ(truncated[0].key_name, std::string("esc"));

    ASSERT_TRUE(Terminal::flush_incomplete(carry).empty());
}

TEST_CASE(test_split_arrow_moves_column_instead_of_aborting) {
    colpick::model::StaticCandidates source;
    source.add_category("Tables", {{"users", "registered accounts"}});
    source.add_category("Columns", {{"id", "primary key"}});

    colpick::ui::widgets::Selector selector;
    selector.set_values(source);

    std::string carry;
    for (const auto* chunk : {"\033", "[C"}) {
        for (const auto& event : Terminal::decode(chunk, carry)) {
            selector.update(event);
        }
    }
    ASSERT_FALSE(selector.done());
    ASSERT_EQ(selector.active_column_index(), 1);
}

TEST_CASE(test_terminal_shutdown_returns) {
    // Only meaningful with a controlling terminal
    auto& terminal = Terminal::instance();
    for (int round = 0; round < 20; ++round) {
        if (!terminal.init()) return;
        terminal.write_raw("");
        terminal.shutdown();
        ASSERT_EQ(terminal.input_fd(), -1);
    }
}

TEST_CASE(test_input_event_text) {
    ASSERT_EQ(InputEvent::key_press("a").text(), std::string("a"));
    ASSERT_EQ(InputEvent::key_press("space").text(), std::string(" "));
    ASSERT_EQ(InputEvent::key_press("enter").text(), std::string(""));
    ASSERT_EQ(InputEvent::key_press("ctrl+a").text(), std::string(""));
    ASSERT_EQ(InputEvent::resize(1, 1).text(), std::string(""));
}

int main(int argc, char** argv) {
    return colpick::test::TestRunner::instance().run_main(argc, argv);
}
