#include "ui/widgets/Column.hpp"
#include "ui/Formatting.hpp"
#include "util/TextMatcher.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>

namespace colpick::ui::widgets {

using config::Action;

Column::Column(std::string name, std::vector<model::Entry> entries, Options options)
    : name_(std::move(name)), options_(options) {
    options_.page_size = std::max(1, options_.page_size);

    std::vector<std::string> keys;
    keys.reserve(entries.size());
    content_width_ = std::max(MIN_CONTENT_WIDTH, display_cols(name_));
    for (const auto& entry : entries) {
        keys.push_back(util::normalize_for_search(entry.filter_value()));
        content_width_ = std::max(content_width_, display_cols(entry.title));
    }

    items_ = std::make_shared<const std::vector<model::Entry>>(std::move(entries));
    search_keys_ = std::make_shared<const std::vector<std::string>>(std::move(keys));

    visible_.resize(items_->size());
    for (size_t i = 0; i < visible_.size(); ++i) {
        visible_[i] = static_cast<int>(i);
    }
}

const model::Entry& Column::visible_entry(int visible_index) const {
    return items_->at(static_cast<size_t>(visible_.at(static_cast<size_t>(visible_index))));
}

void Column::select_cursor(int index) {
    if (visible_.empty()) {
        cursor_ = 0;
        return;
    }
    cursor_ = std::clamp(index, 0, visible_count() - 1);
}

std::optional<model::Entry> Column::current_item() const {
    if (visible_.empty()) return std::nullopt;
    return visible_entry(cursor_);
}

PageInfo Column::page_info() const {
    const int per_page = options_.page_size;
    PageInfo info;
    info.page = cursor_ / per_page;
    info.total_pages = std::max(1, (visible_count() + per_page - 1) / per_page);
    return info;
}

bool Column::on_last_page() const {
    PageInfo info = page_info();
    return info.page >= info.total_pages - 1;
}

void Column::cursor_up() {
    if (cursor_ > 0) --cursor_;
}

void Column::cursor_down() {
    if (cursor_ < visible_count() - 1) ++cursor_;
}

void Column::next_page() {
    if (on_last_page()) return;
    select_cursor(cursor_ + options_.page_size);
}

void Column::prev_page() {
    if (on_first_page()) return;
    select_cursor(cursor_ - options_.page_size);
}

void Column::go_to_start() {
    cursor_ = 0;
}

void Column::go_to_end() {
    select_cursor(visible_count() - 1);
}

bool Column::start_filter() {
    if (items_->empty() || filter_state_ == FilterState::Filtering) return false;
    filter_state_ = FilterState::Filtering;
    filter_.set_value(filter_.value());  // Cursor to the end of the prompt
    return true;
}

bool Column::accept_filter() {
    if (filter_state_ != FilterState::Filtering) return false;
    if (filter_.empty()) {
        if (options_.block_empty_filter_commit) return false;
        filter_state_ = FilterState::Unfiltered;
        return true;
    }
    if (visible_.empty()) {
        reset_filtering();
        return true;
    }
    filter_state_ = FilterState::FilterApplied;
    cursor_ = 0;
    return true;
}

bool Column::cancel_filter() {
    if (filter_state_ != FilterState::Filtering) return false;
    reset_filtering();
    return true;
}

bool Column::clear_filter() {
    if (filter_state_ != FilterState::FilterApplied) return false;
    reset_filtering();
    return true;
}

bool Column::apply(Action action) {
    const bool filtering = is_filtering();
    switch (action) {
        case Action::CursorUp:
            if (filtering) return false;
            cursor_up();
            return true;
        case Action::CursorDown:
            if (filtering) return false;
            cursor_down();
            return true;
        case Action::NextPage:
            if (filtering) return false;
            next_page();
            return true;
        case Action::PrevPage:
            if (filtering) return false;
            prev_page();
            return true;
        case Action::GoToStart:
            if (filtering) return false;
            go_to_start();
            return true;
        case Action::GoToEnd:
            if (filtering) return false;
            go_to_end();
            return true;
        case Action::Filter:
            return start_filter();
        case Action::ClearFilter:
            return clear_filter();
        case Action::CancelWhileFiltering:
            return cancel_filter();
        case Action::AcceptWhileFiltering:
            return accept_filter();
        default:
            return false;
    }
}

void Column::handle_input(const InputEvent& event) {
    if (!is_filtering()) return;
    if (filter_.handle_edit(event) == FilterInput::Result::Changed) {
        refilter();
    }
}

void Column::refilter() {
    visible_.clear();
    const std::string query = util::normalize_for_search(filter_.value());
    util::TextMatcher matcher(query, true);
    const auto& keys = *search_keys_;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (matcher.matches(keys[i])) {
            visible_.push_back(static_cast<int>(i));
        }
    }
    cursor_ = 0;
}

void Column::reset_filtering() {
    filter_state_ = FilterState::Unfiltered;
    filter_.clear();
    refilter();
}

void Column::set_size(int width, int height) {
    width_ = std::max(0, width);
    height_ = std::max(0, height);
}

void Column::render(Canvas& canvas, const LayoutRect& area, const RenderContext& ctx) const {
    // A budget from set_size() bounds the drawn area; 0 means unbounded
    LayoutRect rect = area;
    if (width_ > 0) rect.width = std::min(rect.width, width_);
    if (height_ > 0) rect.height = std::min(rect.height, height_);
    if (rect.width <= 0 || rect.height <= 0) return;

    render_title(canvas, LayoutRect{rect.x, rect.y, rect.width, 1}, ctx);

    const PageInfo info = page_info();
    const bool show_pagination = info.total_pages > 1 && rect.height >= 3;
    const int item_rows = rect.height - 1 - (show_pagination ? 1 : 0);
    if (item_rows <= 0) return;

    if (visible_.empty()) {
        const char* placeholder = items_->empty() ? "(no entries)" : "(no matches)";
        draw_cell_text(canvas, rect.x, rect.y + 1, rect.width, std::string(" ") + placeholder,
                       ctx.theme.empty_placeholder);
    } else {
        const int first = info.page * options_.page_size;
        const int last = std::min(visible_count(), first + options_.page_size);
        int y = rect.y + 1;
        for (int i = first; i < last && y < rect.y + 1 + item_rows; ++i, ++y) {
            render_item(canvas, LayoutRect{rect.x, y, rect.width, 1}, i, ctx);
        }
    }

    if (show_pagination) {
        std::string dots = " " + std::to_string(info.page + 1) + "/" + std::to_string(info.total_pages);
        draw_cell_text(canvas, rect.x, rect.bottom() - 1, rect.width, dots, ctx.theme.pagination);
    }
}

void Column::render_title(Canvas& canvas, const LayoutRect& row, const RenderContext& ctx) const {
    const Style& title_style = ctx.focused ? ctx.theme.focused_title : ctx.theme.blurred_title;

    if (filter_state_ == FilterState::Filtering) {
        RenderContext prompt_ctx{ctx.theme, ctx.focused, ctx.focused};
        filter_.render(canvas, row, prompt_ctx);
        return;
    }

    int x = canvas.draw_text(row.x, row.y, truncate_cols(name_, row.width), title_style, row.right());
    if (filter_state_ == FilterState::FilterApplied) {
        std::string suffix = std::string(" ") + FilterInput::PROMPT + filter_.value();
        canvas.draw_text(x, row.y, suffix, ctx.theme.filter_prompt, row.right());
    }
}

void Column::render_item(Canvas& canvas, const LayoutRect& row, int visible_index, const RenderContext& ctx) const {
    const model::Entry& entry = visible_entry(visible_index);
    const bool selected = ctx.active && visible_index == cursor_;
    const Style style = selected ? ctx.theme.selected_item : ctx.theme.item;

    const int text_x = row.x + ITEM_PADDING;
    canvas.fill_rect(row.x, row.y, ITEM_PADDING, 1, Cell{" ", style});
    draw_cell_text(canvas, text_x, row.y, row.width - ITEM_PADDING, entry.title, style);

    if (filter_state_ == FilterState::Unfiltered || filter_.empty()) return;

    // Underline the first match inside the title, if it is there verbatim
    util::TextMatcher matcher(filter_.value());
    auto match = matcher.find(entry.title);
    if (!match.found()) return;

    Style match_style = style.with(ctx.theme.filter_match.attr);
    if (ctx.theme.filter_match.fg != Color::Default) match_style.fg = ctx.theme.filter_match.fg;

    const int limit = row.x + row.width;
    const int lead = display_cols(entry.title.substr(0, static_cast<size_t>(match.pos)));
    if (display_cols(entry.title) > row.width - ITEM_PADDING) {
        // Title was cut with an ellipsis; only underline what stayed visible
        int visible_cols = row.width - ITEM_PADDING - 1;
        if (lead >= visible_cols) return;
        std::string text = take_cols(entry.title.substr(static_cast<size_t>(match.pos), static_cast<size_t>(match.length)),
                                     visible_cols - lead);
        canvas.draw_text(text_x + lead, row.y, text, match_style, limit);
        return;
    }
    canvas.draw_text(text_x + lead, row.y,
                     entry.title.substr(static_cast<size_t>(match.pos), static_cast<size_t>(match.length)),
                     match_style, limit);
}

std::vector<config::KeyBinding> Column::short_help(const config::KeyMap& keymap) const {
    auto pick = [&keymap](std::initializer_list<Action> actions) {
        std::vector<config::KeyBinding> out;
        for (Action a : actions) out.push_back(keymap.binding(a));
        return out;
    };

    switch (filter_state_) {
        case FilterState::Filtering:
            return pick({Action::AcceptWhileFiltering, Action::CancelWhileFiltering});
        case FilterState::FilterApplied:
            return pick({Action::CursorUp, Action::CursorDown, Action::Filter, Action::ClearFilter});
        case FilterState::Unfiltered:
        default:
            break;
    }

    auto bindings = pick({Action::CursorUp, Action::CursorDown});
    if (!items_->empty()) bindings.push_back(keymap.binding(Action::Filter));
    return bindings;
}

std::vector<std::vector<config::KeyBinding>> Column::full_help(const config::KeyMap& keymap) const {
    if (is_filtering()) {
        return {{keymap.binding(Action::AcceptWhileFiltering), keymap.binding(Action::CancelWhileFiltering)}};
    }

    std::vector<std::vector<config::KeyBinding>> groups = {
        {keymap.binding(Action::CursorUp), keymap.binding(Action::CursorDown),
         keymap.binding(Action::NextPage), keymap.binding(Action::PrevPage)},
        {keymap.binding(Action::GoToStart), keymap.binding(Action::GoToEnd)},
    };

    std::vector<config::KeyBinding> filter_group;
    if (!items_->empty()) filter_group.push_back(keymap.binding(Action::Filter));
    if (filter_state_ == FilterState::FilterApplied) filter_group.push_back(keymap.binding(Action::ClearFilter));
    if (!filter_group.empty()) groups.push_back(std::move(filter_group));
    return groups;
}

}  // namespace colpick::ui::widgets
