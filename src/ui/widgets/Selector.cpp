#include "ui/widgets/Selector.hpp"
#include "ui/InputRouter.hpp"
#include "ui/Formatting.hpp"
#include "ui/widgets/HelpBar.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <format>

namespace colpick::ui::widgets {

using config::Action;
using Target = InputRouter::Route::Target;

Selector::Selector(config::SelectorOptions options)
    : options_(std::move(options)),
      layout_(options_.layout) {}

void Selector::set_values(const model::CandidateSource& source) {
    done_ = false;
    accepted_.reset();
    active_ = 0;
    columns_.clear();

    Column::Options column_options;
    column_options.page_size = options_.layout.page_size;
    // Enter on an empty prompt just keeps the current entry
    column_options.block_empty_filter_commit = false;

    const int num_categories = source.num_categories();
    std::vector<int> sizes;
    int total = 0;
    for (int cat = 0; cat < num_categories; ++cat) {
        const int count = source.num_entries(cat);
        std::vector<model::Entry> entries;
        entries.reserve(static_cast<size_t>(std::max(0, count)));
        for (int i = 0; i < count; ++i) {
            entries.push_back(source.entry(cat, i));
        }
        sizes.push_back(count);
        total += count;
        columns_.emplace_back(source.category_title(cat), std::move(entries), column_options);
    }

    max_height_ = layout_.compute_max_height(sizes);
    set_height(max_height_);
    set_width(width_);

    const bool was_focused = focused_;
    blur();
    if (was_focused) focus();

    util::Logger::info(std::format("Selector: {} categories, {} entries, max height {}",
                                   num_categories, total, max_height_));

    if (columns_.empty()) {
        // Nothing to choose from: same outcome as a cancellation
        done_ = true;
        util::Logger::info("Selector: no candidates, cancelled");
    }
}

void Selector::set_width(int width) {
    width_ = width;
    resize_columns();
}

void Selector::set_height(int height) {
    height_ = layout_.clamp_height(height, max_height_);
    resize_columns();
}

void Selector::resize_columns() {
    const int column_width = layout_.column_width(width_);
    const int column_height = layout_.column_height(height_);
    for (auto& column : columns_) {
        column.set_size(column_width, column_height);
    }
}

Selector::Status Selector::update(const InputEvent& event) {
    if (columns_.empty()) {
        done_ = true;
        return Status::Done;
    }
    if (done_) {
        if (util::Logger::enabled(util::Logger::Level::Debug)) {
            util::Logger::debug(std::format("Selector: input '{}' after termination ignored", event.key_name));
        }
        return Status::Done;
    }

    if (event.type == InputEvent::Type::Resize) {
        set_width(event.width);
        set_height(event.height);
        return status();
    }

    const bool filtering = active_column().is_filtering();
    auto route = InputRouter::classify(event, options_.keymap, filtering);

    switch (route.target) {
        case Target::Selector:
            switch (route.action) {
                case Action::Abort:
                    abort();
                    break;
                case Action::ToggleHelp:
                    show_full_help_ = !show_full_help_;
                    break;
                case Action::NextColumn:
                    next_column();
                    break;
                case Action::PrevColumn:
                    prev_column();
                    break;
                case Action::NextPage:
                    if (active_column().on_last_page()) {
                        next_column();
                    } else {
                        apply_to_active(Action::NextPage);
                    }
                    break;
                case Action::PrevPage:
                    if (active_column().on_first_page()) {
                        prev_column();
                    } else {
                        apply_to_active(Action::PrevPage);
                    }
                    break;
                case Action::Accept:
                    accept();
                    break;
                default:
                    break;
            }
            break;
        case Target::Column:
            if (!apply_to_active(route.action) && util::Logger::enabled(util::Logger::Level::Debug)) {
                util::Logger::debug(std::format("Selector: '{}' has no effect on column {}",
                                                config::KeyMap::action_name(route.action), active_));
            }
            break;
        case Target::FilterEdit:
            edit_active_filter(event);
            break;
        case Target::Ignore:
            if (util::Logger::enabled(util::Logger::Level::Debug)) {
                util::Logger::debug(std::format("Selector: ignored input '{}'", event.key_name));
            }
            break;
    }
    return status();
}

void Selector::handle_input(const InputEvent& event) {
    update(event);
}

bool Selector::apply_to_active(Action action) {
    // Columns are values: update a copy, then replace the slot
    Column updated = columns_[static_cast<size_t>(active_)];
    const auto before = updated.filter_state();
    if (!updated.apply(action)) return false;
    if (updated.filter_state() != before && util::Logger::enabled(util::Logger::Level::Debug)) {
        util::Logger::debug(std::format("Selector: column {} filter {} -> {}", active_,
                                        static_cast<int>(before), static_cast<int>(updated.filter_state())));
    }
    columns_[static_cast<size_t>(active_)] = std::move(updated);
    return true;
}

void Selector::edit_active_filter(const InputEvent& event) {
    Column updated = columns_[static_cast<size_t>(active_)];
    updated.handle_input(event);
    columns_[static_cast<size_t>(active_)] = std::move(updated);
}

void Selector::select_column(int index) {
    const bool was_focused = focused_;
    blur();
    const int count = column_count();
    active_ = ((index % count) + count) % count;

    Column updated = columns_[static_cast<size_t>(active_)];
    updated.select_cursor(0);
    columns_[static_cast<size_t>(active_)] = std::move(updated);

    if (was_focused) focus();
    if (util::Logger::enabled(util::Logger::Level::Debug)) {
        util::Logger::debug(std::format("Selector: active column {} ({})", active_, active_column().name()));
    }
}

void Selector::next_column() {
    select_column(active_ + 1);
}

void Selector::prev_column() {
    select_column(active_ - 1);
}

void Selector::accept() {
    auto item = active_column().current_item();
    done_ = true;
    if (!item) {
        accepted_.reset();
        util::Logger::info("Selector: nothing to accept, cancelled");
        return;
    }
    accepted_ = std::move(item);
    util::Logger::info(std::format("Selector: accepted '{}'", accepted_->title));
}

void Selector::abort() {
    accepted_.reset();
    done_ = true;
    util::Logger::info("Selector: cancelled");
}

bool Selector::matches_key(const InputEvent& event) const {
    if (!focused_ || columns_.empty()) return false;
    if (event.type != InputEvent::Type::KeyPress) return false;

    const bool filtering = active_column().is_filtering();
    if (filtering) return true;
    return InputRouter::classify(event, options_.keymap, filtering).target != Target::Ignore;
}

void Selector::focus() {
    focused_ = true;
    if (columns_.empty()) return;
    columns_[static_cast<size_t>(active_)].set_focused(true);
}

void Selector::blur() {
    focused_ = false;
    for (auto& column : columns_) {
        column.set_focused(false);
    }
}

std::vector<int> Selector::preferred_widths() const {
    std::vector<int> widths;
    widths.reserve(columns_.size());
    for (const auto& column : columns_) {
        widths.push_back(column.preferred_width());
    }
    return widths;
}

std::string Selector::view(bool ansi) const {
    if (columns_.empty() || !layout_.renderable(width_, height_)) return "";

    Canvas canvas(width_, layout_.frame_height(height_));
    RenderContext ctx{options_.theme, focused_, true};
    render(canvas, LayoutRect{0, 0, canvas.width(), canvas.height()}, ctx);
    return canvas.to_string(ansi);
}

void Selector::render(Canvas& canvas, const LayoutRect& rect, const RenderContext& ctx) const {
    if (columns_.empty() || !layout_.renderable(rect.width, height_)) return;

    const config::Theme& theme = ctx.theme;
    SelectorLayout::Frame frame = layout_.frame(rect.width, height_);
    auto offset = [&rect](LayoutRect r) {
        r.x += rect.x;
        r.y += rect.y;
        return r;
    };

    LayoutRect outer = offset(frame.outer);
    canvas.draw_rounded_rect(outer.x, outer.y, outer.width, outer.height, theme.border);

    LayoutRect area = offset(frame.columns);
    const auto widths = preferred_widths();
    const size_t first = layout_.first_visible_column(widths, area, static_cast<size_t>(active_));
    const auto rects = layout_.arrange_columns(widths, area, first);
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (rects[i].width <= 0 || rects[i].height <= 0) continue;
        const bool is_active = static_cast<int>(i) == active_;
        RenderContext column_ctx{theme, columns_[i].focused(), is_active && ctx.active};
        columns_[i].render(canvas, rects[i], column_ctx);
    }

    LayoutRect separator = offset(frame.separator);
    canvas.draw_hline(separator.x, separator.y, separator.width, theme.separator);

    render_description(canvas, offset(frame.description), theme);
}

void Selector::render_description(Canvas& canvas, const LayoutRect& row, const config::Theme& theme) const {
    if (row.width <= 0 || row.height <= 0) return;

    auto item = active_column().current_item();
    if (!item) {
        draw_cell_text(canvas, row.x, row.y, row.width, "(no entry selected)", theme.placeholder_description);
        return;
    }
    if (item->description.empty()) {
        draw_cell_text(canvas, row.x, row.y, row.width, "", theme.placeholder_description);
        return;
    }
    draw_cell_text(canvas, row.x, row.y, row.width, "  " + item->description, theme.description);
}

std::vector<config::KeyBinding> Selector::short_help() const {
    if (columns_.empty()) {
        return {options_.keymap.binding(Action::Abort)};
    }

    const auto& keymap = options_.keymap;
    std::vector<config::KeyBinding> bindings;
    if (active_column().is_filtering()) {
        bindings = active_column().short_help(keymap);
        bindings.push_back(keymap.binding(Action::Abort));
        return bindings;
    }

    bindings.push_back(keymap.binding(Action::Accept));
    bindings.push_back(keymap.binding(Action::Abort));
    auto column_help = active_column().short_help(keymap);
    bindings.insert(bindings.end(), column_help.begin(), column_help.end());
    if (column_count() > 1) {
        bindings.push_back(keymap.binding(Action::NextColumn));
    }
    bindings.push_back(keymap.binding(Action::ToggleHelp));
    return bindings;
}

std::vector<std::vector<config::KeyBinding>> Selector::full_help() const {
    const auto& keymap = options_.keymap;
    if (columns_.empty()) {
        return {{keymap.binding(Action::Abort)}};
    }

    auto groups = active_column().full_help(keymap);
    if (active_column().is_filtering()) {
        groups.push_back({keymap.binding(Action::Abort)});
        return groups;
    }

    std::vector<config::KeyBinding> outer = {keymap.binding(Action::Accept), keymap.binding(Action::Abort)};
    if (column_count() > 1) {
        outer.push_back(keymap.binding(Action::NextColumn));
        outer.push_back(keymap.binding(Action::PrevColumn));
    }
    outer.push_back(keymap.binding(Action::ToggleHelp));
    groups.push_back(std::move(outer));
    return groups;
}

std::string Selector::help_view(bool ansi) const {
    if (!layout_.renderable(width_, SelectorLayout::MIN_HEIGHT)) return "";

    HelpBar bar;
    if (show_full_help_) {
        bar.set_groups(full_help());
    } else {
        bar.set_bindings(short_help());
    }
    return bar.view(width_, options_.theme, ansi);
}

std::string Selector::debug() const {
    std::string out = std::format("focused: {}\nsize: {}x{} (max height {})\nactive: {}/{}\n",
                                  focused_, width_, height_, max_height_, active_, column_count());
    for (size_t i = 0; i < columns_.size(); ++i) {
        const auto& column = columns_[i];
        PageInfo info = column.page_info();
        out += std::format("column {} '{}': {} entries, {} visible, cursor {}, page {}/{}, filter '{}'{}\n",
                           i, column.name(), column.size(), column.visible_count(), column.cursor(),
                           info.page + 1, info.total_pages, column.filter_text(),
                           column.is_filtering() ? " (editing)" : "");
    }
    out += std::format("done: {}", done_);
    if (accepted_) out += std::format(", accepted '{}'", accepted_->title);
    out += "\n";
    return out;
}

}  // namespace colpick::ui::widgets
