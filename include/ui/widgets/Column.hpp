#pragma once

#include "ui/Component.hpp"
#include "ui/widgets/FilterInput.hpp"
#include "config/KeyMap.hpp"
#include "model/Candidates.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace colpick::ui::widgets {

struct PageInfo {
    int page = 0;         // 0-based
    int total_pages = 1;  // Never below 1

    bool operator==(const PageInfo& other) const = default;
};

/**
 * One category of candidates: its entries, a cursor, the page derived
 * from it and the filter sub-state.
 *
 * Columns are plain values. The entry list is shared and immutable, so
 * copying a column to update it is cheap; nothing outside the column
 * holds pointers into it.
 */
class Column : public Component {
public:
    enum class FilterState {
        Unfiltered,
        Filtering,      // Prompt being edited
        FilterApplied   // Prompt closed, entries narrowed
    };

    struct Options {
        int page_size = 4;
        // Default filter behaviour: committing an empty prompt does nothing
        bool block_empty_filter_commit = true;
    };

    static constexpr int MIN_CONTENT_WIDTH = 10;
    static constexpr int ITEM_PADDING = 1;

    Column(std::string name, std::vector<model::Entry> entries, Options options);

    const std::string& name() const { return name_; }
    int size() const { return static_cast<int>(items_->size()); }
    bool empty() const { return items_->empty(); }

    /// Entries currently shown, in order; all of them unless a filter narrows it.
    int visible_count() const { return static_cast<int>(visible_.size()); }
    const model::Entry& visible_entry(int visible_index) const;

    int cursor() const { return cursor_; }
    void select_cursor(int index);
    std::optional<model::Entry> current_item() const;

    PageInfo page_info() const;
    bool on_first_page() const { return page_info().page == 0; }
    bool on_last_page() const;
    int page_size() const { return options_.page_size; }

    // Navigation
    void cursor_up();
    void cursor_down();
    void next_page();
    void prev_page();
    void go_to_start();
    void go_to_end();

    // Filter sub-state
    bool is_filtering() const { return filter_state_ == FilterState::Filtering; }
    FilterState filter_state() const { return filter_state_; }
    const std::string& filter_text() const { return filter_.value(); }
    bool start_filter();
    bool accept_filter();
    bool cancel_filter();
    bool clear_filter();

    /// Perform an in-column action. Returns false if it does not apply.
    bool apply(config::Action action);

    /// Raw keys while filtering: text and prompt editing.
    void handle_input(const InputEvent& event) override;

    /// Size budget; render() never draws beyond it.
    void set_size(int width, int height);
    int width() const { return width_; }
    int height() const { return height_; }
    int content_width() const { return content_width_; }
    int preferred_width() const { return content_width_ + ITEM_PADDING; }

    bool focused() const { return focused_; }
    void set_focused(bool focused) { focused_ = focused; }

    void render(Canvas& canvas, const LayoutRect& rect, const RenderContext& ctx) const override;

    std::vector<config::KeyBinding> short_help(const config::KeyMap& keymap) const;
    std::vector<std::vector<config::KeyBinding>> full_help(const config::KeyMap& keymap) const;

private:
    std::string name_;
    std::shared_ptr<const std::vector<model::Entry>> items_;
    std::shared_ptr<const std::vector<std::string>> search_keys_;  // Normalized filter values
    std::vector<int> visible_;  // Indices into items_

    Options options_;
    int cursor_ = 0;  // Index into visible_
    FilterState filter_state_ = FilterState::Unfiltered;
    FilterInput filter_;

    int width_ = 0;
    int height_ = 0;
    int content_width_ = MIN_CONTENT_WIDTH;
    bool focused_ = false;

    void refilter();
    void reset_filtering();
    void render_title(Canvas& canvas, const LayoutRect& row, const RenderContext& ctx) const;
    void render_item(Canvas& canvas, const LayoutRect& row, int visible_index, const RenderContext& ctx) const;
};

}  // namespace colpick::ui::widgets
