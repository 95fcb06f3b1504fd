#pragma once

#include "ui/Component.hpp"
#include "ui/SelectorLayout.hpp"
#include "ui/widgets/Column.hpp"
#include "config/SelectorOptions.hpp"
#include "model/Candidates.hpp"
#include <optional>
#include <string>
#include <vector>

namespace colpick::ui::widgets {

/**
 * Multi-column completion selector.
 *
 * Owns one Column per category, the active column index, the focus flag
 * and the session outcome. The host feeds it events through update() and
 * reads the rendered block through view(). Once done, the selector
 * ignores input until the next set_values().
 */
class Selector : public Component {
public:
    enum class Status {
        Active,
        Done  // Interaction over; accepted_entry() tells accept from cancel
    };

    explicit Selector(config::SelectorOptions options = config::default_options());

    // Host surface
    void set_values(const model::CandidateSource& source);
    void set_width(int width);
    void set_height(int height);
    Status update(const InputEvent& event);
    std::string view(bool ansi = true) const;

    void handle_input(const InputEvent& event) override;
    void render(Canvas& canvas, const LayoutRect& rect, const RenderContext& ctx) const override;

    /// Whether update() would use this key right now.
    bool matches_key(const InputEvent& event) const;

    void focus();
    void blur();
    bool focused() const { return focused_; }

    // Outcome
    Status status() const { return done_ ? Status::Done : Status::Active; }
    bool done() const { return done_; }
    bool cancelled() const { return done_ && !accepted_.has_value(); }
    const std::optional<model::Entry>& accepted_entry() const { return accepted_; }

    int column_count() const { return static_cast<int>(columns_.size()); }
    int active_column_index() const { return active_; }
    const Column& column(int index) const { return columns_.at(static_cast<size_t>(index)); }
    const Column& active_column() const { return column(active_); }

    int width() const { return width_; }
    int height() const { return height_; }
    int max_height() const { return max_height_; }

    // Help
    std::vector<config::KeyBinding> short_help() const;
    std::vector<std::vector<config::KeyBinding>> full_help() const;
    bool show_full_help() const { return show_full_help_; }
    std::string help_view(bool ansi = true) const;

    const config::SelectorOptions& options() const { return options_; }
    std::string debug() const;

private:
    config::SelectorOptions options_;
    SelectorLayout layout_;

    std::vector<Column> columns_;
    int active_ = 0;
    bool focused_ = true;
    bool show_full_help_ = false;

    int width_ = 0;
    int height_ = 0;
    int max_height_ = 0;

    bool done_ = false;
    std::optional<model::Entry> accepted_;

    void select_column(int index);
    void next_column();
    void prev_column();
    bool apply_to_active(config::Action action);
    void edit_active_filter(const InputEvent& event);
    void accept();
    void abort();
    void resize_columns();
    std::vector<int> preferred_widths() const;
    void render_description(Canvas& canvas, const LayoutRect& row, const config::Theme& theme) const;
};

}  // namespace colpick::ui::widgets
