#include "ui/widgets/FilterInput.hpp"
#include "ui/Formatting.hpp"

namespace colpick::ui::widgets {

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

}  // namespace

void FilterInput::render(Canvas& canvas, const LayoutRect& rect, const RenderContext& ctx) const {
    if (rect.width <= 0 || rect.height <= 0) return;

    const int limit = rect.right();
    int x = canvas.draw_text(rect.x, rect.y, PROMPT, ctx.theme.filter_prompt, limit);

    // Keep the cursor visible: drop leading text when the query is too wide
    std::string before = query_.substr(0, cursor_pos_);
    std::string after = query_.substr(cursor_pos_);
    int room = limit - x - 1;  // One cell for the cursor
    while (!before.empty() && display_cols(before) > room) {
        int cut = 1;
        while (cut < static_cast<int>(before.size()) && is_continuation(static_cast<unsigned char>(before[cut]))) {
            ++cut;
        }
        before.erase(0, cut);
    }

    x = canvas.draw_text(x, rect.y, before, ctx.theme.item, limit);
    if (!ctx.active) {
        canvas.draw_text(x, rect.y, after, ctx.theme.item, limit);
        return;
    }

    // Cursor cell shows the character under it, or a blank at the end
    std::string under = " ";
    if (!after.empty()) {
        int len = next_boundary(cursor_pos_) - cursor_pos_;
        under = after.substr(0, len);
        after.erase(0, len);
    }
    x = canvas.draw_text(x, rect.y, under, ctx.theme.filter_cursor, limit);
    canvas.draw_text(x, rect.y, after, ctx.theme.item, limit);
}

void FilterInput::handle_input(const InputEvent& event) {
    handle_edit(event);
}

FilterInput::Result FilterInput::handle_edit(const InputEvent& event) {
    if (event.type != InputEvent::Type::KeyPress) return Result::None;

    const std::string& key = event.key_name;
    const int len = static_cast<int>(query_.size());

    if (key == "backspace" || key == "ctrl+h") {
        if (cursor_pos_ == 0) return Result::None;
        int start = prev_boundary(cursor_pos_);
        query_.erase(start, cursor_pos_ - start);
        cursor_pos_ = start;
        return Result::Changed;
    }

    if (key == "delete" || key == "ctrl+d") {
        if (cursor_pos_ >= len) return Result::None;
        query_.erase(cursor_pos_, next_boundary(cursor_pos_) - cursor_pos_);
        return Result::Changed;
    }

    if (key == "ctrl+u") {
        if (query_.empty()) return Result::None;
        clear();
        return Result::Changed;
    }

    if (key == "left" || key == "ctrl+b") {
        if (cursor_pos_ == 0) return Result::None;
        cursor_pos_ = prev_boundary(cursor_pos_);
        return Result::Moved;
    }

    if (key == "right" || key == "ctrl+f") {
        if (cursor_pos_ >= len) return Result::None;
        cursor_pos_ = next_boundary(cursor_pos_);
        return Result::Moved;
    }

    if (key == "home" || key == "ctrl+a") {
        if (cursor_pos_ == 0) return Result::None;
        cursor_pos_ = 0;
        return Result::Moved;
    }

    if (key == "end" || key == "ctrl+e") {
        if (cursor_pos_ == len) return Result::None;
        cursor_pos_ = len;
        return Result::Moved;
    }

    std::string text = event.text();
    if (text.empty()) return Result::None;

    query_.insert(cursor_pos_, text);
    cursor_pos_ += static_cast<int>(text.size());
    return Result::Changed;
}

void FilterInput::set_value(const std::string& value) {
    query_ = value;
    cursor_pos_ = static_cast<int>(query_.size());
}

void FilterInput::clear() {
    query_.clear();
    cursor_pos_ = 0;
}

int FilterInput::prev_boundary(int pos) const {
    int p = pos - 1;
    while (p > 0 && is_continuation(static_cast<unsigned char>(query_[p]))) {
        --p;
    }
    return p < 0 ? 0 : p;
}

int FilterInput::next_boundary(int pos) const {
    const int len = static_cast<int>(query_.size());
    int p = pos + 1;
    while (p < len && is_continuation(static_cast<unsigned char>(query_[p]))) {
        ++p;
    }
    return p > len ? len : p;
}

}  // namespace colpick::ui::widgets
