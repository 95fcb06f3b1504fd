#pragma once

#include "ui/Component.hpp"
#include <string>

namespace colpick::ui::widgets {

/**
 * One-line filter prompt ("/query") edited while a column is filtering.
 * The cursor is a byte offset that always sits on a UTF-8 boundary.
 */
class FilterInput : public Component {
public:
    enum class Result {
        None,     // Key not used
        Changed,  // Text changed
        Moved     // Only the cursor moved
    };

    static constexpr const char* PROMPT = "/";

    void render(Canvas& canvas, const LayoutRect& rect, const RenderContext& ctx) const override;

    void handle_input(const InputEvent& event) override;  // Generic interface
    Result handle_edit(const InputEvent& event);          // Specialized interface


    const std::string& value() const { return query_; }
    int cursor() const { return cursor_pos_; }
    bool empty() const { return query_.empty(); }

    void set_value(const std::string& value);
    void clear();

private:
    std::string query_;
    int cursor_pos_ = 0;

    int prev_boundary(int pos) const;
    int next_boundary(int pos) const;
};

}  // namespace colpick::ui::widgets
