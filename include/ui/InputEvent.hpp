#pragma once

#include <string>

namespace colpick::ui {

/**
 * Key names follow the terminal decoder: "up", "down", "left", "right",
 * "pgup", "pgdown", "home", "end", "enter", "tab", "shift+tab", "esc",
 * "backspace", "delete", "space", "ctrl+<letter>", "alt+<key>", or the
 * UTF-8 text of a printable character.
 */
struct InputEvent {
    enum class Type {
        KeyPress,
        Resize
    };

    Type type = Type::KeyPress;
    int key = 0; // char code or 0 for named keys
    std::string key_name;
    int width = 0;  // Resize only
    int height = 0; // Resize only

    /// Text the key inserts into a line editor, empty for non-text keys.
    std::string text() const {
        if (type != Type::KeyPress) return "";
        if (key_name == "space") return " ";
        if (key_name.empty()) return "";
        unsigned char first = static_cast<unsigned char>(key_name[0]);
        if (key_name.size() == 1) {
            return (first >= 0x20 && first < 0x7F) ? key_name : "";
        }
        // Multi-byte UTF-8 character
        return (first >= 0xC0) ? key_name : "";
    }

    static InputEvent key_press(const std::string& name) {
        int code = (name.size() == 1) ? static_cast<unsigned char>(name[0]) : 0;
        return InputEvent{Type::KeyPress, code, name, 0, 0};
    }

    static InputEvent resize(int w, int h) {
        return InputEvent{Type::Resize, 0, "resize", w, h};
    }
};

} // namespace colpick::ui
