#ifndef GCM_TUI_EVENT_H
#define GCM_TUI_EVENT_H

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gcm {

enum class KeyCode {
    Char,
    F,
    Up,
    Down,
    Left,
    Right,
    Enter,
    Tab,
    BackTab,
    Backspace,
    Delete,
    Insert,
    Home,
    End,
    PageUp,
    PageDown,
    Esc,
    Null,
};

// A single key press, independent of the terminal library.
// Uppercase ASCII letters always carry `shift`.
struct KeyEvent {
    KeyCode code = KeyCode::Null;
    std::string ch;   // UTF-8 text when code == Char
    int fn = 0;       // function key number when code == F
    bool ctrl = false;
    bool alt = false;
    bool shift = false;

    static KeyEvent character(std::string ch);
    static KeyEvent special(KeyCode code);
    static KeyEvent function(int n);
    static KeyEvent ctrlChar(char c);

    // Plain character press without Ctrl/Alt
    bool isChar(char c) const;
    bool is(KeyCode c) const { return code == c && !ctrl && !alt; }

    auto operator<=>(const KeyEvent&) const = default;
};

struct MouseEvent {
    enum class Kind { Press, Release, Move, WheelUp, WheelDown };
    Kind kind = Kind::Move;
    int x = 0;
    int y = 0;

    bool operator==(const MouseEvent&) const = default;
};

enum class EventType {
    Tick,
    Render,
    Resize,
    Key,
    Mouse,
    Quit,
};

// Raw event produced by the terminal event source
struct Event {
    EventType type = EventType::Render;
    KeyEvent key;
    MouseEvent mouse;
    uint16_t width = 0;
    uint16_t height = 0;

    static Event tick() { return Event{EventType::Tick}; }
    static Event render() { return Event{EventType::Render}; }
    static Event quit() { return Event{EventType::Quit}; }
    static Event resize(uint16_t w, uint16_t h);
    static Event keyPress(KeyEvent key);
    static Event mouseEvent(MouseEvent mouse);
};

// Parses one key description such as "q", "Q", "ctrl-c", "esc", "f5",
// "alt-enter". Returns nullopt when the description is not understood.
std::optional<KeyEvent> parseKey(const std::string& raw);

// Parses a keymap sequence such as "<q>", "<Ctrl-d>" or "<g><g>".
std::optional<std::vector<KeyEvent>> parseKeySequence(const std::string& raw);

}  // namespace gcm

#endif  // GCM_TUI_EVENT_H
