#include "event.h"

#include <algorithm>
#include <cctype>

namespace gcm {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<KeyEvent> parseKeyName(const std::string& name) {
    if (name.size() == 1) {
        return KeyEvent::character(name);
    }

    std::string lower = toLower(name);
    if (lower == "esc") return KeyEvent::special(KeyCode::Esc);
    if (lower == "enter") return KeyEvent::special(KeyCode::Enter);
    if (lower == "tab") return KeyEvent::special(KeyCode::Tab);
    if (lower == "backtab") return KeyEvent::special(KeyCode::BackTab);
    if (lower == "backspace") return KeyEvent::special(KeyCode::Backspace);
    if (lower == "delete" || lower == "del") return KeyEvent::special(KeyCode::Delete);
    if (lower == "insert" || lower == "ins") return KeyEvent::special(KeyCode::Insert);
    if (lower == "home") return KeyEvent::special(KeyCode::Home);
    if (lower == "end") return KeyEvent::special(KeyCode::End);
    if (lower == "pageup") return KeyEvent::special(KeyCode::PageUp);
    if (lower == "pagedown") return KeyEvent::special(KeyCode::PageDown);
    if (lower == "up") return KeyEvent::special(KeyCode::Up);
    if (lower == "down") return KeyEvent::special(KeyCode::Down);
    if (lower == "left") return KeyEvent::special(KeyCode::Left);
    if (lower == "right") return KeyEvent::special(KeyCode::Right);
    if (lower == "space") return KeyEvent::character(" ");
    if (lower == "hyphen" || lower == "minus") return KeyEvent::character("-");

    if (lower.size() >= 2 && lower.size() <= 3 && lower[0] == 'f') {
        int n = 0;
        for (size_t i = 1; i < lower.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(lower[i]))) return std::nullopt;
            n = n * 10 + (lower[i] - '0');
        }
        if (n >= 1 && n <= 12) return KeyEvent::function(n);
    }
    return std::nullopt;
}

}  // namespace

KeyEvent KeyEvent::character(std::string ch) {
    KeyEvent key;
    key.code = KeyCode::Char;
    if (ch.size() == 1 && std::isupper(static_cast<unsigned char>(ch[0]))) {
        key.shift = true;
    }
    key.ch = std::move(ch);
    return key;
}

KeyEvent KeyEvent::special(KeyCode code) {
    KeyEvent key;
    key.code = code;
    return key;
}

KeyEvent KeyEvent::function(int n) {
    KeyEvent key;
    key.code = KeyCode::F;
    key.fn = n;
    return key;
}

KeyEvent KeyEvent::ctrlChar(char c) {
    KeyEvent key;
    key.code = KeyCode::Char;
    key.ch = std::string(1, static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    key.ctrl = true;
    return key;
}

bool KeyEvent::isChar(char c) const {
    return code == KeyCode::Char && !ctrl && !alt && ch.size() == 1 && ch[0] == c;
}

Event Event::resize(uint16_t w, uint16_t h) {
    Event e{EventType::Resize};
    e.width = w;
    e.height = h;
    return e;
}

Event Event::keyPress(KeyEvent key) {
    Event e{EventType::Key};
    e.key = std::move(key);
    return e;
}

Event Event::mouseEvent(MouseEvent mouse) {
    Event e{EventType::Mouse};
    e.mouse = mouse;
    return e;
}

std::optional<KeyEvent> parseKey(const std::string& raw) {
    std::string rest = raw;
    bool ctrl = false;
    bool alt = false;
    bool shift = false;

    // Modifiers are written "ctrl-", "alt-", "shift-" in any order
    while (true) {
        std::string lower = toLower(rest);
        if (lower.rfind("ctrl-", 0) == 0 && rest.size() > 5) {
            ctrl = true;
            rest = rest.substr(5);
        } else if (lower.rfind("alt-", 0) == 0 && rest.size() > 4) {
            alt = true;
            rest = rest.substr(4);
        } else if (lower.rfind("shift-", 0) == 0 && rest.size() > 6) {
            shift = true;
            rest = rest.substr(6);
        } else {
            break;
        }
    }

    auto key = parseKeyName(rest);
    if (!key) return std::nullopt;

    if (ctrl) {
        key->ctrl = true;
        if (key->code == KeyCode::Char && key->ch.size() == 1) {
            // Terminals cannot tell Ctrl+a from Ctrl+A
            key->ch = toLower(key->ch);
            key->shift = false;
        }
    }
    if (alt) key->alt = true;
    if (shift) {
        key->shift = true;
        if (key->code == KeyCode::Char && key->ch.size() == 1) {
            key->ch[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(key->ch[0])));
        }
    }
    return key;
}

std::optional<std::vector<KeyEvent>> parseKeySequence(const std::string& raw) {
    std::vector<KeyEvent> keys;
    size_t pos = 0;
    while (pos < raw.size()) {
        if (raw[pos] != '<') return std::nullopt;
        // "<>>" is the '>' key
        size_t close = raw.find('>', pos + 2);
        if (close == std::string::npos) return std::nullopt;
        auto key = parseKey(raw.substr(pos + 1, close - pos - 1));
        if (!key) return std::nullopt;
        keys.push_back(*key);
        pos = close + 1;
    }
    if (keys.empty()) return std::nullopt;
    return keys;
}

}  // namespace gcm
