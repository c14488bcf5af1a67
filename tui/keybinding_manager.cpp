#include "keybinding_manager.h"

#include <algorithm>
#include <cctype>

namespace gcm {

bool KeybindingManager::matches(const KeyEvent& key, const std::string& name) const {
    auto keys = keysFor(name);
    return std::find(keys.begin(), keys.end(), formatKeyEvent(key)) != keys.end();
}

std::vector<std::string> KeybindingManager::keysFor(const std::string& name) const {
    if (!settings_) return {};
    return settings_->keysFor(name);
}

std::string KeybindingManager::buildHelpText(
    const std::vector<std::pair<std::string, std::string>>& items) const {
    std::string out;
    for (const auto& [name, label] : items) {
        auto keys = keysFor(name);
        if (keys.empty()) continue;

        if (!out.empty()) out += " | ";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) out += ", ";
            out += keys[i];
        }
        out += ": " + label;
    }
    return out;
}

std::string KeybindingManager::formatKeyEvent(const KeyEvent& key) {
    std::string out;
    if (key.ctrl) out += "Ctrl+";
    if (key.alt) out += "Alt+";
    if (key.shift) out += "Shift+";

    switch (key.code) {
        case KeyCode::Char:
            if (key.ch == " ") {
                out += "Space";
            } else if (key.shift && key.ch.size() == 1) {
                out += static_cast<char>(std::toupper(static_cast<unsigned char>(key.ch[0])));
            } else {
                out += key.ch;
            }
            break;
        case KeyCode::F: out += "F" + std::to_string(key.fn); break;
        case KeyCode::Up: out += "Up"; break;
        case KeyCode::Down: out += "Down"; break;
        case KeyCode::Left: out += "Left"; break;
        case KeyCode::Right: out += "Right"; break;
        case KeyCode::Enter: out += "Enter"; break;
        case KeyCode::Tab: out += "Tab"; break;
        case KeyCode::BackTab: out += "BackTab"; break;
        case KeyCode::Backspace: out += "Backspace"; break;
        case KeyCode::Delete: out += "Delete"; break;
        case KeyCode::Insert: out += "Insert"; break;
        case KeyCode::Home: out += "Home"; break;
        case KeyCode::End: out += "End"; break;
        case KeyCode::PageUp: out += "PageUp"; break;
        case KeyCode::PageDown: out += "PageDown"; break;
        case KeyCode::Esc: out += "Esc"; break;
        case KeyCode::Null: out += "Unknown"; break;
    }
    return out;
}

}  // namespace gcm
