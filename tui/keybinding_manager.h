#ifndef GCM_TUI_KEYBINDING_MANAGER_H
#define GCM_TUI_KEYBINDING_MANAGER_H

#include "event.h"
#include "core/settings.h"
#include <string>
#include <utility>
#include <vector>

namespace gcm {

// Resolves key presses against the user-configurable chord tables.
// A default-constructed manager has no settings and treats every name
// as unbound.
class KeybindingManager {
public:
    KeybindingManager() = default;
    explicit KeybindingManager(SharedSettings settings) : settings_(std::move(settings)) {}

    void setSettings(SharedSettings settings) { settings_ = std::move(settings); }

    // True when the formatted key is one of the chords bound to `name`
    bool matches(const KeyEvent& key, const std::string& name) const;

    std::vector<std::string> keysFor(const std::string& name) const;

    // "Up, k: Navigate | Enter, Space: Select"
    std::string buildHelpText(const std::vector<std::pair<std::string, std::string>>& items) const;

    // Canonical chord string: "Ctrl+Alt+Shift+X", "Space", "F5", "Enter"
    static std::string formatKeyEvent(const KeyEvent& key);

private:
    SharedSettings settings_;
};

}  // namespace gcm

#endif  // GCM_TUI_KEYBINDING_MANAGER_H
