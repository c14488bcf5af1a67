#include "settings_view.h"
#include "modal.h"
#include "table.h"
#include "core/errors.h"

#include <algorithm>

namespace gcm {
namespace components {

using namespace ftxui;

namespace {

const std::vector<std::pair<SettingsView::Section, std::string>>& sections() {
    static const std::vector<std::pair<SettingsView::Section, std::string>> list = {
        {SettingsView::Section::Appearance, "Appearance"},
        {SettingsView::Section::Keybindings, "Keybindings"},
    };
    return list;
}

std::string describeBinding(const std::string& name) {
    static const std::map<std::string, std::string> descriptions = {
        {"up", "Move up"},
        {"down", "Move down"},
        {"left", "Previous tab / pane"},
        {"right", "Next tab / pane"},
        {"back", "Go back"},
        {"quit", "Quit"},
        {"edit", "Edit item"},
        {"delete", "Delete item"},
        {"create", "Create new"},
        {"import", "Import extension"},
        {"launch", "Launch profile"},
        {"select", "Open / select"},
        {"search", "Search"},
    };
    auto it = descriptions.find(name);
    return it == descriptions.end() ? name : it->second;
}

}  // namespace

SettingsView::SettingsView() {
    bindingNames_ = navigationBindingNames();
    const auto& actions = actionBindingNames();
    bindingNames_.insert(bindingNames_.end(), actions.begin(), actions.end());
}

void SettingsView::registerSettingsHandler(SharedSettings settings) {
    Component::registerSettingsHandler(settings);
    if (settings_) selectedTheme_ = findThemeIndex(settings_->theme());
}

void SettingsView::move(int delta) {
    if (pane_ == Pane::Sections) {
        int count = sections().size();
        int index = static_cast<int>(section_);
        section_ = sections()[(index + delta + count) % count].first;
        return;
    }
    if (section_ == Section::Appearance) {
        int count = builtinThemes().size();
        selectedTheme_ = (selectedTheme_ + delta + count) % count;
    } else {
        int count = bindingNames_.size();
        selectedBinding_ = (selectedBinding_ + delta + count) % count;
    }
}

std::optional<Action> SettingsView::handleCaptureKey(const KeyEvent& key) {
    if (key.is(KeyCode::Esc)) {
        capturing_ = false;
        captured_.clear();
        return ActionType::Render;
    }
    if (key.ctrl && key.code == KeyCode::Char && key.ch == "s") {
        if (captured_.empty()) return ActionType::Render;
        capturing_ = false;
        auto keys = std::move(captured_);
        captured_.clear();
        return Action::updateKeybinding(bindingNames_[selectedBinding_], std::move(keys));
    }
    if (key.is(KeyCode::Backspace)) {
        if (!captured_.empty()) captured_.pop_back();
        return ActionType::Render;
    }

    std::string chord = KeybindingManager::formatKeyEvent(key);
    if (std::find(captured_.begin(), captured_.end(), chord) == captured_.end()) {
        captured_.push_back(chord);
    }
    return ActionType::Render;
}

std::optional<Action> SettingsView::handleKeyEvent(const KeyEvent& key) {
    if (capturing_) return handleCaptureKey(key);

    if (keys_.matches(key, "back")) {
        if (pane_ == Pane::Content) {
            pane_ = Pane::Sections;
            return ActionType::Render;
        }
        return ActionType::NavigateBack;
    }
    if (key.is(KeyCode::Tab)) {
        return ActionType::NavigateToExtensions;
    }
    if (key.is(KeyCode::BackTab)) {
        return ActionType::NavigateToProfiles;
    }
    if (keys_.matches(key, "up")) {
        move(-1);
        return ActionType::Render;
    }
    if (keys_.matches(key, "down")) {
        move(1);
        return ActionType::Render;
    }
    if (keys_.matches(key, "right")) {
        if (pane_ == Pane::Sections) {
            pane_ = Pane::Content;
            return ActionType::Render;
        }
        return std::nullopt;
    }
    if (keys_.matches(key, "left")) {
        if (pane_ == Pane::Content) {
            pane_ = Pane::Sections;
            return ActionType::Render;
        }
        return ActionType::NavigateToProfiles;
    }
    if (keys_.matches(key, "select") || key.is(KeyCode::Enter)) {
        if (pane_ == Pane::Sections) {
            pane_ = Pane::Content;
            return ActionType::Render;
        }
        if (section_ == Section::Appearance) {
            return Action(ActionType::ChangeTheme, builtinThemes()[selectedTheme_].name);
        }
        capturing_ = true;
        captured_.clear();
        return ActionType::Render;
    }
    if (key.isChar('r') && section_ == Section::Keybindings && pane_ == Pane::Content) {
        return ActionType::ResetKeybindings;
    }
    return std::nullopt;
}

std::optional<Action> SettingsView::update(const Action& action) {
    switch (action.type) {
        case ActionType::ChangeTheme:
        case ActionType::UpdateKeybinding:
        case ActionType::ResetKeybindings:
        case ActionType::SaveSettings:
            break;
        default:
            return std::nullopt;
    }
    if (!settings_) {
        return Action::error("Settings are not available");
    }

    try {
        switch (action.type) {
            case ActionType::ChangeTheme: {
                int index = findThemeIndex(action.text);
                const ColorTheme& theme = builtinThemes()[index];
                if (theme.name != action.text) {
                    return Action::error("Unknown theme: " + action.text);
                }
                selectedTheme_ = index;
                settings_->updateTheme(theme.name);
                send(Action::success("Theme changed to " + theme.label));
                break;
            }
            case ActionType::UpdateKeybinding:
                settings_->updateKeybinding(action.text, action.keys);
                send(Action::success("Keybinding for '" + action.text + "' updated successfully"));
                break;
            case ActionType::ResetKeybindings:
                settings_->resetKeybindings();
                send(Action::success("Keybindings reset to defaults"));
                break;
            default:
                settings_->save();
                send(Action::success("Settings saved"));
                break;
        }
    } catch (const SettingsError& e) {
        return Action::error(std::string("Failed to save settings: ") + e.what());
    }
    return ActionType::Render;
}

Element SettingsView::drawSections(const ColorTheme& theme) const {
    Elements rows;
    for (const auto& [section, label] : sections()) {
        bool selected = section == section_;
        auto row = text((selected ? " ▶ " : "   ") + label);
        if (selected) {
            row = pane_ == Pane::Sections ? row | bold | color(theme.primaryFg) | bgcolor(theme.primary)
                                          : row | bold | color(theme.accent);
        }
        rows.push_back(row);
    }
    bool focused = pane_ == Pane::Sections;
    return window(text(" Sections ") | bold | (focused ? color(theme.accent) : color(theme.muted)),
                  vbox(rows))
        | size(WIDTH, EQUAL, 18);
}

Element SettingsView::drawAppearance(const ColorTheme& theme) const {
    std::string current = settings_ ? settings_->theme() : "";
    Elements rows = {text("Theme") | bold, text("")};
    const auto& themes = builtinThemes();
    for (size_t i = 0; i < themes.size(); ++i) {
        const ColorTheme& t = themes[i];
        bool cursor = pane_ == Pane::Content && (int)i == selectedTheme_;
        auto swatch = hbox({
            text("  ") | bgcolor(t.bg),
            text("  ") | bgcolor(t.accent),
            text("  ") | bgcolor(t.primary),
            text("  ") | bgcolor(t.success),
            text("  ") | bgcolor(t.error),
        });
        auto row = hbox({
            text(cursor ? "▶ " : "  ") | color(theme.accent),
            text(t.label) | size(WIDTH, EQUAL, 24) | (cursor ? bold : nothing),
            swatch,
            text(t.name == current ? "  (active)" : "") | color(theme.success),
        });
        rows.push_back(row);
    }
    return vbox(rows);
}

Element SettingsView::drawKeybindings(const ColorTheme& theme) const {
    std::vector<std::vector<std::string>> rows;
    for (size_t i = 0; i < bindingNames_.size(); ++i) {
        const std::string& name = bindingNames_[i];
        std::string keys = joinList(keys_.keysFor(name));
        if (capturing_ && (int)i == selectedBinding_) {
            keys = captured_.empty() ? "press keys..." : joinList(captured_);
        }
        rows.push_back({name, describeBinding(name), keys.empty() ? "(unbound)" : keys});
    }

    Elements body;
    if (capturing_) {
        body.push_back(text("Recording keys for '" + bindingNames_[selectedBinding_] + "'") | bold
                       | color(theme.warning));
        body.push_back(text("Press keys to add | Backspace: Remove last | Ctrl+S: Save | Esc: Cancel")
                       | color(theme.muted));
        body.push_back(text(""));
    }
    body.push_back(TableElement(rows, {{"Name", 10}, {"Description", 22}, {"Keys", 0}}, theme,
                                pane_ == Pane::Content ? selectedBinding_ : -1));
    return vbox(body);
}

Element SettingsView::draw(const ColorTheme& theme) {
    bool contentFocused = pane_ == Pane::Content;
    Element content = section_ == Section::Appearance ? drawAppearance(theme) : drawKeybindings(theme);
    std::string contentTitle = section_ == Section::Appearance ? " Appearance " : " Keybindings ";

    std::string hints;
    if (capturing_) {
        hints = "Recording: Ctrl+S to save, Esc to cancel";
    } else if (section_ == Section::Keybindings && contentFocused) {
        hints = keys_.buildHelpText({{"up", "Up"}, {"down", "Down"}, {"select", "Edit"},
                                     {"r", "Reset all"}, {"back", "Sections"}});
    } else {
        hints = keys_.buildHelpText({{"up", "Up"}, {"down", "Down"}, {"select", "Select"},
                                     {"back", "Back"}, {"tab", "Extensions"}});
    }

    return vbox({
        hbox({
            drawSections(theme),
            window(text(contentTitle) | bold | (contentFocused ? color(theme.accent) : color(theme.muted)),
                   content | vscroll_indicator | yframe) | flex,
        }) | flex,
        FooterBar(hints, "?: Help", theme),
    }) | bgcolor(theme.bg) | color(theme.fg);
}

}  // namespace components
}  // namespace gcm
