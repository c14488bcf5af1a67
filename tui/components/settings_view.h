#ifndef GCM_TUI_COMPONENTS_SETTINGS_VIEW_H
#define GCM_TUI_COMPONENTS_SETTINGS_VIEW_H

#include "component.h"
#include <string>
#include <vector>

namespace gcm {
namespace components {

// Theme picker and keybinding editor.
//
// Enter on a keybinding starts key capture: every key pressed is added to
// the new chord list, Backspace drops the last one, Ctrl+S stores the list
// and Esc cancels. While capturing, global shortcuts are suspended.
class SettingsView : public Component {
public:
    enum class Section { Appearance, Keybindings };
    enum class Pane { Sections, Content };

    SettingsView();

    void registerSettingsHandler(SharedSettings settings) override;

    Section section() const { return section_; }
    Pane pane() const { return pane_; }
    int selectedTheme() const { return selectedTheme_; }
    int selectedBinding() const { return selectedBinding_; }
    bool capturing() const { return capturing_; }
    const std::vector<std::string>& capturedKeys() const { return captured_; }

    // Logical names in table order: navigation first, then actions
    const std::vector<std::string>& bindingNames() const { return bindingNames_; }

    std::optional<Action> handleKeyEvent(const KeyEvent& key) override;
    std::optional<Action> update(const Action& action) override;
    ftxui::Element draw(const ColorTheme& theme) override;
    bool capturesInput() const override { return capturing_; }

private:
    std::optional<Action> handleCaptureKey(const KeyEvent& key);
    void move(int delta);

    ftxui::Element drawSections(const ColorTheme& theme) const;
    ftxui::Element drawAppearance(const ColorTheme& theme) const;
    ftxui::Element drawKeybindings(const ColorTheme& theme) const;

    std::vector<std::string> bindingNames_;
    Section section_ = Section::Appearance;
    Pane pane_ = Pane::Sections;
    int selectedTheme_ = 0;
    int selectedBinding_ = 0;
    bool capturing_ = false;
    std::vector<std::string> captured_;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_SETTINGS_VIEW_H
