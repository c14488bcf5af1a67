#ifndef GCM_TUI_THEME_H
#define GCM_TUI_THEME_H

#include <ftxui/screen/color.hpp>
#include <string>
#include <vector>

namespace gcm {

struct ColorTheme {
    std::string name;          // key stored in settings.json
    std::string label;         // shown in the settings screen
    ftxui::Color bg;           // main background
    ftxui::Color fg;           // default text color
    ftxui::Color accent;       // focused borders, selection marker, headings
    ftxui::Color primary;      // active tab bg, selected row bg
    ftxui::Color primaryFg;    // active tab text, selected row text
    ftxui::Color success;      // status messages, enabled toggles
    ftxui::Color warning;      // unsaved changes, key capture prompt
    ftxui::Color error;        // error overlay, validation messages
    ftxui::Color notification; // default profile marker
    ftxui::Color bgDark;       // footer bg, tab strip bg
    ftxui::Color muted;        // hints and secondary text
};

// Catppuccin flavours: mocha, macchiato, frappe, latte
const std::vector<ColorTheme>& builtinThemes();

// Index of the theme called `name`, 0 (mocha) when unknown
int findThemeIndex(const std::string& name);

const ColorTheme& themeByName(const std::string& name);

}  // namespace gcm

#endif  // GCM_TUI_THEME_H
