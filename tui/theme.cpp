#include "theme.h"

namespace gcm {

const std::vector<ColorTheme>& builtinThemes() {
    using ftxui::Color;

    static const std::vector<ColorTheme> themes = {
        // Mocha
        {
            "mocha",
            "Catppuccin Mocha",
            Color::RGB(30, 30, 46),     // bg: base
            Color::RGB(205, 214, 244),  // fg: text
            Color::RGB(203, 166, 247),  // accent: mauve
            Color::RGB(137, 180, 250),  // primary: blue
            Color::RGB(30, 30, 46),     // primaryFg: base
            Color::RGB(166, 227, 161),  // success: green
            Color::RGB(249, 226, 175),  // warning: yellow
            Color::RGB(243, 139, 168),  // error: red
            Color::RGB(250, 179, 135),  // notification: peach
            Color::RGB(49, 50, 68),     // bgDark: surface0
            Color::RGB(108, 112, 134),  // muted: overlay0
        },
        // Macchiato
        {
            "macchiato",
            "Catppuccin Macchiato",
            Color::RGB(36, 39, 58),     // bg: base
            Color::RGB(202, 211, 245),  // fg: text
            Color::RGB(198, 160, 246),  // accent: mauve
            Color::RGB(138, 173, 244),  // primary: blue
            Color::RGB(36, 39, 58),     // primaryFg: base
            Color::RGB(166, 218, 149),  // success: green
            Color::RGB(238, 212, 159),  // warning: yellow
            Color::RGB(237, 135, 150),  // error: red
            Color::RGB(245, 169, 127),  // notification: peach
            Color::RGB(54, 58, 79),     // bgDark: surface0
            Color::RGB(110, 115, 141),  // muted: overlay0
        },
        // Frappe
        {
            "frappe",
            "Catppuccin Frappe",
            Color::RGB(48, 52, 70),     // bg: base
            Color::RGB(198, 208, 245),  // fg: text
            Color::RGB(202, 158, 230),  // accent: mauve
            Color::RGB(140, 170, 238),  // primary: blue
            Color::RGB(48, 52, 70),     // primaryFg: base
            Color::RGB(166, 209, 137),  // success: green
            Color::RGB(229, 200, 144),  // warning: yellow
            Color::RGB(231, 130, 132),  // error: red
            Color::RGB(239, 159, 118),  // notification: peach
            Color::RGB(65, 69, 89),     // bgDark: surface0
            Color::RGB(115, 121, 148),  // muted: overlay0
        },
        // Latte (light)
        {
            "latte",
            "Catppuccin Latte",
            Color::RGB(239, 241, 245),  // bg: base
            Color::RGB(76, 79, 105),    // fg: text
            Color::RGB(136, 57, 239),   // accent: mauve
            Color::RGB(30, 102, 245),   // primary: blue
            Color::RGB(239, 241, 245),  // primaryFg: base
            Color::RGB(64, 160, 43),    // success: green
            Color::RGB(223, 142, 29),   // warning: yellow
            Color::RGB(210, 15, 57),    // error: red
            Color::RGB(254, 100, 11),   // notification: peach
            Color::RGB(204, 208, 218),  // bgDark: surface0
            Color::RGB(156, 160, 176),  // muted: overlay0
        },
    };

    return themes;
}

int findThemeIndex(const std::string& name) {
    const auto& themes = builtinThemes();
    for (size_t i = 0; i < themes.size(); ++i) {
        if (themes[i].name == name) {
            return static_cast<int>(i);
        }
    }
    return 0;  // Mocha
}

const ColorTheme& themeByName(const std::string& name) {
    return builtinThemes()[findThemeIndex(name)];
}

}  // namespace gcm
