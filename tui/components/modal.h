#ifndef GCM_TUI_COMPONENTS_MODAL_H
#define GCM_TUI_COMPONENTS_MODAL_H

#include "theme.h"
#include <ftxui/dom/elements.hpp>
#include <string>
#include <utility>
#include <vector>

namespace gcm {
namespace components {

// Centered window drawn over whatever is beneath it
ftxui::Element ModalFrame(
    const std::string& title,
    ftxui::Color titleColor,
    ftxui::Element content,
    const ColorTheme& theme
);

// Error banner shown by the view manager until it expires or Esc
ftxui::Element ErrorModal(
    const std::string& message,
    const ColorTheme& theme
);

// Key/description table. An empty key inserts a separator.
ftxui::Element HelpOverlay(
    const std::string& title,
    const std::vector<std::pair<std::string, std::string>>& bindings,
    const ColorTheme& theme
);

// Bottom hint line: "<hints>            <right>"
ftxui::Element FooterBar(
    const std::string& hints,
    const std::string& right,
    const ColorTheme& theme
);

// Splits text on '\n' into one text() per line
ftxui::Element Paragraph(const std::string& content);

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_MODAL_H
