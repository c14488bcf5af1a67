#ifndef GCM_TUI_COMPONENTS_SCROLLTEXT_H
#define GCM_TUI_COMPONENTS_SCROLLTEXT_H

#include <ftxui/dom/elements.hpp>
#include <string>
#include <vector>

namespace gcm {
namespace components {

// Line in scrollable text area
struct TextLine {
    std::string prefix;      // e.g., "Version:     "
    std::string content;     // The main text
    ftxui::Color prefixColor = ftxui::Color::Default;
    bool dim = false;        // For placeholders like "(none)"
    bool heading = false;    // Section titles
};

// Render `visibleLines` lines starting at `scrollOffset` (from the top).
// Shows "N more" markers above/below when content is cut.
ftxui::Element ScrollTextElement(
    const std::vector<TextLine>& lines,
    int scrollOffset,
    int visibleLines
);

// Largest scroll offset that still fills the view
int maxScrollOffset(int totalLines, int visibleLines);

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_SCROLLTEXT_H
