#include "modal.h"

namespace gcm {
namespace components {

using namespace ftxui;

Element ModalFrame(const std::string& title, Color titleColor, Element content, const ColorTheme& theme) {
    return window(text(" " + title + " ") | bold | color(titleColor), content)
        | bgcolor(theme.bg) | color(theme.fg) | clear_under | center;
}

Element ErrorModal(const std::string& message, const ColorTheme& theme) {
    auto content = vbox({
        Paragraph(message),
        separator(),
        hbox({filler(), text(" [Esc] Dismiss ") | color(theme.muted), filler()})
    }) | size(WIDTH, GREATER_THAN, 40) | size(WIDTH, LESS_THAN, 80);
    return ModalFrame("Error", theme.error, content, theme);
}

Element HelpOverlay(const std::string& title,
                    const std::vector<std::pair<std::string, std::string>>& bindings,
                    const ColorTheme& theme) {
    Elements lines;
    for (const auto& [key, desc] : bindings) {
        if (key.empty()) {
            lines.push_back(separator());
        } else {
            lines.push_back(hbox({
                text(key) | bold | color(theme.accent) | size(WIDTH, EQUAL, 16),
                text(desc)
            }));
        }
    }

    return window(
        text(" " + title + " ") | bold,
        vbox(lines) | size(WIDTH, EQUAL, 44)
    ) | bgcolor(theme.bg) | color(theme.fg) | clear_under | center;
}

Element FooterBar(const std::string& hints, const std::string& right, const ColorTheme& theme) {
    return hbox({
        text(" " + hints + " ") | color(theme.muted),
        filler(),
        text(" " + right + " ") | color(theme.muted)
    }) | bgcolor(theme.bgDark);
}

Element Paragraph(const std::string& content) {
    Elements lines;
    size_t start = 0;
    while (true) {
        size_t end = content.find('\n', start);
        lines.push_back(paragraph(content.substr(start, end == std::string::npos ? std::string::npos : end - start)));
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return vbox(std::move(lines));
}

}  // namespace components
}  // namespace gcm
