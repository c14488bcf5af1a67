#include "confirm_dialog.h"
#include "modal.h"

namespace gcm {
namespace components {

using namespace ftxui;

ConfirmDialog::ConfirmDialog(std::string title, std::string message,
                             Action confirmAction, Action cancelAction)
    : title_(std::move(title)),
      message_(std::move(message)),
      confirmAction_(std::move(confirmAction)),
      cancelAction_(std::move(cancelAction)) {}

std::optional<Action> ConfirmDialog::handleKeyEvent(const KeyEvent& key) {
    if (key.is(KeyCode::Left) || key.is(KeyCode::Right) ||
        key.is(KeyCode::Tab) || key.is(KeyCode::BackTab) ||
        key.isChar('h') || key.isChar('l')) {
        confirmSelected_ = !confirmSelected_;
        return ActionType::Render;
    }
    if (key.is(KeyCode::Enter)) {
        return confirmSelected_ ? confirmAction_ : cancelAction_;
    }
    if (key.isChar('y') || key.isChar('Y')) {
        return confirmAction_;
    }
    if (key.isChar('n') || key.isChar('N') || key.is(KeyCode::Esc)) {
        return cancelAction_;
    }
    return std::nullopt;
}

Element ConfirmDialog::draw(const ColorTheme& theme) {
    auto button = [&](const std::string& label, bool selected, Color active) {
        auto el = text("  " + label + "  ") | border;
        if (selected) {
            el = el | bold | bgcolor(active) | color(theme.bg);
        } else {
            el = el | color(theme.muted);
        }
        return el;
    };

    auto content = vbox({
        text(""),
        hbox({text("⚠ ") | color(theme.warning), Paragraph(message_)}) | center,
        text(""),
        separator(),
        hbox({
            filler(),
            button("Cancel", !confirmSelected_, theme.success),
            text("    "),
            button("Delete", confirmSelected_, theme.error),
            filler()
        }),
        text(" [y] Yes  [n/Esc] No  [←/→] Switch  [Enter] Select ") | color(theme.muted) | center,
    }) | size(WIDTH, GREATER_THAN, 50) | size(WIDTH, LESS_THAN, 70);

    return ModalFrame(title_, theme.warning, content, theme);
}

}  // namespace components
}  // namespace gcm
