#ifndef GCM_TUI_COMPONENTS_CONFIRM_DIALOG_H
#define GCM_TUI_COMPONENTS_CONFIRM_DIALOG_H

#include "component.h"
#include <string>

namespace gcm {
namespace components {

// Yes/No dialog resolving to one of two actions. Starts on Cancel.
// Left/Right/Tab switch buttons, Enter picks, y confirms, n/Esc cancel.
class ConfirmDialog : public Component {
public:
    ConfirmDialog(std::string title, std::string message,
                  Action confirmAction = ActionType::ConfirmDelete,
                  Action cancelAction = ActionType::CancelDelete);

    const std::string& title() const { return title_; }
    const std::string& message() const { return message_; }
    bool confirmSelected() const { return confirmSelected_; }

    std::optional<Action> handleKeyEvent(const KeyEvent& key) override;
    ftxui::Element draw(const ColorTheme& theme) override;

private:
    std::string title_;
    std::string message_;
    Action confirmAction_;
    Action cancelAction_;
    bool confirmSelected_ = false;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_CONFIRM_DIALOG_H
