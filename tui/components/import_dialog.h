#ifndef GCM_TUI_COMPONENTS_IMPORT_DIALOG_H
#define GCM_TUI_COMPONENTS_IMPORT_DIALOG_H

#include "component.h"
#include "text_input.h"
#include "core/importer.h"
#include <memory>
#include <string>
#include <vector>

namespace gcm {
namespace components {

// Path prompt for importing an extension. Tab completes the path,
// Enter imports, Esc goes back. Import errors stay inside the dialog.
class ImportDialog : public Component {
public:
    explicit ImportDialog(std::shared_ptr<Storage> storage);

    void reset();

    const std::string& path() const { return path_.value(); }
    void setPath(const std::string& path) { path_.setValue(path); }
    const std::string& error() const { return error_; }

    // Entries of the typed directory matching the typed prefix
    std::vector<std::string> completions() const;

    std::optional<Action> handleKeyEvent(const KeyEvent& key) override;
    ftxui::Element draw(const ColorTheme& theme) override;
    bool capturesInput() const override { return true; }

private:
    std::optional<Action> runImport();
    void complete();

    ExtensionImporter importer_;
    TextInput path_;
    std::string error_;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_IMPORT_DIALOG_H
