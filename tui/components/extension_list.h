#ifndef GCM_TUI_COMPONENTS_EXTENSION_LIST_H
#define GCM_TUI_COMPONENTS_EXTENSION_LIST_H

#include "component.h"
#include "text_input.h"
#include "core/storage.h"
#include <memory>
#include <vector>

namespace gcm {
namespace components {

// Browsable list of stored extensions with an incremental '/' filter
class ExtensionList : public Component {
public:
    explicit ExtensionList(std::shared_ptr<Storage> storage);

    void init(Size area) override;
    std::optional<Action> handleKeyEvent(const KeyEvent& key) override;
    std::optional<Action> update(const Action& action) override;
    ftxui::Element draw(const ColorTheme& theme) override;
    bool capturesInput() const override { return searching_; }

    // Re-read extensions from storage
    void reload();

    // Extensions matching the current filter, in display order
    std::vector<const Extension*> visible() const;
    const Extension* selectedExtension() const;
    int selectedIndex() const { return selected_; }
    const std::string& filter() const { return search_.value(); }

private:
    void clampSelection();

    std::shared_ptr<Storage> storage_;
    std::vector<Extension> extensions_;
    int selected_ = 0;
    bool searching_ = false;
    TextInput search_;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_EXTENSION_LIST_H
