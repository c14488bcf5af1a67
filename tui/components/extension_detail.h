#ifndef GCM_TUI_COMPONENTS_EXTENSION_DETAIL_H
#define GCM_TUI_COMPONENTS_EXTENSION_DETAIL_H

#include "component.h"
#include "scrolltext.h"
#include "core/storage.h"
#include <memory>
#include <optional>

namespace gcm {
namespace components {

// Read-only view of one extension: metadata, MCP servers, context file
class ExtensionDetail : public Component {
public:
    explicit ExtensionDetail(std::shared_ptr<Storage> storage);

    // Throws NotFoundError / StorageError
    void loadExtension(const std::string& id);
    const std::optional<Extension>& extension() const { return extension_; }
    int scrollOffset() const { return scroll_; }

    std::optional<Action> handleKeyEvent(const KeyEvent& key) override;
    std::optional<Action> update(const Action& action) override;
    ftxui::Element draw(const ColorTheme& theme) override;

private:
    std::vector<TextLine> buildLines(const ColorTheme& theme) const;
    int visibleLines() const;

    std::shared_ptr<Storage> storage_;
    std::optional<Extension> extension_;
    std::string missingId_;
    int scroll_ = 0;
    int totalLines_ = 0;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_EXTENSION_DETAIL_H
