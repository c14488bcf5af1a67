#ifndef GCM_TUI_COMPONENTS_EXTENSION_FORM_H
#define GCM_TUI_COMPONENTS_EXTENSION_FORM_H

#include "component.h"
#include "text_input.h"
#include "core/storage.h"
#include <memory>
#include <optional>
#include <string>

namespace gcm {
namespace components {

// Create/edit form for an extension, including an inline MCP server editor.
// Tab/Shift+Tab move between fields, Ctrl+S saves, Esc goes back.
class ExtensionForm : public Component {
public:
    enum class Field {
        Name,
        Version,
        Description,
        Tags,
        ContextFileName,
        ContextContent,
        McpServers,
    };

    // Server editor fields, in tab order
    enum class ServerField { Name, Command, Args, Env, Cwd, Timeout, Trust };

    // Create mode
    explicit ExtensionForm(std::shared_ptr<Storage> storage);
    // Edit mode, pre-populated from `extension`
    ExtensionForm(std::shared_ptr<Storage> storage, const Extension& extension);

    bool editMode() const { return original_.has_value(); }
    Field currentField() const { return field_; }
    bool editingServer() const { return server_.has_value(); }
    const std::map<std::string, McpServerConfig>& servers() const { return servers_; }
    TextInput& input(Field field);

    // Record as it would be saved. Throws std::invalid_argument with a
    // user-facing message when required fields are missing.
    Extension buildExtension() const;

    std::optional<Action> handleKeyEvent(const KeyEvent& key) override;
    ftxui::Element draw(const ColorTheme& theme) override;

private:
    struct ServerEditor {
        std::string originalName;  // empty when adding
        TextInput name;
        TextInput command;
        TextInput args;
        TextInput env;       // KEY=VALUE, comma separated
        TextInput cwd;
        TextInput timeout;   // milliseconds
        bool trust = false;
        ServerField field = ServerField::Name;
        std::string error;
    };

    std::optional<Action> save();
    std::optional<Action> handleServerKey(const KeyEvent& key);
    void startServerEdit(const std::string& name);
    bool commitServer();
    TextInput* serverInput(ServerEditor& editor);
    std::string selectedServerName() const;

    ftxui::Element drawServerEditor(const ColorTheme& theme) const;

    std::shared_ptr<Storage> storage_;
    std::optional<Extension> original_;

    TextInput name_;
    TextInput version_{"1.0.0"};
    TextInput description_;
    TextInput tags_;
    TextInput contextFileName_{"GEMINI.md"};
    TextInput contextContent_{"", true};
    std::map<std::string, McpServerConfig> servers_;
    int serverCursor_ = 0;
    std::optional<ServerEditor> server_;

    Field field_ = Field::Name;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_EXTENSION_FORM_H
