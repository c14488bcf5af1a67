#include "extension_form.h"
#include "modal.h"
#include "core/errors.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace gcm {
namespace components {

using namespace ftxui;

namespace {

constexpr ExtensionForm::Field kFieldOrder[] = {
    ExtensionForm::Field::Name,
    ExtensionForm::Field::Version,
    ExtensionForm::Field::Description,
    ExtensionForm::Field::Tags,
    ExtensionForm::Field::ContextFileName,
    ExtensionForm::Field::ContextContent,
    ExtensionForm::Field::McpServers,
};
constexpr int kFieldCount = sizeof(kFieldOrder) / sizeof(kFieldOrder[0]);
constexpr int kServerFieldCount = 7;

std::optional<std::string> nonEmpty(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string word;
    while (in >> word) out.push_back(word);
    return out;
}

Element labelled(const std::string& label, Element field, bool focused, const ColorTheme& theme) {
    auto head = text(label) | bold;
    head = focused ? head | color(theme.accent) : head | color(theme.muted);
    auto body = field;
    if (focused) body = body | focus;
    return vbox({
        head,
        body | borderStyled(focused ? ROUNDED : LIGHT, focused ? theme.accent : theme.muted),
    });
}

}  // namespace

ExtensionForm::ExtensionForm(std::shared_ptr<Storage> storage)
    : storage_(std::move(storage)) {}

ExtensionForm::ExtensionForm(std::shared_ptr<Storage> storage, const Extension& extension)
    : storage_(std::move(storage)),
      original_(extension),
      name_(extension.name),
      version_(extension.version),
      description_(extension.description.value_or("")),
      tags_(joinList(extension.metadata.tags)),
      contextFileName_(extension.contextFileName.value_or("GEMINI.md")),
      contextContent_(extension.contextContent.value_or(""), true),
      servers_(extension.mcpServers) {}

TextInput& ExtensionForm::input(Field field) {
    switch (field) {
        case Field::Name: return name_;
        case Field::Version: return version_;
        case Field::Description: return description_;
        case Field::Tags: return tags_;
        case Field::ContextFileName: return contextFileName_;
        case Field::ContextContent: return contextContent_;
        case Field::McpServers: break;
    }
    throw std::invalid_argument("MCP servers field has no text input");
}

Extension ExtensionForm::buildExtension() const {
    if (name_.empty() || version_.empty()) {
        throw std::invalid_argument("Extension name and version are required");
    }

    Extension ext;
    ext.id = original_ ? original_->id : slugify(name_.value());
    if (ext.id.empty()) {
        throw std::invalid_argument("Extension name must contain letters or digits");
    }
    ext.name = name_.value();
    ext.version = version_.value();
    ext.description = nonEmpty(description_.value());
    ext.mcpServers = servers_;

    // The default context file name is implied, so it is not stored
    std::string contextName = trim(contextFileName_.value());
    if (!contextName.empty() && contextName != "GEMINI.md") ext.contextFileName = contextName;
    ext.contextContent = nonEmpty(contextContent_.value());

    if (original_) {
        ext.metadata.importedAt = original_->metadata.importedAt;
        ext.metadata.sourcePath = original_->metadata.sourcePath;
    } else {
        ext.metadata.importedAt = currentTimestamp();
    }
    ext.metadata.tags = splitList(tags_.value());
    return ext;
}

std::optional<Action> ExtensionForm::save() {
    Extension ext;
    try {
        ext = buildExtension();
    } catch (const std::invalid_argument& e) {
        return Action::error(e.what());
    }

    try {
        if (!original_) {
            try {
                storage_->loadExtension(ext.id);
                return Action::error("Failed to save extension: an extension with id '" + ext.id +
                                     "' already exists");
            } catch (const NotFoundError&) {
                // id is free
            }
        }
        storage_->saveExtension(ext);
    } catch (const StorageError& e) {
        return Action::error(std::string("Failed to save extension: ") + e.what());
    }

    send(Action::success(original_ ? "Extension updated successfully"
                                   : "Extension created successfully"));
    send(ActionType::RefreshExtensions);
    send(ActionType::Render);
    return ActionType::NavigateBack;
}

std::string ExtensionForm::selectedServerName() const {
    if (servers_.empty()) return "";
    int index = std::clamp(serverCursor_, 0, (int)servers_.size() - 1);
    return std::next(servers_.begin(), index)->first;
}

void ExtensionForm::startServerEdit(const std::string& name) {
    ServerEditor editor;
    auto it = servers_.find(name);
    if (it != servers_.end()) {
        const McpServerConfig& cfg = it->second;
        editor.originalName = name;
        editor.name.setValue(name);
        editor.command.setValue(cfg.command.value_or(""));
        if (cfg.args) editor.args.setValue(joinList(*cfg.args, " "));
        if (cfg.env) editor.env.setValue(formatKeyValueList(*cfg.env));
        editor.cwd.setValue(cfg.cwd.value_or(""));
        if (cfg.timeout) editor.timeout.setValue(std::to_string(*cfg.timeout));
        editor.trust = cfg.trust.value_or(false);
    }
    server_ = std::move(editor);
}

bool ExtensionForm::commitServer() {
    ServerEditor& editor = *server_;
    std::string name = trim(editor.name.value());
    std::string command = trim(editor.command.value());
    if (name.empty() || command.empty()) {
        editor.error = "Server name and command are required";
        return false;
    }

    McpServerConfig cfg;
    cfg.command = command;
    auto args = splitWhitespace(editor.args.value());
    if (!args.empty()) cfg.args = args;
    auto env = parseKeyValueList(editor.env.value());
    if (!env.empty()) cfg.env = env;
    cfg.cwd = nonEmpty(trim(editor.cwd.value()));

    std::string timeout = trim(editor.timeout.value());
    if (!timeout.empty()) {
        if (!std::all_of(timeout.begin(), timeout.end(), [](unsigned char c) { return std::isdigit(c); })) {
            editor.error = "Timeout must be a number of milliseconds";
            return false;
        }
        try {
            cfg.timeout = std::stoull(timeout);
        } catch (const std::out_of_range&) {
            editor.error = "Timeout is too large";
            return false;
        }
    }
    if (editor.trust) cfg.trust = true;

    // Renaming replaces the old entry
    if (!editor.originalName.empty() && editor.originalName != name) {
        servers_.erase(editor.originalName);
    }
    servers_[name] = std::move(cfg);
    serverCursor_ = std::distance(servers_.begin(), servers_.find(name));
    server_.reset();
    return true;
}

TextInput* ExtensionForm::serverInput(ServerEditor& editor) {
    switch (editor.field) {
        case ServerField::Name: return &editor.name;
        case ServerField::Command: return &editor.command;
        case ServerField::Args: return &editor.args;
        case ServerField::Env: return &editor.env;
        case ServerField::Cwd: return &editor.cwd;
        case ServerField::Timeout: return &editor.timeout;
        case ServerField::Trust: return nullptr;
    }
    return nullptr;
}

std::optional<Action> ExtensionForm::handleServerKey(const KeyEvent& key) {
    ServerEditor& editor = *server_;
    int field = static_cast<int>(editor.field);

    if (key.is(KeyCode::Esc)) {
        server_.reset();
        return ActionType::Render;
    }
    if (key.is(KeyCode::Tab) || key.is(KeyCode::Down)) {
        editor.field = static_cast<ServerField>((field + 1) % kServerFieldCount);
        return ActionType::Render;
    }
    if (key.is(KeyCode::BackTab) || key.is(KeyCode::Up)) {
        editor.field = static_cast<ServerField>((field + kServerFieldCount - 1) % kServerFieldCount);
        return ActionType::Render;
    }
    if (key.is(KeyCode::Enter)) {
        commitServer();
        return ActionType::Render;
    }
    if (editor.field == ServerField::Trust) {
        if (key.isChar(' ')) {
            editor.trust = !editor.trust;
            return ActionType::Render;
        }
        return std::nullopt;
    }
    if (serverInput(editor)->handleKey(key)) {
        editor.error.clear();
        return ActionType::Render;
    }
    return std::nullopt;
}

std::optional<Action> ExtensionForm::handleKeyEvent(const KeyEvent& key) {
    if (server_) return handleServerKey(key);

    if (key.is(KeyCode::Esc)) {
        return ActionType::NavigateBack;
    }
    if (key.ctrl && key.code == KeyCode::Char && key.ch == "s") {
        return save();
    }

    int index = static_cast<int>(field_);
    if (key.is(KeyCode::Tab)) {
        field_ = kFieldOrder[(index + 1) % kFieldCount];
        return ActionType::Render;
    }
    if (key.is(KeyCode::BackTab)) {
        field_ = kFieldOrder[(index + kFieldCount - 1) % kFieldCount];
        return ActionType::Render;
    }

    if (field_ == Field::McpServers) {
        int count = servers_.size();
        if (key.is(KeyCode::Down) || key.isChar('j')) {
            if (count > 0) serverCursor_ = (serverCursor_ + 1) % count;
            return ActionType::Render;
        }
        if (key.is(KeyCode::Up) || key.isChar('k')) {
            if (count > 0) serverCursor_ = serverCursor_ > 0 ? serverCursor_ - 1 : count - 1;
            return ActionType::Render;
        }
        if (key.isChar('n') || key.isChar('a')) {
            startServerEdit("");
            return ActionType::Render;
        }
        if ((key.isChar('e') || key.is(KeyCode::Enter)) && count > 0) {
            startServerEdit(selectedServerName());
            return ActionType::Render;
        }
        if (key.isChar('d') && count > 0) {
            servers_.erase(selectedServerName());
            serverCursor_ = std::max(0, std::min(serverCursor_, (int)servers_.size() - 1));
            return ActionType::Render;
        }
        return std::nullopt;
    }

    if (input(field_).handleKey(key)) return ActionType::Render;

    // Enter on a single-line field moves on
    if (key.is(KeyCode::Enter)) {
        field_ = kFieldOrder[(index + 1) % kFieldCount];
        return ActionType::Render;
    }
    return std::nullopt;
}

Element ExtensionForm::drawServerEditor(const ColorTheme& theme) const {
    const ServerEditor& editor = *server_;
    auto row = [&](ServerField f, const std::string& label, Element value) {
        bool focused = editor.field == f;
        return hbox({
            text(focused ? "▶ " : "  ") | color(theme.accent),
            text(label) | size(WIDTH, EQUAL, 18) | (focused ? color(theme.accent) : color(theme.muted)),
            value | flex,
        });
    };
    auto field = [&](ServerField f, const TextInput& in, const std::string& placeholder) {
        return in.render(editor.field == f, theme, placeholder);
    };

    Elements rows = {
        row(ServerField::Name, "Name", field(ServerField::Name, editor.name, "my-server")),
        row(ServerField::Command, "Command", field(ServerField::Command, editor.command, "npx")),
        row(ServerField::Args, "Args", field(ServerField::Args, editor.args, "space separated")),
        row(ServerField::Env, "Env", field(ServerField::Env, editor.env, "KEY=VALUE, KEY2=$VAR")),
        row(ServerField::Cwd, "Working dir", field(ServerField::Cwd, editor.cwd, "optional")),
        row(ServerField::Timeout, "Timeout (ms)", field(ServerField::Timeout, editor.timeout, "optional")),
        row(ServerField::Trust, "Trust",
            text(editor.trust ? "[x] trusted" : "[ ] not trusted")
                | (editor.field == ServerField::Trust ? bold : nothing)),
    };
    if (!editor.error.empty()) {
        rows.push_back(text(""));
        rows.push_back(text(editor.error) | color(theme.error));
    }
    rows.push_back(separator() | color(theme.muted));
    rows.push_back(text("Tab: Next | Enter: Save server | Space: Toggle trust | Esc: Cancel")
                   | color(theme.muted));

    std::string title = editor.originalName.empty() ? " Add MCP Server "
                                                     : " Edit MCP Server: " + editor.originalName + " ";
    return window(text(title) | bold | color(theme.accent), vbox(rows))
        | size(WIDTH, GREATER_THAN, 60) | bgcolor(theme.bg) | clear_under | center;
}

Element ExtensionForm::draw(const ColorTheme& theme) {
    auto fieldBox = [&](Field f, const std::string& label, const std::string& placeholder) {
        bool focused = field_ == f && !server_;
        return labelled(label, input(f).render(focused, theme, placeholder), focused, theme);
    };

    Elements serverRows;
    int i = 0;
    for (const auto& [name, cfg] : servers_) {
        bool selected = field_ == Field::McpServers && i == serverCursor_;
        std::string line = name + ": " + cfg.command.value_or("");
        if (cfg.args) line += " " + joinList(*cfg.args, " ");
        auto row = text((selected ? "▶ " : "  ") + line);
        if (selected) row = row | color(theme.accent) | bold;
        serverRows.push_back(row);
        ++i;
    }
    if (serverRows.empty()) serverRows.push_back(text("  No MCP servers") | color(theme.muted));

    bool serversFocused = field_ == Field::McpServers && !server_;
    auto serversBox = vbox({
        text("MCP Servers") | bold | (serversFocused ? color(theme.accent) : color(theme.muted)),
        vbox(serverRows) | borderStyled(serversFocused ? ROUNDED : LIGHT,
                                        serversFocused ? theme.accent : theme.muted),
    });

    auto content = vbox({
        hbox({
            fieldBox(Field::Name, "Name *", "My Extension") | flex,
            text(" "),
            fieldBox(Field::Version, "Version *", "1.0.0") | size(WIDTH, EQUAL, 20),
        }),
        fieldBox(Field::Description, "Description", "What this extension provides"),
        hbox({
            fieldBox(Field::Tags, "Tags", "comma, separated") | flex,
            text(" "),
            fieldBox(Field::ContextFileName, "Context file", "GEMINI.md") | flex,
        }),
        fieldBox(Field::ContextContent, "Context content", "Markdown loaded as model context")
            | size(HEIGHT, LESS_THAN, 12),
        serversBox,
    });

    std::string title = original_ ? " Edit Extension: " + original_->name + " " : " New Extension ";
    std::string hints = field_ == Field::McpServers
        ? "n: Add server | e/Enter: Edit | d: Delete | Tab: Next field | Ctrl+S: Save | Esc: Cancel"
        : "Tab/Shift+Tab: Fields | Ctrl+S: Save | Esc: Cancel";

    Element form = vbox({
        window(text(title) | bold | color(theme.accent), content | yframe) | flex,
        FooterBar(hints, "", theme),
    }) | bgcolor(theme.bg) | color(theme.fg);

    if (server_) {
        return dbox({form, drawServerEditor(theme)});
    }
    return form;
}

}  // namespace components
}  // namespace gcm
