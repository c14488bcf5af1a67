#include "extension_detail.h"
#include "modal.h"
#include "core/errors.h"

#include <algorithm>

namespace gcm {
namespace components {

using namespace ftxui;

ExtensionDetail::ExtensionDetail(std::shared_ptr<Storage> storage)
    : storage_(std::move(storage)) {}

void ExtensionDetail::loadExtension(const std::string& id) {
    extension_ = storage_->loadExtension(id);
    missingId_.clear();
    scroll_ = 0;
}

int ExtensionDetail::visibleLines() const {
    // Tab strip (3), window border (2), footer (1)
    return std::max(3, (int)area_.height - 6);
}

std::optional<Action> ExtensionDetail::handleKeyEvent(const KeyEvent& key) {
    if (keys_.matches(key, "back")) {
        return ActionType::NavigateBack;
    }
    if (keys_.matches(key, "up")) {
        scroll_ = std::max(0, scroll_ - 1);
        return ActionType::Render;
    }
    if (keys_.matches(key, "down")) {
        scroll_ = std::min(scroll_ + 1, maxScrollOffset(totalLines_, visibleLines()));
        return ActionType::Render;
    }
    if (key.is(KeyCode::PageUp)) {
        scroll_ = std::max(0, scroll_ - visibleLines());
        return ActionType::Render;
    }
    if (key.is(KeyCode::PageDown)) {
        scroll_ = std::min(scroll_ + visibleLines(), maxScrollOffset(totalLines_, visibleLines()));
        return ActionType::Render;
    }
    if (!extension_) return std::nullopt;

    if (keys_.matches(key, "edit")) {
        return Action(ActionType::EditExtension, extension_->id);
    }
    if (keys_.matches(key, "delete")) {
        return Action(ActionType::DeleteExtension, extension_->id);
    }
    return std::nullopt;
}

std::optional<Action> ExtensionDetail::update(const Action& action) {
    switch (action.type) {
        case ActionType::Resize:
            area_ = Size{action.width, action.height};
            return std::nullopt;
        case ActionType::RefreshExtensions:
            if (extension_) {
                std::string id = extension_->id;
                try {
                    loadExtension(id);
                } catch (const NotFoundError&) {
                    // Deleted while we were showing it
                    extension_.reset();
                    missingId_ = id;
                }
            }
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

std::vector<TextLine> ExtensionDetail::buildLines(const ColorTheme& theme) const {
    std::vector<TextLine> lines;
    const Extension& ext = *extension_;
    auto label = [&](const std::string& name, const std::string& value, bool dim = false) {
        lines.push_back({name, value, theme.muted, dim});
    };

    label("Description:  ", ext.description.value_or("(none)"), !ext.description);
    label("ID:           ", ext.id);
    label("Imported:     ", ext.metadata.importedAt);
    if (ext.metadata.sourcePath) label("Source:       ", *ext.metadata.sourcePath);
    label("Tags:         ", ext.metadata.tags.empty() ? "(none)" : joinList(ext.metadata.tags),
          ext.metadata.tags.empty());

    lines.push_back({});
    lines.push_back({"", "MCP Servers (" + std::to_string(ext.mcpServers.size()) + ")",
                     Color::Default, false, true});
    if (ext.mcpServers.empty()) {
        lines.push_back({"  ", "(none)", Color::Default, true});
    }
    for (const auto& [name, server] : ext.mcpServers) {
        lines.push_back({"  • ", name, theme.success});
        if (server.command) {
            std::string cmd = *server.command;
            if (server.args && !server.args->empty()) cmd += " " + joinList(*server.args, " ");
            lines.push_back({"    Command: ", cmd, theme.muted});
        }
        if (server.cwd) lines.push_back({"    Cwd:     ", *server.cwd, theme.muted});
        if (server.env) {
            for (const auto& [key, value] : *server.env) {
                lines.push_back({"    Env:     ", key + " = " + value, theme.muted});
            }
        }
        if (server.timeout) {
            lines.push_back({"    Timeout: ", std::to_string(*server.timeout) + " ms", theme.muted});
        }
        if (server.trust) {
            lines.push_back({"    Trust:   ", *server.trust ? "yes" : "no", theme.muted});
        }
    }

    if (ext.contextFileName) {
        lines.push_back({});
        lines.push_back({"", "Context File: " + *ext.contextFileName, Color::Default, false, true});
        if (ext.contextContent && !ext.contextContent->empty()) {
            size_t start = 0;
            const std::string& body = *ext.contextContent;
            while (start <= body.size()) {
                size_t end = body.find('\n', start);
                if (end == std::string::npos) end = body.size();
                lines.push_back({"  ", body.substr(start, end - start)});
                start = end + 1;
            }
        } else {
            lines.push_back({"  ", "(empty)", Color::Default, true});
        }
    }
    return lines;
}

Element ExtensionDetail::draw(const ColorTheme& theme) {
    std::string hints = keys_.buildHelpText({{"back", "Back"}, {"up", "Scroll up"}, {"down", "Scroll down"},
                                             {"edit", "Edit"}, {"delete", "Delete"}});

    if (!extension_) {
        std::string msg = missingId_.empty() ? "No extension selected"
                                             : "Extension '" + missingId_ + "' no longer exists";
        return vbox({
            window(text(" Extension ") | bold, text(msg) | color(theme.muted) | center) | flex,
            FooterBar(hints, "?: Help", theme),
        }) | bgcolor(theme.bg) | color(theme.fg);
    }

    auto lines = buildLines(theme);
    totalLines_ = lines.size();
    scroll_ = std::min(scroll_, maxScrollOffset(totalLines_, visibleLines()));

    std::string title = " " + extension_->name + " v" + extension_->version + " ";
    return vbox({
        window(text(title) | bold | color(theme.accent),
               ScrollTextElement(lines, scroll_, visibleLines())) | flex,
        FooterBar(hints, "?: Help", theme),
    }) | bgcolor(theme.bg) | color(theme.fg);
}

}  // namespace components
}  // namespace gcm
