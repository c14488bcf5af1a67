#include "extension_list.h"
#include "modal.h"

#include <algorithm>
#include <cctype>

namespace gcm {
namespace components {

using namespace ftxui;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool matchesFilter(const Extension& ext, const std::string& needle) {
    if (needle.empty()) return true;
    if (lower(ext.name).find(needle) != std::string::npos) return true;
    if (ext.description && lower(*ext.description).find(needle) != std::string::npos) return true;
    for (const auto& tag : ext.metadata.tags) {
        if (lower(tag).find(needle) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

ExtensionList::ExtensionList(std::shared_ptr<Storage> storage)
    : storage_(std::move(storage)) {}

void ExtensionList::init(Size area) {
    Component::init(area);
    reload();
}

void ExtensionList::reload() {
    extensions_ = storage_->listExtensions();
    std::sort(extensions_.begin(), extensions_.end(), [](const Extension& a, const Extension& b) {
        return lower(a.name) < lower(b.name);
    });
    clampSelection();
}

std::vector<const Extension*> ExtensionList::visible() const {
    std::vector<const Extension*> out;
    std::string needle = lower(search_.value());
    for (const auto& ext : extensions_) {
        if (matchesFilter(ext, needle)) out.push_back(&ext);
    }
    return out;
}

const Extension* ExtensionList::selectedExtension() const {
    auto items = visible();
    if (selected_ < 0 || selected_ >= (int)items.size()) return nullptr;
    return items[selected_];
}

void ExtensionList::clampSelection() {
    int count = visible().size();
    if (count == 0) {
        selected_ = 0;
    } else if (selected_ >= count) {
        selected_ = count - 1;
    }
}

std::optional<Action> ExtensionList::handleKeyEvent(const KeyEvent& key) {
    if (searching_) {
        if (key.is(KeyCode::Esc)) {
            searching_ = false;
            search_.clear();
            clampSelection();
            return ActionType::Render;
        }
        if (key.is(KeyCode::Enter)) {
            searching_ = false;
            return ActionType::Render;
        }
        if (search_.handleKey(key)) {
            selected_ = 0;
            return ActionType::Render;
        }
        return std::nullopt;
    }

    int count = visible().size();
    if (keys_.matches(key, "down")) {
        if (count > 0) selected_ = (selected_ + 1) % count;
        return ActionType::Render;
    }
    if (keys_.matches(key, "up")) {
        if (count > 0) selected_ = selected_ > 0 ? selected_ - 1 : count - 1;
        return ActionType::Render;
    }
    if (keys_.matches(key, "select")) {
        if (const auto* ext = selectedExtension()) {
            return Action(ActionType::ViewExtensionDetails, ext->id);
        }
        return std::nullopt;
    }
    if (keys_.matches(key, "search")) {
        searching_ = true;
        return ActionType::Render;
    }
    if (keys_.matches(key, "import")) {
        return ActionType::ImportExtension;
    }
    if (keys_.matches(key, "create")) {
        return ActionType::CreateNewExtension;
    }
    if (keys_.matches(key, "edit")) {
        if (const auto* ext = selectedExtension()) {
            return Action(ActionType::EditExtension, ext->id);
        }
        return std::nullopt;
    }
    if (keys_.matches(key, "delete")) {
        if (const auto* ext = selectedExtension()) {
            return Action(ActionType::DeleteExtension, ext->id);
        }
        return std::nullopt;
    }
    if (key.is(KeyCode::Tab) || keys_.matches(key, "right")) {
        return ActionType::NavigateToProfiles;
    }
    if (key.is(KeyCode::Esc) && !search_.empty()) {
        search_.clear();
        clampSelection();
        return ActionType::Render;
    }
    return std::nullopt;
}

std::optional<Action> ExtensionList::update(const Action& action) {
    if (action.type == ActionType::RefreshExtensions) {
        reload();
        return ActionType::Render;
    }
    return std::nullopt;
}

Element ExtensionList::draw(const ColorTheme& theme) {
    auto items = visible();

    Elements rows;
    for (size_t i = 0; i < items.size(); ++i) {
        const Extension& ext = *items[i];
        bool selected = (int)i == selected_;

        auto name = text(ext.name) | bold;
        if (selected) name = name | color(theme.accent);

        std::string counts = std::to_string(ext.mcpServers.size()) + " MCP server" +
                             (ext.mcpServers.size() == 1 ? "" : "s");
        if (ext.contextFileName) counts += " | context: " + *ext.contextFileName;
        if (!ext.metadata.tags.empty()) counts += " | tags: " + joinList(ext.metadata.tags);

        auto item = hbox({
            text(selected ? "│ " : "  ") | color(theme.accent),
            vbox({
                hbox({name, text(" v" + ext.version) | color(theme.muted)}),
                text("  " + ext.description.value_or("No description")) | color(theme.fg),
                text("  " + counts) | color(theme.muted),
                text(""),
            }) | flex,
        });
        if (selected) item = item | bgcolor(theme.bgDark) | focus;
        rows.push_back(item);
    }

    if (items.empty()) {
        rows.push_back(text(""));
        if (extensions_.empty()) {
            rows.push_back(text("No extensions yet") | bold | center);
            rows.push_back(text("Press 'i' to import one or 'n' to create one") | color(theme.muted) | center);
        } else {
            rows.push_back(text("No extensions match '" + search_.value() + "'") | color(theme.muted) | center);
        }
    }

    std::string title = " Extensions (" + std::to_string(extensions_.size()) + ") ";
    Elements body;
    if (searching_ || !search_.empty()) {
        body.push_back(hbox({
            text(" / ") | bold | color(theme.accent),
            search_.render(searching_, theme, "search") | flex,
        }));
        body.push_back(separator() | color(theme.muted));
    }
    body.push_back(vbox(rows) | vscroll_indicator | yframe | flex);

    std::string hints = searching_
        ? "Type to filter | Enter: Keep filter | Esc: Clear"
        : keys_.buildHelpText({{"up", "Up"}, {"down", "Down"}, {"select", "Details"},
                               {"search", "Search"}, {"import", "Import"}, {"create", "New"},
                               {"edit", "Edit"}, {"delete", "Delete"}, {"tab", "Profiles"}});

    return vbox({
        window(text(title) | bold | color(theme.accent), vbox(body)) | flex,
        FooterBar(hints, "?: Help  q: Quit", theme),
    }) | bgcolor(theme.bg) | color(theme.fg);
}

}  // namespace components
}  // namespace gcm
