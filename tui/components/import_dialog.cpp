#include "import_dialog.h"
#include "modal.h"
#include "config.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace gcm {
namespace components {

using namespace ftxui;
namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxCompletionsShown = 8;

std::string commonPrefix(const std::vector<std::string>& items) {
    if (items.empty()) return "";
    std::string prefix = items.front();
    for (const auto& item : items) {
        size_t n = 0;
        while (n < prefix.size() && n < item.size() && prefix[n] == item[n]) ++n;
        prefix.resize(n);
    }
    return prefix;
}

}  // namespace

ImportDialog::ImportDialog(std::shared_ptr<Storage> storage)
    : importer_(std::move(storage)) {}

void ImportDialog::reset() {
    path_.clear();
    error_.clear();
}

std::vector<std::string> ImportDialog::completions() const {
    const std::string& typed = path_.value();
    size_t slash = typed.rfind('/');
    std::string dirPart = slash == std::string::npos ? "" : typed.substr(0, slash + 1);
    std::string prefix = slash == std::string::npos ? typed : typed.substr(slash + 1);

    fs::path dir = dirPart.empty() ? fs::path(".") : expandHome(dirPart);
    std::vector<std::string> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string name = entry.path().filename().string();
        if (name.rfind(prefix, 0) != 0) continue;
        if (name[0] == '.' && (prefix.empty() || prefix[0] != '.')) continue;
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) name += "/";
        out.push_back(dirPart + name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void ImportDialog::complete() {
    auto items = completions();
    if (items.empty()) return;
    std::string completed = items.size() == 1 ? items.front() : commonPrefix(items);
    if (completed.size() > path_.value().size()) path_.setValue(completed);
}

std::optional<Action> ImportDialog::runImport() {
    std::string typed = path_.value();
    while (typed.size() > 1 && typed.back() == '/') typed.pop_back();

    try {
        auto result = importer_.importPath(expandHome(typed));
        error_.clear();
        send(Action::success((result.contextOnly ? "Successfully imported context: "
                                                 : "Successfully imported: ") +
                             result.extension.name));
        send(ActionType::RefreshExtensions);
        send(ActionType::NavigateBack);
        reset();
        return ActionType::Render;
    } catch (const ImportError& e) {
        error_ = e.what();
    } catch (const StorageError& e) {
        spdlog::error("Import of {} failed: {}", typed, e.what());
        error_ = std::string("Failed to save extension: ") + e.what();
    }
    return ActionType::Render;
}

std::optional<Action> ImportDialog::handleKeyEvent(const KeyEvent& key) {
    if (key.is(KeyCode::Esc)) {
        reset();
        return ActionType::NavigateBack;
    }
    if (key.is(KeyCode::Enter)) {
        return runImport();
    }
    if (key.is(KeyCode::Tab)) {
        complete();
        return ActionType::Render;
    }
    if (path_.handleKey(key)) {
        error_.clear();
        return ActionType::Render;
    }
    return std::nullopt;
}

Element ImportDialog::draw(const ColorTheme& theme) {
    Elements body = {
        text("Path to an extension directory, a .json manifest or a .md context file")
            | color(theme.muted),
        text(""),
        hbox({
            text(" > ") | bold | color(theme.accent),
            path_.render(true, theme, "~/extensions/my-extension") | flex,
        }) | borderStyled(ROUNDED, theme.accent),
    };

    auto items = completions();
    if (!items.empty() && !path_.empty()) {
        Elements list;
        for (size_t i = 0; i < items.size() && i < kMaxCompletionsShown; ++i) {
            list.push_back(text("  " + items[i]) | color(theme.muted));
        }
        if (items.size() > kMaxCompletionsShown) {
            list.push_back(text("  ... " + std::to_string(items.size() - kMaxCompletionsShown) + " more")
                           | dim);
        }
        body.push_back(vbox(list));
    }

    if (!error_.empty()) {
        body.push_back(text(""));
        body.push_back(hbox({text(" ✗ ") | bold, Paragraph(error_) | flex}) | color(theme.error));
    }

    return vbox({
        window(text(" Import Extension ") | bold | color(theme.accent), vbox(body)) | flex,
        FooterBar("Enter: Import | Tab: Complete | Ctrl+U: Clear | Esc: Cancel", "", theme),
    }) | bgcolor(theme.bg) | color(theme.fg);
}

}  // namespace components
}  // namespace gcm
