#include "profile_detail.h"
#include "modal.h"
#include "table.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>

namespace gcm {
namespace components {

using namespace ftxui;

namespace {

Element field(const std::string& label, const std::string& value, const ColorTheme& theme,
              bool placeholder = false) {
    auto v = text(value);
    if (placeholder) v = v | dim;
    return hbox({text(label) | color(theme.muted) | size(WIDTH, EQUAL, 14), v | flex});
}

std::string yesNo(bool b) { return b ? "yes" : "no"; }

}  // namespace

ProfileDetail::ProfileDetail(std::shared_ptr<Storage> storage)
    : storage_(std::move(storage)) {}

void ProfileDetail::loadProfile(const std::string& id) {
    profile_ = storage_->loadProfile(id);
    missingId_.clear();
    selected_ = 0;
    loadExtensions();
}

void ProfileDetail::loadExtensions() {
    extensions_.clear();
    for (const auto& id : profile_->extensionIds) {
        try {
            extensions_.push_back(storage_->loadExtension(id));
        } catch (const NotFoundError&) {
            spdlog::warn("Profile {} references missing extension {}", profile_->id, id);
            extensions_.push_back(std::nullopt);
        }
    }
    if (selected_ >= (int)extensions_.size()) selected_ = std::max(0, (int)extensions_.size() - 1);
}

std::optional<Action> ProfileDetail::handleKeyEvent(const KeyEvent& key) {
    if (keys_.matches(key, "back")) {
        return ActionType::NavigateBack;
    }
    if (!profile_) return std::nullopt;

    int count = extensions_.size();
    if (keys_.matches(key, "down")) {
        if (count > 0) selected_ = std::min(selected_ + 1, count - 1);
        return ActionType::Render;
    }
    if (keys_.matches(key, "up")) {
        selected_ = std::max(0, selected_ - 1);
        return ActionType::Render;
    }
    if (keys_.matches(key, "edit")) {
        return Action(ActionType::EditProfile, profile_->id);
    }
    if (keys_.matches(key, "delete")) {
        return Action(ActionType::DeleteProfile, profile_->id);
    }
    if (keys_.matches(key, "launch")) {
        return Action(ActionType::LaunchWithProfile, profile_->id);
    }
    if (key.isChar('x')) {
        return Action(ActionType::SetDefaultProfile, profile_->id);
    }
    return std::nullopt;
}

std::optional<Action> ProfileDetail::update(const Action& action) {
    switch (action.type) {
        case ActionType::RefreshProfiles:
        case ActionType::RefreshExtensions:
            if (profile_) {
                std::string id = profile_->id;
                try {
                    profile_ = storage_->loadProfile(id);
                    loadExtensions();
                } catch (const NotFoundError&) {
                    profile_.reset();
                    extensions_.clear();
                    missingId_ = id;
                }
            }
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

Element ProfileDetail::draw(const ColorTheme& theme) {
    std::string hints = keys_.buildHelpText({{"back", "Back"}, {"launch", "Launch"}, {"edit", "Edit"},
                                             {"delete", "Delete"}, {"x", "Set default"}});

    if (!profile_) {
        std::string msg = missingId_.empty() ? "No profile selected"
                                             : "Profile '" + missingId_ + "' no longer exists";
        return vbox({
            window(text(" Profile ") | bold, text(msg) | color(theme.muted) | center) | flex,
            FooterBar(hints, "?: Help", theme),
        }) | bgcolor(theme.bg) | color(theme.fg);
    }

    const Profile& p = *profile_;
    Elements body = {
        field("Description", p.description.value_or("(none)"), theme, !p.description),
        field("ID", p.id, theme),
        field("Directory", p.workingDirectory.value_or("(current)"), theme, !p.workingDirectory),
        field("Created", p.metadata.createdAt, theme),
        field("Updated", p.metadata.updatedAt, theme),
        field("Tags", p.metadata.tags.empty() ? "(none)" : joinList(p.metadata.tags), theme,
              p.metadata.tags.empty()),
        field("Default", yesNo(p.metadata.isDefault), theme),
        field("Launch", "clean: " + yesNo(p.launchConfig.cleanLaunch) +
                        ", cleanup on exit: " + yesNo(p.launchConfig.cleanupOnExit), theme),
        text(""),
        text("Extensions (" + std::to_string(extensions_.size()) + ")") | bold,
    };

    std::vector<std::vector<std::string>> rows;
    for (size_t i = 0; i < extensions_.size(); ++i) {
        const auto& ext = extensions_[i];
        if (ext) {
            rows.push_back({ext->name, ext->version, std::to_string(ext->mcpServers.size()),
                            ext->description.value_or("")});
        } else {
            rows.push_back({p.extensionIds[i], "-", "-", "(missing)"});
        }
    }
    body.push_back(TableElement(rows,
                                {{"Name", 24}, {"Version", 10}, {"Servers", 8, TableColumn::Align::Right},
                                 {"Description", 0}},
                                theme, selected_, true, "No extensions enabled"));

    body.push_back(text(""));
    body.push_back(text("Environment (" + std::to_string(p.environmentVariables.size()) + ")") | bold);
    std::vector<std::vector<std::string>> envRows;
    for (const auto& [key, value] : p.environmentVariables) envRows.push_back({key, value});
    body.push_back(TableElement(envRows, {{"Variable", 24}, {"Value", 0}}, theme, -1, false,
                                "No environment variables"));

    return vbox({
        window(text(" " + p.displayName() + " ") | bold | color(theme.accent),
               vbox(body) | vscroll_indicator | yframe) | flex,
        FooterBar(hints, "?: Help", theme),
    }) | bgcolor(theme.bg) | color(theme.fg);
}

}  // namespace components
}  // namespace gcm
