#include "profile_list.h"
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

}  // namespace

ProfileList::ProfileList(std::shared_ptr<Storage> storage)
    : storage_(std::move(storage)) {}

void ProfileList::init(Size area) {
    Component::init(area);
    reload();
}

void ProfileList::reload() {
    std::string keep = selectedProfile() ? selectedProfile()->id : "";

    profiles_ = storage_->listProfiles();
    std::sort(profiles_.begin(), profiles_.end(), [](const Profile& a, const Profile& b) {
        return lower(a.name) < lower(b.name);
    });

    // Stay on the same profile across reloads when it still exists
    for (size_t i = 0; i < profiles_.size(); ++i) {
        if (profiles_[i].id == keep) selected_ = i;
    }
    if (selected_ >= (int)profiles_.size()) selected_ = std::max(0, (int)profiles_.size() - 1);
}

const Profile* ProfileList::selectedProfile() const {
    if (selected_ < 0 || selected_ >= (int)profiles_.size()) return nullptr;
    return &profiles_[selected_];
}

std::optional<Action> ProfileList::handleKeyEvent(const KeyEvent& key) {
    int count = profiles_.size();
    const Profile* profile = selectedProfile();

    if (keys_.matches(key, "down")) {
        if (count > 0) selected_ = (selected_ + 1) % count;
        return ActionType::Render;
    }
    if (keys_.matches(key, "up")) {
        if (count > 0) selected_ = selected_ > 0 ? selected_ - 1 : count - 1;
        return ActionType::Render;
    }
    if (keys_.matches(key, "select")) {
        if (profile) return Action(ActionType::ViewProfileDetails, profile->id);
        return std::nullopt;
    }
    if (keys_.matches(key, "create")) {
        return ActionType::CreateProfile;
    }
    if (keys_.matches(key, "edit")) {
        if (profile) return Action(ActionType::EditProfile, profile->id);
        return std::nullopt;
    }
    if (keys_.matches(key, "delete")) {
        if (profile) return Action(ActionType::DeleteProfile, profile->id);
        return std::nullopt;
    }
    // "l" is both launch and right by default; launching wins here
    if (keys_.matches(key, "launch")) {
        if (profile) return Action(ActionType::LaunchWithProfile, profile->id);
        return std::nullopt;
    }
    if (key.isChar('x')) {
        if (profile) return Action(ActionType::SetDefaultProfile, profile->id);
        return std::nullopt;
    }
    if (key.is(KeyCode::Tab) || keys_.matches(key, "right")) {
        return ActionType::NavigateToSettings;
    }
    if (key.is(KeyCode::BackTab) || keys_.matches(key, "left")) {
        return ActionType::NavigateToExtensions;
    }
    return std::nullopt;
}

std::optional<Action> ProfileList::update(const Action& action) {
    if (action.type == ActionType::RefreshProfiles) {
        reload();
        return ActionType::Render;
    }
    return std::nullopt;
}

Element ProfileList::draw(const ColorTheme& theme) {
    Elements rows;
    for (size_t i = 0; i < profiles_.size(); ++i) {
        const Profile& p = profiles_[i];
        bool selected = (int)i == selected_;

        auto name = text(p.displayName()) | bold;
        if (selected) name = name | color(theme.accent);

        Elements head = {name};
        if (p.metadata.isDefault) head.push_back(text(" ★ default") | color(theme.warning));

        std::string details = p.summary();
        if (p.workingDirectory) details += " | dir: " + *p.workingDirectory;
        if (!p.metadata.tags.empty()) details += " | tags: " + joinList(p.metadata.tags);

        auto item = hbox({
            text(selected ? "│ " : "  ") | color(theme.accent),
            vbox({
                hbox(head),
                text("  " + p.description.value_or("No description")),
                text("  " + details) | color(theme.muted),
                text(""),
            }) | flex,
        });
        if (selected) item = item | bgcolor(theme.bgDark) | focus;
        rows.push_back(item);
    }

    if (profiles_.empty()) {
        rows.push_back(text(""));
        rows.push_back(text("No profiles yet") | bold | center);
        rows.push_back(text("Press 'n' to create one") | color(theme.muted) | center);
    }

    std::string title = " Profiles (" + std::to_string(profiles_.size()) + ") ";
    std::string hints = keys_.buildHelpText({{"up", "Up"}, {"down", "Down"}, {"select", "Details"},
                                             {"launch", "Launch"}, {"create", "New"}, {"edit", "Edit"},
                                             {"delete", "Delete"}, {"x", "Set default"}});

    return vbox({
        window(text(title) | bold | color(theme.accent), vbox(rows) | vscroll_indicator | yframe) | flex,
        FooterBar(hints, "?: Help  q: Quit", theme),
    }) | bgcolor(theme.bg) | color(theme.fg);
}

}  // namespace components
}  // namespace gcm
