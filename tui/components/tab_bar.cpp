#include "tab_bar.h"

namespace gcm {
namespace components {

using namespace ftxui;

int TabBar::activeTab() const {
    switch (current_) {
        case ViewType::ExtensionList:
        case ViewType::ExtensionDetail:
        case ViewType::ExtensionCreate:
        case ViewType::ExtensionEdit:
        case ViewType::ExtensionImport:
            return 0;
        case ViewType::ProfileList:
        case ViewType::ProfileDetail:
        case ViewType::ProfileCreate:
        case ViewType::ProfileEdit:
            return 1;
        case ViewType::Settings:
            return 2;
        case ViewType::ConfirmDelete:
            return -1;
    }
    return -1;
}

std::string TabBar::breadcrumb() const {
    switch (current_) {
        case ViewType::ExtensionDetail: return "Extension Details";
        case ViewType::ExtensionCreate: return "Create Extension";
        case ViewType::ExtensionEdit: return "Edit Extension";
        case ViewType::ExtensionImport: return "Import Extension";
        case ViewType::ProfileDetail: return "Profile Details";
        case ViewType::ProfileCreate: return "Create Profile";
        case ViewType::ProfileEdit: return "Edit Profile";
        case ViewType::ConfirmDelete: return "Confirm Delete";
        default: return "";
    }
}

Element TabBar::draw(const ColorTheme& theme) {
    std::vector<std::string> tabNames = {"Extensions", "Profiles", "Settings"};
    int active = activeTab();

    Elements tabs;
    for (size_t i = 0; i < tabNames.size(); ++i) {
        auto tabText = text(" " + tabNames[i] + " ");
        if ((int)i == active) {
            tabText = tabText | bold | bgcolor(theme.primary) | color(theme.primaryFg);
        } else {
            tabText = tabText | color(theme.muted);
        }
        if (i > 0) tabs.push_back(text(" │ ") | color(theme.muted));
        tabs.push_back(tabText);
    }

    tabs.push_back(filler());
    std::string crumb = breadcrumb();
    if (!crumb.empty()) {
        tabs.push_back(text("> " + crumb + " ") | color(theme.muted));
    }

    return hbox(tabs) | borderRounded | color(theme.accent);
}

}  // namespace components
}  // namespace gcm
