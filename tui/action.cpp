#include "action.h"

#include <utility>

namespace gcm {

namespace {

struct ActionInfo {
    ActionType type;
    const char* name;
    bool hasPayload;
};

constexpr ActionInfo kActions[] = {
    {ActionType::Tick, "Tick", false},
    {ActionType::Render, "Render", false},
    {ActionType::Resize, "Resize", true},
    {ActionType::Suspend, "Suspend", false},
    {ActionType::Resume, "Resume", false},
    {ActionType::Quit, "Quit", false},
    {ActionType::ClearScreen, "ClearScreen", false},
    {ActionType::Help, "Help", false},
    {ActionType::Error, "Error", true},
    {ActionType::Success, "Success", true},
    {ActionType::ViewExtensionDetails, "ViewExtensionDetails", true},
    {ActionType::ImportExtension, "ImportExtension", false},
    {ActionType::CreateNewExtension, "CreateNewExtension", false},
    {ActionType::EditExtension, "EditExtension", true},
    {ActionType::DeleteExtension, "DeleteExtension", true},
    {ActionType::RefreshExtensions, "RefreshExtensions", false},
    {ActionType::ViewProfileDetails, "ViewProfileDetails", true},
    {ActionType::CreateProfile, "CreateProfile", false},
    {ActionType::EditProfile, "EditProfile", true},
    {ActionType::DeleteProfile, "DeleteProfile", true},
    {ActionType::RefreshProfiles, "RefreshProfiles", false},
    {ActionType::LaunchWithProfile, "LaunchWithProfile", true},
    {ActionType::SetDefaultProfile, "SetDefaultProfile", true},
    {ActionType::NavigateToExtensions, "NavigateToExtensions", false},
    {ActionType::NavigateToProfiles, "NavigateToProfiles", false},
    {ActionType::NavigateToSettings, "NavigateToSettings", false},
    {ActionType::NavigateBack, "NavigateBack", false},
    {ActionType::ConfirmDelete, "ConfirmDelete", false},
    {ActionType::CancelDelete, "CancelDelete", false},
    {ActionType::ChangeTheme, "ChangeTheme", true},
    {ActionType::UpdateKeybinding, "UpdateKeybinding", true},
    {ActionType::ResetKeybindings, "ResetKeybindings", false},
    {ActionType::SaveSettings, "SaveSettings", false},
};

const ActionInfo* findInfo(ActionType type) {
    for (const auto& info : kActions) {
        if (info.type == type) return &info;
    }
    return nullptr;
}

}  // namespace

Action Action::resize(uint16_t w, uint16_t h) {
    Action a(ActionType::Resize);
    a.width = w;
    a.height = h;
    return a;
}

Action Action::error(std::string message) {
    return Action(ActionType::Error, std::move(message));
}

Action Action::success(std::string message) {
    return Action(ActionType::Success, std::move(message));
}

Action Action::updateKeybinding(std::string name, std::vector<std::string> chords) {
    Action a(ActionType::UpdateKeybinding, std::move(name));
    a.keys = std::move(chords);
    return a;
}

bool Action::entersForm() const {
    switch (type) {
        case ActionType::CreateNewExtension:
        case ActionType::EditExtension:
        case ActionType::CreateProfile:
        case ActionType::EditProfile:
        case ActionType::ImportExtension:
            return true;
        default:
            return false;
    }
}

bool Action::isNavigation() const {
    switch (type) {
        case ActionType::NavigateBack:
        case ActionType::NavigateToExtensions:
        case ActionType::NavigateToProfiles:
        case ActionType::NavigateToSettings:
            return true;
        default:
            return false;
    }
}

std::string actionName(ActionType type) {
    const ActionInfo* info = findInfo(type);
    return info ? info->name : "Unknown";
}

std::string toString(const Action& action) {
    std::string out = actionName(action.type);
    if (action.type == ActionType::Resize) {
        out += "(" + std::to_string(action.width) + "x" + std::to_string(action.height) + ")";
    } else if (action.type == ActionType::UpdateKeybinding) {
        out += "(" + action.text + " = [";
        for (size_t i = 0; i < action.keys.size(); ++i) {
            if (i > 0) out += ", ";
            out += action.keys[i];
        }
        out += "])";
    } else if (!action.text.empty()) {
        out += "(" + action.text + ")";
    }
    return out;
}

std::optional<Action> parseAction(const std::string& name) {
    for (const auto& info : kActions) {
        if (name == info.name) {
            if (info.hasPayload) return std::nullopt;
            return Action(info.type);
        }
    }
    return std::nullopt;
}

}  // namespace gcm
