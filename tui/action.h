#ifndef GCM_TUI_ACTION_H
#define GCM_TUI_ACTION_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gcm {

enum class ActionType {
    // Lifecycle
    Tick,
    Render,
    Resize,
    Suspend,
    Resume,
    Quit,
    ClearScreen,
    Help,

    // Notifications
    Error,
    Success,

    // Extensions
    ViewExtensionDetails,
    ImportExtension,
    CreateNewExtension,
    EditExtension,
    DeleteExtension,
    RefreshExtensions,

    // Profiles
    ViewProfileDetails,
    CreateProfile,
    EditProfile,
    DeleteProfile,
    RefreshProfiles,
    LaunchWithProfile,
    SetDefaultProfile,

    // Navigation
    NavigateToExtensions,
    NavigateToProfiles,
    NavigateToSettings,
    NavigateBack,

    // Dialog results
    ConfirmDelete,
    CancelDelete,

    // Settings
    ChangeTheme,
    UpdateKeybinding,
    ResetKeybindings,
    SaveSettings,
};

// A message processed by the App loop and every component.
// `text` carries the id, message, theme or logical keybinding name,
// depending on the type. `keys` is only used by UpdateKeybinding.
struct Action {
    ActionType type = ActionType::Render;
    std::string text;
    std::vector<std::string> keys;
    uint16_t width = 0;
    uint16_t height = 0;

    Action() = default;
    Action(ActionType t) : type(t) {}
    Action(ActionType t, std::string payload) : type(t), text(std::move(payload)) {}

    static Action resize(uint16_t w, uint16_t h);
    static Action error(std::string message);
    static Action success(std::string message);
    static Action updateKeybinding(std::string name, std::vector<std::string> chords);

    // True when the action moves the user into a text-entry form
    bool entersForm() const;
    // True when the action leaves whatever view had focus
    bool isNavigation() const;

    bool operator==(const Action& other) const = default;
};

// Canonical name, e.g. "NavigateToProfiles"
std::string actionName(ActionType type);

// Human readable form used in logs: "EditExtension(abc)"
std::string toString(const Action& action);

// Parses the name of a parameterless action (as written in config.json).
// Returns nullopt for unknown names and for actions that need a payload.
std::optional<Action> parseAction(const std::string& name);

}  // namespace gcm

#endif  // GCM_TUI_ACTION_H
