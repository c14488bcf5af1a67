#include "view_manager.h"
#include "components/confirm_dialog.h"
#include "components/extension_detail.h"
#include "components/extension_form.h"
#include "components/extension_list.h"
#include "components/import_dialog.h"
#include "components/modal.h"
#include "components/profile_detail.h"
#include "components/profile_form.h"
#include "components/profile_list.h"
#include "components/settings_view.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>

namespace gcm {

using namespace ftxui;
using namespace components;

ViewManager::ViewManager(std::shared_ptr<Storage> storage, Clock clock,
                         SteadyClock::duration errorDuration,
                         SteadyClock::duration statusDuration)
    : storage_(std::move(storage)),
      clock_(std::move(clock)),
      error_(errorDuration),
      status_(statusDuration) {
    auto extensionDetail = std::make_unique<ExtensionDetail>(storage_);
    auto profileDetail = std::make_unique<ProfileDetail>(storage_);
    auto importDialog = std::make_unique<ImportDialog>(storage_);
    extensionDetail_ = extensionDetail.get();
    profileDetail_ = profileDetail.get();
    importDialog_ = importDialog.get();

    views_[ViewType::ExtensionList] = std::make_unique<ExtensionList>(storage_);
    views_[ViewType::ExtensionDetail] = std::move(extensionDetail);
    views_[ViewType::ExtensionImport] = std::move(importDialog);
    views_[ViewType::ProfileList] = std::make_unique<ProfileList>(storage_);
    views_[ViewType::ProfileDetail] = std::move(profileDetail);
    views_[ViewType::Settings] = std::make_unique<SettingsView>();
    tabBar_.setCurrentView(current_);
}

ViewManager::~ViewManager() = default;

void ViewManager::registerActionHandler(ActionSender sender) {
    Component::registerActionHandler(sender);
    for (auto& [type, view] : views_) view->registerActionHandler(sender);
    tabBar_.registerActionHandler(sender);
}

void ViewManager::registerConfigHandler(const Config& config) {
    config_ = config;
    for (auto& [type, view] : views_) view->registerConfigHandler(config);
    tabBar_.registerConfigHandler(config);
}

void ViewManager::registerSettingsHandler(SharedSettings settings) {
    Component::registerSettingsHandler(settings);
    for (auto& [type, view] : views_) view->registerSettingsHandler(settings);
    tabBar_.registerSettingsHandler(settings);
}

void ViewManager::init(Size area) {
    Component::init(area);
    for (auto& [type, view] : views_) view->init(area);
    tabBar_.init(area);
}

Component* ViewManager::view(ViewType type) const {
    auto it = views_.find(type);
    return it == views_.end() ? nullptr : it->second.get();
}

void ViewManager::installView(ViewType type, std::unique_ptr<Component> component) {
    component->registerActionHandler(sender_);
    component->registerConfigHandler(config_);
    component->registerSettingsHandler(settings_);
    component->init(area_);
    views_[type] = std::move(component);
}

void ViewManager::navigate(ViewType target) {
    if (target == current_) return;
    spdlog::debug("View {} -> {}", viewName(current_), viewName(target));
    previous_ = current_;
    current_ = target;
    tabBar_.setCurrentView(target);
}

bool ViewManager::capturesInput() const {
    Component* active = activeView();
    return active != nullptr && active->capturesInput();
}

std::optional<Action> ViewManager::handleEvents(const std::optional<Event>& event) {
    if (!event) return std::nullopt;

    if (event->type == EventType::Key) {
        // The error overlay is modal
        if (error_.visible()) {
            if (event->key.is(KeyCode::Esc)) {
                error_.clear();
                return ActionType::Render;
            }
            return std::nullopt;
        }
        if (helpVisible_) {
            if (event->key.is(KeyCode::Esc)) {
                helpVisible_ = false;
                return ActionType::Render;
            }
            return std::nullopt;
        }
    }

    Component* active = activeView();
    if (!active) return std::nullopt;
    return active->handleEvents(event);
}

std::optional<Action> ViewManager::update(const Action& action) {
    std::optional<Action> result;

    switch (action.type) {
        case ActionType::Tick: {
            auto now = clock_();
            bool expired = error_.expireIfStale(now);
            expired = status_.expireIfStale(now) || expired;
            if (expired) result = ActionType::Render;
            break;
        }
        case ActionType::Resize:
            area_ = Size{action.width, action.height};
            break;
        case ActionType::Error:
            spdlog::warn("Error shown: {}", action.text);
            error_.set(action.text, clock_());
            result = ActionType::Render;
            break;
        case ActionType::Success:
            status_.set(action.text, clock_());
            result = ActionType::Render;
            break;
        case ActionType::Help:
            helpVisible_ = !helpVisible_;
            result = ActionType::Render;
            break;

        case ActionType::ViewExtensionDetails:
            try {
                extensionDetail_->loadExtension(action.text);
                navigate(ViewType::ExtensionDetail);
            } catch (const StorageError& e) {
                send(Action::error(std::string("Failed to load extension: ") + e.what()));
            }
            break;
        case ActionType::ViewProfileDetails:
            try {
                profileDetail_->loadProfile(action.text);
                navigate(ViewType::ProfileDetail);
            } catch (const StorageError& e) {
                send(Action::error(std::string("Failed to load profile: ") + e.what()));
            }
            break;

        case ActionType::CreateNewExtension:
            editingExtensionId_.reset();
            installView(ViewType::ExtensionCreate, std::make_unique<ExtensionForm>(storage_));
            navigate(ViewType::ExtensionCreate);
            break;
        case ActionType::CreateProfile:
            editingProfileId_.reset();
            installView(ViewType::ProfileCreate, std::make_unique<ProfileForm>(storage_));
            navigate(ViewType::ProfileCreate);
            break;
        case ActionType::EditExtension:
            editExtension(action.text);
            break;
        case ActionType::EditProfile:
            editProfile(action.text);
            break;
        case ActionType::ImportExtension:
            importDialog_->reset();
            navigate(ViewType::ExtensionImport);
            break;

        case ActionType::DeleteExtension:
            deleteExtension(action.text);
            break;
        case ActionType::DeleteProfile:
            deleteProfile(action.text);
            break;
        case ActionType::ConfirmDelete:
            confirmDelete();
            break;
        case ActionType::CancelDelete:
            cancelDelete();
            break;
        case ActionType::SetDefaultProfile:
            setDefaultProfile(action.text);
            break;

        case ActionType::NavigateToExtensions:
            navigate(ViewType::ExtensionList);
            break;
        case ActionType::NavigateToProfiles:
            navigate(ViewType::ProfileList);
            break;
        case ActionType::NavigateToSettings:
            navigate(ViewType::Settings);
            break;
        case ActionType::NavigateBack:
            navigateBack();
            break;

        default:
            break;
    }

    forward(action);
    return result;
}

void ViewManager::forward(const Action& action) {
    for (auto& [type, view] : views_) {
        try {
            if (auto follow = view->update(action)) send(std::move(*follow));
        } catch (const std::exception& e) {
            spdlog::error("{} failed on {}: {}", viewName(type), toString(action), e.what());
            send(Action::error(e.what()));
        }
    }
    if (auto follow = tabBar_.update(action)) send(std::move(*follow));
}

void ViewManager::navigateBack() {
    switch (current_) {
        case ViewType::ExtensionDetail:
            navigate(ViewType::ExtensionList);
            break;
        case ViewType::ProfileDetail:
            navigate(ViewType::ProfileList);
            break;
        case ViewType::ExtensionEdit:
            if (cameFromDetail_ && editingExtensionId_) {
                navigate(ViewType::ExtensionDetail);
            } else {
                navigate(ViewType::ExtensionList);
            }
            editingExtensionId_.reset();
            cameFromDetail_ = false;
            break;
        case ViewType::ProfileEdit:
            if (cameFromDetail_ && editingProfileId_) {
                navigate(ViewType::ProfileDetail);
            } else {
                navigate(ViewType::ProfileList);
            }
            editingProfileId_.reset();
            cameFromDetail_ = false;
            break;
        case ViewType::ExtensionCreate:
            navigate(ViewType::ExtensionList);
            break;
        case ViewType::ProfileCreate:
            navigate(ViewType::ProfileList);
            break;
        default:
            if (previous_) navigate(*previous_);
            break;
    }
}

void ViewManager::editExtension(const std::string& id) {
    cameFromDetail_ = current_ == ViewType::ExtensionDetail;
    editingExtensionId_ = id;

    Extension extension;
    try {
        extension = storage_->loadExtension(id);
    } catch (const StorageError& e) {
        editingExtensionId_.reset();
        cameFromDetail_ = false;
        send(Action::error(std::string("Failed to load extension: ") + e.what()));
        return;
    }
    installView(ViewType::ExtensionEdit, std::make_unique<ExtensionForm>(storage_, extension));
    navigate(ViewType::ExtensionEdit);
}

void ViewManager::editProfile(const std::string& id) {
    cameFromDetail_ = current_ == ViewType::ProfileDetail;
    editingProfileId_ = id;

    Profile profile;
    try {
        profile = storage_->loadProfile(id);
    } catch (const StorageError& e) {
        editingProfileId_.reset();
        cameFromDetail_ = false;
        send(Action::error(std::string("Failed to load profile: ") + e.what()));
        return;
    }
    installView(ViewType::ProfileEdit, std::make_unique<ProfileForm>(storage_, profile));
    navigate(ViewType::ProfileEdit);
}

void ViewManager::deleteExtension(const std::string& id) {
    std::vector<std::string> users;
    for (const auto& profile : storage_->listProfiles()) {
        if (profile.referencesExtension(id)) users.push_back(profile.name);
    }
    if (!users.empty()) {
        send(Action::error("Cannot delete extension: it is used by profile" +
                           std::string(users.size() == 1 ? " " : "s ") + joinList(users)));
        return;
    }

    std::string message;
    try {
        message = "Delete extension '" + storage_->loadExtension(id).name + "'?\nThis cannot be undone.";
    } catch (const StorageError& e) {
        spdlog::warn("Deleting unreadable extension {}: {}", id, e.what());
        message = "Delete this extension?\nThis cannot be undone.";
    }

    deletingExtensionId_ = id;
    deletingProfileId_.reset();
    installView(ViewType::ConfirmDelete, std::make_unique<ConfirmDialog>("Delete Extension", message));
    navigate(ViewType::ConfirmDelete);
}

void ViewManager::deleteProfile(const std::string& id) {
    std::string message;
    try {
        message = "Delete profile '" + storage_->loadProfile(id).displayName() + "'?\nThis cannot be undone.";
    } catch (const StorageError& e) {
        spdlog::warn("Deleting unreadable profile {}: {}", id, e.what());
        message = "Delete this profile?\nThis cannot be undone.";
    }

    deletingProfileId_ = id;
    deletingExtensionId_.reset();
    installView(ViewType::ConfirmDelete, std::make_unique<ConfirmDialog>("Delete Profile", message));
    navigate(ViewType::ConfirmDelete);
}

void ViewManager::confirmDelete() {
    if (deletingProfileId_) {
        try {
            storage_->deleteProfile(*deletingProfileId_);
            spdlog::info("Deleted profile {}", *deletingProfileId_);
            send(ActionType::RefreshProfiles);
            send(ActionType::Render);
        } catch (const StorageError& e) {
            send(Action::error(std::string("Failed to delete profile: ") + e.what()));
        }
    } else if (deletingExtensionId_) {
        try {
            storage_->deleteExtension(*deletingExtensionId_);
            spdlog::info("Deleted extension {}", *deletingExtensionId_);
            send(ActionType::RefreshExtensions);
            send(ActionType::Render);
        } catch (const StorageError& e) {
            send(Action::error(std::string("Failed to delete extension: ") + e.what()));
        }
    }

    deletingProfileId_.reset();
    deletingExtensionId_.reset();
    if (previous_) navigate(*previous_);
}

void ViewManager::cancelDelete() {
    deletingProfileId_.reset();
    deletingExtensionId_.reset();
    if (previous_) navigate(*previous_);
}

void ViewManager::setDefaultProfile(const std::string& id) {
    try {
        storage_->setDefaultProfile(id);
    } catch (const StorageError& e) {
        send(Action::error(std::string("Failed to set default profile: ") + e.what()));
        return;
    }
    send(ActionType::RefreshProfiles);
    send(Action::success("Default profile set to " + id));
}

std::string ViewManager::chords(const std::string& name) const {
    return joinList(keys_.keysFor(name), "/");
}

std::vector<std::pair<std::string, std::string>> ViewManager::helpBindings() const {
    std::vector<std::pair<std::string, std::string>> bindings = {
        {"q/Ctrl+C", "Quit"},
        {"Ctrl+Z", "Suspend"},
        {"?", "Toggle help"},
        {"Tab", "Next tab"},
        {"", ""},
    };

    auto add = [&](const std::string& name, const std::string& label) {
        std::string keys = chords(name);
        if (!keys.empty()) bindings.push_back({keys, label});
    };

    switch (current_) {
        case ViewType::ExtensionList:
            add("up", "Previous extension");
            add("down", "Next extension");
            add("select", "Show details");
            add("search", "Filter");
            add("create", "New extension");
            add("import", "Import extension");
            add("edit", "Edit extension");
            add("delete", "Delete extension");
            break;
        case ViewType::ExtensionDetail:
            add("up", "Scroll up");
            add("down", "Scroll down");
            bindings.push_back({"PgUp/PgDn", "Scroll a page"});
            add("edit", "Edit extension");
            add("delete", "Delete extension");
            add("back", "Back to list");
            break;
        case ViewType::ProfileList:
            add("up", "Previous profile");
            add("down", "Next profile");
            add("select", "Show details");
            add("launch", "Launch gemini");
            add("create", "New profile");
            add("edit", "Edit profile");
            add("delete", "Delete profile");
            bindings.push_back({"x", "Make default"});
            break;
        case ViewType::ProfileDetail:
            add("launch", "Launch gemini");
            add("edit", "Edit profile");
            add("delete", "Delete profile");
            bindings.push_back({"x", "Make default"});
            add("back", "Back to list");
            break;
        case ViewType::ExtensionCreate:
        case ViewType::ExtensionEdit:
        case ViewType::ProfileCreate:
        case ViewType::ProfileEdit:
            bindings.push_back({"Tab/S-Tab", "Next/previous field"});
            bindings.push_back({"Space", "Toggle checkbox"});
            bindings.push_back({"Ctrl+S", "Save"});
            bindings.push_back({"Ctrl+U", "Clear field"});
            bindings.push_back({"Esc", "Cancel"});
            break;
        case ViewType::ExtensionImport:
            bindings.push_back({"Tab", "Complete path"});
            bindings.push_back({"Enter", "Import"});
            bindings.push_back({"Esc", "Cancel"});
            break;
        case ViewType::ConfirmDelete:
            bindings.push_back({"y", "Delete"});
            bindings.push_back({"n/Esc", "Keep"});
            break;
        case ViewType::Settings:
            add("up", "Previous item");
            add("down", "Next item");
            add("select", "Apply theme / record keys");
            bindings.push_back({"r", "Reset keybindings"});
            add("back", "Back");
            break;
    }
    return bindings;
}

Element ViewManager::draw(const ColorTheme& theme) {
    Component* active = activeView();
    Element content = active ? active->draw(theme) : text("");

    // The confirmation dialog floats over the view it was opened from
    if (current_ == ViewType::ConfirmDelete && previous_) {
        if (Component* below = view(*previous_)) {
            content = dbox({below->draw(theme), content});
        }
    }

    Elements rows = {tabBar_.draw(theme), content | flex};
    if (status_.visible()) {
        rows.push_back(hbox({text(" ✓ ") | bold, text(status_.text())}) | color(theme.success)
                       | bgcolor(theme.bgDark));
    }

    Elements layers = {vbox(rows) | bgcolor(theme.bg)};
    if (helpVisible_) {
        layers.push_back(HelpOverlay(viewName(current_) + " Help", helpBindings(), theme));
    }
    if (error_.visible()) {
        layers.push_back(ErrorModal(error_.text(), theme));
    }
    return dbox(layers);
}

}  // namespace gcm
