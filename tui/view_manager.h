#ifndef GCM_TUI_VIEW_MANAGER_H
#define GCM_TUI_VIEW_MANAGER_H

#include "timed_message.h"
#include "view_type.h"
#include "components/component.h"
#include "components/tab_bar.h"
#include "core/storage.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gcm {

namespace components {
class ExtensionDetail;
class ImportDialog;
class ProfileDetail;
}  // namespace components

// Owns every view and decides which one is active.
//
// Navigation intents, delete confirmation, the error overlay, the status
// line and the help overlay live here. Every action is forwarded to all
// registered views and the tab bar after the manager has handled it, and
// raw events go to the active view only.
class ViewManager : public components::Component {
public:
    using Clock = std::function<SteadyClock::time_point()>;

    static constexpr std::chrono::seconds kErrorDisplayDuration{5};
    static constexpr std::chrono::seconds kStatusDisplayDuration{3};

    explicit ViewManager(std::shared_ptr<Storage> storage,
                         Clock clock = [] { return SteadyClock::now(); },
                         SteadyClock::duration errorDuration = kErrorDisplayDuration,
                         SteadyClock::duration statusDuration = kStatusDisplayDuration);
    ~ViewManager() override;

    void registerActionHandler(ActionSender sender) override;
    void registerConfigHandler(const Config& config) override;
    void registerSettingsHandler(SharedSettings settings) override;
    void init(Size area) override;

    std::optional<Action> handleEvents(const std::optional<Event>& event) override;
    std::optional<Action> update(const Action& action) override;
    ftxui::Element draw(const ColorTheme& theme) override;
    bool capturesInput() const override;

    ViewType currentView() const { return current_; }
    std::optional<ViewType> previousView() const { return previous_; }
    const std::optional<std::string>& editingExtensionId() const { return editingExtensionId_; }
    const std::optional<std::string>& deletingExtensionId() const { return deletingExtensionId_; }
    const std::optional<std::string>& editingProfileId() const { return editingProfileId_; }
    const std::optional<std::string>& deletingProfileId() const { return deletingProfileId_; }
    bool cameFromDetailView() const { return cameFromDetail_; }

    const TimedMessage& errorOverlay() const { return error_; }
    const TimedMessage& statusMessage() const { return status_; }
    bool helpVisible() const { return helpVisible_; }

    // Registered component for `view`, nullptr when none has been created yet
    components::Component* view(ViewType view) const;
    components::Component* activeView() const { return view(current_); }

    // Key/description pairs for the help overlay of the current view
    std::vector<std::pair<std::string, std::string>> helpBindings() const;

private:
    void navigate(ViewType target);
    void installView(ViewType type, std::unique_ptr<components::Component> component);

    void navigateBack();
    void editExtension(const std::string& id);
    void editProfile(const std::string& id);
    void deleteExtension(const std::string& id);
    void deleteProfile(const std::string& id);
    void confirmDelete();
    void cancelDelete();
    void setDefaultProfile(const std::string& id);

    void forward(const Action& action);
    std::string chords(const std::string& name) const;

    std::shared_ptr<Storage> storage_;
    Clock clock_;
    Config config_;

    std::map<ViewType, std::unique_ptr<components::Component>> views_;
    components::TabBar tabBar_;
    components::ExtensionDetail* extensionDetail_ = nullptr;
    components::ProfileDetail* profileDetail_ = nullptr;
    components::ImportDialog* importDialog_ = nullptr;

    ViewType current_ = ViewType::ExtensionList;
    std::optional<ViewType> previous_;
    std::optional<std::string> editingExtensionId_;
    std::optional<std::string> deletingExtensionId_;
    std::optional<std::string> editingProfileId_;
    std::optional<std::string> deletingProfileId_;
    bool cameFromDetail_ = false;

    TimedMessage error_;
    TimedMessage status_;
    bool helpVisible_ = false;
};

}  // namespace gcm

#endif  // GCM_TUI_VIEW_MANAGER_H
