#ifndef GCM_TUI_COMPONENTS_PROFILE_DETAIL_H
#define GCM_TUI_COMPONENTS_PROFILE_DETAIL_H

#include "component.h"
#include "core/storage.h"
#include <memory>
#include <optional>
#include <vector>

namespace gcm {
namespace components {

// One profile: settings, environment and the extensions it enables
class ProfileDetail : public Component {
public:
    explicit ProfileDetail(std::shared_ptr<Storage> storage);

    // Throws NotFoundError / StorageError
    void loadProfile(const std::string& id);
    const std::optional<Profile>& profile() const { return profile_; }

    // Referenced extensions in profile order; nullopt for missing ones
    const std::vector<std::optional<Extension>>& extensions() const { return extensions_; }
    int selectedIndex() const { return selected_; }

    std::optional<Action> handleKeyEvent(const KeyEvent& key) override;
    std::optional<Action> update(const Action& action) override;
    ftxui::Element draw(const ColorTheme& theme) override;

private:
    void loadExtensions();

    std::shared_ptr<Storage> storage_;
    std::optional<Profile> profile_;
    std::vector<std::optional<Extension>> extensions_;
    std::string missingId_;
    int selected_ = 0;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_PROFILE_DETAIL_H
