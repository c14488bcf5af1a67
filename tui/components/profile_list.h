#ifndef GCM_TUI_COMPONENTS_PROFILE_LIST_H
#define GCM_TUI_COMPONENTS_PROFILE_LIST_H

#include "component.h"
#include "core/storage.h"
#include <memory>
#include <vector>

namespace gcm {
namespace components {

// Profiles sorted by name, the default one marked with a star
class ProfileList : public Component {
public:
    explicit ProfileList(std::shared_ptr<Storage> storage);

    void init(Size area) override;
    std::optional<Action> handleKeyEvent(const KeyEvent& key) override;
    std::optional<Action> update(const Action& action) override;
    ftxui::Element draw(const ColorTheme& theme) override;

    void reload();

    const std::vector<Profile>& profiles() const { return profiles_; }
    const Profile* selectedProfile() const;
    int selectedIndex() const { return selected_; }

private:
    std::shared_ptr<Storage> storage_;
    std::vector<Profile> profiles_;
    int selected_ = 0;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_PROFILE_LIST_H
