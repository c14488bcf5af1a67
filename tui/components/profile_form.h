#ifndef GCM_TUI_COMPONENTS_PROFILE_FORM_H
#define GCM_TUI_COMPONENTS_PROFILE_FORM_H

#include "component.h"
#include "text_input.h"
#include "core/storage.h"
#include <memory>
#include <optional>
#include <vector>

namespace gcm {
namespace components {

// Create/edit form for a profile. Extensions are picked from a checklist
// and launch options are toggles; everything else is text.
class ProfileForm : public Component {
public:
    enum class Field {
        Name,
        Description,
        WorkingDirectory,
        Extensions,
        Environment,
        Tags,
        LaunchConfig,
    };

    explicit ProfileForm(std::shared_ptr<Storage> storage);
    ProfileForm(std::shared_ptr<Storage> storage, const Profile& profile);

    void init(Size area) override;

    bool editMode() const { return original_.has_value(); }
    Field currentField() const { return field_; }
    TextInput& input(Field field);

    const std::vector<Extension>& availableExtensions() const { return available_; }
    const std::vector<std::string>& selectedExtensionIds() const { return selectedIds_; }
    bool cleanLaunch() const { return cleanLaunch_; }
    bool cleanupOnExit() const { return cleanupOnExit_; }

    // Throws std::invalid_argument when the name is missing
    Profile buildProfile() const;

    std::optional<Action> handleKeyEvent(const KeyEvent& key) override;
    ftxui::Element draw(const ColorTheme& theme) override;

private:
    std::optional<Action> save();
    void toggleExtension();
    bool isSelected(const std::string& id) const;

    std::shared_ptr<Storage> storage_;
    std::optional<Profile> original_;

    TextInput name_;
    TextInput description_;
    TextInput workingDirectory_;
    TextInput environment_;  // KEY=VALUE, comma separated
    TextInput tags_;

    std::vector<Extension> available_;
    std::vector<std::string> selectedIds_;
    int extensionCursor_ = 0;

    bool cleanLaunch_ = false;
    bool cleanupOnExit_ = true;
    int launchCursor_ = 0;

    Field field_ = Field::Name;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_PROFILE_FORM_H
