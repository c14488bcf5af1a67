#include "profile_form.h"
#include "modal.h"
#include "core/errors.h"

#include <algorithm>
#include <stdexcept>

namespace gcm {
namespace components {

using namespace ftxui;

namespace {

constexpr ProfileForm::Field kFieldOrder[] = {
    ProfileForm::Field::Name,
    ProfileForm::Field::Description,
    ProfileForm::Field::WorkingDirectory,
    ProfileForm::Field::Extensions,
    ProfileForm::Field::Environment,
    ProfileForm::Field::Tags,
    ProfileForm::Field::LaunchConfig,
};
constexpr int kFieldCount = sizeof(kFieldOrder) / sizeof(kFieldOrder[0]);

std::optional<std::string> nonEmpty(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

Element section(const std::string& label, Element body, bool focused, const ColorTheme& theme) {
    auto head = text(label) | bold | color(focused ? theme.accent : theme.muted);
    if (focused) body = body | focus;
    return vbox({
        head,
        body | borderStyled(focused ? ROUNDED : LIGHT, focused ? theme.accent : theme.muted),
    });
}

Element checkbox(bool checked, const std::string& label, bool cursor, const ColorTheme& theme) {
    auto row = hbox({
        text(cursor ? "▶ " : "  ") | color(theme.accent),
        text(checked ? "[x] " : "[ ] ") | color(checked ? theme.success : theme.muted),
        text(label),
    });
    if (cursor) row = row | bold;
    return row;
}

}  // namespace

ProfileForm::ProfileForm(std::shared_ptr<Storage> storage)
    : storage_(std::move(storage)) {}

ProfileForm::ProfileForm(std::shared_ptr<Storage> storage, const Profile& profile)
    : storage_(std::move(storage)),
      original_(profile),
      name_(profile.name),
      description_(profile.description.value_or("")),
      workingDirectory_(profile.workingDirectory.value_or("")),
      environment_(formatKeyValueList(profile.environmentVariables)),
      tags_(joinList(profile.metadata.tags)),
      selectedIds_(profile.extensionIds),
      cleanLaunch_(profile.launchConfig.cleanLaunch),
      cleanupOnExit_(profile.launchConfig.cleanupOnExit) {}

void ProfileForm::init(Size area) {
    Component::init(area);
    available_ = storage_->listExtensions();
    std::sort(available_.begin(), available_.end(),
              [](const Extension& a, const Extension& b) { return a.name < b.name; });
}

TextInput& ProfileForm::input(Field field) {
    switch (field) {
        case Field::Name: return name_;
        case Field::Description: return description_;
        case Field::WorkingDirectory: return workingDirectory_;
        case Field::Environment: return environment_;
        case Field::Tags: return tags_;
        case Field::Extensions:
        case Field::LaunchConfig:
            break;
    }
    throw std::invalid_argument("field has no text input");
}

bool ProfileForm::isSelected(const std::string& id) const {
    return std::find(selectedIds_.begin(), selectedIds_.end(), id) != selectedIds_.end();
}

void ProfileForm::toggleExtension() {
    if (extensionCursor_ < 0 || extensionCursor_ >= (int)available_.size()) return;
    const std::string& id = available_[extensionCursor_].id;
    auto it = std::find(selectedIds_.begin(), selectedIds_.end(), id);
    if (it != selectedIds_.end()) {
        selectedIds_.erase(it);
    } else {
        selectedIds_.push_back(id);
    }
}

Profile ProfileForm::buildProfile() const {
    if (name_.empty()) {
        throw std::invalid_argument("Profile name is required");
    }

    Profile p;
    p.id = original_ ? original_->id : slugify(name_.value());
    if (p.id.empty()) {
        throw std::invalid_argument("Profile name must contain letters or digits");
    }
    p.name = name_.value();
    p.description = nonEmpty(description_.value());
    p.workingDirectory = nonEmpty(workingDirectory_.value());
    p.extensionIds = selectedIds_;
    p.environmentVariables = parseKeyValueList(environment_.value());
    p.launchConfig.cleanLaunch = cleanLaunch_;
    p.launchConfig.cleanupOnExit = cleanupOnExit_;

    std::string now = currentTimestamp();
    if (original_) {
        p.launchConfig.preserveExtensions = original_->launchConfig.preserveExtensions;
        p.metadata = original_->metadata;
    } else {
        p.metadata.createdAt = now;
    }
    p.metadata.updatedAt = now;
    p.metadata.tags = splitList(tags_.value());
    return p;
}

std::optional<Action> ProfileForm::save() {
    Profile profile;
    try {
        profile = buildProfile();
    } catch (const std::invalid_argument& e) {
        return Action::error(e.what());
    }

    try {
        if (!original_) {
            try {
                storage_->loadProfile(profile.id);
                return Action::error("Failed to save profile: a profile with id '" + profile.id +
                                     "' already exists");
            } catch (const NotFoundError&) {
                // id is free
            }
        }
        storage_->saveProfile(profile);
    } catch (const StorageError& e) {
        return Action::error(std::string("Failed to save profile: ") + e.what());
    }

    send(Action::success(original_ ? "Profile updated successfully" : "Profile created successfully"));
    send(ActionType::RefreshProfiles);
    send(ActionType::Render);
    return ActionType::NavigateBack;
}

std::optional<Action> ProfileForm::handleKeyEvent(const KeyEvent& key) {
    if (key.is(KeyCode::Esc)) {
        return ActionType::NavigateBack;
    }
    if (key.ctrl && key.code == KeyCode::Char && key.ch == "s") {
        return save();
    }

    int index = static_cast<int>(field_);
    if (key.is(KeyCode::Tab)) {
        field_ = kFieldOrder[(index + 1) % kFieldCount];
        return ActionType::Render;
    }
    if (key.is(KeyCode::BackTab)) {
        field_ = kFieldOrder[(index + kFieldCount - 1) % kFieldCount];
        return ActionType::Render;
    }

    switch (field_) {
        case Field::Extensions: {
            int count = available_.size();
            if (key.is(KeyCode::Down) || key.isChar('j')) {
                if (count > 0) extensionCursor_ = (extensionCursor_ + 1) % count;
                return ActionType::Render;
            }
            if (key.is(KeyCode::Up) || key.isChar('k')) {
                if (count > 0) extensionCursor_ = extensionCursor_ > 0 ? extensionCursor_ - 1 : count - 1;
                return ActionType::Render;
            }
            if (key.isChar(' ') || key.is(KeyCode::Enter)) {
                toggleExtension();
                return ActionType::Render;
            }
            return std::nullopt;
        }
        case Field::LaunchConfig:
            if (key.is(KeyCode::Down) || key.is(KeyCode::Up) || key.isChar('j') || key.isChar('k')) {
                launchCursor_ = 1 - launchCursor_;
                return ActionType::Render;
            }
            if (key.isChar(' ') || key.is(KeyCode::Enter)) {
                if (launchCursor_ == 0) {
                    cleanLaunch_ = !cleanLaunch_;
                } else {
                    cleanupOnExit_ = !cleanupOnExit_;
                }
                return ActionType::Render;
            }
            return std::nullopt;
        default:
            break;
    }

    if (input(field_).handleKey(key)) return ActionType::Render;
    if (key.is(KeyCode::Enter)) {
        field_ = kFieldOrder[(index + 1) % kFieldCount];
        return ActionType::Render;
    }
    return std::nullopt;
}

Element ProfileForm::draw(const ColorTheme& theme) {
    auto textField = [&](Field f, const std::string& label, const std::string& placeholder) {
        bool focused = field_ == f;
        return section(label, input(f).render(focused, theme, placeholder), focused, theme);
    };

    bool extensionsFocused = field_ == Field::Extensions;
    Elements extensionRows;
    for (size_t i = 0; i < available_.size(); ++i) {
        const Extension& ext = available_[i];
        bool cursor = extensionsFocused && (int)i == extensionCursor_;
        auto row = checkbox(isSelected(ext.id), ext.name + " v" + ext.version, cursor, theme);
        if (cursor) row = row | focus;
        extensionRows.push_back(row);
    }
    if (available_.empty()) {
        extensionRows.push_back(text("  No extensions available. Import or create one first.")
                                | color(theme.muted));
    }
    std::string extensionsLabel = "Extensions (" + std::to_string(selectedIds_.size()) + " selected)";

    bool launchFocused = field_ == Field::LaunchConfig;
    auto launchBody = vbox({
        checkbox(cleanLaunch_, "Clean launch (remove other extensions from the workspace first)",
                 launchFocused && launchCursor_ == 0, theme),
        checkbox(cleanupOnExit_, "Clean up workspace extensions after gemini exits",
                 launchFocused && launchCursor_ == 1, theme),
    });

    auto content = vbox({
        textField(Field::Name, "Name *", "Web Development"),
        textField(Field::Description, "Description", "What this profile is for"),
        textField(Field::WorkingDirectory, "Working directory", "~/projects/app (optional)"),
        section(extensionsLabel, vbox(extensionRows) | size(HEIGHT, LESS_THAN, 10) | yframe,
                extensionsFocused, theme),
        textField(Field::Environment, "Environment", "KEY=VALUE, TOKEN=$GITHUB_TOKEN"),
        textField(Field::Tags, "Tags", "comma, separated"),
        section("Launch options", launchBody, launchFocused, theme),
    });

    std::string hints;
    switch (field_) {
        case Field::Extensions:
        case Field::LaunchConfig:
            hints = "Up/Down: Move | Space: Toggle | Tab: Next field | Ctrl+S: Save | Esc: Cancel";
            break;
        default:
            hints = "Tab/Shift+Tab: Fields | Ctrl+S: Save | Esc: Cancel";
            break;
    }

    std::string title = original_ ? " Edit Profile: " + original_->name + " " : " New Profile ";
    return vbox({
        window(text(title) | bold | color(theme.accent), content | vscroll_indicator | yframe) | flex,
        FooterBar(hints, "", theme),
    }) | bgcolor(theme.bg) | color(theme.fg);
}

}  // namespace components
}  // namespace gcm
