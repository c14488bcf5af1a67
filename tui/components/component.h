#ifndef GCM_TUI_COMPONENTS_COMPONENT_H
#define GCM_TUI_COMPONENTS_COMPONENT_H

#include "action_channel.h"
#include "config.h"
#include "keybinding_manager.h"
#include "terminal.h"
#include "theme.h"
#include "core/settings.h"
#include <ftxui/dom/elements.hpp>
#include <optional>

namespace gcm {
namespace components {

// Base class of every view, dialog and form.
// Failures are reported by throwing; the App turns them into Error actions.
class Component {
public:
    Component() = default;
    virtual ~Component() = default;

    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;

    virtual void registerActionHandler(ActionSender sender) { sender_ = std::move(sender); }
    virtual void registerConfigHandler(const Config& config) { (void)config; }
    virtual void registerSettingsHandler(SharedSettings settings) {
        keys_.setSettings(settings);
        settings_ = std::move(settings);
    }

    virtual void init(Size area) { area_ = area; }

    // Translate a raw event into at most one action.
    // Key and mouse events go to the narrower handlers below.
    virtual std::optional<Action> handleEvents(const std::optional<Event>& event);
    virtual std::optional<Action> handleKeyEvent(const KeyEvent& key) { (void)key; return std::nullopt; }
    virtual std::optional<Action> handleMouseEvent(const MouseEvent& mouse) { (void)mouse; return std::nullopt; }

    // React to an action; may return one follow-up action
    virtual std::optional<Action> update(const Action& action) { (void)action; return std::nullopt; }

    virtual ftxui::Element draw(const ColorTheme& theme) = 0;

    // True while the component consumes plain characters as text
    // (key capture, search box), so global shortcuts must stay quiet
    virtual bool capturesInput() const { return false; }

protected:
    // Send through the registered channel. A closed channel only
    // happens at shutdown, so the action is dropped with a debug log.
    void send(Action action) const;

    ActionSender sender_;
    SharedSettings settings_;
    KeybindingManager keys_;
    Size area_;
};

}  // namespace components
}  // namespace gcm

#endif  // GCM_TUI_COMPONENTS_COMPONENT_H
