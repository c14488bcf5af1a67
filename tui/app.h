#ifndef GCM_TUI_APP_H
#define GCM_TUI_APP_H

#include "action_channel.h"
#include "config.h"
#include "key_chord_resolver.h"
#include "keybinding_manager.h"
#include "terminal.h"
#include "view_manager.h"
#include "components/component.h"
#include "core/launcher.h"
#include "core/settings.h"
#include "core/storage.h"
#include <atomic>
#include <memory>
#include <vector>

namespace gcm {

// Event loop: raw terminal events in, actions through the channel, one
// render per Render action.
class App {
public:
    // Upper bound on drain passes per loop iteration; actions produced by
    // the last pass wait for the next iteration
    static constexpr int kMaxDrainPasses = 8;

    App(Config config, std::shared_ptr<Storage> storage, SharedSettings settings,
        std::unique_ptr<Terminal> terminal, std::unique_ptr<ProfileLauncher> launcher);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Run the application (blocking)
    void run();

    // Thread-safe: leave the loop at the next event
    void quit() { quitRequested_ = true; }

    ViewManager& viewManager() { return *viewManager_; }
    bool inFormMode() const { return formMode_; }
    const KeyChordResolver& resolver() const { return resolver_; }

private:
    void handleEvent(const Event& event);
    void drainActions();
    void dispatch(const Action& action);
    void render();
    void launchProfile(const std::string& id);
    bool inputCaptured() const;

    Config config_;
    std::shared_ptr<Storage> storage_;
    SharedSettings settings_;
    std::unique_ptr<Terminal> terminal_;
    std::unique_ptr<ProfileLauncher> launcher_;

    ActionChannel channel_;
    ActionSender sender_;
    KeyChordResolver resolver_;
    KeybindingManager keys_;

    std::vector<std::unique_ptr<components::Component>> components_;
    ViewManager* viewManager_ = nullptr;

    std::atomic<bool> quitRequested_{false};
    bool shouldQuit_ = false;
    bool shouldSuspend_ = false;
    bool formMode_ = false;
};

}  // namespace gcm

#endif  // GCM_TUI_APP_H
