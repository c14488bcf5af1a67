#include "app.h"
#include "theme.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>

namespace gcm {

App::App(Config config, std::shared_ptr<Storage> storage, SharedSettings settings,
         std::unique_ptr<Terminal> terminal, std::unique_ptr<ProfileLauncher> launcher)
    : config_(std::move(config)),
      storage_(std::move(storage)),
      settings_(std::move(settings)),
      terminal_(std::move(terminal)),
      launcher_(std::move(launcher)),
      sender_(channel_.sender()),
      resolver_(config_.keymap("Normal")) {
    keys_.setSettings(settings_);

    auto viewManager = std::make_unique<ViewManager>(storage_);
    viewManager_ = viewManager.get();
    components_.push_back(std::move(viewManager));

    for (auto& component : components_) {
        component->registerActionHandler(sender_);
        component->registerConfigHandler(config_);
        component->registerSettingsHandler(settings_);
        component->init(terminal_->size());
    }
}

App::~App() = default;

void App::run() {
    terminal_->enter();
    sender_.send(ActionType::Render);
    drainActions();

    while (!shouldQuit_) {
        auto event = terminal_->nextEvent();
        if (!event) {
            spdlog::info("Event source closed");
            break;
        }
        handleEvent(*event);
        drainActions();

        if (quitRequested_) {
            shouldQuit_ = true;
        }
        if (shouldSuspend_ && !shouldQuit_) {
            spdlog::info("Suspending");
            terminal_->suspend();
            shouldSuspend_ = false;
            sender_.send(ActionType::Resume);
            sender_.send(ActionType::ClearScreen);
            sender_.send(ActionType::Render);
            drainActions();
        }
    }

    terminal_->exit();
    spdlog::info("Application loop finished");
}

bool App::inputCaptured() const {
    for (const auto& component : components_) {
        if (component->capturesInput()) return true;
    }
    return false;
}

void App::handleEvent(const Event& event) {
    bool viewHandled = false;
    for (auto& component : components_) {
        try {
            if (auto action = component->handleEvents(event)) {
                viewHandled = true;
                sender_.send(std::move(*action));
            }
        } catch (const std::exception& e) {
            sender_.send(Action::error(e.what()));
        }
    }

    switch (event.type) {
        case EventType::Tick:
            sender_.send(ActionType::Tick);
            break;
        case EventType::Render:
            sender_.send(ActionType::Render);
            break;
        case EventType::Resize:
            sender_.send(Action::resize(event.width, event.height));
            break;
        case EventType::Quit:
            sender_.send(ActionType::Quit);
            break;
        case EventType::Key:
            if (!formMode_ && !inputCaptured()) {
                if (auto action = resolver_.resolve(event.key)) {
                    sender_.send(std::move(*action));
                } else if (!viewHandled && keys_.matches(event.key, "quit")) {
                    // The user-editable "quit" binding from settings
                    sender_.send(ActionType::Quit);
                }
            }
            break;
        case EventType::Mouse:
            break;
    }
}

void App::drainActions() {
    for (int pass = 0; pass < kMaxDrainPasses; ++pass) {
        size_t count = channel_.pending();
        if (count == 0) return;
        for (size_t i = 0; i < count; ++i) {
            auto action = channel_.tryRecv();
            if (!action) break;
            dispatch(*action);
        }
    }
    if (channel_.pending() > 0) {
        spdlog::debug("{} actions carried over to the next iteration", channel_.pending());
    }
}

void App::dispatch(const Action& action) {
    if (action.type != ActionType::Tick && action.type != ActionType::Render) {
        spdlog::debug("Dispatching {}", toString(action));
    }

    switch (action.type) {
        case ActionType::Tick:
            resolver_.clearBuffer();
            break;
        case ActionType::Quit:
            shouldQuit_ = true;
            break;
        case ActionType::Suspend:
            shouldSuspend_ = true;
            break;
        case ActionType::Resume:
            shouldSuspend_ = false;
            break;
        case ActionType::ClearScreen:
            terminal_->clear();
            break;
        case ActionType::Resize:
            terminal_->resize(Size{action.width, action.height});
            render();
            break;
        case ActionType::Render:
            render();
            break;
        case ActionType::LaunchWithProfile:
            launchProfile(action.text);
            break;
        default:
            break;
    }

    for (auto& component : components_) {
        try {
            if (auto followUp = component->update(action)) {
                sender_.send(std::move(*followUp));
            }
        } catch (const std::exception& e) {
            spdlog::error("{} failed: {}", toString(action), e.what());
            sender_.send(Action::error(e.what()));
        }
    }

    // A form intent only counts once the view manager has opened the form;
    // a failed load leaves the list active and global keys must keep working
    if (action.entersForm()) {
        formMode_ = isFormView(viewManager_->currentView());
    } else if (action.isNavigation()) {
        formMode_ = false;
    }
}

void App::render() {
    const ColorTheme& theme = settings_ ? themeByName(settings_->theme()) : builtinThemes().front();
    ftxui::Element frame;
    try {
        frame = viewManager_->draw(theme);
    } catch (const std::exception& e) {
        spdlog::error("Render failed: {}", e.what());
        sender_.send(Action::error(std::string("Render failed: ") + e.what()));
        return;
    }
    terminal_->draw(std::move(frame));
}

void App::launchProfile(const std::string& id) {
    Profile profile;
    try {
        profile = storage_->loadProfile(id);
    } catch (const StorageError& e) {
        sender_.send(ActionType::ClearScreen);
        sender_.send(Action::error(std::string("Failed to load profile: ") + e.what()));
        return;
    }

    std::optional<std::string> failure;
    terminal_->runRestored([&] {
        try {
            launcher_->launch(profile);
        } catch (const std::exception& e) {
            failure = e.what();
        }
    });

    sender_.send(ActionType::ClearScreen);
    if (failure) {
        spdlog::error("Launch of profile {} failed: {}", id, *failure);
        sender_.send(Action::error("Failed to launch profile: " + *failure));
    } else {
        sender_.send(ActionType::Render);
    }
}

}  // namespace gcm
