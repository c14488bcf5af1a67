#include "app.h"
#include "components/profile_form.h"
#include "fake_terminal.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace gcm;
using namespace gcm::test;

namespace {

struct AppTest : ::testing::Test {
    TempDir dir;
    std::shared_ptr<Storage> storage = makeStorage(dir);
    SharedSettings settings = std::make_shared<SettingsStore>(dir / "settings.json");
    FakeTerminal::Counters counters;
    std::vector<std::string> launched;
    Config config;

    void SetUp() override {
        config.dataDir = dir / "data";
        config.workspaceDir = dir / "workspace";
        config.keybindings["Normal"] = Config::defaultKeymap();
        storage->saveProfile(makeProfile("dev", "Dev"));
    }

    std::unique_ptr<App> makeApp(std::deque<Event> script, std::string launchFailure = "") {
        return std::make_unique<App>(config, storage, settings,
                                     std::make_unique<FakeTerminal>(std::move(script), &counters),
                                     std::make_unique<FakeLauncher>(&launched, std::move(launchFailure)));
    }
};

}  // namespace

TEST_F(AppTest, EntersAndRestoresTerminal) {
    auto app = makeApp({});
    app->run();
    EXPECT_EQ(counters.enters, 1);
    EXPECT_EQ(counters.exits, 1);
    EXPECT_GE(counters.draws, 1);
}

TEST_F(AppTest, QuitKeyStopsLoop) {
    auto app = makeApp({special(KeyCode::Tab), key("q"), special(KeyCode::Tab)});
    app->run();
    EXPECT_EQ(app->viewManager().currentView(), ViewType::ProfileList);
    EXPECT_EQ(counters.exits, 1);
}

TEST_F(AppTest, QuitEventStopsLoop) {
    auto app = makeApp({Event::quit(), special(KeyCode::Tab)});
    app->run();
    EXPECT_EQ(app->viewManager().currentView(), ViewType::ExtensionList);
}

TEST_F(AppTest, QuitRequestStopsAfterCurrentEvent) {
    auto app = makeApp({special(KeyCode::Tab), special(KeyCode::Tab)});
    app->quit();
    app->run();
    EXPECT_EQ(app->viewManager().currentView(), ViewType::ProfileList);
}

TEST_F(AppTest, FormModeSendsKeysToForm) {
    auto app = makeApp({special(KeyCode::Tab), key("n"), key("q"), key("?")});
    app->run();

    ASSERT_EQ(app->viewManager().currentView(), ViewType::ProfileCreate);
    EXPECT_TRUE(app->inFormMode());
    EXPECT_FALSE(app->viewManager().helpVisible());
    auto* form = dynamic_cast<components::ProfileForm*>(app->viewManager().activeView());
    ASSERT_NE(form, nullptr);
    EXPECT_EQ(form->input(components::ProfileForm::Field::Name).value(), "q?");
}

TEST_F(AppTest, LeavingFormRestoresGlobalKeys) {
    auto app = makeApp({special(KeyCode::Tab), key("n"), special(KeyCode::Esc), key("q"), key("n")});
    app->run();
    EXPECT_EQ(app->viewManager().currentView(), ViewType::ProfileList);
    EXPECT_FALSE(app->inFormMode());
}

TEST_F(AppTest, FailedEditKeepsGlobalKeys) {
    auto app = makeApp({special(KeyCode::Tab), key("e"), special(KeyCode::Esc), key("q"),
                        special(KeyCode::Tab)});
    storage->deleteProfile("dev");
    app->run();
    EXPECT_EQ(app->viewManager().currentView(), ViewType::ProfileList);
    EXPECT_FALSE(app->inFormMode());
    EXPECT_FALSE(app->viewManager().errorOverlay().visible());
}

TEST_F(AppTest, EditOpensFormMode) {
    auto app = makeApp({special(KeyCode::Tab), key("e"), key("q")});
    app->run();
    ASSERT_EQ(app->viewManager().currentView(), ViewType::ProfileEdit);
    EXPECT_TRUE(app->inFormMode());
}

TEST_F(AppTest, RebindQuitFromSettings) {
    settings->updateKeybinding("quit", {"Ctrl+x"});
    auto app = makeApp({Event::keyPress(KeyEvent::ctrlChar('x')), special(KeyCode::Tab)});
    app->run();
    EXPECT_EQ(app->viewManager().currentView(), ViewType::ExtensionList);
    EXPECT_EQ(counters.exits, 1);
}

TEST_F(AppTest, HelpKeyTogglesOverlay) {
    auto app = makeApp({key("?")});
    app->run();
    EXPECT_TRUE(app->viewManager().helpVisible());
}

TEST_F(AppTest, ChordWithinOneTick) {
    config.keybindings["Normal"][{KeyEvent::character("g"), KeyEvent::character("s")}] =
        ActionType::NavigateToSettings;
    auto app = makeApp({key("g"), key("s")});
    app->run();
    EXPECT_EQ(app->viewManager().currentView(), ViewType::Settings);
}

TEST_F(AppTest, TickBreaksChord) {
    config.keybindings["Normal"][{KeyEvent::character("g"), KeyEvent::character("s")}] =
        ActionType::NavigateToSettings;
    auto app = makeApp({key("g"), Event::tick(), key("s")});
    app->run();
    EXPECT_EQ(app->viewManager().currentView(), ViewType::ExtensionList);
}

TEST_F(AppTest, LaunchesSelectedProfile) {
    auto app = makeApp({special(KeyCode::Tab), key("l")});
    app->run();
    EXPECT_EQ(launched, (std::vector<std::string>{"dev"}));
    EXPECT_EQ(counters.restored, 1);
    EXPECT_GE(counters.clears, 1);
    EXPECT_FALSE(app->viewManager().errorOverlay().visible());
    EXPECT_EQ(app->viewManager().currentView(), ViewType::ProfileList);
}

TEST_F(AppTest, LaunchFailureShowsError) {
    auto app = makeApp({special(KeyCode::Tab), key("l")}, "gemini not found");
    app->run();
    EXPECT_EQ(launched.size(), 1u);
    ASSERT_TRUE(app->viewManager().errorOverlay().visible());
    EXPECT_EQ(app->viewManager().errorOverlay().text(), "Failed to launch profile: gemini not found");
}

TEST_F(AppTest, LaunchOfVanishedProfileShowsError) {
    auto app = makeApp({special(KeyCode::Tab), key("l")});
    storage->deleteProfile("dev");
    app->run();
    EXPECT_TRUE(launched.empty());
    EXPECT_EQ(counters.restored, 0);
    ASSERT_TRUE(app->viewManager().errorOverlay().visible());
    EXPECT_EQ(app->viewManager().errorOverlay().text().rfind("Failed to load profile: ", 0), 0u);
}

TEST_F(AppTest, CtrlZSuspendsAndRepaints) {
    auto app = makeApp({Event::keyPress(KeyEvent::ctrlChar('z'))});
    app->run();
    EXPECT_EQ(counters.suspends, 1);
    EXPECT_GE(counters.clears, 1);
}

TEST_F(AppTest, ResizeReachesTerminal) {
    auto app = makeApp({Event::resize(120, 50)});
    app->run();
    ASSERT_EQ(counters.resizes.size(), 1u);
    EXPECT_TRUE(counters.resizes[0] == (Size{120, 50}));
    EXPECT_GE(counters.draws, 2);
}
