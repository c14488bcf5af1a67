#include "view_manager.h"
#include "components/extension_form.h"
#include "core/errors.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace gcm;
using namespace gcm::test;
using namespace std::chrono_literals;

namespace {

struct ViewManagerTest : ::testing::Test {
    TempDir dir;
    std::shared_ptr<Storage> storage = makeStorage(dir);
    SharedSettings settings = std::make_shared<SettingsStore>(dir / "settings.json");
    ActionChannel channel;
    SteadyClock::time_point now = SteadyClock::time_point{} + 1h;
    std::unique_ptr<ViewManager> vm;

    void SetUp() override {
        storage->saveExtension(makeExtension("fs", "Filesystem"));
        storage->saveExtension(makeExtension("web", "Web"));
        storage->saveProfile(makeProfile("dev", "Dev", {"fs"}));
        storage->saveProfile(makeProfile("ops", "Ops"));

        vm = std::make_unique<ViewManager>(storage, [this] { return now; });
        vm->registerActionHandler(channel.sender());
        vm->registerConfigHandler(Config{});
        vm->registerSettingsHandler(settings);
        vm->init(Size{100, 40});
    }

    std::optional<Action> apply(const Action& action) { return vm->update(action); }

    std::optional<Action> key(KeyEvent k) { return vm->handleEvents(Event::keyPress(std::move(k))); }
};

}  // namespace

TEST_F(ViewManagerTest, StartsOnExtensionList) {
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionList);
    EXPECT_FALSE(vm->previousView());
    EXPECT_NE(vm->activeView(), nullptr);
}

TEST_F(ViewManagerTest, TabNavigationRecordsPreviousView) {
    apply(ActionType::NavigateToProfiles);
    EXPECT_EQ(vm->currentView(), ViewType::ProfileList);
    EXPECT_EQ(vm->previousView(), ViewType::ExtensionList);

    apply(ActionType::NavigateToSettings);
    EXPECT_EQ(vm->currentView(), ViewType::Settings);
    EXPECT_EQ(vm->previousView(), ViewType::ProfileList);

    // Navigating to the current view changes nothing
    apply(ActionType::NavigateToSettings);
    EXPECT_EQ(vm->previousView(), ViewType::ProfileList);
}

TEST_F(ViewManagerTest, DetailViewsAndBack) {
    apply(Action(ActionType::ViewExtensionDetails, "fs"));
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionDetail);
    apply(ActionType::NavigateBack);
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionList);

    apply(Action(ActionType::ViewProfileDetails, "dev"));
    EXPECT_EQ(vm->currentView(), ViewType::ProfileDetail);
    apply(ActionType::NavigateBack);
    EXPECT_EQ(vm->currentView(), ViewType::ProfileList);
}

TEST_F(ViewManagerTest, MissingDetailReportsErrorWithoutNavigating) {
    apply(Action(ActionType::ViewExtensionDetails, "ghost"));
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionList);
    auto sent = drain(channel);
    const Action* error = findType(sent, ActionType::Error);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->text.rfind("Failed to load extension: ", 0), 0u);
}

TEST_F(ViewManagerTest, EditFromDetailReturnsToDetail) {
    apply(Action(ActionType::ViewProfileDetails, "dev"));
    apply(Action(ActionType::EditProfile, "dev"));
    EXPECT_EQ(vm->currentView(), ViewType::ProfileEdit);
    EXPECT_EQ(vm->editingProfileId(), "dev");
    EXPECT_TRUE(vm->cameFromDetailView());

    apply(ActionType::NavigateBack);
    EXPECT_EQ(vm->currentView(), ViewType::ProfileDetail);
    EXPECT_FALSE(vm->editingProfileId());
    EXPECT_FALSE(vm->cameFromDetailView());
}

TEST_F(ViewManagerTest, EditFromListReturnsToList) {
    apply(Action(ActionType::EditExtension, "web"));
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionEdit);
    EXPECT_FALSE(vm->cameFromDetailView());
    auto* form = dynamic_cast<components::ExtensionForm*>(vm->activeView());
    ASSERT_NE(form, nullptr);
    EXPECT_TRUE(form->editMode());

    apply(ActionType::NavigateBack);
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionList);
    EXPECT_FALSE(vm->editingExtensionId());
}

TEST_F(ViewManagerTest, EditOfMissingRecordStaysPut) {
    apply(Action(ActionType::EditProfile, "ghost"));
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionList);
    EXPECT_FALSE(vm->editingProfileId());
    EXPECT_TRUE(containsType(drain(channel), ActionType::Error));
}

TEST_F(ViewManagerTest, CreateFormsReturnToTheirList) {
    apply(ActionType::CreateNewExtension);
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionCreate);
    EXPECT_FALSE(vm->editingExtensionId());
    apply(ActionType::NavigateBack);
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionList);

    apply(ActionType::CreateProfile);
    EXPECT_EQ(vm->currentView(), ViewType::ProfileCreate);
    apply(ActionType::NavigateBack);
    EXPECT_EQ(vm->currentView(), ViewType::ProfileList);
}

TEST_F(ViewManagerTest, ImportOpensDialogAndBackReturns) {
    apply(ActionType::ImportExtension);
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionImport);
    apply(ActionType::NavigateBack);
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionList);
}

TEST_F(ViewManagerTest, ExtensionInUseCannotBeDeleted) {
    apply(Action(ActionType::DeleteExtension, "fs"));
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionList);
    EXPECT_FALSE(vm->deletingExtensionId());

    auto sent = drain(channel);
    const Action* error = findType(sent, ActionType::Error);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->text, "Cannot delete extension: it is used by profile Dev");
    EXPECT_NO_THROW(storage->loadExtension("fs"));
}

TEST_F(ViewManagerTest, ConfirmedDeleteRemovesRecord) {
    apply(Action(ActionType::DeleteExtension, "web"));
    EXPECT_EQ(vm->currentView(), ViewType::ConfirmDelete);
    EXPECT_EQ(vm->deletingExtensionId(), "web");

    apply(ActionType::ConfirmDelete);
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionList);
    EXPECT_FALSE(vm->deletingExtensionId());
    EXPECT_THROW(storage->loadExtension("web"), NotFoundError);
    EXPECT_TRUE(containsType(drain(channel), ActionType::RefreshExtensions));
}

TEST_F(ViewManagerTest, ConfirmedProfileDeleteReturnsToPreviousView) {
    apply(Action(ActionType::ViewProfileDetails, "ops"));
    apply(Action(ActionType::DeleteProfile, "ops"));
    EXPECT_EQ(vm->currentView(), ViewType::ConfirmDelete);
    EXPECT_EQ(vm->deletingProfileId(), "ops");

    apply(ActionType::ConfirmDelete);
    EXPECT_EQ(vm->currentView(), ViewType::ProfileDetail);
    EXPECT_THROW(storage->loadProfile("ops"), NotFoundError);
}

TEST_F(ViewManagerTest, CancelledDeleteKeepsRecord) {
    apply(ActionType::NavigateToProfiles);
    apply(Action(ActionType::DeleteProfile, "ops"));
    apply(ActionType::CancelDelete);
    EXPECT_EQ(vm->currentView(), ViewType::ProfileList);
    EXPECT_FALSE(vm->deletingProfileId());
    EXPECT_NO_THROW(storage->loadProfile("ops"));
}

TEST_F(ViewManagerTest, ConfirmWithoutPendingDeleteChangesNothing) {
    apply(ActionType::ConfirmDelete);
    EXPECT_EQ(storage->listExtensions().size(), 2u);
    EXPECT_EQ(storage->listProfiles().size(), 2u);
    EXPECT_FALSE(containsType(drain(channel), ActionType::Error));
}

TEST_F(ViewManagerTest, SetDefaultProfile) {
    apply(Action(ActionType::SetDefaultProfile, "ops"));
    EXPECT_TRUE(storage->loadProfile("ops").metadata.isDefault);
    EXPECT_FALSE(storage->loadProfile("dev").metadata.isDefault);
    auto sent = drain(channel);
    EXPECT_TRUE(containsType(sent, ActionType::Success));

    apply(Action(ActionType::SetDefaultProfile, "ghost"));
    EXPECT_TRUE(storage->loadProfile("ops").metadata.isDefault);
    EXPECT_TRUE(containsType(drain(channel), ActionType::Error));
}

TEST_F(ViewManagerTest, ErrorOverlayExpiresAfterFiveSeconds) {
    auto result = apply(Action::error("boom"));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->type, ActionType::Render);
    ASSERT_TRUE(vm->errorOverlay().visible());
    EXPECT_EQ(vm->errorOverlay().text(), "boom");

    now += 5s - 1ms;
    EXPECT_FALSE(apply(ActionType::Tick));
    EXPECT_TRUE(vm->errorOverlay().visible());

    now += 2ms;
    result = apply(ActionType::Tick);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->type, ActionType::Render);
    EXPECT_FALSE(vm->errorOverlay().visible());
}

TEST_F(ViewManagerTest, ErrorOverlaySwallowsKeysUntilEsc) {
    apply(Action::error("boom"));
    EXPECT_FALSE(key(KeyEvent::character("n")));
    EXPECT_TRUE(vm->errorOverlay().visible());

    auto result = key(KeyEvent::special(KeyCode::Esc));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->type, ActionType::Render);
    EXPECT_FALSE(vm->errorOverlay().visible());

    result = key(KeyEvent::character("n"));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->type, ActionType::CreateNewExtension);
}

TEST_F(ViewManagerTest, StatusMessageExpiresAfterThreeSeconds) {
    apply(Action::success("Saved"));
    ASSERT_TRUE(vm->statusMessage().visible());
    now += 3s;
    apply(ActionType::Tick);
    EXPECT_TRUE(vm->statusMessage().visible());
    now += 1ms;
    apply(ActionType::Tick);
    EXPECT_FALSE(vm->statusMessage().visible());
}

TEST_F(ViewManagerTest, HelpToggles) {
    apply(ActionType::Help);
    EXPECT_TRUE(vm->helpVisible());
    EXPECT_FALSE(key(KeyEvent::character("j")));
    key(KeyEvent::special(KeyCode::Esc));
    EXPECT_FALSE(vm->helpVisible());

    apply(ActionType::Help);
    apply(ActionType::Help);
    EXPECT_FALSE(vm->helpVisible());
}

TEST_F(ViewManagerTest, HelpListsCurrentBindings) {
    settings->updateKeybinding("create", {"a"});
    auto bindings = vm->helpBindings();
    bool found = false;
    for (const auto& [keys, label] : bindings) {
        if (label == "New extension") {
            found = true;
            EXPECT_EQ(keys, "a");
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(ViewManagerTest, KeysGoToActiveView) {
    auto result = key(KeyEvent::special(KeyCode::Enter));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->type, ActionType::ViewExtensionDetails);
    EXPECT_EQ(result->text, "fs");

    apply(ActionType::NavigateToProfiles);
    result = key(KeyEvent::character("l"));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->type, ActionType::LaunchWithProfile);
}

TEST_F(ViewManagerTest, SearchCapturesInput) {
    EXPECT_FALSE(vm->capturesInput());
    key(KeyEvent::character("/"));
    EXPECT_TRUE(vm->capturesInput());
    key(KeyEvent::special(KeyCode::Esc));
    EXPECT_FALSE(vm->capturesInput());
}

TEST_F(ViewManagerTest, DrawsEveryView) {
    const ColorTheme& theme = builtinThemes().front();
    EXPECT_NE(vm->draw(theme), nullptr);
    apply(ActionType::NavigateToProfiles);
    EXPECT_NE(vm->draw(theme), nullptr);
    apply(ActionType::NavigateToSettings);
    EXPECT_NE(vm->draw(theme), nullptr);
    apply(Action::error("boom"));
    apply(ActionType::Help);
    EXPECT_NE(vm->draw(theme), nullptr);
}

TEST_F(ViewManagerTest, ExtensionEditFromDetailReturnsToDetail) {
    apply(Action(ActionType::ViewExtensionDetails, "web"));
    apply(Action(ActionType::EditExtension, "web"));
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionEdit);
    EXPECT_TRUE(vm->cameFromDetailView());
    apply(ActionType::NavigateBack);
    EXPECT_EQ(vm->currentView(), ViewType::ExtensionDetail);
}

TEST_F(ViewManagerTest, CreateProfileRoundTrip) {
    apply(ActionType::NavigateToProfiles);
    apply(ActionType::CreateProfile);
    EXPECT_EQ(vm->currentView(), ViewType::ProfileCreate);
    apply(ActionType::NavigateBack);
    EXPECT_EQ(vm->currentView(), ViewType::ProfileList);
}
