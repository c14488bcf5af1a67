#include "action.h"

#include <gtest/gtest.h>

using namespace gcm;

TEST(ActionTest, NamesAreCanonical) {
    EXPECT_EQ(actionName(ActionType::NavigateToProfiles), "NavigateToProfiles");
    EXPECT_EQ(actionName(ActionType::ConfirmDelete), "ConfirmDelete");
    EXPECT_EQ(actionName(ActionType::SaveSettings), "SaveSettings");
}

TEST(ActionTest, ToStringIncludesPayload) {
    EXPECT_EQ(toString(Action(ActionType::EditExtension, "abc")), "EditExtension(abc)");
    EXPECT_EQ(toString(Action::resize(80, 24)), "Resize(80x24)");
    EXPECT_EQ(toString(Action::updateKeybinding("up", {"Up", "k"})), "UpdateKeybinding(up = [Up, k])");
    EXPECT_EQ(toString(ActionType::Quit), "Quit");
}

TEST(ActionTest, ParseAcceptsOnlyParameterlessActions) {
    auto quit = parseAction("Quit");
    ASSERT_TRUE(quit);
    EXPECT_EQ(quit->type, ActionType::Quit);
    EXPECT_TRUE(parseAction("NavigateToExtensions"));

    EXPECT_FALSE(parseAction("EditExtension"));
    EXPECT_FALSE(parseAction("Error"));
    EXPECT_FALSE(parseAction("quit"));
    EXPECT_FALSE(parseAction(""));
}

TEST(ActionTest, FormAndNavigationClassification) {
    EXPECT_TRUE(Action(ActionType::CreateNewExtension).entersForm());
    EXPECT_TRUE(Action(ActionType::EditExtension, "x").entersForm());
    EXPECT_TRUE(Action(ActionType::CreateProfile).entersForm());
    EXPECT_TRUE(Action(ActionType::EditProfile, "x").entersForm());
    EXPECT_TRUE(Action(ActionType::ImportExtension).entersForm());
    EXPECT_FALSE(Action(ActionType::ViewExtensionDetails, "x").entersForm());

    EXPECT_TRUE(Action(ActionType::NavigateBack).isNavigation());
    EXPECT_TRUE(Action(ActionType::NavigateToSettings).isNavigation());
    EXPECT_FALSE(Action(ActionType::ConfirmDelete).isNavigation());
}
