#include "keybinding_manager.h"

#include <gtest/gtest.h>

using namespace gcm;

TEST(KeybindingManagerTest, FormatsKeys) {
    EXPECT_EQ(KeybindingManager::formatKeyEvent(KeyEvent::character("j")), "j");
    EXPECT_EQ(KeybindingManager::formatKeyEvent(KeyEvent::character("J")), "Shift+J");
    EXPECT_EQ(KeybindingManager::formatKeyEvent(KeyEvent::character(" ")), "Space");
    EXPECT_EQ(KeybindingManager::formatKeyEvent(KeyEvent::ctrlChar('c')), "Ctrl+c");
    EXPECT_EQ(KeybindingManager::formatKeyEvent(KeyEvent::special(KeyCode::Enter)), "Enter");
    EXPECT_EQ(KeybindingManager::formatKeyEvent(KeyEvent::function(5)), "F5");

    KeyEvent altUp = KeyEvent::special(KeyCode::Up);
    altUp.alt = true;
    EXPECT_EQ(KeybindingManager::formatKeyEvent(altUp), "Alt+Up");
}

TEST(KeybindingManagerTest, MatchesDefaultBindings) {
    KeybindingManager keys(std::make_shared<SettingsStore>("unused.json"));
    EXPECT_TRUE(keys.matches(KeyEvent::special(KeyCode::Up), "up"));
    EXPECT_TRUE(keys.matches(KeyEvent::character("k"), "up"));
    EXPECT_TRUE(keys.matches(KeyEvent::character(" "), "select"));
    EXPECT_TRUE(keys.matches(KeyEvent::ctrlChar('c'), "quit"));
    EXPECT_FALSE(keys.matches(KeyEvent::character("K"), "up"));
    EXPECT_FALSE(keys.matches(KeyEvent::character("k"), "down"));
}

TEST(KeybindingManagerTest, WithoutSettingsNothingIsBound) {
    KeybindingManager keys;
    EXPECT_FALSE(keys.matches(KeyEvent::special(KeyCode::Up), "up"));
    EXPECT_TRUE(keys.keysFor("up").empty());
    EXPECT_EQ(keys.buildHelpText({{"up", "Up"}}), "");
}

TEST(KeybindingManagerTest, BuildsHelpTextSkippingUnbound) {
    KeybindingManager keys(std::make_shared<SettingsStore>("unused.json"));
    EXPECT_EQ(keys.buildHelpText({{"up", "Navigate"}, {"nothing", "Hidden"}, {"select", "Select"}}),
              "Up, k: Navigate | Enter, Space: Select");
    EXPECT_EQ(keys.buildHelpText({{"tab", "Next tab"}}), "Tab: Next tab");
}
