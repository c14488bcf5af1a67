#include "config.h"
#include "core/errors.h"
#include "test_helpers.h"

#include <gtest/gtest.h>
#include <cstdlib>

using namespace gcm;
using gcm::test::TempDir;
using gcm::test::writeFile;

namespace {

Config defaults() {
    Config config;
    config.keybindings["Normal"] = Config::defaultKeymap();
    return config;
}

}  // namespace

TEST(ConfigTest, DefaultKeymap) {
    KeyMap keymap = Config::defaultKeymap();
    EXPECT_EQ(keymap.at({KeyEvent::character("q")}).type, ActionType::Quit);
    EXPECT_EQ(keymap.at({KeyEvent::ctrlChar('c')}).type, ActionType::Quit);
    EXPECT_EQ(keymap.at({KeyEvent::ctrlChar('d')}).type, ActionType::Quit);
    EXPECT_EQ(keymap.at({KeyEvent::ctrlChar('z')}).type, ActionType::Suspend);
    EXPECT_EQ(keymap.at({KeyEvent::character("?")}).type, ActionType::Help);
}

TEST(ConfigTest, MissingFileKeepsDefaults) {
    TempDir dir;
    Config config = defaults();
    mergeConfigFile(config, dir / "config.json");
    EXPECT_EQ(config.keymap("Normal"), Config::defaultKeymap());
    EXPECT_TRUE(config.keymap("Insert").empty());
}

TEST(ConfigTest, FileAddsAndOverridesBindings) {
    TempDir dir;
    writeFile(dir / "config.json", R"({
        "keybindings": {
            "Normal": {
                "<g><g>": "NavigateToExtensions",
                "<q>": "Help"
            }
        }
    })");
    Config config = defaults();
    mergeConfigFile(config, dir / "config.json");

    const KeyMap& keymap = config.keymap("Normal");
    std::vector<KeyEvent> gg = {KeyEvent::character("g"), KeyEvent::character("g")};
    EXPECT_EQ(keymap.at(gg).type, ActionType::NavigateToExtensions);
    EXPECT_EQ(keymap.at({KeyEvent::character("q")}).type, ActionType::Help);
    EXPECT_EQ(keymap.at({KeyEvent::ctrlChar('c')}).type, ActionType::Quit);
}

TEST(ConfigTest, InvalidEntriesAreRejected) {
    TempDir dir;
    Config config = defaults();

    writeFile(dir / "bad_key.json", R"({"keybindings": {"Normal": {"<nokey>": "Quit"}}})");
    EXPECT_THROW(mergeConfigFile(config, dir / "bad_key.json"), ConfigError);

    writeFile(dir / "bad_action.json", R"({"keybindings": {"Normal": {"<x>": "Explode"}}})");
    EXPECT_THROW(mergeConfigFile(config, dir / "bad_action.json"), ConfigError);

    writeFile(dir / "payload.json", R"({"keybindings": {"Normal": {"<x>": "EditExtension"}}})");
    EXPECT_THROW(mergeConfigFile(config, dir / "payload.json"), ConfigError);

    writeFile(dir / "broken.json", "{ not json");
    EXPECT_THROW(mergeConfigFile(config, dir / "broken.json"), ConfigError);
}

TEST(ConfigTest, ExpandsHome) {
    const char* home = std::getenv("HOME");
    ASSERT_NE(home, nullptr);
    EXPECT_EQ(expandHome("~"), std::filesystem::path(home));
    EXPECT_EQ(expandHome("~/work"), std::filesystem::path(home) / "work");
    EXPECT_EQ(expandHome("/tmp/x"), std::filesystem::path("/tmp/x"));
}

TEST(ConfigTest, DirectoriesFollowEnvironment) {
    TempDir dir;
    ::setenv("GCM_DATA", (dir / "data").c_str(), 1);
    ::setenv("GCM_WORKSPACE", (dir / "ws").c_str(), 1);
    EXPECT_EQ(defaultDataDir(), dir / "data");
    EXPECT_EQ(defaultWorkspaceDir(), dir / "ws");
    ::unsetenv("GCM_DATA");
    ::unsetenv("GCM_WORKSPACE");
}
