#include "core/errors.h"
#include "core/settings.h"
#include "test_helpers.h"

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace gcm;
using gcm::test::TempDir;
using gcm::test::writeFile;

TEST(SettingsTest, DefaultsBindEveryLogicalName) {
    KeybindingConfig defaults = KeybindingConfig::defaults();
    for (const auto& name : navigationBindingNames()) {
        EXPECT_FALSE(defaults.keysFor(name).empty()) << name;
    }
    for (const auto& name : actionBindingNames()) {
        EXPECT_FALSE(defaults.keysFor(name).empty()) << name;
    }
    EXPECT_EQ(defaults.keysFor("quit"), (std::vector<std::string>{"q", "Ctrl+c"}));
}

TEST(SettingsTest, MissingFileGivesDefaults) {
    TempDir dir;
    auto store = SettingsStore::load(dir / "settings.json");
    EXPECT_EQ(store->theme(), "mocha");
    EXPECT_EQ(store->snapshot(), UserSettings{});
}

TEST(SettingsTest, CorruptFileGivesDefaults) {
    TempDir dir;
    writeFile(dir / "settings.json", "{ \"theme\": ");
    auto store = SettingsStore::load(dir / "settings.json");
    EXPECT_EQ(store->snapshot(), UserSettings{});
}

TEST(SettingsTest, KeybindingsSurviveWriteAndReload) {
    TempDir dir;
    auto store = SettingsStore::load(dir / "settings.json");
    store->updateKeybinding("up", {"Up", "w"});
    store->updateKeybinding("search", {"/", "Ctrl+f"});
    store->updateTheme("latte");

    auto reloaded = SettingsStore::load(dir / "settings.json");
    UserSettings before = store->snapshot();
    UserSettings after = reloaded->snapshot();
    EXPECT_EQ(after.theme, "latte");
    for (const auto& name : navigationBindingNames()) {
        EXPECT_EQ(after.keybindings.keysFor(name), before.keybindings.keysFor(name)) << name;
    }
    for (const auto& name : actionBindingNames()) {
        EXPECT_EQ(after.keybindings.keysFor(name), before.keybindings.keysFor(name)) << name;
    }
    EXPECT_EQ(after, before);
}

TEST(SettingsTest, PartialFileFallsBackPerName) {
    TempDir dir;
    writeFile(dir / "settings.json", R"({
        "theme": "frappe",
        "keybindings": {"navigation": {"up": ["w"], "teleport": ["t"]}}
    })");
    auto store = SettingsStore::load(dir / "settings.json");
    EXPECT_EQ(store->theme(), "frappe");
    EXPECT_EQ(store->keysFor("up"), std::vector<std::string>{"w"});
    EXPECT_EQ(store->keysFor("down"), KeybindingConfig::defaults().keysFor("down"));
    EXPECT_TRUE(store->keysFor("teleport").empty());
}

TEST(SettingsTest, UnknownKeybindingIsRejected) {
    TempDir dir;
    auto store = SettingsStore::load(dir / "settings.json");
    EXPECT_THROW(store->updateKeybinding("teleport", {"t"}), SettingsError);
}

TEST(SettingsTest, ResetRestoresDefaults) {
    TempDir dir;
    auto store = SettingsStore::load(dir / "settings.json");
    store->updateKeybinding("edit", {"E"});
    store->resetKeybindings();
    EXPECT_EQ(store->snapshot().keybindings, KeybindingConfig::defaults());
    EXPECT_EQ(SettingsStore::load(dir / "settings.json")->snapshot().keybindings,
              KeybindingConfig::defaults());
}

TEST(SettingsTest, ConcurrentWritersLeaveLatestOnDisk) {
    TempDir dir;
    auto store = SettingsStore::load(dir / "settings.json");

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&store, t] {
            for (int i = 0; i < 25; ++i) {
                if (t % 2 == 0) {
                    store->updateTheme("theme-" + std::to_string(t) + "-" + std::to_string(i));
                } else {
                    store->updateKeybinding("edit", {"F" + std::to_string(i % 12 + 1)});
                }
            }
        });
    }
    for (auto& writer : writers) writer.join();

    EXPECT_EQ(SettingsStore::load(dir / "settings.json")->snapshot(), store->snapshot());
}
