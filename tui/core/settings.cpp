#include "settings.h"
#include "errors.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <mutex>
#include <sstream>

namespace gcm {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Help text mentions a few keys that are not user configurable
const std::map<std::string, std::vector<std::string>>& fixedBindings() {
    static const std::map<std::string, std::vector<std::string>> fixed = {
        {"tab", {"Tab"}},
        {"Space", {"Space"}},
        {"Ctrl+S", {"Ctrl+S"}},
        {"Type", {"Type"}},
        {"x", {"x"}},
        {"r", {"r"}},
    };
    return fixed;
}

void readGroup(const json& j, const char* group, const std::vector<std::string>& names,
               std::map<std::string, std::vector<std::string>>& out) {
    auto it = j.find(group);
    if (it == j.end() || !it->is_object()) return;
    for (const auto& item : it->items()) {
        if (!contains(names, item.key())) {
            spdlog::warn("Ignoring unknown keybinding '{}.{}'", group, item.key());
            continue;
        }
        out[item.key()] = item.value().get<std::vector<std::string>>();
    }
}

}  // namespace

const std::vector<std::string>& navigationBindingNames() {
    static const std::vector<std::string> names = {"up", "down", "left", "right", "back", "quit"};
    return names;
}

const std::vector<std::string>& actionBindingNames() {
    static const std::vector<std::string> names = {
        "edit", "delete", "create", "import", "launch", "select", "search"};
    return names;
}

KeybindingConfig KeybindingConfig::defaults() {
    KeybindingConfig k;
    k.navigation = {
        {"up", {"Up", "k"}},
        {"down", {"Down", "j"}},
        {"left", {"Left", "h"}},
        {"right", {"Right", "l"}},
        {"back", {"Esc", "b"}},
        {"quit", {"q", "Ctrl+c"}},
    };
    k.actions = {
        {"edit", {"e"}},
        {"delete", {"d"}},
        {"create", {"n"}},
        {"import", {"i"}},
        {"launch", {"l"}},
        {"select", {"Enter", "Space"}},
        {"search", {"/"}},
    };
    return k;
}

std::vector<std::string> KeybindingConfig::keysFor(const std::string& name) const {
    if (auto it = navigation.find(name); it != navigation.end()) return it->second;
    if (auto it = actions.find(name); it != actions.end()) return it->second;
    if (auto it = fixedBindings().find(name); it != fixedBindings().end()) return it->second;
    return {};
}

bool KeybindingConfig::set(const std::string& name, std::vector<std::string> keys) {
    if (contains(navigationBindingNames(), name)) {
        navigation[name] = std::move(keys);
        return true;
    }
    if (contains(actionBindingNames(), name)) {
        actions[name] = std::move(keys);
        return true;
    }
    return false;
}

void to_json(json& j, const KeybindingConfig& k) {
    j = json{{"navigation", k.navigation}, {"actions", k.actions}};
}

void from_json(const json& j, KeybindingConfig& k) {
    // Start from defaults so a partial file still binds every name
    k = KeybindingConfig::defaults();
    readGroup(j, "navigation", navigationBindingNames(), k.navigation);
    readGroup(j, "actions", actionBindingNames(), k.actions);
}

void to_json(json& j, const UserSettings& s) {
    j = json{{"theme", s.theme}, {"keybindings", s.keybindings}};
}

void from_json(const json& j, UserSettings& s) {
    UserSettings defaults;
    s.theme = j.value("theme", defaults.theme);
    if (j.contains("keybindings")) {
        j.at("keybindings").get_to(s.keybindings);
    } else {
        s.keybindings = defaults.keybindings;
    }
}

SettingsStore::SettingsStore(fs::path file, UserSettings initial)
    : file_(std::move(file)), settings_(std::move(initial)) {}

std::shared_ptr<SettingsStore> SettingsStore::load(const fs::path& file) {
    if (!fs::exists(file)) {
        spdlog::info("No settings at {}, using defaults", file.string());
        return std::make_shared<SettingsStore>(file);
    }

    try {
        std::ifstream in(file);
        std::stringstream buffer;
        buffer << in.rdbuf();
        auto settings = json::parse(buffer.str()).get<UserSettings>();
        spdlog::info("Loaded settings from {}", file.string());
        return std::make_shared<SettingsStore>(file, std::move(settings));
    } catch (const json::exception& e) {
        spdlog::warn("Unreadable settings {} ({}), using defaults", file.string(), e.what());
        return std::make_shared<SettingsStore>(file);
    }
}

UserSettings SettingsStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

std::string SettingsStore::theme() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_.theme;
}

std::vector<std::string> SettingsStore::keysFor(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_.keybindings.keysFor(name);
}

void SettingsStore::updateTheme(const std::string& theme) {
    UserSettings copy;
    uint64_t version = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        settings_.theme = theme;
        copy = settings_;
        version = ++version_;
    }
    persist(copy, version);
}

void SettingsStore::updateKeybinding(const std::string& name, std::vector<std::string> keys) {
    UserSettings copy;
    uint64_t version = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!settings_.keybindings.set(name, std::move(keys))) {
            throw SettingsError("Unknown action: " + name);
        }
        copy = settings_;
        version = ++version_;
    }
    persist(copy, version);
}

void SettingsStore::resetKeybindings() {
    UserSettings copy;
    uint64_t version = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        settings_.keybindings = KeybindingConfig::defaults();
        copy = settings_;
        version = ++version_;
    }
    persist(copy, version);
}

void SettingsStore::save() const {
    UserSettings copy;
    uint64_t version = 0;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        copy = settings_;
        version = version_;
    }
    persist(copy, version);
}

void SettingsStore::persist(const UserSettings& settings, uint64_t version) const {
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (version < writtenVersion_) {
        spdlog::debug("Skipping stale settings write (v{} < v{})", version, writtenVersion_);
        return;
    }

    std::error_code ec;
    if (file_.has_parent_path()) {
        fs::create_directories(file_.parent_path(), ec);
        if (ec) {
            throw SettingsError("Failed to create " + file_.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(file_, std::ios::trunc);
    if (!out) {
        throw SettingsError("Failed to open " + file_.string() + " for writing");
    }
    out << json(settings).dump(2) << "\n";
    if (!out) {
        throw SettingsError("Failed to write " + file_.string());
    }
    writtenVersion_ = version;
    spdlog::debug("Settings written to {}", file_.string());
}

}  // namespace gcm
