#ifndef GCM_TUI_CORE_SETTINGS_H
#define GCM_TUI_CORE_SETTINGS_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace gcm {

// Logical keybinding names, in display order
const std::vector<std::string>& navigationBindingNames();
const std::vector<std::string>& actionBindingNames();

// Chord tables keyed by logical name, e.g. "up" -> {"Up", "k"}
struct KeybindingConfig {
    std::map<std::string, std::vector<std::string>> navigation;
    std::map<std::string, std::vector<std::string>> actions;

    static KeybindingConfig defaults();

    // Empty for unbound or unknown names
    std::vector<std::string> keysFor(const std::string& name) const;
    // Returns false for names outside the known set
    bool set(const std::string& name, std::vector<std::string> keys);

    bool operator==(const KeybindingConfig&) const = default;
};

struct UserSettings {
    std::string theme = "mocha";
    KeybindingConfig keybindings = KeybindingConfig::defaults();

    bool operator==(const UserSettings&) const = default;
};

void to_json(nlohmann::json& j, const KeybindingConfig& k);
void from_json(const nlohmann::json& j, KeybindingConfig& k);
void to_json(nlohmann::json& j, const UserSettings& s);
void from_json(const nlohmann::json& j, UserSettings& s);

// Process-wide user settings (theme + keybindings) persisted to a JSON file.
// Readers take a shared lock per lookup. Writers mutate under the exclusive
// lock, release it, then rewrite the whole file. File writes are serialised
// and each carries the version it snapshotted; an older snapshot never
// overwrites a newer one.
class SettingsStore {
public:
    explicit SettingsStore(std::filesystem::path file, UserSettings initial = {});

    // Reads `file`; falls back to defaults when it is missing or unparsable
    static std::shared_ptr<SettingsStore> load(const std::filesystem::path& file);

    const std::filesystem::path& path() const { return file_; }

    UserSettings snapshot() const;
    std::string theme() const;
    std::vector<std::string> keysFor(const std::string& name) const;

    // Each of these persists the full settings. Throws SettingsError.
    void updateTheme(const std::string& theme);
    void updateKeybinding(const std::string& name, std::vector<std::string> keys);
    void resetKeybindings();
    void save() const;

private:
    void persist(const UserSettings& settings, uint64_t version) const;

    std::filesystem::path file_;
    mutable std::shared_mutex mutex_;
    UserSettings settings_;
    uint64_t version_ = 0;

    mutable std::mutex fileMutex_;
    mutable uint64_t writtenVersion_ = 0;
};

using SharedSettings = std::shared_ptr<SettingsStore>;

}  // namespace gcm

#endif  // GCM_TUI_CORE_SETTINGS_H
